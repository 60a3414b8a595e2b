#include "registry.h"
#include <iostream>
#include <thread>
#include <chrono>

using namespace std::chrono_literals;

int main() {
    auto table = cache<std::string, std::string>("test");

    // table->set_logger(make_stderr_logger("[test] "));

    table->set_load_miss_callback(
        [](const std::string& key, const CacheTable<std::string, std::string>::LoaderArgs&) {
            // Real loaders would read the value from a database, network or file
            return make_entry<std::string, std::string>(key, "This is a test with key " + key, 5s);
        });

    std::cout << "=== Loader on miss ===\n";
    for (int i = 0; i < 10; i++) {
        try {
            auto entry = table->get("someKey_" + std::to_string(i));
            std::cout << "Found value in cache: " << entry->value() << "\n";
        } catch (const CacheError& e) {
            std::cout << "Error retrieving value from cache: " << e.what() << "\n";
        }
    }

    std::cout << "Count: " << table->count() << "\n";

    std::this_thread::sleep_for(3s);

    std::cout << "\n=== Iteration ===\n";
    table->for_each([](const std::string& key, const CacheTable<std::string, std::string>::EntryPtr& entry) {
        std::cout << "Key: " << key << "; Val: " << entry->value() << "\n";
    });

    std::cout << "\n=== Idle expiry ===\n";
    table->get("someKey_0")->set_on_evict([](const std::string& key) {
        std::cout << "Evicting " << key << "\n";
    });
    std::this_thread::sleep_for(6s);
    std::cout << "Count after TTL: " << table->count() << "\n";

    return 0;
}
