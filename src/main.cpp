#include "api.h"
#include "config.h"
#include "logger.h"
#include "registry.h"
#include <chrono>
#include <exception>
#include <iostream>
#include <string>

using StringTable = CacheTable<std::string, std::string>;

// Wire one configured table: optional logging, a loader producing
// placeholder values with the table's TTL, then the preload.
static void setup_table(const TableConfig& tc, bool verbose, Logger& log) {
    auto table = cache<std::string, std::string>(tc.name);
    if (verbose) {
        table->set_logger(make_stderr_logger("[" + tc.name + "] "));
    }

    auto ttl = std::chrono::milliseconds(tc.default_ttl_ms);
    table->set_load_miss_callback(
        [ttl](const std::string& key, const StringTable::LoaderArgs&) {
            return make_entry<std::string, std::string>(key, "value of " + key, ttl);
        });

    for (size_t i = 0; i < tc.preload; ++i) {
        table->get(tc.name + "_" + std::to_string(i));
    }

    log.print("Table", tc.name, "ready with", table->count(), "entries, ttl",
              tc.default_ttl_ms, "ms");
}

int main(int argc, char* argv[]) {
    Logger log(std::cerr, "[xscache] ");

    ServerConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        std::cerr << "usage: " << argv[0]
                  << " [--config file.json] [--host addr] [--port n] [--verbose]"
                     " [--table name [--ttl ms] [--preload n]]..." << std::endl;
        return 1;
    }

    // --- Core components ---
    for (const auto& tc : config.tables) {
        setup_table(tc, config.verbose, log);
    }

    // --- Start REST API ---
    CacheAPI api(CacheRegistry::instance(), config.verbose ? make_stderr_logger("[api] ") : nullptr);
    try {
        api.start(config.host, config.port);
    } catch (const std::exception& e) {
        log.print("Server failed:", e.what());
        return 1;
    }

    return 0;
}
