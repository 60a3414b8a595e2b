#include "registry.h"
#include "cache_table_base.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(RegistryTest, SameNameSameTable) {
    CacheRegistry registry;
    auto a = registry.get_or_create<std::string, std::string>("x");
    auto b = registry.get_or_create<std::string, std::string>("x");
    auto c = registry.get_or_create<std::string, std::string>("y");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a->name(), "x");
    EXPECT_EQ(a->count(), 0u);
}

TEST(RegistryTest, ConcurrentFirstAccessCreatesOneTable) {
    CacheRegistry registry;
    std::vector<std::shared_ptr<CacheTable<std::string, int>>> seen(16);

    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); i++) {
        threads.emplace_back([&registry, &seen, i]() {
            seen[i] = registry.get_or_create<std::string, int>("x");
        });
    }
    for (auto& t : threads) t.join();

    for (const auto& table : seen) {
        EXPECT_EQ(table, seen[0]);
    }
    EXPECT_EQ(registry.table_names().size(), 1u);
}

TEST(RegistryTest, TypeMismatchThrows) {
    CacheRegistry registry;
    registry.get_or_create<std::string, std::string>("typed");

    try {
        registry.get_or_create<int, int>("typed");
        FAIL() << "expected TableTypeMismatchError";
    } catch (const CacheError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TableTypeMismatch);
    }
}

TEST(RegistryTest, StatsInNameOrder) {
    CacheRegistry registry;
    registry.get_or_create<std::string, std::string>("b")->add("k", "v", 0ms);
    registry.get_or_create<std::string, std::string>("a");

    auto names = registry.table_names();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "a");
    EXPECT_EQ(names[1], "b");

    auto stats = registry.stats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].name, "a");
    EXPECT_EQ(stats[1].entries, 1u);

    EXPECT_TRUE(registry.stats("b").has_value());
    EXPECT_FALSE(registry.stats("missing").has_value());
    EXPECT_TRUE(registry.contains("a"));
    EXPECT_FALSE(registry.contains("missing"));
}

TEST(RegistryTest, GlobalCacheShorthand) {
    auto a = cache<std::string, std::string>("registry_test_global");
    a->add("k", "v", 0ms);

    std::shared_ptr<CacheTable<std::string, std::string>> b;
    std::thread t([&b]() { b = cache<std::string, std::string>("registry_test_global"); });
    t.join();

    EXPECT_EQ(a, b);
    EXPECT_TRUE(b->exists("k"));
    EXPECT_TRUE(CacheRegistry::instance().contains("registry_test_global"));
}

TEST(RegistryTest, TablesOfAnyTypeShareBaseView) {
    CacheRegistry registry;
    auto words = registry.get_or_create<std::string, std::string>("words");
    auto numbers = registry.get_or_create<int, double>("numbers");
    words->add("a", "A", 0ms);
    numbers->add(1, 1.5, 0ms);
    numbers->add(2, 2.5, 0ms);

    std::vector<std::shared_ptr<CacheTableBase>> views{words, numbers};
    EXPECT_EQ(views[0]->name(), "words");
    EXPECT_EQ(views[0]->count(), 1u);
    EXPECT_EQ(views[1]->name(), "numbers");
    EXPECT_EQ(views[1]->stats().entries, 2u);
}
