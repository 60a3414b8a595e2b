#include <gtest/gtest.h>
#include <thread>
#include <nlohmann/json.hpp>
#include <chrono>
#include "../include/registry.h"
#include "../include/api.h"
#include <httplib.h>

using json = nlohmann::json;
using namespace std::chrono_literals;

TEST(ApiTest, TablesAndStats){
    CacheRegistry registry;
    auto users = registry.get_or_create<std::string, std::string>("users");
    users->add("alice", "secret", 0ms);
    users->get("alice");
    registry.get_or_create<std::string, std::string>("sessions");

    CacheAPI api(registry);

    // Run server in background thread
    std::thread server_thread([&api]() {
        api.start("127.0.0.1", 5101);
    });

    // Give server time to start
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    httplib::Client cli("127.0.0.1", 5101);

    // GET /tables
    auto list_res = cli.Get("/tables");
    ASSERT_TRUE(list_res != nullptr);
    EXPECT_EQ(list_res->status, 200);
    json list_json = json::parse(list_res->body);
    EXPECT_EQ(list_json["tables"], json::array({"sessions", "users"}));

    // GET /tables/users
    auto stats_res = cli.Get("/tables/users");
    ASSERT_TRUE(stats_res != nullptr);
    EXPECT_EQ(stats_res->status, 200);
    json stats_json = json::parse(stats_res->body);
    EXPECT_EQ(stats_json["entries"], 1);
    EXPECT_EQ(stats_json["hits"], 1);
    EXPECT_EQ(stats_res->body.find("secret"), std::string::npos); // Values never exposed

    // Unknown table
    auto missing_res = cli.Get("/tables/nope");
    ASSERT_TRUE(missing_res != nullptr);
    EXPECT_EQ(missing_res->status, 404);
    json missing_json = json::parse(missing_res->body);
    EXPECT_EQ(missing_json["error"], "table not found");

    // Check metrics
    auto metrics_res = cli.Get("/metrics");
    ASSERT_TRUE(metrics_res != nullptr);
    EXPECT_EQ(metrics_res->status, 200);
    EXPECT_NE(metrics_res->body.find("xscache_hits_total{table=\"users\"} 1"), std::string::npos);

    // Clean shutdown
    api.stop();
    server_thread.join();
}

TEST(ApiTest, HealthzEndpointRespondsOk) {
    CacheRegistry registry;
    CacheAPI api(registry);

    int port = 5102;
    std::thread server_thread([&]() {
        api.start("127.0.0.1", port);
    });

    // Give server time to bind
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/healthz");

    ASSERT_TRUE(res != nullptr);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("\"status\":\"ok\""), std::string::npos);

    api.stop();
    if (server_thread.joinable()) server_thread.join();
}
