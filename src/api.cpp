#include "api.h"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

CacheAPI::CacheAPI(CacheRegistry& registry, std::shared_ptr<Logger> logger)
    : registry_(registry), logger_(std::move(logger)) {}

void CacheAPI::logRequest(const std::string& method, const std::string& path, int status) {
    if (logger_) {
        logger_->print(method, path, "->", status);
    }
}

void CacheAPI::start(const std::string& host, int port) {
    server_.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });

    // GET /metrics
    server_.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        auto body = make_prometheus_metrics(registry_.stats());
        res.set_content(body, "text/plain; version=0.0.4; charset=utf-8");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });

    // GET /tables
    server_.Get("/tables", [this](const httplib::Request& req, httplib::Response& res) {
        json j = {{"tables", registry_.table_names()}};
        res.set_content(j.dump(), "application/json");
        res.status = 200;
        logRequest("GET", req.path, res.status);
    });

    // GET /tables/<name>
    server_.Get(R"(/tables/([\w.-]+))", [this](const httplib::Request& req, httplib::Response& res) {
        std::string name = req.matches[1];
        auto stats = registry_.stats(name);
        if (stats.has_value()) {
            json j = *stats;
            res.set_content(j.dump(), "application/json");
            res.status = 200;
        } else {
            res.status = 404;
            res.set_content(R"({"error": "table not found"})", "application/json");
        }
        logRequest("GET", req.path, res.status);
    });

    if (logger_) {
        logger_->print("Starting admin API on", host + ":" + std::to_string(port));
    }

    if (!server_.bind_to_port(host.c_str(), port)) {
        throw std::runtime_error("Failed to bind server to port " + std::to_string(port));
    }

    server_.listen_after_bind();
}

void CacheAPI::stop() {
    server_.stop();
}
