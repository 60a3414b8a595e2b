#pragma once
#ifndef API_H
#define API_H

#include "logger.h"
#include "registry.h"
#include "httplib.h"
#include <memory>
#include <string>

/**
 * Read-only REST view over the tables of a CacheRegistry.
 *
 * GET /healthz        -> {"status":"ok"}
 * GET /metrics        -> Prometheus text for every table
 * GET /tables         -> {"tables":[names...]}
 * GET /tables/<name>  -> table stats as JSON, 404 if unknown
 *
 * Cached values are never exposed.
 */
class CacheAPI {
public:
    /**
     * Constructor
     * @param registry Registry whose tables are reported, must outlive the API
     * @param logger   Request log sink, nullptr to disable request logging
     */
    explicit CacheAPI(CacheRegistry& registry, std::shared_ptr<Logger> logger = nullptr);

    /**
     * Start the HTTP server. Blocks until stop() is called.
     * @param host Host to bind (default: "0.0.0.0")
     * @param port Port to bind
     * @throws std::runtime_error if the port cannot be bound
     */
    void start(const std::string& host, int port);

    /**
     * Stop a running server, unblocking start().
     */
    void stop();

private:
    /**
     * Log an incoming request with method, path, and status code
     */
    void logRequest(const std::string& method, const std::string& path, int status);

    CacheRegistry& registry_;
    std::shared_ptr<Logger> logger_;
    httplib::Server server_;
};

#endif // API_H
