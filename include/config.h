#pragma once
#ifndef CONFIG_H
#define CONFIG_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

/**
 * A table the server creates at startup.
 */
struct TableConfig {
    std::string name;
    uint64_t default_ttl_ms{0};   ///< Idle TTL of preloaded / loaded entries (0 = no expiry)
    size_t preload{0};            ///< Number of entries loaded at startup
};

/**
 * Settings of the xscache_server process.
 */
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{5000};
    bool verbose{false};          ///< Attach a logger to every table
    std::vector<TableConfig> tables;
};

void from_json(const nlohmann::json& j, TableConfig& table);

/**
 * Overlay the fields present in j onto config. Tables in j replace the list.
 * @throws nlohmann::json::exception on wrongly typed fields
 * @throws std::invalid_argument on out of range values
 */
void apply_json(const nlohmann::json& j, ServerConfig& config);

/**
 * Read a JSON config file and overlay it onto config.
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
void load_config_file(const std::string& path, ServerConfig& config);

/**
 * Build the configuration from command line flags:
 *   --host <addr> --port <n> --config <file.json> --verbose
 *   --table <name> [--ttl <ms>] [--preload <n>]
 * --ttl and --preload apply to the most recent --table. Flags are applied in
 * order, so flags after --config override the file.
 * @throws std::invalid_argument on unknown flags, missing or bad values
 */
ServerConfig parse_args(int argc, char* argv[]);

#endif // CONFIG_H
