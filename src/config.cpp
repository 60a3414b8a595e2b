#include "config.h"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

int parse_port(long long port) {
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(port));
    }
    return static_cast<int>(port);
}

unsigned long long parse_unsigned(const std::string& flag, const std::string& text) {
    if (text.empty() || text[0] == '-') {
        throw std::invalid_argument(flag + " expects a non-negative number, got '" + text + "'");
    }
    size_t used = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + text + "'");
    }
    return value;
}

} // namespace

void from_json(const json& j, TableConfig& table) {
    j.at("name").get_to(table.name);
    table.default_ttl_ms = j.value("ttl_ms", uint64_t{0});
    table.preload = j.value("preload", size_t{0});
    if (table.name.empty()) {
        throw std::invalid_argument("table name must not be empty");
    }
}

void apply_json(const json& j, ServerConfig& config) {
    if (j.contains("host")) {
        j.at("host").get_to(config.host);
    }
    if (j.contains("port")) {
        config.port = parse_port(j.at("port").get<long long>());
    }
    if (j.contains("verbose")) {
        j.at("verbose").get_to(config.verbose);
    }
    if (j.contains("tables")) {
        config.tables = j.at("tables").get<std::vector<TableConfig>>();
    }
}

void load_config_file(const std::string& path, ServerConfig& config) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open config file " + path);
    }
    try {
        apply_json(json::parse(in), config);
    } catch (const json::exception& e) {
        throw std::runtime_error("invalid config file " + path + ": " + e.what());
    }
}

ServerConfig parse_args(int argc, char* argv[]) {
    ServerConfig config;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value");
        }
        return argv[++i];
    };
    auto last_table = [&](const std::string& flag) -> TableConfig& {
        if (config.tables.empty()) {
            throw std::invalid_argument(flag + " must follow --table");
        }
        return config.tables.back();
    };

    // --- Parse args ---
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--host") config.host = next_value(i, arg);
        else if (arg == "--port") config.port = parse_port(static_cast<long long>(parse_unsigned(arg, next_value(i, arg))));
        else if (arg == "--config") load_config_file(next_value(i, arg), config);
        else if (arg == "--verbose") config.verbose = true;
        else if (arg == "--table") {
            std::string name = next_value(i, arg);
            if (name.empty()) throw std::invalid_argument("--table requires a non-empty name");
            config.tables.push_back(TableConfig{name});
        }
        else if (arg == "--ttl") last_table(arg).default_ttl_ms = parse_unsigned(arg, next_value(i, arg));
        else if (arg == "--preload") last_table(arg).preload = parse_unsigned(arg, next_value(i, arg));
        else throw std::invalid_argument("unknown argument: " + arg);
    }

    return config;
}
