#pragma once
#ifndef TABLE_STATS_H
#define TABLE_STATS_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Point-in-time counters of one cache table.
 */
struct TableStats {
    std::string name;
    size_t entries{0};
    uint64_t hits{0};          ///< get() served from the table
    uint64_t misses{0};        ///< get() that found nothing and loaded nothing
    uint64_t loads{0};         ///< get() served by the load-miss callback
    uint64_t expirations{0};   ///< entries removed by the sweep
    uint64_t deletions{0};     ///< entries removed by erase()
    std::optional<int64_t> next_sweep_ms;  ///< empty when no sweep is pending
};

void to_json(nlohmann::json& j, const TableStats& stats);

/**
 * Render the stats of all tables in the Prometheus text exposition format.
 */
std::string make_prometheus_metrics(const std::vector<TableStats>& tables);

#endif // TABLE_STATS_H
