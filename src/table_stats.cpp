#include "table_stats.h"

#include <sstream>

using json = nlohmann::json;

void to_json(json& j, const TableStats& stats) {
    j = json{
        {"name", stats.name},
        {"entries", stats.entries},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"loads", stats.loads},
        {"expirations", stats.expirations},
        {"deletions", stats.deletions},
    };
    if (stats.next_sweep_ms.has_value()) {
        j["next_sweep_ms"] = *stats.next_sweep_ms;
    } else {
        j["next_sweep_ms"] = nullptr;
    }
}

namespace {

template <typename Getter>
void write_family(std::ostringstream& ss, const std::vector<TableStats>& tables,
                  const char* metric, const char* type, const char* help, Getter get) {
    ss << "# HELP " << metric << " " << help << "\n";
    ss << "# TYPE " << metric << " " << type << "\n";
    for (const auto& t : tables) {
        ss << metric << "{table=\"" << t.name << "\"} " << get(t) << "\n";
    }
    ss << "\n";
}

} // namespace

std::string make_prometheus_metrics(const std::vector<TableStats>& tables) {
    std::ostringstream ss;

    ss << "# HELP xscache_tables Number of registered cache tables\n";
    ss << "# TYPE xscache_tables gauge\n";
    ss << "xscache_tables " << tables.size() << "\n\n";

    write_family(ss, tables, "xscache_entries", "gauge",
                 "Number of entries currently stored in the table",
                 [](const TableStats& t) { return static_cast<uint64_t>(t.entries); });
    write_family(ss, tables, "xscache_hits_total", "counter",
                 "Lookups served from the table",
                 [](const TableStats& t) { return t.hits; });
    write_family(ss, tables, "xscache_misses_total", "counter",
                 "Lookups that found no entry and loaded none",
                 [](const TableStats& t) { return t.misses; });
    write_family(ss, tables, "xscache_loads_total", "counter",
                 "Lookups served by the load-miss callback",
                 [](const TableStats& t) { return t.loads; });
    write_family(ss, tables, "xscache_expirations_total", "counter",
                 "Entries removed after their idle TTL elapsed",
                 [](const TableStats& t) { return t.expirations; });
    write_family(ss, tables, "xscache_deletions_total", "counter",
                 "Entries removed explicitly",
                 [](const TableStats& t) { return t.deletions; });

    return ss.str();
}
