#include "registry.h"

CacheRegistry& CacheRegistry::instance() {
    static CacheRegistry registry;
    return registry;
}

bool CacheRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_.find(name) != tables_.end();
}

std::vector<std::string> CacheRegistry::table_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& kv : tables_) {
        names.push_back(kv.first);
    }
    return names;
}

std::vector<TableStats> CacheRegistry::stats() const {
    // Copy the handles first so table locks are never taken under mutex_
    std::vector<std::shared_ptr<CacheTableBase>> tables;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tables.reserve(tables_.size());
        for (const auto& kv : tables_) {
            tables.push_back(kv.second);
        }
    }

    std::vector<TableStats> result;
    result.reserve(tables.size());
    for (const auto& table : tables) {
        result.push_back(table->stats());
    }
    return result;
}

std::optional<TableStats> CacheRegistry::stats(const std::string& name) const {
    std::shared_ptr<CacheTableBase> table;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(name);
        if (it == tables_.end()) {
            return std::nullopt;
        }
        table = it->second;
    }
    return table->stats();
}
