#pragma once
#ifndef REGISTRY_H
#define REGISTRY_H

#include "cache_errors.h"
#include "cache_table.h"
#include "cache_table_base.h"
#include "table_stats.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Process-wide directory of cache tables.
 *
 * Starts empty. A table is created the first time its name is requested and
 * stays registered for the lifetime of the registry; there is no removal.
 * A single mutex guarantees one table per name under concurrent first access.
 */
class CacheRegistry {
public:
    CacheRegistry() = default;

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    /**
     * @return The registry shared by the whole process
     */
    static CacheRegistry& instance();

    /**
     * Return the table named name, creating an empty one if needed.
     * @throws TableTypeMismatchError if name is bound to another K/V pair
     */
    template <typename K, typename V>
    std::shared_ptr<CacheTable<K, V>> get_or_create(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(name);
        if (it != tables_.end()) {
            auto table = std::dynamic_pointer_cast<CacheTable<K, V>>(it->second);
            if (!table) {
                throw TableTypeMismatchError(name);
            }
            return table;
        }

        auto table = std::make_shared<CacheTable<K, V>>(name);
        tables_.emplace(name, table);
        return table;
    }

    bool contains(const std::string& name) const;

    /// Registered table names in lexical order.
    std::vector<std::string> table_names() const;

    /// Stats of every table in lexical name order.
    std::vector<TableStats> stats() const;

    /// Stats of one table, empty if name is unknown.
    std::optional<TableStats> stats(const std::string& name) const;

private:
    mutable std::mutex mutex_;                                       ///< Protects tables_
    std::map<std::string, std::shared_ptr<CacheTableBase>> tables_;  ///< name -> table
};

/**
 * Shorthand for CacheRegistry::instance().get_or_create<K, V>(name).
 */
template <typename K, typename V>
std::shared_ptr<CacheTable<K, V>> cache(const std::string& name) {
    return CacheRegistry::instance().get_or_create<K, V>(name);
}

#endif // REGISTRY_H
