#pragma once
#ifndef CACHE_TABLE_BASE_H
#define CACHE_TABLE_BASE_H

#include "table_stats.h"

#include <cstddef>
#include <string>

/**
 * Type independent view of a cache table, used by the registry.
 */
class CacheTableBase {
public:
    virtual ~CacheTableBase() = default;

    virtual const std::string& name() const = 0;
    virtual size_t count() const = 0;
    virtual TableStats stats() const = 0;
};

#endif // CACHE_TABLE_BASE_H
