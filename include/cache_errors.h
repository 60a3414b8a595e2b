#pragma once
#ifndef CACHE_ERRORS_H
#define CACHE_ERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorCode {
    KeyNotFound,               ///< Key absent and nothing could load it
    KeyNotFoundOrNotLoadable,  ///< Key absent, loader returned no entry
    TableTypeMismatch          ///< Table name already bound to other types
};

/**
 * Base class for every error raised by the cache library.
 */
class CacheError : public std::runtime_error {
public:
    CacheError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class KeyNotFoundError : public CacheError {
public:
    KeyNotFoundError()
        : CacheError(ErrorCode::KeyNotFound, "key not found in cache") {}
};

class KeyNotFoundOrNotLoadableError : public CacheError {
public:
    KeyNotFoundOrNotLoadableError()
        : CacheError(ErrorCode::KeyNotFoundOrNotLoadable,
                     "key not found and could not be loaded into cache") {}
};

class TableTypeMismatchError : public CacheError {
public:
    explicit TableTypeMismatchError(const std::string& table)
        : CacheError(ErrorCode::TableTypeMismatch,
                     "table '" + table + "' exists with different key/value types") {}
};

#endif // CACHE_ERRORS_H
