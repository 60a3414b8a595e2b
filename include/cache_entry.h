#pragma once
#ifndef CACHE_ENTRY_H
#define CACHE_ENTRY_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>

/**
 * A single cached value plus its bookkeeping.
 *
 * - key, value, idle TTL and creation time are fixed at construction
 * - last access time, access count and the evict callback change under the
 *   entry's own lock, independent of the owning table's lock
 *
 * An idle TTL of zero means the entry never expires on idleness.
 */
template <typename K, typename V>
class CacheEntry {
public:
    using clock = std::chrono::steady_clock;
    using EvictCallback = std::function<void(const K&)>;

    /**
     * @param key      Key under which the entry is stored
     * @param value    Cached payload
     * @param idle_ttl How long the entry may stay unread (0 = forever)
     */
    CacheEntry(K key, V value, clock::duration idle_ttl)
        : key_(std::move(key)),
          value_(std::move(value)),
          idle_ttl_(idle_ttl),
          created_at_(clock::now()),
          last_accessed_at_(created_at_) {}

    CacheEntry(const CacheEntry&) = delete;
    CacheEntry& operator=(const CacheEntry&) = delete;

    // ---------------- Immutable accessors ----------------

    const K& key() const { return key_; }
    const V& value() const { return value_; }
    clock::duration idle_ttl() const { return idle_ttl_; }
    clock::time_point created_at() const { return created_at_; }

    // ---------------- Access tracking ----------------

    /**
     * Mark the entry as used now: refreshes the idle clock and bumps the
     * access counter.
     */
    void keep_alive() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto now = clock::now();
        if (now > last_accessed_at_) {
            last_accessed_at_ = now;
        }
        ++access_count_;
    }

    clock::time_point last_accessed_at() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return last_accessed_at_;
    }

    int64_t access_count() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return access_count_;
    }

    // ---------------- Eviction hook ----------------

    /// Replace the callback run with the key right before removal.
    void set_on_evict(EvictCallback f) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        on_evict_ = std::move(f);
    }

    EvictCallback on_evict() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return on_evict_;
    }

    /**
     * Claim the entry for removal. Only the first caller gets true, which
     * keeps the eviction callbacks from running twice when an explicit erase
     * races the expiration sweep.
     */
    bool try_claim_removal() {
        return !removal_claimed_.exchange(true);
    }

private:
    const K key_;
    const V value_;
    const clock::duration idle_ttl_;
    const clock::time_point created_at_;

    mutable std::shared_mutex mutex_;       ///< Protects the fields below
    clock::time_point last_accessed_at_;
    int64_t access_count_{0};
    EvictCallback on_evict_;

    std::atomic<bool> removal_claimed_{false};
};

/**
 * Build a shared entry, typically from inside a load-miss callback.
 */
template <typename K, typename V>
std::shared_ptr<CacheEntry<K, V>> make_entry(K key, V value,
                                             std::chrono::steady_clock::duration idle_ttl) {
    return std::make_shared<CacheEntry<K, V>>(std::move(key), std::move(value), idle_ttl);
}

#endif // CACHE_ENTRY_H
