#pragma once
#ifndef CACHE_TABLE_H
#define CACHE_TABLE_H

#include "cache_entry.h"
#include "cache_errors.h"
#include "cache_table_base.h"
#include "expiry_timer.h"
#include "logger.h"
#include "table_stats.h"
#include "time_utils.h"

#include <algorithm>
#include <any>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * Named, thread-safe collection of expiring cache entries.
 *
 * - Entries expire after staying unread for their idle TTL (0 = never)
 * - Expiration is driven by a one-shot timer armed for the nearest known
 *   expiry, so the table never polls on a fixed interval
 * - User callbacks always run with the table lock released and may call
 *   back into the same table
 * - A table owned through std::shared_ptr stays alive until a running sweep
 *   returns, even if a callback drops the last outside reference
 *
 * @tparam K Key type, needs std::hash<K> and operator==
 * @tparam V Value type
 */
template <typename K, typename V>
class CacheTable : public CacheTableBase,
                   public std::enable_shared_from_this<CacheTable<K, V>> {
public:
    using clock = std::chrono::steady_clock;
    using Entry = CacheEntry<K, V>;
    using EntryPtr = std::shared_ptr<Entry>;
    using LoaderArgs = std::vector<std::any>;

    using LoadMissCallback = std::function<EntryPtr(const K&, const LoaderArgs&)>;
    using AddCallback = std::function<void(const EntryPtr&)>;
    using DeleteCallback = std::function<void(const EntryPtr&)>;
    using Visitor = std::function<void(const K&, const EntryPtr&)>;

    explicit CacheTable(std::string name)
        : name_(std::move(name)),
          timer_([this]() {
              auto self = this->weak_from_this().lock();   // empty if not shared-owned
              expiration_check();
          }) {}

    /**
     * Destructor - stops the expiration timer, waiting for a running sweep.
     */
    ~CacheTable() override {
        timer_.stop();
    }

    CacheTable(const CacheTable&) = delete;
    CacheTable& operator=(const CacheTable&) = delete;

    // ---------------- Public API ----------------

    /**
     * Insert a new entry, replacing any entry stored under the same key.
     * Fires the add callback and moves the next expiration check earlier if
     * the new entry expires before it.
     * @param key      Key to store under
     * @param value    Value to cache
     * @param idle_ttl Idle time after which the entry expires (0 = never)
     * @return The created entry
     */
    EntryPtr add(const K& key, V value, clock::duration idle_ttl) {
        auto entry = std::make_shared<Entry>(key, std::move(value), idle_ttl);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        add_internal(entry, lock);
        return entry;
    }

    /**
     * Fetch an entry and mark it as accessed.
     *
     * On a miss the load-miss callback, if configured, receives the key and
     * the extra arguments. A loaded entry is stored under key and returned.
     * @throws KeyNotFoundError              no entry and no loader
     * @throws KeyNotFoundOrNotLoadableError the loader returned nullptr
     */
    template <typename... Args>
    EntryPtr get(const K& key, Args&&... args) {
        EntryPtr entry;
        LoadMissCallback loader;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                entry = it->second;
            } else {
                loader = on_load_miss_;
            }
        }

        if (entry) {
            entry->keep_alive();
            hits_++;
            return entry;
        }

        if (!loader) {
            misses_++;
            throw KeyNotFoundError();
        }

        LoaderArgs loader_args{std::any(std::forward<Args>(args))...};
        EntryPtr loaded = loader(key, loader_args);
        if (!loaded) {
            misses_++;
            throw KeyNotFoundOrNotLoadableError();
        }

        add(key, loaded->value(), loaded->idle_ttl());
        loads_++;
        return loaded;
    }

    /**
     * Insert only if key is absent. Check and insert happen in one critical
     * section.
     * @return true if inserted, false if key was already present
     */
    bool not_found_add(const K& key, V value, clock::duration idle_ttl) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (entries_.find(key) != entries_.end()) {
            return false;
        }
        auto entry = std::make_shared<Entry>(key, std::move(value), idle_ttl);
        add_internal(entry, lock);
        return true;
    }

    /**
     * Remove an entry. Runs the table delete callback with the entry, then
     * the entry's own evict callback with the key, then drops it.
     * @return The removed entry
     * @throws KeyNotFoundError if key is absent
     */
    EntryPtr erase(const K& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            throw KeyNotFoundError();
        }
        EntryPtr entry = it->second;
        if (!remove_entry(entry, lock, false)) {
            // Already being removed by another thread
            throw KeyNotFoundError();
        }
        return entry;
    }

    /**
     * Raw presence check. Does not count as an access.
     */
    bool exists(const K& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.find(key) != entries_.end();
    }

    /**
     * @return Current number of entries in the table
     */
    size_t count() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    /**
     * Visit every entry under the read lock. visit must not modify the table.
     */
    void for_each(const Visitor& visit) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& kv : entries_) {
            visit(kv.first, kv.second);
        }
    }

    /**
     * @return Up to n entries ordered by descending access count
     */
    std::vector<EntryPtr> most_accessed(size_t n) const {
        std::vector<std::pair<int64_t, EntryPtr>> ranked;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            ranked.reserve(entries_.size());
            for (const auto& kv : entries_) {
                ranked.emplace_back(kv.second->access_count(), kv.second);
            }
        }

        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        std::vector<EntryPtr> result;
        result.reserve(std::min(n, ranked.size()));
        for (size_t i = 0; i < ranked.size() && i < n; ++i) {
            result.push_back(ranked[i].second);
        }
        return result;
    }

    /**
     * Drop all entries and cancel the pending expiration check.
     * No callbacks are run.
     */
    void flush() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        log("Flushing table", name_);
        entries_.clear();
        cleanup_interval_.reset();
        timer_.cancel();
    }

    // ---------------- Configuration ----------------

    void set_load_miss_callback(LoadMissCallback f) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        on_load_miss_ = std::move(f);
    }

    void set_add_callback(AddCallback f) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        on_add_ = std::move(f);
    }

    void set_delete_callback(DeleteCallback f) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        on_delete_ = std::move(f);
    }

    /// nullptr disables logging.
    void set_logger(std::shared_ptr<Logger> logger) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        logger_ = std::move(logger);
    }

    // ---------------- Introspection ----------------

    const std::string& name() const override { return name_; }

    /// True while an expiration check is pending.
    bool expiration_scheduled() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return timer_.armed();
    }

    TableStats stats() const override {
        TableStats s;
        s.name = name_;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            s.entries = entries_.size();
            if (auto deadline = timer_.deadline()) {
                s.next_sweep_ms = std::max<long long>(0, to_millis(*deadline - clock::now()));
            }
        }
        s.hits = hits_.load();
        s.misses = misses_.load();
        s.loads = loads_.load();
        s.expirations = expirations_.load();
        s.deletions = deletions_.load();
        return s;
    }

private:
    // ---------------- Internal helpers ----------------

    static bool expires(const EntryPtr& entry) {
        return entry->idle_ttl() > clock::duration::zero();
    }

    template <typename... Args>
    void log(const Args&... args) const {
        if (logger_) {
            logger_->print(args...);
        }
    }

    // PRECONDITION: lock holds mutex_ exclusively. Returns with lock released.
    void add_internal(const EntryPtr& entry, std::unique_lock<std::shared_mutex>& lock) {
        log("Adding item with key", entry->key(), "and lifespan of",
            to_millis(entry->idle_ttl()), "ms to table", name_);
        entries_[entry->key()] = entry;

        if (expires(entry)) {
            schedule_check_before(entry->created_at() + entry->idle_ttl());
        }

        AddCallback on_add = on_add_;
        lock.unlock();

        if (on_add) {
            on_add(entry);
        }
    }

    // PRECONDITION: caller holds mutex_ exclusively.
    // Arms the timer for deadline unless an earlier check is already pending.
    void schedule_check_before(clock::time_point deadline) {
        auto pending = timer_.deadline();
        if (pending && *pending <= deadline) {
            return;
        }
        log("Expiration check scheduled in",
            std::max<long long>(0, to_millis(deadline - clock::now())), "ms for table", name_);
        timer_.arm_at(deadline);
    }

    // PRECONDITION: lock holds mutex_ exclusively. Returns with lock held.
    // Runs the delete and evict callbacks with the lock released, then drops
    // entry if it is still the one stored under its key. Returns false when
    // entry is no longer stored (replaced, erased, flushed) or another thread
    // already claimed it.
    bool remove_entry(const EntryPtr& entry, std::unique_lock<std::shared_mutex>& lock, bool expired) {
        auto stored = entries_.find(entry->key());
        if (stored == entries_.end() || stored->second != entry) {
            return false;
        }
        if (!entry->try_claim_removal()) {
            return false;
        }

        DeleteCallback on_delete = on_delete_;
        lock.unlock();

        if (on_delete) {
            on_delete(entry);
        }
        if (auto on_evict = entry->on_evict()) {
            on_evict(entry->key());
        }

        lock.lock();
        log("Deleting item with key", entry->key(), "and hit count",
            entry->access_count(), "from table", name_);
        auto it = entries_.find(entry->key());
        if (it != entries_.end() && it->second == entry) {
            entries_.erase(it);
        }
        if (expired) {
            expirations_++;
        } else {
            deletions_++;
        }
        return true;
    }

    // Timer task: removes idle entries and re-arms for the nearest expiry.
    void expiration_check() {
        std::vector<EntryPtr> candidates;
        std::optional<clock::duration> next_wait;
        clock::time_point now;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (cleanup_interval_) {
                log("Expiration check triggered after", to_millis(*cleanup_interval_),
                    "ms for table", name_);
            } else {
                log("Expiration check installed for table", name_);
            }

            now = clock::now();
            for (const auto& kv : entries_) {
                const EntryPtr& entry = kv.second;
                if (!expires(entry)) {
                    continue;
                }
                auto idle_for = now - entry->last_accessed_at();
                if (idle_for >= entry->idle_ttl()) {
                    candidates.push_back(entry);
                } else {
                    auto remaining = entry->idle_ttl() - idle_for;
                    if (!next_wait || remaining < *next_wait) {
                        next_wait = remaining;
                    }
                }
            }
        }

        // Callbacks of one candidate may replace, erase or flush the next ones;
        // remove_entry skips whatever is no longer stored
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : candidates) {
            // The entry may have been read again since the scan
            auto expiry = entry->last_accessed_at() + entry->idle_ttl();
            if (clock::now() < expiry) {
                auto remaining = expiry - now;
                if (!next_wait || remaining < *next_wait) {
                    next_wait = remaining;
                }
                continue;
            }
            remove_entry(entry, lock, true);
        }

        cleanup_interval_ = next_wait;
        if (next_wait) {
            schedule_check_before(now + *next_wait);
        }
    }

    // ---------------- Data members ----------------
    const std::string name_;

    mutable std::shared_mutex mutex_;                   ///< Protects everything below up to timer_
    std::unordered_map<K, EntryPtr> entries_;           ///< key -> Entry
    std::optional<clock::duration> cleanup_interval_;   ///< Delay of the last re-arm by a sweep

    LoadMissCallback on_load_miss_;
    AddCallback on_add_;
    DeleteCallback on_delete_;
    std::shared_ptr<Logger> logger_;

    // Metrics
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> loads_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> deletions_{0};

    ExpiryTimer timer_;   ///< Declared last: stopped before the members above go away
};

#endif // CACHE_TABLE_H
