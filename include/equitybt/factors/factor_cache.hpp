// factor_cache.hpp
// In-process factor panel cache shared between concurrent runs
// Reader/writer locked index over immutable panels, with TTL and size-bounded eviction

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include "../core/exceptions.hpp"
#include "../interfaces/factor_cache.hpp"

namespace equitybt {

// ============================================================================
// In-Memory Factor Cache
// ============================================================================

class InMemoryFactorCache : public IFactorCache {
public:
    using Clock = std::chrono::steady_clock;

    struct CacheConfig {
        std::chrono::seconds ttl;  // zero disables expiry
        size_t max_entries;        // zero means unbounded

        CacheConfig()
            : ttl(std::chrono::hours(1))
            , max_entries(4096) {}

        static CacheConfig getDefault() {
            return CacheConfig();
        }
    };

private:
    struct Entry {
        std::shared_ptr<const FactorPanel> panel;
        Clock::time_point stored_at;
        uint64_t sequence;
    };

    CacheConfig config_;
    std::function<Clock::time_point()> now_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<uint64_t, std::string> insertion_order_;
    uint64_t next_sequence_ = 0;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> puts_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};

    bool isExpired(const Entry& entry, Clock::time_point now) const {
        return config_.ttl.count() > 0 && now - entry.stored_at >= config_.ttl;
    }

    // Caller holds the unique lock
    void eraseEntry(std::map<std::string, Entry>::iterator it) {
        insertion_order_.erase(it->second.sequence);
        entries_.erase(it);
    }

    void purgeExpiredLocked(Clock::time_point now) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto current = it++;
            if (isExpired(current->second, now)) {
                eraseEntry(current);
                expirations_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

public:
    InMemoryFactorCache()
        : config_(CacheConfig::getDefault())
        , now_([] { return Clock::now(); }) {}

    explicit InMemoryFactorCache(const CacheConfig& config,
                                 std::function<Clock::time_point()> now = [] { return Clock::now(); })
        : config_(config)
        , now_(std::move(now)) {}

    std::shared_ptr<const FactorPanel> get(const FactorCacheKey& key) override {
        const std::string k = key.toString();
        const auto now = now_();

        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(k);
        if (it == entries_.end() || isExpired(it->second, now)) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second.panel;
    }

    // Last writer wins; readers holding the previous panel keep it alive
    void put(const FactorCacheKey& key, std::shared_ptr<const FactorPanel> panel) override {
        if (!panel) throw CacheException("refusing to store an empty panel for " + key.toString());
        const std::string k = key.toString();
        const auto now = now_();

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto existing = entries_.find(k);
        if (existing != entries_.end()) eraseEntry(existing);

        const uint64_t seq = next_sequence_++;
        entries_[k] = Entry{std::move(panel), now, seq};
        insertion_order_[seq] = k;
        puts_.fetch_add(1, std::memory_order_relaxed);

        if (config_.max_entries > 0 && entries_.size() > config_.max_entries) {
            purgeExpiredLocked(now);
        }
        while (config_.max_entries > 0 && entries_.size() > config_.max_entries) {
            auto oldest = entries_.find(insertion_order_.begin()->second);
            eraseEntry(oldest);
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void purgeExpired() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        purgeExpiredLocked(now_());
    }

    void clear() override {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries_.clear();
        insertion_order_.clear();
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    CacheStats getStats() const override {
        CacheStats stats;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.puts = puts_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        stats.expirations = expirations_.load(std::memory_order_relaxed);
        stats.entries = size();
        return stats;
    }
};

} // namespace equitybt
