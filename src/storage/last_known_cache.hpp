// File: src/storage/last_known_cache.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace kte {

/// LastKnownCache: Bounded memory of the last value read for each key
///
/// Holds the most recent successful store read so that a later read that
/// times out can fall back to it. Least recently remembered entries are
/// evicted first. Thread-safe with mutex protection.
///
/// @tparam Key Key type (must be hashable)
/// @tparam Value Value type (must be copyable)
template<typename Key, typename Value>
class LastKnownCache {
public:
    struct Stats {
        size_t entries{0};
        size_t capacity{0};
        uint64_t recalls{0};   // Recall() served from memory
        uint64_t misses{0};
        uint64_t evictions{0};
    };

    explicit LastKnownCache(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
    }

    /// Record the latest value of a key
    void Remember(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = value;
            order_.splice(order_.begin(), order_, it->second);
            return;
        }

        if (order_.size() >= capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        order_.emplace_front(key, value);
        index_[key] = order_.begin();
    }

    /// Last value remembered for a key
    std::optional<Value> Recall(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        recalls_.fetch_add(1, std::memory_order_relaxed);
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    bool Forget(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.clear();
        index_.clear();
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_.size();
    }

    size_t Capacity() const { return capacity_; }

    Stats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Stats stats;
        stats.entries = order_.size();
        stats.capacity = capacity_;
        stats.recalls = recalls_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        return stats;
    }

private:
    using Entry = std::pair<Key, Value>;

    size_t capacity_;

    // Front = most recently remembered or recalled
    std::list<Entry> order_;
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> recalls_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace kte
