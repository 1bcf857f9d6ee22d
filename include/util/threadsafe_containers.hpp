// Copyright (c) 2025 The Watchtower developers
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace watchtower {
namespace util {

/**
 * ThreadSafeMap - Thread-safe wrapper around std::map or std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<std::string, uint256, std::map> tips_;
 *   tips_.Insert("watcher", hash);
 *
 *   uint256 tip;
 *   tips_.Read("watcher", [&](const uint256& h) { tip = h; });
 *
 * Design decisions:
 * - All operations are atomic (single lock per operation)
 * - Read() uses a callback to avoid copies and keep the lock scoped
 * - No iterator-based API to avoid lock lifetime issues
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert or update a key-value pair
     * Returns true if inserted, false if updated
     */
    bool Insert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = map_.insert_or_assign(key, value);
        return inserted;
    }

    /**
     * Read value by key with a callback
     * Calls reader(const Value&) under lock if key exists
     * Returns true if key exists and was read, false otherwise
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            reader(it->second);
            return true;
        }
        return false;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.clear();
    }

    /**
     * Get snapshot of all entries
     * Returns vector of key-value pairs (safe to iterate without lock)
     */
    std::vector<std::pair<Key, Value>> GetAll() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::pair<Key, Value>>(map_.begin(), map_.end());
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

/**
 * ThreadSafeQueue - Unbounded blocking FIFO
 *
 * Purpose:
 * - Hand-off buffer between producer threads and a single consumer
 * - Preserves the global order in which Push() calls acquired the lock,
 *   across any number of producers
 *
 * Usage:
 *   ThreadSafeQueue<uint256> pending;
 *   pending.Push(hash);                                    // producer
 *   auto next = pending.WaitAndPop(std::chrono::milliseconds(100));  // consumer
 *   if (next) { ... }
 *
 * WaitAndPop() returns std::nullopt on timeout, which lets consumer loops
 * re-check their own stop condition at a bounded interval.
 */
template <typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue(ThreadSafeQueue&&) = delete;
    ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

    void Push(const T& value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(value);
        }
        cv_.notify_one();
    }

    /**
     * Pop the front element, waiting up to `timeout` for one to arrive
     * A zero timeout never blocks
     */
    template <typename Rep, typename Period>
    std::optional<T> WaitAndPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool Empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
};

} // namespace util
} // namespace watchtower
