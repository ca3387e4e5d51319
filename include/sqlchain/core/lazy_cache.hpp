#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqlchain::core {

// Keyed cache whose values are computed at most once. The first caller for a
// key runs the factory outside the lock; concurrent callers for the same key
// block on the pending result. A factory that throws leaves no entry behind,
// so waiting callers observe the failure and the next caller retries.
template <typename Key, typename Value, typename Hash = std::hash<Key>, typename KeyEqual = std::equal_to<Key>>
class LazyCache final {
public:
    struct Stats final {
        std::uint64_t hits = 0U;
        std::uint64_t misses = 0U;
        std::uint64_t failures = 0U;
        std::size_t entries = 0U;
    };

    LazyCache() = default;
    LazyCache(const LazyCache&) = delete;
    LazyCache& operator=(const LazyCache&) = delete;

    template <typename Factory>
    [[nodiscard]] Value get_or_create(const Key& key, Factory&& factory)
    {
        std::optional<std::promise<Value>> promise;
        std::shared_future<Value> pending;

        {
            std::lock_guard guard(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                hits_.fetch_add(1U, std::memory_order_relaxed);
                pending = it->second;
            } else {
                misses_.fetch_add(1U, std::memory_order_relaxed);
                promise.emplace();
                pending = promise->get_future().share();
                entries_.emplace(key, pending);
            }
        }

        if (!promise) {
            return pending.get();
        }

        try {
            promise->set_value(std::forward<Factory>(factory)(key));
        } catch (...) {
            failures_.fetch_add(1U, std::memory_order_relaxed);
            {
                std::lock_guard guard(mutex_);
                entries_.erase(key);
            }
            promise->set_exception(std::current_exception());
            throw;
        }
        return pending.get();
    }

    // Completed values only; entries still being computed are skipped.
    [[nodiscard]] std::vector<Value> completed_values() const
    {
        std::vector<Value> values;
        std::lock_guard guard(mutex_);
        values.reserve(entries_.size());
        for (const auto& [_, pending] : entries_) {
            if (pending.wait_for(std::chrono::seconds{0}) == std::future_status::ready) {
                values.push_back(pending.get());
            }
        }
        return values;
    }

    void clear()
    {
        std::lock_guard guard(mutex_);
        entries_.clear();
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard guard(mutex_);
        return entries_.size();
    }

    [[nodiscard]] Stats stats() const
    {
        Stats stats{};
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.failures = failures_.load(std::memory_order_relaxed);
        stats.entries = size();
        return stats;
    }

private:
    mutable std::mutex mutex_{};
    std::unordered_map<Key, std::shared_future<Value>, Hash, KeyEqual> entries_{};
    std::atomic<std::uint64_t> hits_{0U};
    std::atomic<std::uint64_t> misses_{0U};
    std::atomic<std::uint64_t> failures_{0U};
};

}  // namespace sqlchain::core
