#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace treescout::datastructures {

    /**
     * @brief Capacity-bounded LRU map with an optional per-entry TTL.
     *
     * Not thread-safe. The owner serialises access; in this server that is the
     * single dispatch loop. The clock is injectable so expiry can be tested
     * without sleeping.
     */
    template<typename Key, typename Value>
    class LRUCache {
    public:
        using iterator = typename std::list<std::pair<Key, Value>>::iterator;
        using clock_type = std::chrono::steady_clock;
        using time_point = std::chrono::time_point<clock_type>;
        using clock_fn = std::function<time_point()>;

        explicit LRUCache(size_t capacity,
                          std::chrono::milliseconds ttl = std::chrono::milliseconds::zero(),
                          clock_fn clock = nullptr)
            : capacity_(capacity), ttl_(ttl),
              clock_(clock ? std::move(clock) : clock_fn([] { return clock_type::now(); })) {}

        // Expired entries are dropped on access and reported as misses
        std::optional<Value> Get(const Key &key) {
            auto it = cache_.find(key);
            if (it == cache_.end()) {
                return std::nullopt;
            }

            if (IsExpired(key)) {
                Erase(it);
                return std::nullopt;
            }

            MoveToFront(it);
            return std::make_optional(it->second->second);
        }

        void setCacheCapacity(size_t capacity) {
            capacity_ = capacity;
            if (cache_.size() > capacity_) {
                EvictLRUBatch(cache_.size() - capacity_);
            }
        }

        void Put(const Key &key, const Value &value,
                 std::chrono::milliseconds ttl = std::chrono::milliseconds::zero()) {
            if (capacity_ == 0) {
                Clear();
                return;
            }

            auto it = cache_.find(key);
            if (it != cache_.end()) {
                Erase(it);
            }

            EnsureCapacity(1);

            usage_.emplace_front(key, value);
            cache_[key] = usage_.begin();
            SetExpiration(key, ttl);
        }

        [[nodiscard]] bool Contains(const Key &key) const {
            return cache_.find(key) != cache_.end();
        }

        // Present and not yet expired
        [[nodiscard]] bool HasKey(const Key &key) const {
            return Contains(key) && !IsExpired(key);
        }

        [[nodiscard]] size_t Size() const {
            return cache_.size();
        }

        [[nodiscard]] size_t Capacity() const {
            return capacity_;
        }

        // Most recently used first
        std::vector<Key> GetKeys() const {
            std::vector<Key> keys;
            keys.reserve(usage_.size());
            for (const auto &entry: usage_) {
                keys.emplace_back(entry.first);
            }
            return keys;
        }

        void Clear() {
            usage_.clear();
            cache_.clear();
            expiration_times_.clear();
        }

        bool Remove(const Key &key) {
            auto it = cache_.find(key);
            if (it == cache_.end()) {
                return false;
            }
            Erase(it);
            return true;
        }

        // Drop every expired entry, returns how many were removed
        size_t CleanUpExpiredItems() {
            size_t removed = 0;
            auto now = clock_();
            for (auto it = expiration_times_.begin(); it != expiration_times_.end();) {
                if (it->second <= now) {
                    auto cache_it = cache_.find(it->first);
                    if (cache_it != cache_.end()) {
                        usage_.erase(cache_it->second);
                        cache_.erase(cache_it);
                        ++removed;
                    }
                    it = expiration_times_.erase(it);
                } else {
                    ++it;
                }
            }
            return removed;
        }

    protected:
        void MoveToFront(typename std::unordered_map<Key, iterator>::iterator it) {
            if (usage_.begin() != it->second) {
                usage_.splice(usage_.begin(), usage_, it->second);
                it->second = usage_.begin();
            }
        }

        void Erase(typename std::unordered_map<Key, iterator>::iterator it) {
            expiration_times_.erase(it->first);
            usage_.erase(it->second);
            cache_.erase(it);
        }

        void EvictLRUBatch(size_t count) {
            size_t evict_count = std::min(count, usage_.size());
            for (size_t i = 0; i < evict_count; ++i) {
                const auto &lru_entry = usage_.back();
                cache_.erase(lru_entry.first);
                expiration_times_.erase(lru_entry.first);
                usage_.pop_back();
            }
        }

        void EnsureCapacity(size_t required) {
            if (cache_.size() + required <= capacity_) return;
            EvictLRUBatch(cache_.size() + required - capacity_);
        }

        void SetExpiration(const Key &key, std::chrono::milliseconds ttl) {
            if (ttl.count() > 0) {
                expiration_times_[key] = clock_() + ttl;
            } else if (ttl_.count() > 0) {
                expiration_times_[key] = clock_() + ttl_;
            } else {
                expiration_times_.erase(key);
            }
        }

    private:
        bool IsExpired(const Key &key) const {
            auto exp_it = expiration_times_.find(key);
            if (exp_it != expiration_times_.end()) {
                return exp_it->second <= clock_();
            }
            return false;
        }

        size_t capacity_;
        std::chrono::milliseconds ttl_;
        clock_fn clock_;
        std::unordered_map<Key, time_point> expiration_times_;
        std::list<std::pair<Key, Value>> usage_;
        std::unordered_map<Key, iterator> cache_;
    };

}// namespace treescout::datastructures
