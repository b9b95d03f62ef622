// src/cache/listing_cache.h
#pragma once

#include "LRUCache.hpp"
#include "scanner/directory_scanner.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace treescout::cache {

    using ListingPtr = std::shared_ptr<const scanner::Listing>;

    /**
     * @brief Read-through cache of complete listings.
     *
     * Keyed by (root, filters, sort); offset and limit are not part of the key
     * because every page is sliced from the same stored Listing. Partial
     * listings are never stored.
     */
    class ListingCache {
    public:
        using ScanFn = std::function<scanner::Listing()>;

        ListingCache(size_t capacity,
                     std::chrono::milliseconds ttl,
                     datastructures::LRUCache<std::string, ListingPtr>::clock_fn clock = nullptr);

        /**
         * @brief Deterministic key: 16 hex digits of a 64-bit FNV-1a hash over
         *        the canonical root, the normalised options and the sort spec.
         */
        static std::string make_key(const std::string &directory,
                                    const scanner::ScanOptions &options,
                                    const scanner::SortSpec &sort);

        ListingPtr get(const std::string &key);
        void put(const std::string &key, ListingPtr listing);

        /**
         * @brief Return the cached listing for key, or run scan and store its
         *        result. use_cache=false skips the lookup but still refreshes
         *        the entry.
         * @param hit Set to whether the result came from the cache
         */
        ListingPtr get_or_scan(const std::string &key, bool use_cache, const ScanFn &scan, bool *hit = nullptr);

        size_t size() const { return cache_.Size(); }
        size_t capacity() const { return cache_.Capacity(); }
        size_t hits() const { return hits_; }
        size_t misses() const { return misses_; }

        void clear() { cache_.Clear(); }

    private:
        datastructures::LRUCache<std::string, ListingPtr> cache_;
        size_t hits_ = 0;
        size_t misses_ = 0;
    };

}// namespace treescout::cache
