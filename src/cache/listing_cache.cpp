#include "listing_cache.h"
#include "core/logger.h"
#include <cstdint>
#include <cstdio>

namespace treescout::cache {

    namespace {

        constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
        constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

        void fnv1a(std::uint64_t &hash, const std::string &text) {
            for (unsigned char c: text) {
                hash ^= c;
                hash *= kFnvPrime;
            }
            // field separator so ("ab","c") and ("a","bc") differ
            hash ^= 0xffu;
            hash *= kFnvPrime;
        }

    }// namespace

    ListingCache::ListingCache(size_t capacity,
                               std::chrono::milliseconds ttl,
                               datastructures::LRUCache<std::string, ListingPtr>::clock_fn clock)
        : cache_(capacity, ttl, std::move(clock)) {
    }

    std::string ListingCache::make_key(const std::string &directory,
                                       const scanner::ScanOptions &options,
                                       const scanner::SortSpec &sort) {
        scanner::ScanOptions normalized = options;
        normalized.normalize();

        std::uint64_t hash = kFnvOffsetBasis;
        fnv1a(hash, scanner::canonical_root(directory).string());
        fnv1a(hash, std::to_string(normalized.max_depth));
        fnv1a(hash, normalized.include_hidden ? "1" : "0");
        fnv1a(hash, normalized.files_only ? "1" : "0");
        for (const auto &ext: normalized.extensions) {
            fnv1a(hash, ext);
        }
        fnv1a(hash, "|");
        fnv1a(hash, scanner::to_string(sort.key));
        fnv1a(hash, scanner::to_string(sort.order));

        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
        return std::string(buf);
    }

    ListingPtr ListingCache::get(const std::string &key) {
        auto value = cache_.Get(key);
        if (!value) {
            return nullptr;
        }
        return *value;
    }

    void ListingCache::put(const std::string &key, ListingPtr listing) {
        if (!listing || listing->partial()) {
            return;
        }
        cache_.Put(key, listing);
    }

    ListingPtr ListingCache::get_or_scan(const std::string &key, bool use_cache, const ScanFn &scan, bool *hit) {
        if (use_cache) {
            if (auto cached = get(key)) {
                ++hits_;
                if (hit) *hit = true;
                TREESCOUT_DEBUG("Listing cache hit: {}", key);
                return cached;
            }
        }

        ++misses_;
        if (hit) *hit = false;
        auto listing = std::make_shared<const scanner::Listing>(scan());
        put(key, listing);
        TREESCOUT_DEBUG("Listing cache {}: {} ({} entries cached)", use_cache ? "miss" : "bypass", key, cache_.Size());
        return listing;
    }

}// namespace treescout::cache
