// src/business/server_state.h
#pragma once

#include "cache/listing_cache.h"
#include "collaborators/collaborators.h"
#include "metrics/performance_metrics.h"
#include "scanner/directory_scanner.h"
#include "stream/stream_session_manager.h"
#include <chrono>
#include <memory>
#include <string>

namespace treescout::business {

    struct ServerSettings {
        std::string server_name = "treescout";
        scanner::ScanLimits scan_limits;
        size_t cache_capacity = 64;
        std::chrono::milliseconds cache_ttl{300000};
        stream::StreamConfig stream;
    };

    /**
     * @brief Everything a tool call may read or mutate.
     *
     * One instance per server, owned by the request handler and passed by
     * reference into every handler. Handlers run one at a time, so nothing
     * here is locked.
     */
    class ServerState {
    public:
        ServerState(ServerSettings settings,
                    std::shared_ptr<collaborators::UsageRecorder> usage,
                    std::shared_ptr<collaborators::CodeMetrics> code_metrics,
                    std::shared_ptr<collaborators::HealthReporter> health,
                    scanner::MemoryProbe probe = nullptr,
                    scanner::SteadyClock clock = nullptr)
            : settings_(std::move(settings)),
              scanner_(settings_.scan_limits, probe, clock),
              cache_(settings_.cache_capacity, settings_.cache_ttl, clock),
              streams_(settings_.stream, probe, clock),
              usage_(usage ? std::move(usage) : collaborators::make_default_usage_recorder()),
              code_metrics_(code_metrics ? std::move(code_metrics) : collaborators::make_default_code_metrics()),
              health_(health ? std::move(health) : collaborators::make_default_health_reporter()) {}

        /**
         * @brief Sorted listing of directory, served from the cache when
         *        allowed and fresh.
         * @throws protocol::ResourceError if directory cannot be scanned
         */
        cache::ListingPtr listing(const std::string &directory,
                                  const scanner::ScanOptions &options,
                                  const scanner::SortSpec &sort,
                                  bool use_cache,
                                  bool *hit = nullptr) {
            auto key = cache::ListingCache::make_key(directory, options, sort);
            return cache_.get_or_scan(
                    key, use_cache, [&] { return scanner_.scan(directory, options, sort); }, hit);
        }

        const ServerSettings &settings() const { return settings_; }
        scanner::DirectoryScanner &scanner() { return scanner_; }
        cache::ListingCache &cache() { return cache_; }
        stream::StreamSessionManager &streams() { return streams_; }
        collaborators::UsageRecorder &usage() { return *usage_; }
        collaborators::CodeMetrics &code_metrics() { return *code_metrics_; }
        collaborators::HealthReporter &health() { return *health_; }
        metrics::RequestStats &request_stats() { return request_stats_; }

    private:
        ServerSettings settings_;
        scanner::DirectoryScanner scanner_;
        cache::ListingCache cache_;
        stream::StreamSessionManager streams_;
        std::shared_ptr<collaborators::UsageRecorder> usage_;
        std::shared_ptr<collaborators::CodeMetrics> code_metrics_;
        std::shared_ptr<collaborators::HealthReporter> health_;
        metrics::RequestStats request_stats_;
    };

}// namespace treescout::business
