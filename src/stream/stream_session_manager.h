// src/stream/stream_session_manager.h
#pragma once

#include "scanner/file_entry.h"
#include "scanner/memory_probe.h"
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace treescout::stream {

    /**
     * @brief Session lifecycle: Created -> Active -> (Exhausted | Stopped)
     */
    enum class SessionState {
        Created,
        Active,
        Exhausted,
        Stopped
    };

    std::string to_string(SessionState state);
    std::optional<SessionState> session_state_from_string(std::string_view text);

    /**
     * @brief Where a session resumes. The walk is re-run and this many
     *        entries are skipped; last_path is the entry expected right
     *        before the resume point.
     */
    struct StreamCursor {
        std::size_t entries_emitted = 0;
        std::string last_path;
    };

    struct StreamSession {
        std::string session_id;
        std::string directory;
        scanner::ScanOptions options;
        std::size_t batch_size = 5;
        StreamCursor cursor;
        SessionState state = SessionState::Created;
        std::chrono::steady_clock::time_point created_at;
        std::chrono::steady_clock::time_point last_access_at;

        nlohmann::json to_json() const;
    };

    struct StreamBatch {
        std::string session_id;
        std::string directory;
        SessionState state = SessionState::Active;
        std::vector<scanner::FileEntry> entries;// walk order
        std::size_t offset = 0;
        std::optional<std::size_t> next_offset;
        bool complete = false;
        scanner::PartialReason partial_reason = scanner::PartialReason::None;

        bool has_more() const { return next_offset.has_value(); }
        bool partial() const { return partial_reason != scanner::PartialReason::None; }

        nlohmann::json to_json() const;
    };

    struct StreamConfig {
        std::size_t batch_size = 5;
        std::chrono::seconds idle_timeout{300};
        std::size_t max_sessions = 64;
        scanner::ScanLimits limits{10u * 1024u * 1024u, std::chrono::milliseconds(10000), 200000, 1000};
    };

    /**
     * @brief Owns the session table. Single-threaded; only the dispatch loop
     *        calls into it.
     *
     * Idle sessions are collected at the start of every operation, so an
     * expired id is reported as not found rather than revived.
     */
    class StreamSessionManager {
    public:
        explicit StreamSessionManager(StreamConfig config = {},
                                      scanner::MemoryProbe probe = nullptr,
                                      scanner::SteadyClock clock = nullptr);

        /**
         * @brief Open a session on directory and return its first batch.
         * @param batch_size Entries per batch, config default when nullopt
         * @throws protocol::ResourceError if directory cannot be scanned
         */
        StreamBatch start(const std::string &directory,
                          const scanner::ScanOptions &options,
                          std::optional<std::size_t> batch_size = std::nullopt);

        /**
         * @brief Next batch of an open session.
         *
         * Every non-empty batch advances the cursor. When the time ceiling is
         * reached while re-walking to the cursor, the batch is empty and
         * partial without next_offset, and the session stays open for a retry.
         *
         * @throws protocol::SessionNotFoundError for unknown or expired ids
         */
        StreamBatch next(const std::string &session_id);

        /**
         * @brief Close a session in any state.
         * @return The session as it was, with state Stopped
         * @throws protocol::SessionNotFoundError for unknown or expired ids
         */
        StreamSession stop(const std::string &session_id);

        // Drop sessions idle past the timeout, returns how many were dropped
        std::size_t collect_idle();

        std::size_t size() const { return sessions_.size(); }
        std::optional<SessionState> state_of(const std::string &session_id) const;
        const StreamConfig &config() const { return config_; }

    private:
        StreamSession &find(const std::string &session_id);
        void evict_least_recent();
        StreamBatch advance(StreamSession &session);

        StreamConfig config_;
        scanner::MemoryProbe probe_;
        scanner::SteadyClock clock_;
        std::unordered_map<std::string, StreamSession> sessions_;
    };

}// namespace treescout::stream
