#include "stream_session_manager.h"
#include "core/logger.h"
#include "protocol/tool_error.h"
#include "scanner/directory_scanner.h"
#include "scanner/directory_walker.h"
#include "utils/session_id.h"
#include <algorithm>

namespace treescout::stream {

    std::string to_string(SessionState state) {
        switch (state) {
            case SessionState::Created:
                return "created";
            case SessionState::Active:
                return "active";
            case SessionState::Exhausted:
                return "exhausted";
            case SessionState::Stopped:
                return "stopped";
        }
        return "created";
    }

    std::optional<SessionState> session_state_from_string(std::string_view text) {
        if (text == "created") return SessionState::Created;
        if (text == "active") return SessionState::Active;
        if (text == "exhausted") return SessionState::Exhausted;
        if (text == "stopped") return SessionState::Stopped;
        return std::nullopt;
    }

    nlohmann::json StreamSession::to_json() const {
        return {
                {"session_id", session_id},
                {"directory", directory},
                {"state", to_string(state)},
                {"batch_size", batch_size},
                {"entries_emitted", cursor.entries_emitted},
                {"filters", options.to_json()}};
    }

    nlohmann::json StreamBatch::to_json() const {
        nlohmann::json items = nlohmann::json::array();
        for (const auto &entry: entries) {
            items.push_back(entry.to_json());
        }
        nlohmann::json j = {
                {"session_id", session_id},
                {"directory", directory},
                {"state", to_string(state)},
                {"entries", std::move(items)},
                {"offset", offset},
                {"returned", entries.size()},
                {"has_more", has_more()},
                {"complete", complete},
                {"partial", partial()}};
        if (next_offset) {
            j["next_offset"] = *next_offset;
        }
        if (partial()) {
            j["partial_reason"] = scanner::to_string(partial_reason);
        }
        return j;
    }

    StreamSessionManager::StreamSessionManager(StreamConfig config, scanner::MemoryProbe probe, scanner::SteadyClock clock)
        : config_(std::move(config)),
          probe_(probe ? std::move(probe) : scanner::default_memory_probe()),
          clock_(clock ? std::move(clock) : scanner::default_clock()) {
        if (config_.batch_size == 0) {
            config_.batch_size = 1;
        }
    }

    StreamBatch StreamSessionManager::start(const std::string &directory,
                                            const scanner::ScanOptions &options,
                                            std::optional<std::size_t> batch_size) {
        collect_idle();

        StreamSession session;
        do {
            session.session_id = utils::generate_session_id();
        } while (sessions_.count(session.session_id) != 0);
        session.directory = scanner::canonical_root(directory).string();
        session.options = options;
        session.options.normalize();
        session.batch_size = std::max<std::size_t>(batch_size.value_or(config_.batch_size), 1);
        session.created_at = clock_();
        session.last_access_at = session.created_at;

        // throws ResourceError before the session is registered
        StreamBatch batch = advance(session);
        session.state = SessionState::Active;
        batch.state = session.state;

        if (config_.max_sessions > 0) {
            while (sessions_.size() >= config_.max_sessions) {
                evict_least_recent();
            }
        }

        TREESCOUT_INFO("Stream {} started on '{}' (batch size {})",
                       session.session_id, session.directory, session.batch_size);
        sessions_.emplace(session.session_id, std::move(session));
        return batch;
    }

    StreamBatch StreamSessionManager::next(const std::string &session_id) {
        collect_idle();
        StreamSession &session = find(session_id);
        session.last_access_at = clock_();

        if (session.state == SessionState::Exhausted) {
            StreamBatch batch;
            batch.session_id = session.session_id;
            batch.directory = session.directory;
            batch.state = session.state;
            batch.offset = session.cursor.entries_emitted;
            batch.complete = true;
            return batch;
        }

        StreamBatch batch = advance(session);
        if (batch.entries.empty() && !batch.partial()) {
            session.state = SessionState::Exhausted;
            batch.complete = true;
            TREESCOUT_DEBUG("Stream {} exhausted after {} entries", session_id, session.cursor.entries_emitted);
        } else {
            session.state = SessionState::Active;
        }
        batch.state = session.state;
        return batch;
    }

    StreamSession StreamSessionManager::stop(const std::string &session_id) {
        collect_idle();
        StreamSession session = std::move(find(session_id));
        sessions_.erase(session_id);
        session.state = SessionState::Stopped;
        TREESCOUT_INFO("Stream {} stopped after {} entries", session_id, session.cursor.entries_emitted);
        return session;
    }

    std::size_t StreamSessionManager::collect_idle() {
        if (config_.idle_timeout.count() <= 0) {
            return 0;
        }
        auto now = clock_();
        std::size_t removed = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (now - it->second.last_access_at > config_.idle_timeout) {
                TREESCOUT_DEBUG("Stream {} expired after idling", it->first);
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::optional<SessionState> StreamSessionManager::state_of(const std::string &session_id) const {
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second.state;
    }

    StreamSession &StreamSessionManager::find(const std::string &session_id) {
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            throw protocol::SessionNotFoundError(session_id);
        }
        return it->second;
    }

    void StreamSessionManager::evict_least_recent() {
        auto oldest = std::min_element(sessions_.begin(), sessions_.end(),
                                       [](const auto &a, const auto &b) {
                                           return a.second.last_access_at < b.second.last_access_at;
                                       });
        if (oldest == sessions_.end()) {
            return;
        }
        TREESCOUT_WARN("Session table full, evicting stream {}", oldest->first);
        sessions_.erase(oldest);
    }

    StreamBatch StreamSessionManager::advance(StreamSession &session) {
        StreamBatch batch;
        batch.session_id = session.session_id;
        batch.directory = session.directory;
        batch.offset = session.cursor.entries_emitted;

        scanner::ScanBudget budget(config_.limits, probe_, clock_);
        scanner::DirectoryWalker walker(session.directory, session.options);

        if (session.cursor.entries_emitted > 0) {
            std::optional<scanner::PartialReason> skip_breach;
            auto skipped = walker.skip(session.cursor.entries_emitted, [&budget, &skip_breach] {
                skip_breach = budget.on_skip();
                return skip_breach.has_value();
            });
            if (skipped.stopped) {
                // cursor unchanged; no next_offset so the caller cannot spin on an empty batch
                batch.partial_reason = *skip_breach;
                TREESCOUT_WARN("Stream {}: {} ceiling reached while resuming at entry {}",
                               session.session_id, scanner::to_string(batch.partial_reason),
                               session.cursor.entries_emitted);
                return batch;
            }
            if (skipped.skipped != session.cursor.entries_emitted || skipped.last_path != session.cursor.last_path) {
                TREESCOUT_WARN("Stream {}: '{}' changed since the previous batch, resuming at entry {}",
                               session.session_id, session.directory, session.cursor.entries_emitted);
            }
        }

        while (batch.entries.size() < session.batch_size) {
            auto entry = walker.next();
            if (!entry) {
                break;
            }
            // the first entry is always admitted so every batch moves the cursor
            if (auto reason = budget.on_entry(); reason && !batch.entries.empty()) {
                batch.partial_reason = *reason;
                break;
            }
            batch.entries.push_back(std::move(*entry));
        }

        // batches are far shorter than the check interval, so sample once more here
        if (!batch.partial() && !batch.entries.empty()) {
            if (auto reason = budget.check_now()) {
                batch.partial_reason = *reason;
            }
        }

        bool more = !batch.entries.empty() &&
                    (batch.partial() || (batch.entries.size() == session.batch_size && walker.next().has_value()));
        if (more) {
            batch.next_offset = batch.offset + batch.entries.size();
        }

        if (!batch.entries.empty()) {
            session.cursor.entries_emitted += batch.entries.size();
            session.cursor.last_path = batch.entries.back().path;
        }
        return batch;
    }

}// namespace treescout::stream
