#include "protocol/json_rpc.h"
#include "protocol/tool_error.h"
#include "stream/stream_session_manager.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <memory>
#include <set>

using namespace treescout::stream;
using treescout::protocol::ResourceError;
using treescout::protocol::SessionNotFoundError;
using treescout::scanner::ScanOptions;
using treescout::testing::FakeClock;
using treescout::testing::TempTree;

namespace {

    StreamSessionManager make_manager(const FakeClock &clock, StreamConfig config = {}) {
        return StreamSessionManager(config, [] { return std::size_t{0}; }, clock.fn());
    }

    // Each sample reports step bytes more than the previous one
    treescout::scanner::MemoryProbe growing_rss(std::size_t step) {
        auto calls = std::make_shared<std::size_t>(0);
        return [calls, step] { return (*calls)++ * step; };
    }

    constexpr std::size_t kMiB = 1024u * 1024u;

}// namespace

TEST(StreamSessionManagerTest, StreamsThirtyFilesInBatchesOfFive) {
    TempTree tree;
    tree.numbered_files(30);
    FakeClock clock;
    auto manager = make_manager(clock);

    auto first = manager.start(tree.str(), ScanOptions{}, 5);
    EXPECT_EQ(first.entries.size(), 5u);
    EXPECT_TRUE(first.has_more());
    EXPECT_EQ(first.state, SessionState::Active);
    EXPECT_TRUE(treescout::utils::is_session_id(first.session_id));

    std::set<std::string> seen;
    for (const auto &e: first.entries) {
        seen.insert(e.path);
    }

    for (int i = 0; i < 5; ++i) {
        auto batch = manager.next(first.session_id);
        EXPECT_EQ(batch.entries.size(), 5u);
        EXPECT_EQ(batch.offset, 5u * (i + 1));
        EXPECT_EQ(batch.has_more(), i < 4);
        EXPECT_FALSE(batch.complete);
        for (const auto &e: batch.entries) {
            EXPECT_TRUE(seen.insert(e.path).second) << e.path << " emitted twice";
        }
    }
    EXPECT_EQ(seen.size(), 30u);

    auto done = manager.next(first.session_id);
    EXPECT_TRUE(done.entries.empty());
    EXPECT_TRUE(done.complete);
    EXPECT_FALSE(done.has_more());
    EXPECT_EQ(done.state, SessionState::Exhausted);
    EXPECT_EQ(manager.state_of(first.session_id), SessionState::Exhausted);

    auto again = manager.next(first.session_id);
    EXPECT_TRUE(again.entries.empty());
    EXPECT_TRUE(again.complete);
}

TEST(StreamSessionManagerTest, BatchesFollowWalkOrder) {
    TempTree tree;
    tree.numbered_files(4);
    FakeClock clock;
    auto manager = make_manager(clock);

    auto first = manager.start(tree.str(), ScanOptions{}, 3);
    ASSERT_EQ(first.entries.size(), 3u);
    EXPECT_EQ(first.entries[0].path, "f00.txt");
    EXPECT_EQ(first.entries[2].path, "f02.txt");
    EXPECT_EQ(first.next_offset.value_or(0), 3u);

    auto second = manager.next(first.session_id);
    ASSERT_EQ(second.entries.size(), 1u);
    EXPECT_EQ(second.entries[0].path, "f03.txt");
    EXPECT_FALSE(second.has_more());
}

TEST(StreamSessionManagerTest, StopRemovesSession) {
    TempTree tree;
    tree.numbered_files(10);
    FakeClock clock;
    auto manager = make_manager(clock);

    auto first = manager.start(tree.str(), ScanOptions{}, 5);
    auto stopped = manager.stop(first.session_id);
    EXPECT_EQ(stopped.state, SessionState::Stopped);
    EXPECT_EQ(stopped.cursor.entries_emitted, 5u);
    EXPECT_EQ(manager.size(), 0u);

    try {
        manager.next(first.session_id);
        FAIL() << "expected SessionNotFoundError";
    } catch (const SessionNotFoundError &e) {
        EXPECT_EQ(e.code(), treescout::protocol::error_code::SESSION_NOT_FOUND);
    }
    EXPECT_THROW(manager.stop(first.session_id), SessionNotFoundError);
}

TEST(StreamSessionManagerTest, UnknownSessionIsRejected) {
    FakeClock clock;
    auto manager = make_manager(clock);
    EXPECT_THROW(manager.next("0123456789abcdef0123456789abcdef"), SessionNotFoundError);
}

TEST(StreamSessionManagerTest, MissingDirectoryCreatesNoSession) {
    FakeClock clock;
    auto manager = make_manager(clock);
    EXPECT_THROW(manager.start("/no/such/path", ScanOptions{}), ResourceError);
    EXPECT_EQ(manager.size(), 0u);
}

TEST(StreamSessionManagerTest, IdleSessionsExpire) {
    TempTree tree;
    tree.numbered_files(10);
    FakeClock clock;
    StreamConfig config;
    config.idle_timeout = std::chrono::seconds(10);
    auto manager = make_manager(clock, config);

    auto first = manager.start(tree.str(), ScanOptions{}, 2);
    clock.advance(std::chrono::seconds(9));
    EXPECT_NO_THROW(manager.next(first.session_id));

    clock.advance(std::chrono::seconds(11));
    EXPECT_THROW(manager.next(first.session_id), SessionNotFoundError);
    EXPECT_EQ(manager.size(), 0u);
}

TEST(StreamSessionManagerTest, FullTableEvictsLeastRecentlyUsed) {
    TempTree tree;
    tree.numbered_files(3);
    FakeClock clock;
    StreamConfig config;
    config.max_sessions = 2;
    auto manager = make_manager(clock, config);

    auto a = manager.start(tree.str(), ScanOptions{}, 1);
    clock.advance(std::chrono::seconds(1));
    auto b = manager.start(tree.str(), ScanOptions{}, 1);
    clock.advance(std::chrono::seconds(1));
    manager.next(a.session_id);
    clock.advance(std::chrono::seconds(1));
    auto c = manager.start(tree.str(), ScanOptions{}, 1);

    EXPECT_EQ(manager.size(), 2u);
    EXPECT_TRUE(manager.state_of(a.session_id).has_value());
    EXPECT_FALSE(manager.state_of(b.session_id).has_value());
    EXPECT_TRUE(manager.state_of(c.session_id).has_value());
}

TEST(StreamSessionManagerTest, StateNamesRoundTrip) {
    for (auto state: {SessionState::Created, SessionState::Active, SessionState::Exhausted, SessionState::Stopped}) {
        EXPECT_EQ(session_state_from_string(to_string(state)), state);
    }
    EXPECT_FALSE(session_state_from_string("paused").has_value());
}

TEST(StreamSessionManagerTest, MemoryCeilingIsSampledOncePerBatch) {
    TempTree tree;
    tree.numbered_files(12);
    FakeClock clock;
    // default check interval is far larger than any batch
    StreamSessionManager manager(StreamConfig{}, growing_rss(100 * kMiB), clock.fn());

    auto first = manager.start(tree.str(), ScanOptions{}, 5);
    EXPECT_EQ(first.entries.size(), 5u);
    EXPECT_TRUE(first.partial());
    EXPECT_EQ(first.partial_reason, treescout::scanner::PartialReason::Memory);
    EXPECT_EQ(first.next_offset.value_or(0), 5u);
    EXPECT_EQ(first.to_json()["partial_reason"], "memory");
}

TEST(StreamSessionManagerTest, BreachedCeilingStillMakesProgress) {
    TempTree tree;
    tree.numbered_files(10);
    FakeClock clock;
    StreamConfig config;
    config.limits.memory_ceiling_bytes = 1;
    config.limits.check_interval = 1;
    StreamSessionManager manager(config, growing_rss(kMiB), clock.fn());

    auto batch = manager.start(tree.str(), ScanOptions{}, 5);
    ASSERT_EQ(batch.entries.size(), 1u);
    EXPECT_TRUE(batch.partial());
    EXPECT_TRUE(batch.has_more());

    std::set<std::string> seen{batch.entries[0].path};
    std::size_t last_offset = batch.offset;
    int calls = 0;
    while (!batch.complete && calls++ < 30) {
        batch = manager.next(batch.session_id);
        if (batch.complete) {
            break;
        }
        ASSERT_FALSE(batch.entries.empty()) << "stalled at offset " << batch.offset;
        EXPECT_GT(batch.offset, last_offset);
        last_offset = batch.offset;
        for (const auto &e: batch.entries) {
            EXPECT_TRUE(seen.insert(e.path).second) << e.path << " emitted twice";
        }
    }
    EXPECT_TRUE(batch.complete);
    EXPECT_EQ(seen.size(), 10u);
}

TEST(StreamSessionManagerTest, ResumeIsBoundedByTimeCeiling) {
    TempTree tree;
    tree.numbered_files(10);
    auto now = std::make_shared<std::chrono::steady_clock::time_point>();
    auto step = std::make_shared<std::chrono::steady_clock::duration>(std::chrono::steady_clock::duration::zero());
    auto clock = [now, step] {
        *now += *step;
        return *now;
    };
    StreamConfig config;
    config.limits.time_budget = std::chrono::milliseconds(5);
    StreamSessionManager manager(config, [] { return std::size_t{0}; }, clock);

    auto first = manager.start(tree.str(), ScanOptions{}, 2);
    ASSERT_EQ(first.entries.size(), 2u);

    // every clock reading now costs a second
    *step = std::chrono::seconds(1);
    auto stalled = manager.next(first.session_id);
    EXPECT_TRUE(stalled.entries.empty());
    EXPECT_EQ(stalled.partial_reason, treescout::scanner::PartialReason::Time);
    EXPECT_FALSE(stalled.has_more());
    EXPECT_FALSE(stalled.complete);
    EXPECT_EQ(stalled.offset, 2u);
    EXPECT_EQ(manager.state_of(first.session_id), SessionState::Active);

    *step = std::chrono::steady_clock::duration::zero();
    auto resumed = manager.next(first.session_id);
    ASSERT_EQ(resumed.entries.size(), 2u);
    EXPECT_EQ(resumed.offset, 2u);
    EXPECT_EQ(resumed.entries[0].path, "f02.txt");
}
