#include "protocol/tool_error.h"
#include "scanner/directory_scanner.h"
#include "scanner/pagination.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <memory>
#include <optional>

using namespace treescout::scanner;
using treescout::testing::FakeClock;
using treescout::testing::TempTree;

namespace {

    // Each sample reports 1 MiB more than the previous one
    MemoryProbe growing_rss() {
        auto calls = std::make_shared<std::size_t>(0);
        return [calls] { return (*calls)++ * 1024u * 1024u; };
    }

    MemoryProbe flat_rss() {
        return [] { return std::size_t{100}; };
    }

    std::vector<std::string> paths_of(const std::vector<FileEntry> &entries) {
        std::vector<std::string> paths;
        for (const auto &e: entries) {
            paths.push_back(e.path);
        }
        return paths;
    }

}// namespace

TEST(DirectoryScannerTest, TwentyFiveEntriesInPagesOfTen) {
    TempTree tree;
    tree.numbered_files(25);
    DirectoryScanner scanner(ScanLimits{}, flat_rss());
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});
    ASSERT_EQ(listing.entries.size(), 25u);
    EXPECT_FALSE(listing.partial());

    auto first = paginate(listing, 0, 10);
    EXPECT_EQ(first.entries.size(), 10u);
    EXPECT_TRUE(first.has_more());
    EXPECT_EQ(first.next_offset.value_or(0), 10u);

    auto second = paginate(listing, 10, 10);
    EXPECT_EQ(second.entries.size(), 10u);
    EXPECT_EQ(second.next_offset.value_or(0), 20u);

    auto third = paginate(listing, 20, 10);
    EXPECT_EQ(third.entries.size(), 5u);
    EXPECT_FALSE(third.has_more());
    EXPECT_FALSE(third.next_offset.has_value());

    auto j = third.to_json();
    EXPECT_EQ(j["has_more"], false);
    EXPECT_FALSE(j.contains("next_offset"));
    EXPECT_EQ(j["total"], 25);
    EXPECT_EQ(j["offset"], 20);
}

TEST(DirectoryScannerTest, FollowingNextOffsetReconstructsListing) {
    TempTree tree;
    tree.numbered_files(23, ".log");
    tree.file("docs/readme.md", 40);
    tree.file("docs/guide.md", 7);
    tree.file("src/main.cc", 100);
    DirectoryScanner scanner(ScanLimits{}, flat_rss());

    ScanOptions options;
    options.max_depth = 2;
    for (auto key: {SortKey::Name, SortKey::Size, SortKey::Type, SortKey::Modified}) {
        for (auto order: {SortOrder::Asc, SortOrder::Desc}) {
            auto listing = scanner.scan(tree.str(), options, SortSpec{key, order});
            for (std::size_t batch_size: {1u, 5u, 7u, 50u}) {
                std::vector<FileEntry> collected;
                std::optional<std::size_t> offset = 0;
                while (offset) {
                    auto batch = paginate(listing, *offset, batch_size);
                    EXPECT_EQ(batch.has_more(), batch.next_offset.has_value());
                    EXPECT_LE(batch.offset + batch.entries.size(), batch.total);
                    collected.insert(collected.end(), batch.entries.begin(), batch.entries.end());
                    offset = batch.next_offset;
                }
                EXPECT_EQ(paths_of(collected), paths_of(listing.entries));
            }
        }
    }
}

TEST(DirectoryScannerTest, OffsetAtOrBeyondTotalIsEmpty) {
    TempTree tree;
    tree.numbered_files(3);
    DirectoryScanner scanner(ScanLimits{}, flat_rss());
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});

    for (std::size_t offset: {3u, 4u, 1000u}) {
        auto batch = paginate(listing, offset, 10);
        EXPECT_TRUE(batch.entries.empty());
        EXPECT_FALSE(batch.has_more());
        EXPECT_EQ(batch.total, 3u);
    }
}

TEST(DirectoryScannerTest, SortKeysAndTieBreaks) {
    TempTree tree;
    tree.file("beta.txt", 10);
    tree.file("Alpha.md", 30);
    tree.file("gamma.txt", 10);
    tree.file("delta", 20);
    DirectoryScanner scanner(ScanLimits{}, flat_rss());

    auto by_name = scanner.scan(tree.str(), ScanOptions{}, SortSpec{SortKey::Name, SortOrder::Asc});
    EXPECT_EQ(paths_of(by_name.entries), (std::vector<std::string>{"Alpha.md", "beta.txt", "delta", "gamma.txt"}));

    auto by_size = scanner.scan(tree.str(), ScanOptions{}, SortSpec{SortKey::Size, SortOrder::Desc});
    EXPECT_EQ(paths_of(by_size.entries), (std::vector<std::string>{"Alpha.md", "delta", "beta.txt", "gamma.txt"}));

    auto by_type = scanner.scan(tree.str(), ScanOptions{}, SortSpec{SortKey::Type, SortOrder::Asc});
    EXPECT_EQ(paths_of(by_type.entries), (std::vector<std::string>{"delta", "Alpha.md", "beta.txt", "gamma.txt"}));
}

TEST(DirectoryScannerTest, SummaryCountsFilesDirectoriesAndExtensions) {
    TempTree tree;
    tree.file("a.txt", 10);
    tree.file("b.TXT", 5);
    tree.file("Makefile", 1);
    tree.dir("sub");
    DirectoryScanner scanner(ScanLimits{}, flat_rss());
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});

    EXPECT_EQ(listing.summary.total_files, 3u);
    EXPECT_EQ(listing.summary.total_directories, 1u);
    EXPECT_EQ(listing.summary.total_size_bytes, 16u);
    EXPECT_EQ(listing.summary.extensions.at(".txt"), 2u);
    EXPECT_EQ(listing.summary.extensions.at("(none)"), 1u);
    EXPECT_EQ(listing.summary.entries_scanned, 4u);
}

TEST(DirectoryScannerTest, LowMemoryCeilingGivesPartialListing) {
    TempTree tree;
    tree.numbered_files(60);
    ScanLimits limits;
    limits.memory_ceiling_bytes = 1;
    limits.check_interval = 10;
    DirectoryScanner scanner(limits, growing_rss());

    Listing listing;
    ASSERT_NO_THROW(listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{}));
    EXPECT_TRUE(listing.partial());
    EXPECT_EQ(listing.partial_reason, PartialReason::Memory);
    EXPECT_EQ(listing.entries.size(), 9u);

    auto batch = paginate(listing, 0, 20);
    auto j = batch.to_json();
    EXPECT_EQ(j["partial"], true);
    EXPECT_EQ(j["partial_reason"], "memory");
}

TEST(DirectoryScannerTest, EntryCeilingGivesPartialListing) {
    TempTree tree;
    tree.numbered_files(20);
    ScanLimits limits;
    limits.max_entries = 7;
    DirectoryScanner scanner(limits, flat_rss());
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});
    EXPECT_EQ(listing.partial_reason, PartialReason::Entries);
    EXPECT_EQ(listing.entries.size(), 7u);
}

TEST(DirectoryScannerTest, TimeBudgetGivesPartialListing) {
    TempTree tree;
    tree.numbered_files(5);
    FakeClock clock;
    ScanLimits limits;
    limits.time_budget = std::chrono::milliseconds(5);
    auto tick = clock.fn();
    auto advancing = [clock, tick]() mutable {
        clock.advance(std::chrono::seconds(1));
        return tick();
    };
    DirectoryScanner scanner(limits, flat_rss(), advancing);
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});
    EXPECT_EQ(listing.partial_reason, PartialReason::Time);
    EXPECT_TRUE(listing.entries.empty());
}

TEST(DirectoryScannerTest, ZeroDisablesCeilings) {
    TempTree tree;
    tree.numbered_files(30);
    ScanLimits limits{0, std::chrono::milliseconds(0), 0, 1};
    DirectoryScanner scanner(limits, growing_rss());
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});
    EXPECT_FALSE(listing.partial());
    EXPECT_EQ(listing.entries.size(), 30u);
}

TEST(DirectoryScannerTest, MissingDirectoryThrows) {
    DirectoryScanner scanner;
    EXPECT_THROW(scanner.scan("/no/such/path", ScanOptions{}, SortSpec{}), treescout::protocol::ResourceError);
}

TEST(DirectoryScannerTest, CanonicalRootDropsTrailingSeparator) {
    EXPECT_EQ(canonical_root("/tmp/x/"), canonical_root("/tmp/x"));
    EXPECT_EQ(canonical_root("/tmp/./x/../x"), canonical_root("/tmp/x"));
    EXPECT_EQ(canonical_root("/").string(), "/");
}

TEST(PaginationPlanTest, OffsetsCoverEveryBatch) {
    TempTree tree;
    tree.numbered_files(25);
    tree.dir("zz_dir");
    DirectoryScanner scanner(ScanLimits{}, flat_rss());
    auto listing = scanner.scan(tree.str(), ScanOptions{}, SortSpec{});

    auto plan = plan_pagination(listing, 10);
    EXPECT_EQ(plan.total_entries, 26u);
    EXPECT_EQ(plan.total_files, 25u);
    EXPECT_EQ(plan.total_directories, 1u);
    EXPECT_EQ(plan.total_batches, 3u);
    EXPECT_EQ(plan.offsets, (std::vector<std::size_t>{0, 10, 20}));
    EXPECT_EQ(plan.to_json()["partial"], false);

    auto empty = plan_pagination(Listing{}, 10);
    EXPECT_EQ(empty.total_batches, 0u);
    EXPECT_TRUE(empty.offsets.empty());
}

TEST(ScanEnumsTest, NamesConvertBothWays) {
    for (auto reason: {PartialReason::None, PartialReason::Memory, PartialReason::Time, PartialReason::Entries}) {
        EXPECT_EQ(partial_reason_from_string(to_string(reason)), reason);
    }
    for (auto key: {SortKey::Name, SortKey::Size, SortKey::Modified, SortKey::Type}) {
        EXPECT_EQ(sort_key_from_string(to_string(key)), key);
    }
    EXPECT_EQ(sort_order_from_string("desc"), SortOrder::Desc);
    EXPECT_FALSE(partial_reason_from_string("disk").has_value());
    EXPECT_FALSE(sort_key_from_string("color").has_value());
}
