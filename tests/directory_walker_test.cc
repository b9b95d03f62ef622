#include "protocol/tool_error.h"
#include "scanner/directory_walker.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <vector>

using namespace treescout::scanner;
using treescout::testing::TempTree;

namespace {

    std::vector<std::string> walk_paths(const TempTree &tree, const ScanOptions &options) {
        DirectoryWalker walker(tree.root(), options);
        std::vector<std::string> paths;
        while (auto entry = walker.next()) {
            paths.push_back(entry->path);
        }
        return paths;
    }

}// namespace

class DirectoryWalkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree.file("b.txt", 3);
        tree.file("a.txt", 1);
        tree.file("C.MD", 2);
        tree.file("sub/inner.txt", 4);
        tree.file("sub/deeper/leaf.py", 5);
        tree.file(".hidden", 1);
        tree.file(".git/config", 1);
    }

    TempTree tree;
};

TEST_F(DirectoryWalkerTest, DepthOneListsDirectChildrenInByteOrder) {
    EXPECT_EQ(walk_paths(tree, ScanOptions{}),
              (std::vector<std::string>{"C.MD", "a.txt", "b.txt", "sub"}));
}

TEST_F(DirectoryWalkerTest, DeeperWalkIsPreOrder) {
    ScanOptions options;
    options.max_depth = 3;
    EXPECT_EQ(walk_paths(tree, options),
              (std::vector<std::string>{"C.MD", "a.txt", "b.txt", "sub", "sub/deeper", "sub/deeper/leaf.py", "sub/inner.txt"}));

    options.max_depth = 2;
    EXPECT_EQ(walk_paths(tree, options),
              (std::vector<std::string>{"C.MD", "a.txt", "b.txt", "sub", "sub/deeper", "sub/inner.txt"}));
}

TEST_F(DirectoryWalkerTest, HiddenEntriesOnlyWhenRequested) {
    ScanOptions options;
    options.max_depth = 2;
    options.include_hidden = true;
    auto paths = walk_paths(tree, options);
    EXPECT_EQ(paths.front(), ".git");
    EXPECT_EQ(paths[1], ".git/config");
    EXPECT_EQ(paths[2], ".hidden");
}

TEST_F(DirectoryWalkerTest, ExtensionFilterAppliesToFilesOnly) {
    ScanOptions options;
    options.max_depth = 2;
    options.extensions = {"TXT"};
    EXPECT_EQ(walk_paths(tree, options),
              (std::vector<std::string>{"a.txt", "b.txt", "sub", "sub/deeper", "sub/inner.txt"}));

    options.files_only = true;
    EXPECT_EQ(walk_paths(tree, options),
              (std::vector<std::string>{"a.txt", "b.txt", "sub/inner.txt"}));
}

TEST_F(DirectoryWalkerTest, EntriesDescribeTheFilesystem) {
    DirectoryWalker walker(tree.root(), ScanOptions{});
    auto upper = walker.next();
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(upper->name, "C.MD");
    EXPECT_TRUE(upper->is_file);
    EXPECT_FALSE(upper->is_dir);
    EXPECT_EQ(upper->size_bytes, 2u);
    EXPECT_EQ(upper->extension, ".md");
    EXPECT_GT(upper->modified_time, 0.0);

    walker.skip(2);
    auto sub = walker.next();
    ASSERT_TRUE(sub.has_value());
    EXPECT_TRUE(sub->is_dir);
    EXPECT_EQ(sub->size_bytes, 0u);
    EXPECT_EQ(sub->extension, "");
    EXPECT_FALSE(walker.next().has_value());
}

TEST_F(DirectoryWalkerTest, SkipReturnsLastDiscardedEntry) {
    DirectoryWalker walker(tree.root(), ScanOptions{});
    auto last = walker.skip(2);
    EXPECT_EQ(last.skipped, 2u);
    EXPECT_EQ(last.last_path, "a.txt");
    EXPECT_FALSE(last.stopped);
    EXPECT_EQ(walker.next()->path, "b.txt");

    DirectoryWalker short_walk(tree.root(), ScanOptions{});
    auto end = short_walk.skip(100);
    EXPECT_EQ(end.skipped, 4u);
    EXPECT_EQ(end.last_path, "sub");
    EXPECT_FALSE(short_walk.next().has_value());
}

TEST_F(DirectoryWalkerTest, SkipStopsWhenAsked) {
    DirectoryWalker walker(tree.root(), ScanOptions{});
    int polls = 0;
    auto result = walker.skip(4, [&polls] { return ++polls > 1; });
    EXPECT_TRUE(result.stopped);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.last_path, "C.MD");
    // the walk resumes right after the last discarded entry
    EXPECT_EQ(walker.next()->path, "a.txt");
}

TEST(DirectoryWalkerErrors, MissingRootIsResourceError) {
    try {
        DirectoryWalker walker("/no/such/path", ScanOptions{});
        FAIL() << "expected ResourceError";
    } catch (const treescout::protocol::ResourceError &e) {
        EXPECT_EQ(e.code(), treescout::protocol::error_code::RESOURCE_ERROR);
        EXPECT_EQ(e.data()["path"], "/no/such/path");
        EXPECT_EQ(e.data()["reason"], "directory does not exist");
    }
}

TEST(DirectoryWalkerErrors, FileRootIsResourceError) {
    TempTree tree;
    auto file = tree.file("plain.txt", 1);
    try {
        DirectoryWalker walker(file, ScanOptions{});
        FAIL() << "expected ResourceError";
    } catch (const treescout::protocol::ResourceError &e) {
        EXPECT_EQ(e.data()["reason"], "not a directory");
    }
}

TEST(DirectoryWalkerErrors, EmptyDirectoryYieldsNothing) {
    TempTree tree;
    DirectoryWalker walker(tree.root(), ScanOptions{});
    EXPECT_FALSE(walker.next().has_value());
    EXPECT_EQ(walker.unreadable(), 0u);
}
