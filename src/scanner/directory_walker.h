// src/scanner/directory_walker.h
#pragma once

#include "file_entry.h"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace treescout::scanner {

    /**
     * @brief Lazy depth-first walk of a directory tree.
     *
     * Produces one FileEntry per next() call. Only the children of the
     * directories on the current descent path are held in memory. Children are
     * visited in byte-wise name order, so two walks over an unchanged tree
     * produce the same sequence; stream cursors rely on this.
     *
     * The walker lives for a single call. It is not copyable and nothing
     * refers to it once the call returns.
     */
    class DirectoryWalker {
    public:
        /**
         * @throws protocol::ResourceError if root does not exist, is not a
         *         directory, or cannot be opened
         */
        DirectoryWalker(const std::filesystem::path &root, ScanOptions options);

        DirectoryWalker(const DirectoryWalker &) = delete;
        DirectoryWalker &operator=(const DirectoryWalker &) = delete;

        /**
         * @brief Produce the next entry passing the filters.
         * @return nullopt once the walk is exhausted
         */
        std::optional<FileEntry> next();

        struct SkipResult {
            std::size_t skipped = 0;
            std::string last_path;///< Relative path of the last discarded entry
            bool stopped = false; ///< should_stop ended the skip early
        };

        /**
         * @brief Discard up to count entries. Discarded entries are filtered
         *        exactly like next() but their size and modification time are
         *        never read.
         * @param should_stop Polled before each entry; returning true ends the skip
         */
        SkipResult skip(std::size_t count, const std::function<bool()> &should_stop = nullptr);

        // Entries and directories dropped because they could not be read
        std::size_t unreadable() const { return unreadable_; }

        const std::filesystem::path &root() const { return root_; }

        /**
         * @brief Check that path names a readable directory.
         * @throws protocol::ResourceError otherwise
         */
        static void validate_root(const std::filesystem::path &path);

    private:
        struct Frame {
            std::vector<std::filesystem::path> children;
            std::size_t index = 0;
            int depth = 1;
            std::string relative_prefix;
        };

        bool push_directory(const std::filesystem::path &dir, int depth, std::string relative_prefix);
        std::optional<FileEntry> advance(bool with_metadata);
        std::optional<FileEntry> describe(const std::filesystem::path &child, const std::string &relative_path, bool with_metadata);
        bool is_hidden(const std::string &name) const { return !name.empty() && name.front() == '.'; }

        std::filesystem::path root_;
        ScanOptions options_;
        std::vector<Frame> stack_;
        std::size_t unreadable_ = 0;
    };

}// namespace treescout::scanner
