#include "directory_walker.h"
#include "core/logger.h"
#include "protocol/tool_error.h"
#include <algorithm>
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace treescout::scanner {

    void DirectoryWalker::validate_root(const fs::path &path) {
        std::error_code ec;
        auto st = fs::status(path, ec);
        if (ec || !fs::exists(st)) {
            throw protocol::ResourceError(path.string(), "directory does not exist");
        }
        if (!fs::is_directory(st)) {
            throw protocol::ResourceError(path.string(), "not a directory");
        }
        fs::directory_iterator probe(path, ec);
        if (ec) {
            throw protocol::ResourceError(path.string(), "cannot open directory: " + ec.message());
        }
    }

    DirectoryWalker::DirectoryWalker(const fs::path &root, ScanOptions options)
        : root_(root), options_(std::move(options)) {
        options_.normalize();
        validate_root(root_);
        if (!push_directory(root_, 1, "")) {
            throw protocol::ResourceError(root_.string(), "cannot read directory");
        }
    }

    bool DirectoryWalker::push_directory(const fs::path &dir, int depth, std::string relative_prefix) {
        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            ++unreadable_;
            TREESCOUT_DEBUG("Skipping unreadable directory '{}': {}", dir.string(), ec.message());
            return false;
        }

        Frame frame;
        frame.depth = depth;
        frame.relative_prefix = std::move(relative_prefix);
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            frame.children.push_back(it->path());
        }
        if (ec) {
            // keep what was read before the failure
            ++unreadable_;
            TREESCOUT_DEBUG("Listing of '{}' truncated: {}", dir.string(), ec.message());
        }

        std::sort(frame.children.begin(), frame.children.end(),
                  [](const fs::path &a, const fs::path &b) {
                      return a.filename().native() < b.filename().native();
                  });
        stack_.push_back(std::move(frame));
        return true;
    }

    std::optional<FileEntry> DirectoryWalker::describe(const fs::path &child, const std::string &relative_path, bool with_metadata) {
        std::error_code ec;
        auto st = fs::status(child, ec);
        if (ec) {
            return std::nullopt;
        }

        FileEntry entry;
        entry.name = child.filename().string();
        entry.path = relative_path;

        if (fs::is_regular_file(st)) {
            entry.is_file = true;
            entry.extension = normalize_extension(child.extension().string());
        } else if (fs::is_directory(st)) {
            entry.is_dir = true;
        }
        if (!with_metadata) {
            return entry;
        }

        if (entry.is_file) {
            entry.size_bytes = fs::file_size(child, ec);
            if (ec) {
                return std::nullopt;
            }
        }
        auto ftime = fs::last_write_time(child, ec);
        if (ec) {
            return std::nullopt;
        }
        auto sys_time = std::chrono::file_clock::to_sys(ftime);
        entry.modified_time = std::chrono::duration<double>(sys_time.time_since_epoch()).count();
        return entry;
    }

    std::optional<FileEntry> DirectoryWalker::next() {
        return advance(true);
    }

    std::optional<FileEntry> DirectoryWalker::advance(bool with_metadata) {
        while (!stack_.empty()) {
            Frame &frame = stack_.back();
            if (frame.index >= frame.children.size()) {
                stack_.pop_back();
                continue;
            }

            // copy out before push_directory() can reallocate the stack
            fs::path child = frame.children[frame.index++];
            int depth = frame.depth;
            std::string relative_path = frame.relative_prefix.empty()
                                                ? child.filename().string()
                                                : frame.relative_prefix + "/" + child.filename().string();

            if (!options_.include_hidden && is_hidden(child.filename().string())) {
                continue;
            }

            auto entry = describe(child, relative_path, with_metadata);
            if (!entry) {
                ++unreadable_;
                TREESCOUT_DEBUG("Skipping unreadable entry '{}'", child.string());
                continue;
            }

            if (entry->is_dir) {
                std::error_code ec;
                bool is_link = fs::is_symlink(fs::symlink_status(child, ec));
                // symlinked directories are listed but never followed
                if (depth < options_.max_depth && !ec && !is_link) {
                    push_directory(child, depth + 1, relative_path);
                }
                if (options_.files_only) {
                    continue;
                }
                return entry;
            }

            if (entry->is_file && options_.accepts_extension(entry->extension)) {
                return entry;
            }
            // sockets, fifos, devices and filtered-out files fall through
        }
        return std::nullopt;
    }

    DirectoryWalker::SkipResult DirectoryWalker::skip(std::size_t count, const std::function<bool()> &should_stop) {
        SkipResult result;
        while (result.skipped < count) {
            if (should_stop && should_stop()) {
                result.stopped = true;
                break;
            }
            auto entry = advance(false);
            if (!entry) {
                break;
            }
            ++result.skipped;
            result.last_path = std::move(entry->path);
        }
        return result;
    }

}// namespace treescout::scanner
