#include "directory_scanner.h"
#include "core/logger.h"
#include "directory_walker.h"
#include <algorithm>
#include <cctype>

namespace treescout::scanner {

    namespace {

        std::string to_lower(const std::string &s) {
            std::string out = s;
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        int compare_names(const FileEntry &a, const FileEntry &b) {
            int c = to_lower(a.name).compare(to_lower(b.name));
            if (c != 0) {
                return c;
            }
            return a.name.compare(b.name);
        }

        template<typename T>
        int three_way(const T &a, const T &b) {
            if (a < b) return -1;
            if (b < a) return 1;
            return 0;
        }

        int compare_by(SortKey key, const FileEntry &a, const FileEntry &b) {
            switch (key) {
                case SortKey::Name:
                    return compare_names(a, b);
                case SortKey::Size:
                    return three_way(a.size_bytes, b.size_bytes);
                case SortKey::Modified:
                    return three_way(a.modified_time, b.modified_time);
                case SortKey::Type:
                    if (int c = a.extension.compare(b.extension); c != 0) {
                        return c;
                    }
                    return compare_names(a, b);
            }
            return 0;
        }

    }// namespace

    void ScanSummary::add(const FileEntry &entry) {
        ++entries_scanned;
        if (entry.is_dir) {
            ++total_directories;
            return;
        }
        ++total_files;
        total_size_bytes += entry.size_bytes;
        ++extensions[entry.extension.empty() ? "(none)" : entry.extension];
    }

    nlohmann::json ScanSummary::to_json() const {
        return {
                {"total_files", total_files},
                {"total_directories", total_directories},
                {"total_size_bytes", total_size_bytes},
                {"extensions", extensions},
                {"elapsed_ms", elapsed_ms},
                {"memory_growth_bytes", memory_growth_bytes},
                {"entries_scanned", entries_scanned}};
    }

    std::filesystem::path canonical_root(const std::string &directory) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(directory, ec);
        if (ec) {
            absolute = std::filesystem::path(directory);
        }
        auto normal = absolute.lexically_normal();
        // "/tmp/x/" normalises to "/tmp/x/" with an empty filename
        if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
            normal = normal.parent_path();
        }
        return normal;
    }

    void sort_entries(std::vector<FileEntry> &entries, const SortSpec &sort) {
        std::sort(entries.begin(), entries.end(), [&sort](const FileEntry &a, const FileEntry &b) {
            int c = compare_by(sort.key, a, b);
            if (c != 0) {
                return sort.order == SortOrder::Asc ? c < 0 : c > 0;
            }
            return a.path < b.path;
        });
    }

    DirectoryScanner::DirectoryScanner(ScanLimits limits, MemoryProbe probe, SteadyClock clock)
        : limits_(limits),
          probe_(probe ? std::move(probe) : default_memory_probe()),
          clock_(clock ? std::move(clock) : default_clock()) {
    }

    Listing DirectoryScanner::scan(const std::string &directory, const ScanOptions &options, const SortSpec &sort) const {
        Listing listing;
        listing.directory = canonical_root(directory).string();
        listing.options = options;
        listing.options.normalize();
        listing.sort = sort;

        ScanBudget budget(limits_, probe_, clock_);
        DirectoryWalker walker(listing.directory, listing.options);

        while (auto entry = walker.next()) {
            if (auto reason = budget.on_entry()) {
                listing.partial_reason = *reason;
                break;
            }
            listing.summary.add(*entry);
            listing.entries.push_back(std::move(*entry));
        }

        sort_entries(listing.entries, sort);

        listing.summary.elapsed_ms = budget.elapsed().count();
        listing.summary.memory_growth_bytes = budget.memory_growth();

        if (listing.partial()) {
            TREESCOUT_WARN("Scan of '{}' stopped early ({}): {} entries kept",
                           listing.directory, to_string(listing.partial_reason), listing.entries.size());
        } else {
            TREESCOUT_DEBUG("Scanned '{}': {} entries in {} ms ({} unreadable skipped)",
                            listing.directory, listing.entries.size(), listing.summary.elapsed_ms,
                            walker.unreadable());
        }
        return listing;
    }

}// namespace treescout::scanner
