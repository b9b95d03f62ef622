// src/scanner/directory_scanner.h
#pragma once

#include "file_entry.h"
#include "memory_probe.h"
#include <cstddef>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace treescout::scanner {

    struct ScanSummary {
        std::size_t total_files = 0;
        std::size_t total_directories = 0;
        std::uintmax_t total_size_bytes = 0;
        std::map<std::string, std::size_t> extensions;///< files only, "(none)" for no extension
        long long elapsed_ms = 0;
        std::size_t memory_growth_bytes = 0;
        std::size_t entries_scanned = 0;

        void add(const FileEntry &entry);
        nlohmann::json to_json() const;
    };

    /**
     * @brief The full sorted candidate set of one scan. Batches are slices of it.
     */
    struct Listing {
        std::string directory;///< Absolute, lexically normal root
        ScanOptions options;
        SortSpec sort;
        std::vector<FileEntry> entries;
        ScanSummary summary;
        PartialReason partial_reason = PartialReason::None;

        bool partial() const { return partial_reason != PartialReason::None; }
    };

    /**
     * @brief Canonical form of a requested directory: absolute and lexically
     *        normal, without a trailing separator.
     */
    std::filesystem::path canonical_root(const std::string &directory);

    /**
     * @brief Sort in place. Ties on the key fall back to the relative path,
     *        ascending, so the order is total.
     */
    void sort_entries(std::vector<FileEntry> &entries, const SortSpec &sort);

    class DirectoryScanner {
    public:
        explicit DirectoryScanner(ScanLimits limits = {},
                                  MemoryProbe probe = nullptr,
                                  SteadyClock clock = nullptr);

        /**
         * @brief Walk directory and assemble its sorted Listing.
         *
         * A breached ceiling stops the walk; the entries gathered so far are
         * sorted and returned with partial_reason set.
         *
         * @throws protocol::ResourceError if directory cannot be scanned
         */
        Listing scan(const std::string &directory, const ScanOptions &options, const SortSpec &sort) const;

        const ScanLimits &limits() const { return limits_; }
        const MemoryProbe &probe() const { return probe_; }
        const SteadyClock &clock() const { return clock_; }

    private:
        ScanLimits limits_;
        MemoryProbe probe_;
        SteadyClock clock_;
    };

}// namespace treescout::scanner
