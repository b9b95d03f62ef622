// src/scanner/file_entry.h
#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace treescout::scanner {

    /**
     * @brief One enumerated filesystem entry. Immutable once produced.
     */
    struct FileEntry {
        std::string name;         ///< Final path component
        std::string path;         ///< Path relative to the scan root, '/'-separated
        bool is_file = false;     ///< Regular file (after following symlinks)
        bool is_dir = false;      ///< Directory (after following symlinks)
        std::uintmax_t size_bytes = 0;///< 0 for directories
        double modified_time = 0.0;   ///< Seconds since the Unix epoch
        std::string extension;    ///< Lower-case with leading dot, empty if none

        nlohmann::json to_json() const;
    };

    enum class SortKey {
        Name,
        Size,
        Modified,
        Type
    };

    enum class SortOrder {
        Asc,
        Desc
    };

    // Why a scan stopped before exhausting the tree
    enum class PartialReason {
        None,
        Memory,
        Time,
        Entries
    };

    std::string to_string(SortKey key);
    std::string to_string(SortOrder order);
    std::string to_string(PartialReason reason);

    std::optional<SortKey> sort_key_from_string(std::string_view text);
    std::optional<SortOrder> sort_order_from_string(std::string_view text);
    std::optional<PartialReason> partial_reason_from_string(std::string_view text);

    struct SortSpec {
        SortKey key = SortKey::Name;
        SortOrder order = SortOrder::Asc;
    };

    /**
     * @brief Filters applied while walking.
     */
    struct ScanOptions {
        int max_depth = 1;              ///< 1 lists the root's children only
        bool include_hidden = false;    ///< Include names starting with '.'
        bool files_only = false;        ///< Drop directory entries from the output
        std::vector<std::string> extensions;///< Allow-list for files, normalised by normalize()

        // Lower-case every extension, add the leading dot, sort and dedupe
        void normalize();

        // true when the allow-list is empty or contains ext
        bool accepts_extension(const std::string &ext) const;

        nlohmann::json to_json() const;
    };

    /**
     * @brief Ceilings bounding one scan call. Zero disables a ceiling.
     */
    struct ScanLimits {
        std::size_t memory_ceiling_bytes = 25u * 1024u * 1024u;
        std::chrono::milliseconds time_budget{10000};
        std::size_t max_entries = 200000;
        std::size_t check_interval = 1000;///< Memory is sampled every check_interval entries
    };

    // ".TXT" -> ".txt", "md" -> ".md"
    std::string normalize_extension(std::string ext);

}// namespace treescout::scanner
