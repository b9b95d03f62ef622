// src/scanner/pagination.h
#pragma once

#include "directory_scanner.h"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace treescout::scanner {

    /**
     * @brief One page of a Listing.
     *
     * next_offset is the only continuation signal; has_more() is derived from
     * it, so the two can never disagree.
     */
    struct Batch {
        std::vector<FileEntry> entries;
        std::size_t offset = 0;
        std::size_t limit = 0;
        std::size_t total = 0;
        std::optional<std::size_t> next_offset;
        PartialReason partial_reason = PartialReason::None;

        bool has_more() const { return next_offset.has_value(); }
        bool partial() const { return partial_reason != PartialReason::None; }

        nlohmann::json to_json() const;
    };

    /**
     * @brief entries[offset, offset + limit) of the listing.
     *        An offset at or past the end gives an empty batch without next_offset.
     */
    Batch paginate(const Listing &listing, std::size_t offset, std::size_t limit);

    struct PaginationPlan {
        std::size_t total_entries = 0;
        std::size_t total_files = 0;
        std::size_t total_directories = 0;
        std::size_t batch_size = 0;
        std::size_t total_batches = 0;
        std::vector<std::size_t> offsets;
        PartialReason partial_reason = PartialReason::None;

        nlohmann::json to_json() const;
    };

    PaginationPlan plan_pagination(const Listing &listing, std::size_t batch_size);

}// namespace treescout::scanner
