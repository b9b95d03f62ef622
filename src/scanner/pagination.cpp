#include "pagination.h"
#include <algorithm>

namespace treescout::scanner {

    nlohmann::json Batch::to_json() const {
        nlohmann::json items = nlohmann::json::array();
        for (const auto &entry: entries) {
            items.push_back(entry.to_json());
        }
        nlohmann::json j = {
                {"entries", std::move(items)},
                {"offset", offset},
                {"limit", limit},
                {"total", total},
                {"returned", entries.size()},
                {"has_more", has_more()},
                {"partial", partial()}};
        if (next_offset) {
            j["next_offset"] = *next_offset;
        }
        if (partial()) {
            j["partial_reason"] = to_string(partial_reason);
        }
        return j;
    }

    Batch paginate(const Listing &listing, std::size_t offset, std::size_t limit) {
        Batch batch;
        batch.offset = offset;
        batch.limit = limit;
        batch.total = listing.entries.size();
        batch.partial_reason = listing.partial_reason;

        if (offset >= batch.total || limit == 0) {
            return batch;
        }

        std::size_t end = std::min(batch.total, offset + limit);
        batch.entries.assign(listing.entries.begin() + static_cast<std::ptrdiff_t>(offset),
                             listing.entries.begin() + static_cast<std::ptrdiff_t>(end));
        if (end < batch.total) {
            batch.next_offset = end;
        }
        return batch;
    }

    nlohmann::json PaginationPlan::to_json() const {
        nlohmann::json j = {
                {"total_entries", total_entries},
                {"total_files", total_files},
                {"total_directories", total_directories},
                {"batch_size", batch_size},
                {"total_batches", total_batches},
                {"offsets", offsets},
                {"partial", partial_reason != PartialReason::None}};
        if (partial_reason != PartialReason::None) {
            j["partial_reason"] = to_string(partial_reason);
        }
        return j;
    }

    PaginationPlan plan_pagination(const Listing &listing, std::size_t batch_size) {
        PaginationPlan plan;
        plan.total_entries = listing.entries.size();
        plan.total_files = listing.summary.total_files;
        plan.total_directories = listing.summary.total_directories;
        plan.batch_size = std::max<std::size_t>(batch_size, 1);
        plan.partial_reason = listing.partial_reason;
        for (std::size_t offset = 0; offset < plan.total_entries; offset += plan.batch_size) {
            plan.offsets.push_back(offset);
        }
        plan.total_batches = plan.offsets.size();
        return plan;
    }

}// namespace treescout::scanner
