#include "file_entry.h"
#include <algorithm>
#include <cctype>

namespace treescout::scanner {

    nlohmann::json FileEntry::to_json() const {
        return {
                {"name", name},
                {"path", path},
                {"is_file", is_file},
                {"is_dir", is_dir},
                {"size_bytes", size_bytes},
                {"modified_time", modified_time},
                {"extension", extension}};
    }

    std::string to_string(SortKey key) {
        switch (key) {
            case SortKey::Name:
                return "name";
            case SortKey::Size:
                return "size";
            case SortKey::Modified:
                return "modified";
            case SortKey::Type:
                return "type";
        }
        return "name";
    }

    std::string to_string(SortOrder order) {
        return order == SortOrder::Desc ? "desc" : "asc";
    }

    std::string to_string(PartialReason reason) {
        switch (reason) {
            case PartialReason::None:
                return "none";
            case PartialReason::Memory:
                return "memory";
            case PartialReason::Time:
                return "time";
            case PartialReason::Entries:
                return "entries";
        }
        return "none";
    }

    std::optional<SortKey> sort_key_from_string(std::string_view text) {
        if (text == "name") return SortKey::Name;
        if (text == "size") return SortKey::Size;
        if (text == "modified") return SortKey::Modified;
        if (text == "type") return SortKey::Type;
        return std::nullopt;
    }

    std::optional<SortOrder> sort_order_from_string(std::string_view text) {
        if (text == "asc") return SortOrder::Asc;
        if (text == "desc") return SortOrder::Desc;
        return std::nullopt;
    }

    std::optional<PartialReason> partial_reason_from_string(std::string_view text) {
        if (text == "none") return PartialReason::None;
        if (text == "memory") return PartialReason::Memory;
        if (text == "time") return PartialReason::Time;
        if (text == "entries") return PartialReason::Entries;
        return std::nullopt;
    }

    std::string normalize_extension(std::string ext) {
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!ext.empty() && ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
        return ext;
    }

    void ScanOptions::normalize() {
        std::vector<std::string> normalized;
        normalized.reserve(extensions.size());
        for (auto &ext: extensions) {
            auto n = normalize_extension(ext);
            if (!n.empty()) {
                normalized.push_back(std::move(n));
            }
        }
        std::sort(normalized.begin(), normalized.end());
        normalized.erase(std::unique(normalized.begin(), normalized.end()), normalized.end());
        extensions = std::move(normalized);
        if (max_depth < 1) {
            max_depth = 1;
        }
    }

    bool ScanOptions::accepts_extension(const std::string &ext) const {
        if (extensions.empty()) {
            return true;
        }
        return std::binary_search(extensions.begin(), extensions.end(), ext);
    }

    nlohmann::json ScanOptions::to_json() const {
        return {
                {"max_depth", max_depth},
                {"include_hidden", include_hidden},
                {"files_only", files_only},
                {"file_types", extensions}};
    }

}// namespace treescout::scanner
