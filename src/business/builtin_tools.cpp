#include "builtin_tools.h"
#include "core/logger.h"
#include "protocol/tool_error.h"
#include "scanner/pagination.h"
#include "server_state.h"
#include "treescout_version.h"
#include <cstdint>
#include <ctime>
#include <iterator>
#include <limits>
#include <map>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace treescout::business {

    namespace {

        using nlohmann::json;

        constexpr std::int64_t kMaxOffset = std::numeric_limits<std::int32_t>::max();

        // Numeric arguments outside [min, max] are clamped, not rejected
        std::int64_t int_arg(const json &args, const char *name, std::int64_t def, std::int64_t min, std::int64_t max) {
            if (!args.contains(name) || !args[name].is_number()) {
                return def;
            }
            double value = args[name].get<double>();
            if (value < static_cast<double>(min)) return min;
            if (value > static_cast<double>(max)) return max;
            return static_cast<std::int64_t>(value);
        }

        bool bool_arg(const json &args, const char *name, bool def) {
            if (!args.contains(name) || !args[name].is_boolean()) {
                return def;
            }
            return args[name].get<bool>();
        }

        std::string string_arg(const json &args, const char *name) {
            if (!args.contains(name) || !args[name].is_string()) {
                return {};
            }
            return args[name].get<std::string>();
        }

        std::string require_string(const json &args, const char *name, const std::string &context) {
            auto value = string_arg(args, name);
            if (value.empty()) {
                throw protocol::ValidationError(name, "Parameter '" + std::string(name) + "' is required " + context, "string");
            }
            return value;
        }

        scanner::ScanOptions scan_options(const json &args, int depth_limit) {
            scanner::ScanOptions options;
            options.max_depth = static_cast<int>(int_arg(args, "max_depth", 1, 1, depth_limit));
            options.include_hidden = bool_arg(args, "include_hidden", false);
            options.files_only = bool_arg(args, "files_only", false);
            if (args.contains("file_types") && args["file_types"].is_array()) {
                for (const auto &ext: args["file_types"]) {
                    if (ext.is_string()) {
                        options.extensions.push_back(ext.get<std::string>());
                    }
                }
            }
            options.normalize();
            return options;
        }

        scanner::SortSpec sort_spec(const json &args) {
            scanner::SortSpec sort;
            if (auto key = scanner::sort_key_from_string(string_arg(args, "sort_by"))) {
                sort.key = *key;
            }
            if (auto order = scanner::sort_order_from_string(string_arg(args, "sort_order"))) {
                sort.order = *order;
            }
            return sort;
        }

        json filters_json(const scanner::ScanOptions &options, const scanner::SortSpec &sort) {
            json j = options.to_json();
            j["sort_by"] = scanner::to_string(sort.key);
            j["sort_order"] = scanner::to_string(sort.order);
            return j;
        }

        std::string format_size(std::uintmax_t bytes) {
            static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
            double value = static_cast<double>(bytes);
            size_t unit = 0;
            while (value >= 1024.0 && unit + 1 < std::size(units)) {
                value /= 1024.0;
                ++unit;
            }
            if (unit == 0) {
                return fmt::format("{} B", bytes);
            }
            return fmt::format("{:.1f} {}", value, units[unit]);
        }

        // ---------------------------------------------------------------- schemas

        json property(const char *type, const char *description) {
            return {{"type", type}, {"description", description}};
        }

        json ranged(const char *description, std::int64_t min, std::int64_t max, std::int64_t def) {
            json p = property("integer", description);
            p["minimum"] = min;
            p["maximum"] = max;
            p["default"] = def;
            return p;
        }

        json scan_properties(int depth_limit) {
            json file_types = property("array", "Only list files with these extensions, e.g. [\".py\", \"md\"]");
            file_types["items"] = {{"type", "string"}};
            return {
                    {"directory", property("string", "Directory to scan")},
                    {"max_depth", ranged("Levels to descend, 1 lists direct children only", 1, depth_limit, 1)},
                    {"include_hidden", property("boolean", "Include entries whose name starts with '.'")},
                    {"files_only", property("boolean", "Leave directories out of the result")},
                    {"file_types", file_types}};
        }

        json listing_schema() {
            json props = scan_properties(3);
            props["batch_size"] = ranged("Entries per page", 5, 50, 20);
            props["offset"] = ranged("Index of the first entry to return", 0, kMaxOffset, 0);
            props["sort_by"] = property("string", "Sort key");
            props["sort_by"]["enum"] = {"name", "size", "modified", "type"};
            props["sort_order"] = property("string", "Sort direction");
            props["sort_order"]["enum"] = {"asc", "desc"};
            props["use_cache"] = property("boolean", "Serve from the listing cache when fresh (default true)");
            return {{"type", "object"}, {"properties", props}, {"required", {"directory"}}};
        }

        json stream_properties() {
            json props = scan_properties(2);
            props["batch_size"] = ranged("Entries per batch", 1, 50, 5);
            return props;
        }

        json session_schema() {
            return {{"type", "object"},
                    {"properties", {{"session_id", property("string", "Id returned by start_stream")}}},
                    {"required", {"session_id"}}};
        }

        json empty_schema() {
            return {{"type", "object"}, {"properties", json::object()}};
        }

        // ---------------------------------------------------------------- handlers

        struct Page {
            cache::ListingPtr listing;
            scanner::SortSpec sort;
            scanner::Batch batch;
        };

        Page listing_page(const json &args, ServerState &state) {
            auto directory = require_string(args, "directory", "to list a directory");
            auto options = scan_options(args, 3);
            auto sort = sort_spec(args);
            auto batch_size = static_cast<size_t>(int_arg(args, "batch_size", 20, 5, 50));
            auto offset = static_cast<size_t>(int_arg(args, "offset", 0, 0, kMaxOffset));

            Page page;
            page.listing = state.listing(directory, options, sort, bool_arg(args, "use_cache", true));
            page.sort = sort;
            page.batch = scanner::paginate(*page.listing, offset, batch_size);
            return page;
        }

        json list_files(const json &args, ServerState &state) {
            auto page = listing_page(args, state);
            return {
                    {"directory", page.listing->directory},
                    {"batch", page.batch.to_json()},
                    {"summary", page.listing->summary.to_json()},
                    {"filters", filters_json(page.listing->options, page.listing->sort)}};
        }

        json list_files_readable(const json &args, ServerState &state) {
            auto page = listing_page(args, state);
            const auto &listing = page.listing;
            const auto &batch = page.batch;

            std::string text = fmt::format("Directory: {}\n", listing->directory);
            if (batch.entries.empty()) {
                text += fmt::format("No entries at offset {} (total {})\n", batch.offset, batch.total);
            } else {
                text += fmt::format("Showing {}-{} of {} entries (sorted by {} {})\n",
                                    batch.offset + 1, batch.offset + batch.entries.size(), batch.total,
                                    scanner::to_string(page.sort.key), scanner::to_string(page.sort.order));
                for (const auto &entry: batch.entries) {
                    if (entry.is_dir) {
                        text += fmt::format("  [DIR]  {}/\n", entry.path);
                    } else {
                        text += fmt::format("  [FILE] {} ({})\n", entry.path, format_size(entry.size_bytes));
                    }
                }
            }
            text += fmt::format("{} files, {} directories, {}\n",
                                listing->summary.total_files, listing->summary.total_directories,
                                format_size(listing->summary.total_size_bytes));
            if (batch.next_offset) {
                text += fmt::format("More entries available: call again with offset={}\n", *batch.next_offset);
            }
            if (batch.partial()) {
                text += fmt::format("Scan stopped early ({}); the listing is partial\n",
                                    scanner::to_string(batch.partial_reason));
            }
            return text;
        }

        std::string entry_type(const scanner::FileEntry &entry) {
            if (entry.is_dir) return "directory";
            return entry.extension.empty() ? "file" : entry.extension;
        }

        std::string entry_category(const scanner::FileEntry &entry) {
            static const std::map<std::string, std::string> categories = {
                    {".py", "Python file"}, {".pyc", "Python file"},
                    {".md", "Documentation"}, {".txt", "Documentation"},
                    {".json", "Configuration"}, {".yaml", "Configuration"}, {".yml", "Configuration"},
                    {".ini", "Configuration"}, {".log", "Log file"},
                    {".exe", "Executable"}, {".bat", "Executable"}, {".ps1", "Executable"}, {".sh", "Executable"},
                    {".dll", "Binary library"}, {".so", "Binary library"}, {".pyd", "Binary library"}};
            if (entry.is_dir) {
                return "Directory";
            }
            auto it = categories.find(entry.extension);
            return it == categories.end() ? "File" : it->second;
        }

        // UTC, second precision
        std::string format_time(double seconds_since_epoch) {
            auto t = static_cast<std::time_t>(seconds_since_epoch);
            char buf[32];
            const std::tm *tm = std::gmtime(&t);
            if (!tm || std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", tm) == 0) {
                return "unknown";
            }
            return buf;
        }

        // '|' would split a table cell
        std::string cell(const std::string &text) {
            std::string out;
            out.reserve(text.size());
            for (char c: text) {
                if (c == '|') out += '\\';
                out += c;
            }
            return out;
        }

        json list_files_table(const json &args, ServerState &state) {
            auto page = listing_page(args, state);
            const auto &listing = page.listing;
            const auto &batch = page.batch;

            std::string text = "| type | text | annotations | meta |\n";
            text += fmt::format("| summary | Directory: {} | Directory listing | Total: {} files, {} directories, {} |\n",
                                cell(listing->directory), listing->summary.total_files,
                                listing->summary.total_directories, format_size(listing->summary.total_size_bytes));
            for (const auto &entry: batch.entries) {
                std::string meta = entry.is_dir
                                           ? fmt::format("Modified: {} UTC", format_time(entry.modified_time))
                                           : fmt::format("Size: {} | Modified: {} UTC", format_size(entry.size_bytes),
                                                         format_time(entry.modified_time));
                text += fmt::format("| {} | {} | {} | {} |\n",
                                    cell(entry_type(entry)), cell(entry.path), entry_category(entry), meta);
            }
            if (batch.next_offset) {
                text += fmt::format("| pagination | Showing {}-{} of {} | More entries available | Next offset: {} |\n",
                                    batch.offset + 1, batch.offset + batch.entries.size(), batch.total,
                                    *batch.next_offset);
                text += fmt::format("| next_offset | {} | Use this value for the next batch | Batch size: {} |\n",
                                    *batch.next_offset, batch.limit);
            }
            if (batch.partial()) {
                text += fmt::format("| partial | {} | Scan stopped early | Retry later or narrow the filters |\n",
                                    scanner::to_string(batch.partial_reason));
            }
            return text;
        }

        // Names, types and sizes only; no paths
        json list_files_metadata_only(const json &args, ServerState &state) {
            auto page = listing_page(args, state);
            const auto &batch = page.batch;

            json entries = json::array();
            for (const auto &entry: batch.entries) {
                entries.push_back({{"name", entry.name},
                                   {"type", entry_type(entry)},
                                   {"size_bytes", entry.size_bytes}});
            }
            json result = {
                    {"entries", std::move(entries)},
                    {"offset", batch.offset},
                    {"total", batch.total},
                    {"returned", batch.entries.size()},
                    {"has_more", batch.has_more()},
                    {"partial", batch.partial()}};
            if (batch.next_offset) {
                result["next_offset"] = *batch.next_offset;
            }
            if (batch.partial()) {
                result["partial_reason"] = scanner::to_string(batch.partial_reason);
            }
            return result;
        }

        json pagination_plan(const json &args, ServerState &state) {
            auto directory = require_string(args, "directory", "to plan pagination");
            auto options = scan_options(args, 3);
            auto batch_size = static_cast<size_t>(int_arg(args, "batch_size", 20, 5, 50));

            auto listing = state.listing(directory, options, scanner::SortSpec{}, bool_arg(args, "use_cache", true));
            json result = scanner::plan_pagination(*listing, batch_size).to_json();
            result["directory"] = listing->directory;
            return result;
        }

        json start_stream(const json &args, ServerState &state) {
            auto directory = require_string(args, "directory", "to start a stream");
            auto options = scan_options(args, 2);
            std::optional<size_t> batch_size;
            if (args.contains("batch_size")) {
                batch_size = static_cast<size_t>(int_arg(args, "batch_size", 5, 1, 50));
            }
            return state.streams().start(directory, options, batch_size).to_json();
        }

        json next_stream(const json &args, ServerState &state) {
            auto session_id = require_string(args, "session_id", "to continue a stream");
            return state.streams().next(session_id).to_json();
        }

        json stop_stream(const json &args, ServerState &state) {
            auto session_id = require_string(args, "session_id", "to stop a stream");
            return state.streams().stop(session_id).to_json();
        }

        json stream_files(const json &args, ServerState &state) {
            auto action = args["action"].get<std::string>();
            if (action == "start") {
                return start_stream(args, state);
            }
            if (action == "next") {
                return next_stream(args, state);
            }
            return stop_stream(args, state);
        }

        json track_usage(const json &args, ServerState &state) {
            double amount = args.contains("amount") && args["amount"].is_number() ? args["amount"].get<double>() : 1.0;
            return state.usage().record(args["operation"].get<std::string>(), amount);
        }

        json usage_summary(const json &, ServerState &state) {
            return state.usage().summarize();
        }

        json analyze_code(const json &args, ServerState &state) {
            return state.code_metrics().analyze(args["path"].get<std::string>());
        }

        json system_health(const json &, ServerState &state) {
            json status = state.health().status();
            status["server"] = {{"name", state.settings().server_name}, {"version", TREESCOUT_VERSION}};
            status["streams"] = {{"active", state.streams().size()},
                                 {"max_sessions", state.streams().config().max_sessions}};
            status["cache"] = {{"size", state.cache().size()},
                               {"capacity", state.cache().capacity()},
                               {"hits", state.cache().hits()},
                               {"misses", state.cache().misses()}};
            status["requests"] = state.request_stats().to_json();
            return status;
        }

    }// namespace

    void register_builtin_tools(ToolRegistry &registry) {
        registry.register_builtin(
                {"list_files",
                 "List a directory one page at a time. Follow batch.next_offset until it is absent to read the whole listing.",
                 listing_schema()},
                list_files);

        registry.register_builtin(
                {"list_files_readable",
                 "Same listing as list_files, rendered as plain text.",
                 listing_schema()},
                list_files_readable);

        registry.register_builtin(
                {"list_files_table",
                 "Same listing as list_files as a pipe table with type, text, annotations and meta columns.",
                 listing_schema()},
                list_files_table);

        registry.register_builtin(
                {"list_files_metadata_only",
                 "Same listing as list_files reduced to entry names, types and sizes, without paths.",
                 listing_schema()},
                list_files_metadata_only);

        json plan_props = scan_properties(3);
        plan_props["batch_size"] = ranged("Entries per page", 5, 50, 20);
        plan_props["use_cache"] = property("boolean", "Serve from the listing cache when fresh (default true)");
        registry.register_builtin(
                {"pagination_plan",
                 "Count the entries of a directory and return every valid list_files offset for a batch size.",
                 {{"type", "object"}, {"properties", plan_props}, {"required", {"directory"}}}},
                pagination_plan);

        registry.register_builtin(
                {"start_stream",
                 "Open a streaming session over a directory and return its first batch.",
                 {{"type", "object"}, {"properties", stream_properties()}, {"required", {"directory"}}}},
                start_stream);

        registry.register_builtin(
                {"next_stream",
                 "Return the next batch of a streaming session. An empty batch with complete=true ends the stream.",
                 session_schema()},
                next_stream);

        registry.register_builtin(
                {"stop_stream",
                 "Close a streaming session and free its state.",
                 session_schema()},
                stop_stream);

        json stream_props = stream_properties();
        stream_props["action"] = property("string", "start needs directory; next and stop need session_id");
        stream_props["action"]["enum"] = {"start", "next", "stop"};
        stream_props["session_id"] = property("string", "Id returned by action=start");
        registry.register_builtin(
                {"stream_files",
                 "Single entry point for streaming sessions.",
                 {{"type", "object"}, {"properties", stream_props}, {"required", {"action"}}}},
                stream_files);

        json amount = property("number", "Amount to add, default 1");
        amount["default"] = 1;
        registry.register_builtin(
                {"track_usage",
                 "Record one use of an operation.",
                 {{"type", "object"},
                  {"properties", {{"operation", property("string", "Operation name")}, {"amount", amount}}},
                  {"required", {"operation"}}}},
                track_usage);

        registry.register_builtin(
                {"usage_summary", "Totals recorded through track_usage.", empty_schema()},
                usage_summary);

        registry.register_builtin(
                {"analyze_code",
                 "Line counts and a complexity estimate for one source file.",
                 {{"type", "object"},
                  {"properties", {{"path", property("string", "File to analyze")}}},
                  {"required", {"path"}}}},
                analyze_code);

        registry.register_builtin(
                {"system_health", "Process health, cache and session counters.", empty_schema()},
                system_health);

        TREESCOUT_DEBUG("Registered {} built-in tools", registry.size());
    }

}// namespace treescout::business
