#include "collaborators.h"
#include "protocol/tool_error.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <string_view>

namespace treescout::collaborators {

    nlohmann::json InMemoryUsageRecorder::record(const std::string &operation, double amount) {
        auto &t = totals_[operation];
        ++t.count;
        t.amount += amount;
        return {
                {"recorded", true},
                {"operation", operation},
                {"amount", amount},
                {"operation_count", t.count},
                {"operation_total", t.amount}};
    }

    nlohmann::json InMemoryUsageRecorder::summarize() const {
        nlohmann::json operations = nlohmann::json::object();
        std::size_t count = 0;
        double amount = 0.0;
        for (const auto &[name, t]: totals_) {
            operations[name] = {{"count", t.count}, {"total", t.amount}};
            count += t.count;
            amount += t.amount;
        }
        return {
                {"operations", operations},
                {"total_operations", count},
                {"total_amount", amount}};
    }

    namespace {

        bool is_word_char(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        std::size_t count_branches(std::string_view line) {
            static const std::set<std::string_view> keywords = {
                    "if", "elif", "for", "while", "case", "catch", "except", "and", "or"};
            std::size_t count = 0;
            std::size_t i = 0;
            while (i < line.size()) {
                if (is_word_char(line[i])) {
                    std::size_t start = i;
                    while (i < line.size() && is_word_char(line[i])) {
                        ++i;
                    }
                    if (keywords.count(line.substr(start, i - start))) {
                        ++count;
                    }
                    continue;
                }
                if (i + 1 < line.size() &&
                    ((line[i] == '&' && line[i + 1] == '&') || (line[i] == '|' && line[i + 1] == '|'))) {
                    ++count;
                    i += 2;
                    continue;
                }
                if (line[i] == '?') {
                    ++count;
                }
                ++i;
            }
            return count;
        }

        std::string_view trim_left(std::string_view s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
                s.remove_prefix(1);
            }
            return s;
        }

    }// namespace

    nlohmann::json LineCountMetrics::analyze(const std::string &path) {
        std::error_code ec;
        auto st = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(st)) {
            throw protocol::ResourceError(path, "file does not exist");
        }
        if (!std::filesystem::is_regular_file(st)) {
            throw protocol::ResourceError(path, "not a regular file");
        }
        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            throw protocol::ResourceError(path, ec.message());
        }
        if (size > kMaxFileBytes) {
            throw protocol::ResourceError(path, "file larger than " + std::to_string(kMaxFileBytes) + " bytes");
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw protocol::ResourceError(path, "cannot open file");
        }

        std::size_t lines = 0;
        std::size_t blank = 0;
        std::size_t comments = 0;
        std::size_t branches = 0;
        std::string line;
        while (std::getline(in, line)) {
            ++lines;
            auto body = trim_left(line);
            if (body.empty()) {
                ++blank;
                continue;
            }
            if (body.rfind("//", 0) == 0 || body.front() == '#' || body.rfind("/*", 0) == 0 || body.front() == '*') {
                ++comments;
                continue;
            }
            branches += count_branches(body);
        }

        return {
                {"path", path},
                {"extension", std::filesystem::path(path).extension().string()},
                {"size_bytes", size},
                {"lines", lines},
                {"blank_lines", blank},
                {"comment_lines", comments},
                {"code_lines", lines - blank - comments},
                {"complexity", 1 + branches}};
    }

    ProcessHealthReporter::ProcessHealthReporter(scanner::MemoryProbe probe)
        : probe_(probe ? std::move(probe) : scanner::default_memory_probe()),
          started_(std::chrono::steady_clock::now()) {
    }

    nlohmann::json ProcessHealthReporter::status() const {
        auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
        return {
                {"healthy", true},
                {"uptime_seconds", uptime},
                {"rss_bytes", probe_()}};
    }

    std::shared_ptr<UsageRecorder> make_default_usage_recorder() {
        return std::make_shared<InMemoryUsageRecorder>();
    }

    std::shared_ptr<CodeMetrics> make_default_code_metrics() {
        return std::make_shared<LineCountMetrics>();
    }

    std::shared_ptr<HealthReporter> make_default_health_reporter() {
        return std::make_shared<ProcessHealthReporter>();
    }

}// namespace treescout::collaborators
