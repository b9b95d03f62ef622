// src/collaborators/collaborators.h
#pragma once

#include "scanner/memory_probe.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace treescout::collaborators {

    /**
     * @brief Usage accounting. record() acknowledges one operation and
     *        summarize() reports totals per operation.
     */
    class UsageRecorder {
    public:
        virtual ~UsageRecorder() = default;
        virtual nlohmann::json record(const std::string &operation, double amount) = 0;
        virtual nlohmann::json summarize() const = 0;
    };

    /**
     * @brief Source metrics for one file: at least "lines" and "complexity".
     */
    class CodeMetrics {
    public:
        virtual ~CodeMetrics() = default;
        virtual nlohmann::json analyze(const std::string &path) = 0;
    };

    /**
     * @brief Process health: at least "healthy".
     */
    class HealthReporter {
    public:
        virtual ~HealthReporter() = default;
        virtual nlohmann::json status() const = 0;
    };

    class InMemoryUsageRecorder : public UsageRecorder {
    public:
        nlohmann::json record(const std::string &operation, double amount) override;
        nlohmann::json summarize() const override;

    private:
        struct Totals {
            std::size_t count = 0;
            double amount = 0.0;
        };
        std::map<std::string, Totals> totals_;
    };

    /**
     * @brief Line counts plus a keyword-based cyclomatic estimate
     *        (1 + number of branch keywords and boolean operators).
     */
    class LineCountMetrics : public CodeMetrics {
    public:
        // Files larger than this are rejected rather than read
        static constexpr std::uintmax_t kMaxFileBytes = 8u * 1024u * 1024u;

        nlohmann::json analyze(const std::string &path) override;
    };

    class ProcessHealthReporter : public HealthReporter {
    public:
        explicit ProcessHealthReporter(scanner::MemoryProbe probe = nullptr);
        nlohmann::json status() const override;

    private:
        scanner::MemoryProbe probe_;
        std::chrono::steady_clock::time_point started_;
    };

    std::shared_ptr<UsageRecorder> make_default_usage_recorder();
    std::shared_ptr<CodeMetrics> make_default_code_metrics();
    std::shared_ptr<HealthReporter> make_default_health_reporter();

}// namespace treescout::collaborators
