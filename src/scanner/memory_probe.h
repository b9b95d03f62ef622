// src/scanner/memory_probe.h
#pragma once

#include "file_entry.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

namespace treescout::scanner {

    // Returns the process resident set size in bytes
    using MemoryProbe = std::function<std::size_t()>;
    using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @brief Resident set size of this process, read from /proc/self/statm.
     * @return 0 where the information is unavailable, which disables the
     *         memory ceiling rather than failing the scan.
     */
    std::size_t current_rss_bytes();

    MemoryProbe default_memory_probe();
    SteadyClock default_clock();

    /**
     * @brief Tracks one call's consumption against its ScanLimits.
     *
     * Created at the start of a call; check() is invoked after each produced
     * entry and reports the first ceiling that was breached.
     */
    class ScanBudget {
    public:
        ScanBudget(const ScanLimits &limits, MemoryProbe probe, SteadyClock clock);

        /**
         * @brief Account for one more produced entry.
         * @return The breached ceiling, or nullopt while within budget
         */
        std::optional<PartialReason> on_entry();

        /**
         * @brief Account for one entry re-walked but not produced. Only the
         *        time ceiling applies.
         */
        std::optional<PartialReason> on_skip() const { return check_time(); }

        /**
         * @brief Sample memory and time regardless of the check interval.
         */
        std::optional<PartialReason> check_now();

        std::size_t produced() const { return produced_; }
        std::size_t memory_growth() const;
        std::chrono::milliseconds elapsed() const;

    private:
        std::optional<PartialReason> check_time() const;
        std::optional<PartialReason> check_memory() const;

        ScanLimits limits_;
        MemoryProbe probe_;
        SteadyClock clock_;
        std::chrono::steady_clock::time_point started_;
        std::size_t baseline_rss_;
        std::size_t produced_ = 0;
    };

}// namespace treescout::scanner
