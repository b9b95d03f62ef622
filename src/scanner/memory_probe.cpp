#include "memory_probe.h"
#include <fstream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace treescout::scanner {

    std::size_t current_rss_bytes() {
#ifdef _WIN32
        return 0;
#else
        // statm: size resident shared text lib data dt, all in pages
        std::ifstream statm("/proc/self/statm");
        std::size_t size_pages = 0;
        std::size_t resident_pages = 0;
        if (!(statm >> size_pages >> resident_pages)) {
            return 0;
        }
        long page_size = sysconf(_SC_PAGESIZE);
        if (page_size <= 0) {
            return 0;
        }
        return resident_pages * static_cast<std::size_t>(page_size);
#endif
    }

    MemoryProbe default_memory_probe() {
        return &current_rss_bytes;
    }

    SteadyClock default_clock() {
        return [] { return std::chrono::steady_clock::now(); };
    }

    ScanBudget::ScanBudget(const ScanLimits &limits, MemoryProbe probe, SteadyClock clock)
        : limits_(limits),
          probe_(probe ? std::move(probe) : default_memory_probe()),
          clock_(clock ? std::move(clock) : default_clock()),
          started_(clock_()),
          baseline_rss_(probe_()) {
    }

    std::optional<PartialReason> ScanBudget::on_entry() {
        ++produced_;

        if (limits_.max_entries > 0 && produced_ > limits_.max_entries) {
            return PartialReason::Entries;
        }
        if (auto reason = check_time()) {
            return reason;
        }
        std::size_t interval = limits_.check_interval == 0 ? 1 : limits_.check_interval;
        if (produced_ % interval == 0) {
            return check_memory();
        }
        return std::nullopt;
    }

    std::optional<PartialReason> ScanBudget::check_now() {
        if (auto reason = check_memory()) {
            return reason;
        }
        return check_time();
    }

    std::size_t ScanBudget::memory_growth() const {
        std::size_t now = probe_();
        return now > baseline_rss_ ? now - baseline_rss_ : 0;
    }

    std::chrono::milliseconds ScanBudget::elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started_);
    }

    std::optional<PartialReason> ScanBudget::check_time() const {
        if (limits_.time_budget.count() > 0 && elapsed() > limits_.time_budget) {
            return PartialReason::Time;
        }
        return std::nullopt;
    }

    std::optional<PartialReason> ScanBudget::check_memory() const {
        if (limits_.memory_ceiling_bytes > 0 && memory_growth() > limits_.memory_ceiling_bytes) {
            return PartialReason::Memory;
        }
        return std::nullopt;
    }

}// namespace treescout::scanner
