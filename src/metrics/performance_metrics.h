#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace treescout::metrics {

    /**
     * @brief Timing of one dispatched request.
     */
    struct PerformanceMetrics {
        std::string method;                                      ///< JSON-RPC method, empty for unparseable lines
        std::chrono::steady_clock::time_point start_time;        ///< Start time of request handling
        std::chrono::steady_clock::time_point end_time;          ///< End time of request handling
        size_t request_size = 0;                                 ///< Size of the request line in bytes
        size_t response_size = 0;                                ///< Size of the response line in bytes

        /**
         * @brief Calculate the duration of request handling in milliseconds.
         */
        double duration_ms() const {
            return std::chrono::duration<double, std::milli>(end_time - start_time).count();
        }
    };

    class PerformanceTracker {
    public:
        static PerformanceMetrics start_tracking(size_t request_size = 0) {
            PerformanceMetrics metrics{};
            metrics.start_time = std::chrono::steady_clock::now();
            metrics.request_size = request_size;
            return metrics;
        }

        static void end_tracking(PerformanceMetrics &metrics, size_t response_size = 0) {
            metrics.end_time = std::chrono::steady_clock::now();
            metrics.response_size = response_size;
        }
    };

    /**
     * @brief Per-method request counters, reported by system_health.
     */
    class RequestStats {
    public:
        void add(const PerformanceMetrics &metrics) {
            auto &entry = methods_[metrics.method.empty() ? "(invalid)" : metrics.method];
            ++entry.count;
            entry.total_ms += metrics.duration_ms();
            if (metrics.duration_ms() > entry.max_ms) {
                entry.max_ms = metrics.duration_ms();
            }
            ++total_;
        }

        size_t total() const { return total_; }

        nlohmann::json to_json() const {
            nlohmann::json methods = nlohmann::json::object();
            for (const auto &[name, entry]: methods_) {
                methods[name] = {
                        {"count", entry.count},
                        {"avg_ms", entry.count ? entry.total_ms / static_cast<double>(entry.count) : 0.0},
                        {"max_ms", entry.max_ms}};
            }
            return {{"total", total_}, {"methods", methods}};
        }

    private:
        struct Entry {
            size_t count = 0;
            double total_ms = 0.0;
            double max_ms = 0.0;
        };
        std::map<std::string, Entry> methods_;
        size_t total_ = 0;
    };

}// namespace treescout::metrics
