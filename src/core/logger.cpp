#include "logger.h"
#include <filesystem>
#include <memory>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace treescout {
    namespace core {

        std::shared_ptr<spdlog::logger> g_logger = nullptr;
        LogLevel g_current_level = LogLevel::INFO;

        LogLevel parse_log_level(const std::string &name) {
            if (name == "trace") return LogLevel::TRACE;
            if (name == "debug") return LogLevel::DEBUG;
            if (name == "warn") return LogLevel::WARN;
            if (name == "error") return LogLevel::ERR;
            if (name == "critical") return LogLevel::CRITICAL;
            if (name == "off") return LogLevel::OFF;
            return LogLevel::INFO;
        }

        TreeScoutLogger &TreeScoutLogger::instance() {
            static TreeScoutLogger instance;
            return instance;
        }

        // allow access to the underlying spdlog::logger
        std::shared_ptr<spdlog::logger> TreeScoutLogger::operator->() {
            return g_logger;
        }

        void TreeScoutLogger::set_level(LogLevel level) {
            g_current_level = level;
            if (g_logger) {
                g_logger->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(level)));
            }
        }

        LogLevel TreeScoutLogger::get_level() const {
            return g_current_level;
        }

        void TreeScoutLogger::trace(const char *msg) {
            if (enabled(LogLevel::TRACE)) g_logger->trace(msg);
        }

        void TreeScoutLogger::debug(const char *msg) {
            if (enabled(LogLevel::DEBUG)) g_logger->debug(msg);
        }

        void TreeScoutLogger::info(const char *msg) {
            if (enabled(LogLevel::INFO)) g_logger->info(msg);
        }

        void TreeScoutLogger::warn(const char *msg) {
            if (enabled(LogLevel::WARN)) g_logger->warn(msg);
        }

        void TreeScoutLogger::error(const char *msg) {
            if (enabled(LogLevel::ERR)) g_logger->error(msg);
        }

        void TreeScoutLogger::critical(const char *msg) {
            if (enabled(LogLevel::CRITICAL)) g_logger->critical(msg);
        }

        void initializeAsyncLogger(const std::string &log_path, const std::string &log_level, size_t max_file_size,
                                   size_t max_files) {
            spdlog::init_thread_pool(8192, 1);

            std::vector<spdlog::sink_ptr> sinks;

            // stdout is the protocol channel, console output goes to stderr
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_color_mode(spdlog::color_mode::automatic);
            console_sink->set_color(spdlog::level::trace, "\033[36m");           // Cyan
            console_sink->set_color(spdlog::level::debug, "\033[34m");           // Blue
            console_sink->set_color(spdlog::level::info, "\033[32m");            // Green
            console_sink->set_color(spdlog::level::warn, "\033[33m");            // Yellow
            console_sink->set_color(spdlog::level::err, "\033[31m");             // Red
            console_sink->set_color(spdlog::level::critical, "\033[41m\033[37m");// White on red background
            sinks.push_back(console_sink);

            if (!log_path.empty()) {
                std::error_code ec;
                auto parent = std::filesystem::path(log_path).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent, ec);
                }
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path, max_file_size, max_files));
            }

            g_current_level = parse_log_level(log_level);

            g_logger = std::make_shared<spdlog::async_logger>(
                    "treescout", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                    spdlog::async_overflow_policy::block);
            g_logger->set_level(static_cast<spdlog::level::level_enum>(static_cast<int>(g_current_level)));
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            g_logger->flush_on(spdlog::level::err);

            spdlog::register_logger(g_logger);
            spdlog::set_default_logger(g_logger);

            // Start periodic flushing (every 3 seconds)
            spdlog::flush_every(std::chrono::seconds(3));
        }

        void shutdownLogger() {
            if (g_logger) {
                g_logger->flush();
                g_logger.reset();
            }
            spdlog::shutdown();
        }

    }// namespace core
}// namespace treescout
