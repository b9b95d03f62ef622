#ifndef TREESCOUT_CONFIG_HPP
#define TREESCOUT_CONFIG_HPP

#include "core/executable_path.h"
#include "core/logger.h"
#include "inicpp.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>


namespace treescout {
    namespace config {

        constexpr const char *CONFIG_FILE = "config.ini";

        inline std::string g_config_file_path;

        // --config <path> wins over config.ini beside the executable
        inline void set_config_file_path(const std::string &path) {
            g_config_file_path = path;
        }

        inline std::string get_config_file_path() {
            if (!g_config_file_path.empty()) {
                return g_config_file_path;
            }
            std::filesystem::path exe_dir(treescout::core::getExecutableDirectory());
            return (exe_dir / CONFIG_FILE).string();
        }

        enum class ConfigMode {
            NONE, // Use default settings without file
            STATIC// Load from file once, defaults when it is missing
        };

        namespace detail {
            // Empty or absent keys fall back to the default
            inline std::string read_string(inicpp::IniManager &ini, const char *section, const char *key, const std::string &def) {
                auto value = ini[section][key].String();
                return value.empty() ? def : value;
            }

            inline size_t read_size(inicpp::IniManager &ini, const char *section, const char *key, size_t def) {
                return ini[section][key].String().empty() ? def : static_cast<size_t>(ini[section][key]);
            }
        }// namespace detail

        /**
 * [server]: identity and logging
 */
        struct ServerConfig {
            std::string server_name = "treescout";
            std::string log_level = "info";
            std::string log_path = "logs/treescout.log";
            size_t max_file_size = 10485760;
            size_t max_files = 5;

            static ServerConfig load(inicpp::IniManager &ini) {
                try {
                    ServerConfig config;
                    config.server_name = detail::read_string(ini, "server", "server_name", config.server_name);
                    config.log_level = detail::read_string(ini, "server", "log_level", config.log_level);
                    config.log_path = detail::read_string(ini, "server", "log_path", config.log_path);
                    config.max_file_size = detail::read_size(ini, "server", "max_file_size", config.max_file_size);
                    config.max_files = detail::read_size(ini, "server", "max_files", config.max_files);
                    return config;
                } catch (const std::exception &e) {
                    TREESCOUT_ERROR("Failed to load server config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * [scanner]: ceilings of one list/plan call
 */
        struct ScannerConfig {
            size_t memory_ceiling_mb = 25;
            size_t time_budget_ms = 10000;
            size_t max_entries = 200000;
            size_t check_interval = 1000;

            static ScannerConfig load(inicpp::IniManager &ini) {
                try {
                    ScannerConfig config;
                    config.memory_ceiling_mb = detail::read_size(ini, "scanner", "memory_ceiling_mb", config.memory_ceiling_mb);
                    config.time_budget_ms = detail::read_size(ini, "scanner", "time_budget_ms", config.time_budget_ms);
                    config.max_entries = detail::read_size(ini, "scanner", "max_entries", config.max_entries);
                    config.check_interval = detail::read_size(ini, "scanner", "check_interval", config.check_interval);
                    return config;
                } catch (const std::exception &e) {
                    TREESCOUT_ERROR("Failed to load scanner config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * [cache]: listing cache
 */
        struct CacheConfig {
            size_t capacity = 64;
            size_t ttl_seconds = 300;

            static CacheConfig load(inicpp::IniManager &ini) {
                try {
                    CacheConfig config;
                    config.capacity = detail::read_size(ini, "cache", "capacity", config.capacity);
                    config.ttl_seconds = detail::read_size(ini, "cache", "ttl_seconds", config.ttl_seconds);
                    return config;
                } catch (const std::exception &e) {
                    TREESCOUT_ERROR("Failed to load cache config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * [stream]: streaming sessions
 */
        struct StreamConfig {
            size_t batch_size = 5;
            size_t idle_timeout_seconds = 300;
            size_t max_sessions = 64;
            size_t memory_ceiling_mb = 10;

            static StreamConfig load(inicpp::IniManager &ini) {
                try {
                    StreamConfig config;
                    config.batch_size = detail::read_size(ini, "stream", "batch_size", config.batch_size);
                    config.idle_timeout_seconds = detail::read_size(ini, "stream", "idle_timeout_seconds", config.idle_timeout_seconds);
                    config.max_sessions = detail::read_size(ini, "stream", "max_sessions", config.max_sessions);
                    config.memory_ceiling_mb = detail::read_size(ini, "stream", "memory_ceiling_mb", config.memory_ceiling_mb);
                    return config;
                } catch (const std::exception &e) {
                    TREESCOUT_ERROR("Failed to load stream config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Global configuration
 */
        struct GlobalConfig {
            std::string title = "TreeScout Configuration";
            ServerConfig server;
            ScannerConfig scanner;
            CacheConfig cache;
            StreamConfig stream;

            static GlobalConfig load(const std::string &path) {
                try {
                    inicpp::IniManager ini(path);
                    TREESCOUT_INFO("Loading configuration from: {}", path);

                    GlobalConfig config;
                    config.title = detail::read_string(ini, "", "title", config.title);
                    config.server = ServerConfig::load(ini);
                    config.scanner = ScannerConfig::load(ini);
                    config.cache = CacheConfig::load(ini);
                    config.stream = StreamConfig::load(ini);
                    return config;
                } catch (const std::exception &e) {
                    TREESCOUT_ERROR("Failed to load global config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Template Method base: subclasses supply the built-in defaults
 */
        class ConfigLoader {
        protected:
            virtual std::unique_ptr<GlobalConfig> createDefaultConfig() = 0;

            virtual std::unique_ptr<GlobalConfig> loadFromStaticFile(const std::string &path) {
                return std::make_unique<GlobalConfig>(GlobalConfig::load(path));
            }

        public:
            virtual ~ConfigLoader() = default;

            std::unique_ptr<GlobalConfig> load(ConfigMode mode, const std::string &path) {
                switch (mode) {
                    case ConfigMode::NONE:
                        return createDefaultConfig();
                    case ConfigMode::STATIC:
                        if (std::filesystem::exists(path)) {
                            return loadFromStaticFile(path);
                        }
                        TREESCOUT_WARN("Config file not found, using default settings");
                        return createDefaultConfig();
                }
                return createDefaultConfig();
            }
        };

        class DefaultConfigLoader : public ConfigLoader {
        protected:
            std::unique_ptr<GlobalConfig> createDefaultConfig() override {
                auto config = std::make_unique<GlobalConfig>();
                config->title = "Default TreeScout Config";
                return config;
            }
        };

        // Global state (managed by loader)
        inline std::unique_ptr<ConfigLoader> g_config_loader;
        inline std::unique_ptr<GlobalConfig> g_current_config;
        inline std::mutex g_config_mutex;
        inline std::atomic<bool> g_config_initialized{false};

        /**
 * Write config.ini with every key and a comment, unless a non-empty file exists
 */
        inline void initialize_default_config(const std::string &config_file) {
            try {
                if (std::filesystem::exists(config_file) && std::filesystem::file_size(config_file) > 0) {
                    return;
                }
                auto parent = std::filesystem::path(config_file).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }

                inicpp::IniManager ini(config_file);
                TREESCOUT_INFO("Creating default config file: {}", config_file);

                // [server]
                ini.set("server", "server_name", "treescout");
                ini.set("server", "log_level", "info");
                ini.set("server", "log_path", "logs/treescout.log");
                ini.set("server", "max_file_size", 10485760);
                ini.set("server", "max_files", 5);

                // [scanner]
                ini.set("scanner", "memory_ceiling_mb", 25);
                ini.set("scanner", "time_budget_ms", 10000);
                ini.set("scanner", "max_entries", 200000);
                ini.set("scanner", "check_interval", 1000);

                // [cache]
                ini.set("cache", "capacity", 64);
                ini.set("cache", "ttl_seconds", 300);

                // [stream]
                ini.set("stream", "batch_size", 5);
                ini.set("stream", "idle_timeout_seconds", 300);
                ini.set("stream", "max_sessions", 64);
                ini.set("stream", "memory_ceiling_mb", 10);

                ini.setComment("server", "server_name", "Name reported in the initialize response");
                ini.setComment("server", "log_level", "Logging severity (trace, debug, info, warn, error, critical, off)");
                ini.setComment("server", "log_path", "Rotating log file, empty to log to stderr only");
                ini.setComment("server", "max_file_size", "Maximum size per log file in bytes");
                ini.setComment("server", "max_files", "Maximum number of rotated log files");

                ini.setComment("scanner", "memory_ceiling_mb", "Resident memory growth that stops a scan early, 0 disables");
                ini.setComment("scanner", "time_budget_ms", "Wall-clock budget of one scan in milliseconds, 0 disables");
                ini.setComment("scanner", "max_entries", "Entries collected before a scan stops early, 0 disables");
                ini.setComment("scanner", "check_interval", "Entries between two memory samples");

                ini.setComment("cache", "capacity", "Listings kept in the cache");
                ini.setComment("cache", "ttl_seconds", "Seconds a cached listing stays fresh");

                ini.setComment("stream", "batch_size", "Default entries per stream batch");
                ini.setComment("stream", "idle_timeout_seconds", "Idle seconds before a stream session is dropped");
                ini.setComment("stream", "max_sessions", "Open stream sessions kept at most");
                ini.setComment("stream", "memory_ceiling_mb", "Memory ceiling of one stream batch");

                ini.set("title", "TreeScout Configuration");
                ini.setComment("title", "Auto-generated configuration file");
                ini.parse();

                TREESCOUT_INFO("Default config created successfully");
            } catch (const std::exception &e) {
                TREESCOUT_ERROR("Failed to initialize default config: {}", e.what());
                throw;
            }
        }

        inline void print_config(const GlobalConfig &config) {
            TREESCOUT_DEBUG("===== TreeScout Configuration =====");
            TREESCOUT_DEBUG("Title: {}", config.title);
            TREESCOUT_DEBUG("Server name: {}", config.server.server_name);
            TREESCOUT_DEBUG("Log Level: {}", config.server.log_level);
            TREESCOUT_DEBUG("Log Path: {}", config.server.log_path);
            TREESCOUT_DEBUG("Scanner: {} MB, {} ms, {} entries, check every {}",
                            config.scanner.memory_ceiling_mb, config.scanner.time_budget_ms,
                            config.scanner.max_entries, config.scanner.check_interval);
            TREESCOUT_DEBUG("Cache: capacity {}, ttl {} s", config.cache.capacity, config.cache.ttl_seconds);
            TREESCOUT_DEBUG("Stream: batch {}, idle {} s, max {} sessions, {} MB",
                            config.stream.batch_size, config.stream.idle_timeout_seconds,
                            config.stream.max_sessions, config.stream.memory_ceiling_mb);
            TREESCOUT_DEBUG("===================================");
        }

        /**
 * Load the configuration once; later calls are no-ops
 */
        inline void initialize_config_system(ConfigMode mode = ConfigMode::STATIC) {
            if (g_config_initialized.load()) return;

            if (mode == ConfigMode::STATIC) {
                initialize_default_config(get_config_file_path());
            }

            g_config_loader = std::make_unique<DefaultConfigLoader>();
            {
                std::lock_guard<std::mutex> lock(g_config_mutex);
                g_current_config = g_config_loader->load(mode, get_config_file_path());
            }
            g_config_initialized = true;
        }

        inline GlobalConfig get_current_config() {
            std::lock_guard<std::mutex> lock(g_config_mutex);
            return g_current_config ? *g_current_config : GlobalConfig{};
        }

    }// namespace config
}// namespace treescout

#endif// TREESCOUT_CONFIG_HPP
