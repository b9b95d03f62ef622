#include "config/config.hpp"// Configuration management using INI file
#include "core/logger.h"
#include "core/server.h"
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

namespace {

    void print_usage(const char *program) {
        std::cerr << "Usage: " << program << " [--config <path>]\n"
                  << "Serves JSON-RPC requests on stdin/stdout, one per line.\n";
    }

}// namespace

/**
 * Entry point of the TreeScout server.
 * Loads the configuration, sets up logging, builds the server and serves
 * stdin until it is closed.
 *
 * @return 0 when input ends normally, non-zero if startup fails.
 */
int main(int argc, char **argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            treescout::config::set_config_file_path(argv[++i]);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    try {
        // Step 1: write config.ini with defaults if it is missing, then load it
        treescout::config::initialize_config_system(treescout::config::ConfigMode::STATIC);
        auto config = treescout::config::get_current_config();

        // Step 2: logging goes to stderr and the rotating file, never stdout
        treescout::core::initializeAsyncLogger(
                config.server.log_path,
                config.server.log_level,
                config.server.max_file_size,
                config.server.max_files);
        TREESCOUT_INFO("Starting TreeScout with configuration: {}", treescout::config::get_config_file_path());
        treescout::config::print_config(config);

        // Step 3: build the server
        auto server = treescout::core::TreeScoutServer::Builder{}
                              .with_config(config)
                              .build();

        // Setup signal handler for graceful shutdown
        asio::io_context io_context;
        asio::signal_set signals(io_context, SIGINT, SIGTERM);

        signals.async_wait([&](const asio::error_code &error, int signal_number) {
            if (!error) {
                TREESCOUT_INFO("Received signal {}, shutting down", signal_number);
                treescout::core::shutdownLogger();
                std::quick_exit(0);
            }
        });

        // Run the signal handler in a separate thread
        std::thread signal_thread([&io_context]() {
            io_context.run();
        });

        TREESCOUT_INFO("TreeScout is ready, reading requests from stdin");

        // Step 4: serve until stdin is closed
        server->run();

        // Stop the signal handler and wait for the thread to finish
        io_context.stop();
        if (signal_thread.joinable()) {
            signal_thread.join();
        }

        TREESCOUT_INFO("Server shutdown complete.");
        treescout::core::shutdownLogger();
        return 0;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        TREESCOUT_ERROR("Server error: {}", e.what());
        treescout::core::shutdownLogger();
        return -1;
    }
}
