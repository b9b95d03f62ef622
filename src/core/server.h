// src/core/server.h
#pragma once

#include "business/request_handler.h"
#include "business/server_state.h"
#include "business/tool_registry.h"
#include "config/config.hpp"
#include "transport/stdio_transport.h"
#include <iosfwd>
#include <memory>


namespace treescout::core {

    class TreeScoutServer {
    public:
        class Builder;

        /**
         * @brief Serve requests from in to out until end of input.
         * @return Number of input lines handled
         */
        size_t run(std::istream &in, std::ostream &out);

        // stdin/stdout
        size_t run();

        // Stop after the request being handled
        void stop();

        business::RequestHandler &handler() { return *request_handler_; }
        business::ServerState &state() { return *state_; }
        std::shared_ptr<business::ToolRegistry> registry() const { return registry_; }

    private:
        TreeScoutServer() = default;
        friend class Builder;

        std::shared_ptr<business::ToolRegistry> registry_;
        std::shared_ptr<business::ServerState> state_;
        std::unique_ptr<business::RequestHandler> request_handler_;
        transport::StdioTransport *active_transport_ = nullptr;
    };

    class TreeScoutServer::Builder {
    public:
        Builder();

        // Translate [server]/[scanner]/[cache]/[stream] into ServerSettings
        Builder &with_config(const config::GlobalConfig &config);
        Builder &with_settings(business::ServerSettings settings);
        Builder &with_usage_recorder(std::shared_ptr<collaborators::UsageRecorder> recorder);
        Builder &with_code_metrics(std::shared_ptr<collaborators::CodeMetrics> metrics);
        Builder &with_health_reporter(std::shared_ptr<collaborators::HealthReporter> reporter);
        Builder &with_memory_probe(scanner::MemoryProbe probe);
        Builder &with_clock(scanner::SteadyClock clock);
        std::unique_ptr<TreeScoutServer> build();

    private:
        std::unique_ptr<TreeScoutServer> server_ = nullptr;
        business::ServerSettings settings_;
        std::shared_ptr<collaborators::UsageRecorder> usage_;
        std::shared_ptr<collaborators::CodeMetrics> code_metrics_;
        std::shared_ptr<collaborators::HealthReporter> health_;
        scanner::MemoryProbe probe_;
        scanner::SteadyClock clock_;
    };

}// namespace treescout::core
