#include "server.h"
#include "business/builtin_tools.h"
#include "core/logger.h"
#include <iostream>
#include <memory>


namespace treescout::core {

    namespace {
        constexpr size_t kMiB = 1024u * 1024u;
    }

    TreeScoutServer::Builder::Builder() {
        server_ = std::unique_ptr<TreeScoutServer>(new TreeScoutServer());
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_config(const config::GlobalConfig &config) {
        settings_.server_name = config.server.server_name;

        settings_.scan_limits.memory_ceiling_bytes = config.scanner.memory_ceiling_mb * kMiB;
        settings_.scan_limits.time_budget = std::chrono::milliseconds(config.scanner.time_budget_ms);
        settings_.scan_limits.max_entries = config.scanner.max_entries;
        settings_.scan_limits.check_interval = config.scanner.check_interval;

        settings_.cache_capacity = config.cache.capacity;
        settings_.cache_ttl = std::chrono::seconds(config.cache.ttl_seconds);

        settings_.stream.batch_size = config.stream.batch_size;
        settings_.stream.idle_timeout = std::chrono::seconds(config.stream.idle_timeout_seconds);
        settings_.stream.max_sessions = config.stream.max_sessions;
        settings_.stream.limits = settings_.scan_limits;
        settings_.stream.limits.memory_ceiling_bytes = config.stream.memory_ceiling_mb * kMiB;
        return *this;
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_settings(business::ServerSettings settings) {
        settings_ = std::move(settings);
        return *this;
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_usage_recorder(std::shared_ptr<collaborators::UsageRecorder> recorder) {
        usage_ = std::move(recorder);
        return *this;
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_code_metrics(std::shared_ptr<collaborators::CodeMetrics> metrics) {
        code_metrics_ = std::move(metrics);
        return *this;
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_health_reporter(std::shared_ptr<collaborators::HealthReporter> reporter) {
        health_ = std::move(reporter);
        return *this;
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_memory_probe(scanner::MemoryProbe probe) {
        probe_ = std::move(probe);
        return *this;
    }

    TreeScoutServer::Builder &TreeScoutServer::Builder::with_clock(scanner::SteadyClock clock) {
        clock_ = std::move(clock);
        return *this;
    }

    std::unique_ptr<TreeScoutServer> TreeScoutServer::Builder::build() {
        // init core components
        server_->registry_ = std::make_shared<business::ToolRegistry>();
        business::register_builtin_tools(*server_->registry_);

        server_->state_ = std::make_shared<business::ServerState>(
                settings_, usage_, code_metrics_, health_, probe_, clock_);
        server_->request_handler_ = std::make_unique<business::RequestHandler>(server_->registry_, server_->state_);

        auto final_tools = server_->registry_->get_all_tool_names();
        TREESCOUT_INFO("Final tools in registry (total: {}):", final_tools.size());
        for (const auto &name: final_tools) {
            TREESCOUT_DEBUG("  - '{}'", name);
        }

        auto server = std::move(server_);
        server_ = std::unique_ptr<TreeScoutServer>(new TreeScoutServer());
        return server;
    }

    size_t TreeScoutServer::run(std::istream &in, std::ostream &out) {
        transport::StdioTransport transport(in, out);
        active_transport_ = &transport;
        auto handled = transport.run([this](const std::string &line) {
            return request_handler_->handle_request(line);
        });
        active_transport_ = nullptr;
        return handled;
    }

    size_t TreeScoutServer::run() {
        return run(std::cin, std::cout);
    }

    void TreeScoutServer::stop() {
        if (active_transport_) {
            active_transport_->close();
        }
    }

}// namespace treescout::core
