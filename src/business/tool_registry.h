// src/business/tool_registry.h
#pragma once

#include "protocol/tool.h"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace treescout::business {

    class ServerState;

    // Tool execution function signature
    using ToolExecutor = std::function<nlohmann::json(const nlohmann::json &args, ServerState &state)>;

    // Tool metadata + executor
    struct RegisteredTool {
        protocol::Tool metadata;
        ToolExecutor executor;
    };

    class ToolRegistry {
    public:
        // Register built-in tools; a second registration under a name replaces the first
        void register_builtin(const protocol::Tool &tool, ToolExecutor exec);

        // Names and tools in registration order
        std::vector<std::string> get_all_tool_names() const;
        std::vector<protocol::Tool> get_all_tools() const;
        std::shared_ptr<protocol::Tool> get_tool_info(const std::string &name) const;
        size_t size() const { return tools_.size(); }

        /**
         * @brief Check args against the tool's input schema: required keys
         *        present, declared types and enums respected.
         * @throws protocol::ValidationError naming the first offending parameter
         */
        static void validate_arguments(const protocol::Tool &tool, const nlohmann::json &args);

        /**
         * @brief Validate and run a tool.
         * @throws protocol::ValidationError for an unknown tool or bad arguments;
         *         anything the executor throws propagates unchanged
         */
        nlohmann::json execute(const std::string &name, const nlohmann::json &args, ServerState &state);

    private:
        std::vector<RegisteredTool> tools_;
        std::unordered_map<std::string, size_t> index_;
    };

}// namespace treescout::business
