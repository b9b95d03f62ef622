#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include "protocol/tool.h"
#include "protocol/tool_error.h"
#include <memory>

namespace treescout::routers {

    /**
     * @brief Handle tools/call.
     *
     * This is the dispatch boundary: ToolError subclasses become error
     * responses carrying their own code and data, any other exception becomes
     * INTERNAL_ERROR naming the tool. Nothing escapes to the transport loop.
     */
    inline protocol::Response handle_tools_call(
            const protocol::Request &req,
            std::shared_ptr<business::ToolRegistry> registry,
            business::ServerState &state) {
        auto id = protocol::get_request_id(req);

        if (!req.params.is_object() || !req.params.contains("name") || !req.params["name"].is_string()) {
            return protocol::Response{
                    protocol::Error{protocol::error_code::INVALID_PARAMS,
                                    "tools/call requires a string 'name'",
                                    nlohmann::json{{"parameter", "name"}, {"expected", "string"}}},
                    id};
        }

        std::string tool_name = req.params["name"].get<std::string>();
        nlohmann::json args = req.params.contains("arguments") ? req.params["arguments"] : nlohmann::json::object();

        try {
            auto output = registry->execute(tool_name, args, state);
            return protocol::Response{protocol::make_tool_result(output), id};
        } catch (const protocol::ToolError &e) {
            TREESCOUT_WARN("Tool '{}' failed: {}", tool_name, e.what());
            return protocol::Response{e.to_error(), id};
        } catch (const std::exception &e) {
            TREESCOUT_ERROR("Error executing tool '{}': {}", tool_name, e.what());
            return protocol::Response{
                    protocol::Error{protocol::error_code::INTERNAL_ERROR,
                                    "Internal error while running tool '" + tool_name + "'",
                                    nlohmann::json{{"tool", tool_name}, {"detail", e.what()}}},
                    id};
        }
    }
}// namespace treescout::routers
