#pragma once
#include "business/rpc_router.h"
#include "protocol/json_rpc.h"
#include <memory>

namespace treescout::routers {
    /**
     * @brief Handle tool list request
     * @param req RPC request
     * @param registry Tool registry containing available tools
     * @return Response with list of tools and their input schemas
     */
    inline protocol::Response handle_tools_list(
            const protocol::Request &req,
            std::shared_ptr<business::ToolRegistry> registry,
            business::ServerState & /*state*/) {

        protocol::Response resp;
        resp.id = protocol::get_request_id(req);

        nlohmann::json tools_json = nlohmann::json::array();
        for (const auto &tool: registry->get_all_tools()) {
            tools_json.push_back(tool.to_json());
        }

        resp.result = nlohmann::json{{"tools", tools_json}};
        return resp;
    }
}// namespace treescout::routers
