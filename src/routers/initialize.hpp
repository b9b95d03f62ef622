#pragma once
#include "business/rpc_router.h"
#include "protocol/json_rpc.h"
#include "treescout_version.h"
#include <memory>

namespace treescout::routers {

    // Protocol revision answered when the client does not name one
    inline constexpr const char *kDefaultProtocolVersion = "2024-11-05";

    /**
     * @brief Handle initialization request
     *
     * Answers from constants only. Nothing is scanned or warmed up here: the
     * host times the handshake.
     *
     * @return Response with server capabilities and version info
     */
    inline protocol::Response handle_initialize(
            const protocol::Request &req,
            std::shared_ptr<business::ToolRegistry> /*registry*/,
            business::ServerState &state) {
        protocol::Response resp;
        resp.id = protocol::get_request_id(req);

        // echo the client's protocol version
        std::string client_protocol_version = kDefaultProtocolVersion;
        if (req.params.is_object() && req.params.contains("protocolVersion") &&
            req.params["protocolVersion"].is_string()) {
            client_protocol_version = req.params["protocolVersion"].get<std::string>();
        }

        resp.result = nlohmann::json{
                {"protocolVersion", client_protocol_version},
                {"capabilities", nlohmann::json({{"tools", {{"listChanged", false}}}})},
                {"serverInfo", {{"name", state.settings().server_name}, {"version", TREESCOUT_VERSION}}}};

        return resp;
    }
}// namespace treescout::routers
