#pragma once
#include "business/rpc_router.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include <memory>

namespace treescout::routers {

    inline protocol::Response handle_ping(
            const protocol::Request &req,
            std::shared_ptr<business::ToolRegistry> /*registry*/,
            business::ServerState & /*state*/) {
        TREESCOUT_DEBUG("Received ping request");

        protocol::Response resp;
        resp.id = protocol::get_request_id(req);
        resp.result = nlohmann::json::object();// Empty object for ping response
        return resp;
    }

    // notifications/initialized: the host finished its handshake, nothing to send back
    inline protocol::Response handle_initialized(
            const protocol::Request & /*req*/,
            std::shared_ptr<business::ToolRegistry> /*registry*/,
            business::ServerState & /*state*/) {
        TREESCOUT_DEBUG("Received notifications/initialized");
        return protocol::Response::none();
    }

}// namespace treescout::routers
