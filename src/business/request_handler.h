// src/business/request_handler.h
#pragma once

#include "business/rpc_router.h"
#include "business/server_state.h"
#include "business/tool_registry.h"
#include <memory>
#include <optional>
#include <string>


namespace treescout::business {

    /**
     * @brief Turns one input line into at most one output line.
     *
     * Owns the router; shares the registry and the server state with the
     * server that built it.
     */
    class RequestHandler {
    public:
        RequestHandler(std::shared_ptr<ToolRegistry> registry, std::shared_ptr<ServerState> state);

        /**
         * @brief Parse, dispatch and serialise one request.
         * @return The response line, or nullopt for notifications
         */
        std::optional<std::string> handle_request(const std::string &msg);

        ServerState &state() { return *state_; }
        std::shared_ptr<ToolRegistry> registry() const { return registry_; }

    private:
        std::shared_ptr<ToolRegistry> registry_;
        std::shared_ptr<ServerState> state_;
        RpcRouter router_;
    };

}// namespace treescout::business
