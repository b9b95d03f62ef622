#pragma once
#include "protocol/json_rpc.h"
#include "server_state.h"
#include "tool_registry.h"
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>


namespace treescout::business {
    using RpcHandler = std::function<protocol::Response(
            const protocol::Request &,
            std::shared_ptr<ToolRegistry>,
            ServerState &)>;

    class RpcRouter {
    public:
        void register_handler(const std::string &method, RpcHandler handler);

        std::optional<RpcHandler> find_handler(const std::string &method) const;

        /**
         * @brief Dispatch to the handler registered for req.method.
         *        Unknown methods get METHOD_NOT_FOUND; notifications never
         *        get a reply.
         */
        protocol::Response route_request(
                const protocol::Request &req,
                std::shared_ptr<ToolRegistry> registry,
                ServerState &state) const;

    private:
        std::unordered_map<std::string, RpcHandler> handlers_;
    };

}// namespace treescout::business
