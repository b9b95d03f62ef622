#include "rpc_router.h"
#include "core/logger.h"

#include <string>


namespace treescout::business {

    /**
     * @brief Register RPC method handler
     * @param method RPC method name
     * @param handler Handler function for the method
     */
    void RpcRouter::register_handler(const std::string &method, RpcHandler handler) {
        handlers_[method] = std::move(handler);
    }

    /**
     * @brief Find registered handler for a method
     * @param method RPC method name
     * @return Optional handler if found
     */
    std::optional<RpcHandler> RpcRouter::find_handler(const std::string &method) const {
        auto it = handlers_.find(method);
        return (it != handlers_.end()) ? std::optional<RpcHandler>(it->second) : std::nullopt;
    }

    protocol::Response RpcRouter::route_request(
            const protocol::Request &req,
            std::shared_ptr<ToolRegistry> registry,
            ServerState &state) const {

        auto handler = find_handler(req.method);
        if (!handler.has_value()) {
            if (req.is_notification()) {
                TREESCOUT_DEBUG("Ignoring unknown notification: {}", req.method);
                return protocol::Response::none();
            }
            TREESCOUT_WARN("Method not found: {}", req.method);
            return protocol::Response{
                    protocol::Error{protocol::error_code::METHOD_NOT_FOUND,
                                    "Method not found: " + req.method,
                                    nlohmann::json{{"method", req.method}}},
                    protocol::get_request_id(req)};
        }

        auto response = handler.value()(req, std::move(registry), state);
        if (req.is_notification()) {
            return protocol::Response::none();
        }
        return response;
    }


}// namespace treescout::business
