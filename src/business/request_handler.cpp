#include "request_handler.h"
#include "core/logger.h"
#include "metrics/performance_metrics.h"
#include "protocol/json_rpc.h"
#include "routers/initialize.hpp"
#include "routers/ping.hpp"
#include "routers/tool_list.hpp"
#include "routers/tools_call.hpp"


namespace treescout::business {

    using namespace routers;
    RequestHandler::RequestHandler(std::shared_ptr<ToolRegistry> registry, std::shared_ptr<ServerState> state)
        : registry_(std::move(registry)), state_(std::move(state)) {
        // Register route handlers
        router_.register_handler("initialize", handle_initialize);
        router_.register_handler("notifications/initialized", handle_initialized);
        router_.register_handler("ping", handle_ping);
        router_.register_handler("tools/list", handle_tools_list);
        router_.register_handler("tools/call", handle_tools_call);
    }

    std::optional<std::string> RequestHandler::handle_request(const std::string &msg) {
        TREESCOUT_TRACE("Raw message: {}", msg);
        auto metrics = metrics::PerformanceTracker::start_tracking(msg.size());

        // Parse JSON-RPC request
        auto [parsed_req, parse_error] = protocol::parse_request(msg);

        std::optional<std::string> out;
        if (!parsed_req.has_value()) {
            if (parse_error.has_value()) {
                TREESCOUT_WARN("Rejected input line: {}", parse_error->message);
                out = protocol::make_error(parse_error.value());
            } else {
                out = protocol::make_error(protocol::error_code::INVALID_REQUEST,
                                           "Invalid JSON-RPC request format",
                                           nlohmann::json(nullptr));
            }
        } else {
            const protocol::Request &request = parsed_req.value();
            // unknown names share one bucket so clients cannot grow the stats table
            metrics.method = router_.find_handler(request.method) ? request.method : "(unknown)";

            protocol::Response response;
            try {
                response = router_.route_request(request, registry_, *state_);
            } catch (const std::exception &e) {
                // handlers convert their own failures; this is the last line of defence
                TREESCOUT_ERROR("Unhandled error in '{}': {}", request.method, e.what());
                response = request.is_notification()
                                   ? protocol::Response::none()
                                   : protocol::Response{
                                             protocol::Error{protocol::error_code::INTERNAL_ERROR,
                                                             "Internal error",
                                                             nlohmann::json{{"method", request.method}, {"detail", e.what()}}},
                                             protocol::get_request_id(request)};
            }

            if (!response.suppressed) {
                out = protocol::make_response(response);
            }
        }

        metrics::PerformanceTracker::end_tracking(metrics, out ? out->size() : 0);
        state_->request_stats().add(metrics);
        TREESCOUT_DEBUG("Handled '{}' in {:.3f} ms ({} bytes in, {} bytes out)",
                        metrics.method.empty() ? "(invalid)" : metrics.method,
                        metrics.duration_ms(), metrics.request_size, metrics.response_size);
        return out;
    }

}// namespace treescout::business
