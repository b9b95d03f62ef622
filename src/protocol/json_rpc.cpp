#include "json_rpc.h"
#include <string>

namespace treescout::protocol {

    // ==================== Helper Functions ====================
    namespace {
        // Check if jsonrpc field is valid ("2.0")
        bool has_valid_jsonrpc(const nlohmann::json &j) {
            return j.contains("jsonrpc") && j["jsonrpc"].is_string() &&
                   j["jsonrpc"].get<std::string>() == "2.0";
        }

        nlohmann::json id_or_null(const nlohmann::json &j) {
            if (j.contains("id")) {
                const auto &id = j["id"];
                if (id.is_number() || id.is_string()) {
                    return id;
                }
            }
            return nlohmann::json(nullptr);
        }
    }// namespace

    nlohmann::json Error::to_json() const {
        nlohmann::json error_obj{{"code", code}, {"message", message}};
        if (data.has_value()) {
            error_obj["data"] = data.value();
        }
        return error_obj;
    }

    // ==================== parse_request implementation ====================
    std::pair<std::optional<Request>, std::optional<Error>> parse_request(const std::string &text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error &e) {
            return {
                    std::nullopt,
                    Error{
                            error_code::PARSE_ERROR,
                            "Parse error: " + std::string(e.what()),
                            std::make_optional(nlohmann::json{{"byte", e.byte}}),
                            std::make_optional(nlohmann::json(nullptr))}};
        }

        if (!j.is_object()) {
            return {
                    std::nullopt,
                    Error{
                            error_code::INVALID_REQUEST,
                            "Request must be a JSON object",
                            std::nullopt,
                            std::make_optional(nlohmann::json(nullptr))}};
        }

        if (!has_valid_jsonrpc(j)) {
            return {
                    std::nullopt,
                    Error{
                            error_code::INVALID_REQUEST,
                            "'jsonrpc' must be '2.0'",
                            std::nullopt,
                            std::make_optional(id_or_null(j))}};
        }

        if (!j.contains("method") || !j["method"].is_string()) {
            return {
                    std::nullopt,
                    Error{
                            error_code::INVALID_REQUEST,
                            "'method' must be a string",
                            std::nullopt,
                            std::make_optional(id_or_null(j))}};
        }

        std::optional<nlohmann::json> req_id;
        if (j.contains("id")) {
            const auto &id = j["id"];
            if (id.is_number() || id.is_string() || id.is_null()) {
                req_id = std::make_optional(id);
            } else {
                return {
                        std::nullopt,
                        Error{
                                error_code::INVALID_REQUEST,
                                "'id' must be number, string, or null",
                                std::make_optional(nlohmann::json{{"received_type", id.type_name()}}),
                                std::make_optional(nlohmann::json(nullptr))}};
            }
        }

        nlohmann::json params = j.value("params", nlohmann::json::object());
        if (!params.is_object() && !params.is_array()) {
            return {
                    std::nullopt,
                    Error{
                            error_code::INVALID_REQUEST,
                            "'params' must be an object or an array",
                            std::nullopt,
                            std::make_optional(req_id.value_or(nlohmann::json(nullptr)))}};
        }

        Request req(j["method"].get<std::string>(), std::move(params), req_id);
        return {req, std::nullopt};
    }

    // ==================== make_response implementations ====================
    std::string make_response(const Response &resp) {
        if (!resp.is_valid()) {
            return make_error(
                    error_code::INTERNAL_ERROR,
                    "Invalid response: contains both result and error",
                    resp.id);
        }

        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["id"] = resp.id;

        if (resp.error.has_value()) {
            j["error"] = resp.error->to_json();
        } else {
            j["result"] = resp.result.is_null() ? nlohmann::json::object() : resp.result;
        }

        return dump_line(j);
    }

    std::string make_response(const nlohmann::json &result, const nlohmann::json &id) {
        return make_response(Response{result, id});
    }

    std::string make_response(const Error &error, const nlohmann::json &id) {
        return make_response(Response{error, id});
    }

    // ==================== make_error implementations ====================
    std::string make_error(const Error &err) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["id"] = err.id.has_value() ? err.id.value() : nlohmann::json(nullptr);
        j["error"] = err.to_json();
        return dump_line(j);
    }

    std::string make_error(int code, const std::string &message, const nlohmann::json &id) {
        return make_error(Error{code, message, std::nullopt, std::make_optional(id)});
    }

    std::string make_error(int code, const std::string &message, const nlohmann::json &id,
                           const std::optional<nlohmann::json> &data) {
        return make_error(Error{code, message, data, std::make_optional(id)});
    }

    // ==================== make_notification implementation ====================
    std::string make_notification(const std::string &method, const nlohmann::json &params) {
        nlohmann::json j;
        j["jsonrpc"] = "2.0";
        j["method"] = method;
        if (!params.is_null() && !params.empty()) {
            j["params"] = params;
        }
        return dump_line(j);
    }

    nlohmann::json get_request_id(const Request &req) {
        return req.id.has_value() ? req.id.value() : nlohmann::json(nullptr);
    }

    std::string dump_line(const nlohmann::json &j) {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

}// namespace treescout::protocol
