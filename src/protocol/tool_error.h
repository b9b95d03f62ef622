// src/protocol/tool_error.h
#pragma once

#include "json_rpc.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace treescout::protocol {

    /**
     * @brief Base of every error a tool handler reports on purpose.
     *
     * Carries the JSON-RPC code and a data object telling the caller what to
     * fix. The router turns it into an error response; anything else thrown
     * by a handler becomes INTERNAL_ERROR.
     */
    class ToolError : public std::runtime_error {
    public:
        ToolError(int code, const std::string &message, nlohmann::json data = nlohmann::json::object())
            : std::runtime_error(message), code_(code), data_(std::move(data)) {}

        int code() const noexcept { return code_; }
        const nlohmann::json &data() const noexcept { return data_; }

        Error to_error() const { return Error{code_, what(), data_}; }

    private:
        int code_;
        nlohmann::json data_;
    };

    // Missing or mistyped tool argument
    class ValidationError : public ToolError {
    public:
        ValidationError(const std::string &parameter, const std::string &message, const std::string &expected = "")
            : ToolError(error_code::INVALID_PARAMS, message, make_data(parameter, expected)) {}

    private:
        static nlohmann::json make_data(const std::string &parameter, const std::string &expected) {
            nlohmann::json data = {{"parameter", parameter}};
            if (!expected.empty()) {
                data["expected"] = expected;
            }
            return data;
        }
    };

    // Target path missing, not a directory, or not readable
    class ResourceError : public ToolError {
    public:
        ResourceError(const std::string &path, const std::string &reason)
            : ToolError(error_code::RESOURCE_ERROR,
                        "Cannot scan '" + path + "': " + reason,
                        nlohmann::json{{"path", path}, {"reason", reason}}) {}
    };

    class SessionNotFoundError : public ToolError {
    public:
        explicit SessionNotFoundError(const std::string &session_id)
            : ToolError(error_code::SESSION_NOT_FOUND,
                        "Session not found: " + session_id,
                        nlohmann::json{{"session_id", session_id}}) {}
    };

}// namespace treescout::protocol
