// src/protocol/tool.h
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace treescout::protocol {

    struct Tool {
        std::string name;
        std::string description;
        nlohmann::json parameters;// JSON Schema of the arguments object

        nlohmann::json to_json() const {
            nlohmann::json j = {{"name", name}, {"description", description}};
            j["inputSchema"] = parameters.is_null() ? nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}}
                                                    : parameters;
            return j;
        }
    };

    /**
     * @brief Wrap a tool's JSON output in the tools/call result envelope.
     *        The text block carries the pretty-printed JSON for hosts that only
     *        read text content.
     */
    inline nlohmann::json make_tool_result(const nlohmann::json &structured) {
        std::string text = structured.is_string()
                                   ? structured.get<std::string>()
                                   : structured.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        nlohmann::json result = {
                {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
                {"isError", false}};
        if (!structured.is_string()) {
            result["structuredContent"] = structured;
        }
        return result;
    }

}// namespace treescout::protocol
