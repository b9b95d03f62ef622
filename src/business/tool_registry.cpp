#include "tool_registry.h"
#include "core/logger.h"
#include "protocol/tool_error.h"
#include <cmath>

namespace treescout::business {

    namespace {

        bool matches_type(const nlohmann::json &value, const std::string &type) {
            if (type == "string") return value.is_string();
            if (type == "boolean") return value.is_boolean();
            if (type == "number") return value.is_number();
            if (type == "object") return value.is_object();
            if (type == "array") return value.is_array();
            if (type == "integer") {
                if (value.is_number_integer()) {
                    return true;
                }
                // 20.0 is accepted as an integer
                if (value.is_number_float()) {
                    double d = value.get<double>();
                    return std::isfinite(d) && std::floor(d) == d;
                }
                return false;
            }
            return true;
        }

        void check_value(const std::string &name, const nlohmann::json &value, const nlohmann::json &schema) {
            if (!schema.is_object()) {
                return;
            }
            if (schema.contains("type") && schema["type"].is_string()) {
                std::string type = schema["type"].get<std::string>();
                if (!matches_type(value, type)) {
                    throw protocol::ValidationError(
                            name,
                            "Parameter '" + name + "' must be of type " + type + ", got " + value.type_name(),
                            type);
                }
                if (type == "array" && schema.contains("items")) {
                    for (size_t i = 0; i < value.size(); ++i) {
                        check_value(name + "[" + std::to_string(i) + "]", value[i], schema["items"]);
                    }
                }
            }
            if (schema.contains("enum") && schema["enum"].is_array()) {
                const auto &allowed = schema["enum"];
                bool found = false;
                for (const auto &option: allowed) {
                    if (option == value) {
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    throw protocol::ValidationError(
                            name,
                            "Parameter '" + name + "' must be one of " + allowed.dump(),
                            allowed.dump());
                }
            }
        }

    }// namespace

    void ToolRegistry::register_builtin(const protocol::Tool &tool, ToolExecutor exec) {
        auto it = index_.find(tool.name);
        if (it != index_.end()) {
            TREESCOUT_WARN("Built-in tool '{}' already exists, overwriting", tool.name);
            tools_[it->second] = {tool, std::move(exec)};
            return;
        }
        index_[tool.name] = tools_.size();
        tools_.push_back({tool, std::move(exec)});
        TREESCOUT_TRACE("Registered builtin tool: {}", tool.name);
    }

    std::vector<std::string> ToolRegistry::get_all_tool_names() const {
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto &tool: tools_) {
            names.push_back(tool.metadata.name);
        }
        return names;
    }

    std::vector<protocol::Tool> ToolRegistry::get_all_tools() const {
        std::vector<protocol::Tool> all_tools;
        all_tools.reserve(tools_.size());
        for (const auto &tool: tools_) {
            all_tools.push_back(tool.metadata);
        }
        return all_tools;
    }

    std::shared_ptr<protocol::Tool> ToolRegistry::get_tool_info(const std::string &name) const {
        auto it = index_.find(name);
        if (it != index_.end()) {
            return std::make_shared<protocol::Tool>(tools_[it->second].metadata);
        }
        return nullptr;
    }

    void ToolRegistry::validate_arguments(const protocol::Tool &tool, const nlohmann::json &args) {
        if (!args.is_object()) {
            throw protocol::ValidationError("arguments", "Tool arguments must be an object", "object");
        }
        const auto &schema = tool.parameters;
        if (!schema.is_object()) {
            return;
        }

        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto &required: schema["required"]) {
                if (!required.is_string()) {
                    continue;
                }
                auto name = required.get<std::string>();
                if (!args.contains(name) || args[name].is_null()) {
                    std::string expected;
                    if (schema.contains("properties") && schema["properties"].contains(name)) {
                        expected = schema["properties"][name].value("type", "");
                    }
                    throw protocol::ValidationError(name, "Missing required parameter '" + name + "'", expected);
                }
            }
        }

        if (!schema.contains("properties") || !schema["properties"].is_object()) {
            return;
        }
        const auto &properties = schema["properties"];
        for (auto it = args.begin(); it != args.end(); ++it) {
            if (it.value().is_null() || !properties.contains(it.key())) {
                continue;
            }
            check_value(it.key(), it.value(), properties[it.key()]);
        }
    }

    nlohmann::json ToolRegistry::execute(const std::string &name, const nlohmann::json &args, ServerState &state) {
        auto it = index_.find(name);
        if (it == index_.end()) {
            TREESCOUT_ERROR("Tool not found: '{}'", name);
            throw protocol::ValidationError("name", "Unknown tool: '" + name + "'", "one of the names returned by tools/list");
        }

        const auto &tool = tools_[it->second];
        nlohmann::json arguments = args.is_null() ? nlohmann::json::object() : args;
        validate_arguments(tool.metadata, arguments);

        TREESCOUT_DEBUG("Executing tool '{}'", name);
        return tool.executor(arguments, state);
    }

}// namespace treescout::business
