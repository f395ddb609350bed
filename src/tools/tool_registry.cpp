#include "vrpassist/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace vrpassist::tools {

// ToolSpec

std::string_view param_type_to_string(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
        case ParamType::Number: return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Array: return "array";
        case ParamType::Object: return "object";
    }
    return "string";
}

bool param_type_matches(ParamType type, const Json& value) {
    switch (type) {
        case ParamType::String: return value.is_string();
        case ParamType::Integer: return value.is_number_integer();
        case ParamType::Number: return value.is_number();
        case ParamType::Boolean: return value.is_boolean();
        case ParamType::Array: return value.is_array();
        case ParamType::Object: return value.is_object();
    }
    return false;
}

Json ParamSpec::to_json_schema() const {
    Json schema{
        {"type", std::string(param_type_to_string(type))},
        {"description", description}
    };
    if (!enum_values.empty()) {
        schema["enum"] = enum_values;
    }
    return schema;
}

Json ToolSpec::to_openai_format() const {
    Json properties = Json::object();
    Json required = Json::array();

    for (const auto& param : parameters) {
        properties[param.name] = param.to_json_schema();
        if (param.required) {
            required.push_back(param.name);
        }
    }

    return Json{
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", {
                {"type", "object"},
                {"properties", properties},
                {"required", required}
            }}
        }}
    };
}

namespace {

Result<void, Error> validate_args(const ToolSpec& spec, const Json& args) {
    auto invalid = [&spec](std::string message) {
        return Result<void, Error>::err(ErrorCode::ToolValidationFailed, std::move(message), spec.name);
    };

    if (!args.is_object()) {
        return invalid("Arguments must be a JSON object");
    }

    for (const auto& param : spec.parameters) {
        auto it = args.find(param.name);
        if (it == args.end()) {
            if (param.required) {
                return invalid("Missing required parameter: " + param.name);
            }
            continue;
        }

        if (!param_type_matches(param.type, *it)) {
            return invalid("Invalid type for parameter: " + param.name);
        }

        if (!param.enum_values.empty() && it->is_string() &&
            std::find(param.enum_values.begin(), param.enum_values.end(),
                      it->get<std::string>()) == param.enum_values.end()) {
            return invalid("Invalid enum value for parameter: " + param.name);
        }
    }

    return Result<void, Error>::ok();
}

}  // namespace

// ToolRegistry

Result<void, Error> ToolRegistry::register_tool(const ToolSpec& spec, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto [it, inserted] = tools_.try_emplace(spec.name, Entry{spec, std::move(handler), true});
    if (!inserted) {
        return Result<void, Error>::err(ErrorCode::AlreadyExists, "Tool already registered", spec.name);
    }

    spdlog::debug("Registered tool {}", spec.name);
    return Result<void, Error>::ok();
}

Result<void, Error> ToolRegistry::unregister_tool(const ToolId& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (tools_.erase(id) == 0) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }
    return Result<void, Error>::ok();
}

bool ToolRegistry::has_tool(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.contains(id);
}

std::optional<ToolSpec> ToolRegistry::get_spec(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return std::nullopt;
    }
    return it->second.spec;
}

std::vector<ToolSpec> ToolRegistry::get_enabled_specs() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ToolSpec> specs;
    for (const auto& [id, entry] : tools_) {
        if (entry.enabled) {
            specs.push_back(entry.spec);
        }
    }
    return specs;
}

Json ToolRegistry::to_openai_format() const {
    Json tools = Json::array();
    for (const auto& spec : get_enabled_specs()) {
        tools.push_back(spec.to_openai_format());
    }
    return tools;
}

Result<void, Error> ToolRegistry::enable_tool(const ToolId& id) {
    return set_enabled(id, true);
}

Result<void, Error> ToolRegistry::disable_tool(const ToolId& id) {
    return set_enabled(id, false);
}

Result<void, Error> ToolRegistry::set_enabled(const ToolId& id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    if (it == tools_.end()) {
        return Result<void, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
    }
    it->second.enabled = enabled;
    return Result<void, Error>::ok();
}

bool ToolRegistry::is_enabled(const ToolId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tools_.find(id);
    return it != tools_.end() && it->second.enabled;
}

Result<ToolResult, Error> ToolRegistry::execute(const ToolId& id, const Json& args,
                                                const ToolContext& ctx) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = tools_.find(id);
        if (it == tools_.end()) {
            return Result<ToolResult, Error>::err(ErrorCode::ToolNotFound, "Tool not found", id);
        }
        if (!it->second.enabled) {
            return Result<ToolResult, Error>::err(ErrorCode::ToolDisabled, "Tool is disabled", id);
        }
        entry = it->second;
    }

    auto validation = validate_args(entry.spec, args);
    if (validation.is_err()) {
        spdlog::warn("Rejected call to {}: {}", id, validation.error().message);
        return Result<ToolResult, Error>::err(std::move(validation).error());
    }

    try {
        const auto start = std::chrono::steady_clock::now();
        ToolResult result = entry.handler(args, ctx);
        result.execution_time = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - start);

        spdlog::info("Tool {} finished for session {} in {}ms (success={})",
                     id, ctx.session_id, result.execution_time.count(), result.success);
        return Result<ToolResult, Error>::ok(std::move(result));

    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed: {}", id, e.what());
        return Result<ToolResult, Error>::err(ErrorCode::ToolExecutionFailed, e.what(), id);
    }
}

size_t ToolRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

void ToolRegistry::register_builtins() {
    builtin::register_vrp_tools(*this);
}

}  // namespace vrpassist::tools
