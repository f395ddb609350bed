#pragma once

#include "vrpassist/core/result.hpp"
#include "vrpassist/tools/tool_spec.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vrpassist::tools {

using namespace vrpassist::core;

// Named tools the assistant may call, with their argument schemas.
// Thread-safe; handlers run outside the registry lock.
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    // AlreadyExists if the name is taken
    Result<void, Error> register_tool(const ToolSpec& spec, ToolHandler handler);
    Result<void, Error> unregister_tool(const ToolId& id);

    bool has_tool(const ToolId& id) const;
    std::optional<ToolSpec> get_spec(const ToolId& id) const;

    // Specs of enabled tools, ordered by name
    std::vector<ToolSpec> get_enabled_specs() const;

    // Tools array for the chat completions request
    Json to_openai_format() const;

    Result<void, Error> enable_tool(const ToolId& id);
    Result<void, Error> disable_tool(const ToolId& id);
    bool is_enabled(const ToolId& id) const;

    // Validate args against the tool's schema, then run its handler.
    // Handler exceptions are reported as ToolExecutionFailed.
    Result<ToolResult, Error> execute(const ToolId& id, const Json& args,
                                      const ToolContext& ctx);

    size_t size() const;

    // analyze_solution, suggest_improvements
    void register_builtins();

private:
    struct Entry {
        ToolSpec spec;
        ToolHandler handler;
        bool enabled = true;
    };

    mutable std::mutex mutex_;
    std::map<ToolId, Entry> tools_;

    Result<void, Error> set_enabled(const ToolId& id, bool enabled);
};

namespace builtin {
    void register_vrp_tools(ToolRegistry& registry);
}

}  // namespace vrpassist::tools
