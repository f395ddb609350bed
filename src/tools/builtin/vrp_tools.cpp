#include "vrpassist/analysis/analysis_engine.hpp"
#include "vrpassist/analysis/suggestion_engine.hpp"
#include "vrpassist/tools/tool_registry.hpp"

#include <spdlog/spdlog.h>

namespace vrpassist::tools::builtin {

namespace {

ToolResult no_context_result() {
    return ToolResult{
        .success = false,
        .content = Json{
            {"error", "No VRP solution available to analyze"},
            {"suggestion", "Please solve a VRP problem first"}
        },
        .error_message = "No VRP context for this session"
    };
}

}  // namespace

ToolResult analyze_solution_handler(const Json& args, const ToolContext& ctx) {
    const std::string aspect = args.value("aspect", "overview");
    spdlog::info("Analyzing VRP solution aspect '{}' for session {}", aspect, ctx.session_id);

    if (!ctx.session) {
        return no_context_result();
    }

    analysis::AnalysisEngine engine;
    auto result = engine.analyze(aspect, ctx.session->solution, ctx.session->problem);

    return ToolResult{
        .success = !result.no_solution,
        .content = result.to_json(),
        .error_message = result.no_solution
            ? std::optional<std::string>("No solution data available")
            : std::nullopt
    };
}

ToolResult suggest_improvements_handler(const Json& /*args*/, const ToolContext& ctx) {
    spdlog::info("Generating VRP improvement suggestions for session {}", ctx.session_id);

    if (!ctx.session || !ctx.session->has_solution()) {
        return ToolResult{
            .success = false,
            .content = Json{
                {"error", "No VRP solution available to analyze"},
                {"suggestions", Json::array()}
            },
            .error_message = "No VRP solution for this session"
        };
    }

    analysis::SuggestionEngine engine(ctx.suggestion_options);
    auto list = engine.suggest(ctx.session->solution, ctx.session->problem);

    return ToolResult{
        .success = true,
        .content = list.to_json()
    };
}

void register_vrp_tools(ToolRegistry& registry) {
    auto analyze = registry.register_tool(
        ToolSpec{
            .name = "analyze_solution",
            .description = "Analyze a specific aspect of the VRP solution "
                           "(routes, utilization, constraints, efficiency)",
            .parameters = {
                {"aspect", "Aspect to analyze (routes, utilization, constraints, efficiency); "
                           "anything else gives an overview", ParamType::String, true}
            }
        },
        analyze_solution_handler
    );
    if (analyze.is_err()) {
        spdlog::warn("Could not register analyze_solution: {}", analyze.error().to_string());
    }

    auto suggest = registry.register_tool(
        ToolSpec{
            .name = "suggest_improvements",
            .description = "Suggest specific improvements for the VRP solution "
                           "based on current metrics",
            .parameters = {}
        },
        suggest_improvements_handler
    );
    if (suggest.is_err()) {
        spdlog::warn("Could not register suggest_improvements: {}", suggest.error().to_string());
    }
}

}  // namespace vrpassist::tools::builtin
