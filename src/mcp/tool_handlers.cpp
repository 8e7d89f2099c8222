#include <op_mcp/mcp/tool_handlers.hpp>

#include <op_mcp/backend/domain.hpp>
#include <op_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace op_mcp {

namespace {

using json = nlohmann::json;

Error MakeParamError(const std::string& msg) {
    return Error::Make(ErrorCategory::Validation, "ToolArguments", msg);
}

// Absent and explicit null are both "not provided".
const json* OptionalParam(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return nullptr;
    return &*it;
}

Result<std::optional<json>, Error> OptFilters(const json& params) {
    using R = Result<std::optional<json>, Error>;
    const json* filters = OptionalParam(params, "filters");
    if (filters == nullptr) {
        return R::Ok(std::nullopt);
    }
    if (!filters->is_array()) {
        return R::Err(MakeParamError("'filters' must be an array of filter objects"));
    }
    for (const auto& f : *filters) {
        if (!f.is_object()) {
            return R::Err(MakeParamError("'filters' must be an array of filter objects"));
        }
    }
    return R::Ok(std::optional<json>(*filters));
}

Result<std::optional<std::string>, Error> OptWeek(const json& params) {
    using R = Result<std::optional<std::string>, Error>;
    const json* week = OptionalParam(params, "week");
    if (week == nullptr) {
        return R::Ok(std::nullopt);
    }
    if (!week->is_string()) {
        return R::Err(MakeParamError("'week' must be a string like 2025-W41"));
    }
    auto label = WeekLabel::Create(week->get<std::string>());
    if (label.IsErr()) {
        return R::Err(MakeParamError(label.Error()));
    }
    return R::Ok(std::optional<std::string>(label.Value().Value()));
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

json ProjectIdProp() {
    return {{"type", "integer"},
            {"minimum", 1},
            {"description", "OpenProject project id"}};
}

json MakeSchema(const json& properties, const json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// get_project
Result<ToolResult, Error> HandleGetProject(BackendClient& client,
                                           const json& params,
                                           const CallContext& ctx) {
    auto id = RequireProjectId(params);
    if (id.IsErr()) return Result<ToolResult, Error>::Err(id.Error());

    return client.GetProject(id.Value(), ctx.ToCallOptions())
        .Map([](const Project& p) { return MakeOkResult(ToJson(p)); });
}

// get_work_packages
Result<ToolResult, Error> HandleGetWorkPackages(BackendClient& client,
                                                const json& params,
                                                const CallContext& ctx) {
    auto id = RequireProjectId(params);
    if (id.IsErr()) return Result<ToolResult, Error>::Err(id.Error());
    auto filters = OptFilters(params);
    if (filters.IsErr()) return Result<ToolResult, Error>::Err(filters.Error());

    const auto project_id = id.Value().Value();
    return client.GetWorkPackages(id.Value(), filters.Value(), ctx.ToCallOptions())
        .Map([project_id](const std::vector<WorkPackage>& wps) {
            json list = json::array();
            for (const auto& wp : wps) {
                list.push_back(ToJson(wp));
            }
            return MakeOkResult({
                {"project_id", project_id},
                {"work_packages", std::move(list)},
                {"total_count", wps.size()},
            });
        });
}

// get_weekly_report
Result<ToolResult, Error> HandleGetWeeklyReport(BackendClient& client,
                                                const json& params,
                                                const CallContext& ctx) {
    auto id = RequireProjectId(params);
    if (id.IsErr()) return Result<ToolResult, Error>::Err(id.Error());
    auto week = OptWeek(params);
    if (week.IsErr()) return Result<ToolResult, Error>::Err(week.Error());

    return client.GetWeeklyReport(id.Value(), week.Value(), ctx.ToCallOptions())
        .Map([](const WeeklyReport& r) { return MakeOkResult(ToJson(r)); });
}

} // anonymous namespace

Result<ProjectId, Error> RequireProjectId(const json& params) {
    using R = Result<ProjectId, Error>;
    auto it = params.find("project_id");
    if (it == params.end() || it->is_null()) {
        return R::Err(MakeParamError("Missing required parameter: project_id"));
    }
    if (!it->is_number_integer()) {
        return R::Err(MakeParamError("'project_id' must be an integer"));
    }
    auto id = ProjectId::Create(it->get<std::int64_t>());
    if (id.IsErr()) {
        return R::Err(MakeParamError(id.Error()));
    }
    return R::Ok(id.Value());
}

ToolResult MakeOkResult(const json& data) {
    return ToolResult{
        false,
        json::array({{{"type", "text"},
                      {"text", data.dump(2, ' ', false, json::error_handler_t::replace)}}}),
        data};
}

void RegisterProjectTools(ToolRegistryBuilder& builder,
                          std::shared_ptr<BackendClient> client) {
    builder.Add(
        {"get_project",
         "Get project information from OpenProject.",
         MakeSchema({{"project_id", ProjectIdProp()}}, {"project_id"}),
         std::nullopt},
        [client](const json& params, const CallContext& ctx) {
            return HandleGetProject(*client, params, ctx);
        });

    builder.Add(
        {"get_work_packages",
         "Get work packages for a project. Without filters, only work packages "
         "with a status are returned.",
         MakeSchema({{"project_id", ProjectIdProp()},
                     {"filters", {{"type", "array"},
                                  {"items", {{"type", "object"}}},
                                  {"description", "OpenProject filter objects"}}}},
                    {"project_id"}),
         std::nullopt},
        [client](const json& params, const CallContext& ctx) {
            return HandleGetWorkPackages(*client, params, ctx);
        });

    builder.Add(
        {"get_weekly_report",
         "Generate a weekly report for a project: the project plus its work packages.",
         MakeSchema({{"project_id", ProjectIdProp()},
                     {"week", {{"type", "string"},
                               {"pattern", "^[0-9]{4}-W(0?[1-9]|[1-4][0-9]|5[0-3])$"},
                               {"description", "ISO week, e.g. 2025-W41 (default: current)"}}}},
                    {"project_id"}),
         std::nullopt},
        [client](const json& params, const CallContext& ctx) {
            return HandleGetWeeklyReport(*client, params, ctx);
        });

    LogDebug("tools", "registered 3 project tools");
}

} // namespace op_mcp
