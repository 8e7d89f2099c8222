#pragma once

#include <op_mcp/backend/backend_client.hpp>
#include <op_mcp/core/result.hpp>
#include <op_mcp/core/types.hpp>
#include <op_mcp/mcp/tool_registry.hpp>

#include <memory>

#include <nlohmann/json.hpp>

namespace op_mcp {

// Add get_project, get_work_packages and get_weekly_report, in that order.
// Handlers share `client`; it must stay open for the registry's lifetime.
void RegisterProjectTools(ToolRegistryBuilder& builder,
                          std::shared_ptr<BackendClient> client);

// Argument validation shared with the REST mirrors. All fail with
// ErrorCategory::Validation.
Result<ProjectId, Error> RequireProjectId(const nlohmann::json& params);

// A single text content block holding `data` pretty-printed.
ToolResult MakeOkResult(const nlohmann::json& data);

} // namespace op_mcp
