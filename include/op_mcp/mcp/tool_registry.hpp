#pragma once

#include <op_mcp/backend/backend_client.hpp>
#include <op_mcp/core/cancellation.hpp>
#include <op_mcp/core/result.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace op_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor: what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
    std::optional<std::chrono::milliseconds> timeout;  // overrides the registry default
};

// ---------------------------------------------------------------------------
// ToolResult: MCP content blocks plus the structured payload behind them.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
    nlohmann::json data;     // structured result, used by the REST mirrors
};

// Per-invocation context handed to every handler.
struct CallContext {
    CancellationToken cancel;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::string identity;

    [[nodiscard]] CallOptions ToCallOptions() const {
        return CallOptions{cancel, deadline};
    }
};

// Handlers report bad arguments as Validation and pass backend errors through.
using ToolHandler = std::function<Result<ToolResult, Error>(
    const nlohmann::json& params, const CallContext& ctx)>;

// ---------------------------------------------------------------------------
// ToolRegistry: ordered name -> handler map.
//
// List() and Invoke() are safe for concurrent readers. Register() mutates and
// must not run concurrently with anything else.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    explicit ToolRegistry(
        std::optional<std::chrono::milliseconds> default_timeout = std::nullopt);

    // Re-registering a name replaces the handler in place and logs a warning.
    void Register(ToolDescriptor descriptor, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& List() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Fails with ToolNotFound, the handler's own error, Timeout when the
    // tool's budget elapses, or Internal when the handler throws.
    [[nodiscard]] Result<ToolResult, Error> Invoke(const std::string& name,
                                                   const nlohmann::json& params,
                                                   const CallContext& ctx) const;

private:
    std::optional<std::chrono::milliseconds> default_timeout_;
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
};

// ---------------------------------------------------------------------------
// ToolRegistryBuilder: collects descriptor+handler pairs at startup.
// ---------------------------------------------------------------------------
class ToolRegistryBuilder {
public:
    ToolRegistryBuilder& DefaultTimeout(std::chrono::milliseconds timeout);
    ToolRegistryBuilder& Add(ToolDescriptor descriptor, ToolHandler handler);
    [[nodiscard]] ToolRegistry Build() const;

private:
    std::optional<std::chrono::milliseconds> default_timeout_;
    std::vector<std::pair<ToolDescriptor, ToolHandler>> entries_;
};

} // namespace op_mcp
