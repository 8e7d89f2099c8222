#pragma once

#include <op_mcp/core/cancellation.hpp>
#include <op_mcp/core/result.hpp>
#include <op_mcp/mcp/auth.hpp>
#include <op_mcp/mcp/resource_catalog.hpp>
#include <op_mcp/mcp/tool_registry.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace op_mcp {

enum class EngineState {
    Uninitialized,
    Ready,
    ShuttingDown,
    Closed,
};

std::string EngineStateName(EngineState state);

struct EngineOptions {
    // Reject everything except initialize, ping and notifications until the
    // engine is Ready.
    bool strict_initialization = false;
    std::optional<std::chrono::milliseconds> resource_timeout;
};

namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr const char* kProtocolVersion = "2024-11-05";
} // namespace rpc

// ---------------------------------------------------------------------------
// ProtocolEngine: transport-agnostic MCP / JSON-RPC 2.0 dispatcher.
//
//   Uninitialized --initialize / initialized--> Ready
//   any --Shutdown()--> ShuttingDown --> Closed
//
// Methods: initialize, ping, tools/list, tools/call, resources/list,
// resources/read, initialized and notifications/* (no response without id).
// Exactly one response per message carrying an id; none for notifications.
//
// Thread-safe: HTTP and SSE workers call HandleMessage concurrently.
// ---------------------------------------------------------------------------
class ProtocolEngine {
public:
    ProtocolEngine(std::shared_ptr<const ToolRegistry> registry,
                   std::shared_ptr<const ResourceCatalog> resources,
                   std::shared_ptr<const Authenticator> authenticator,
                   EngineOptions options = {});

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    // Parse one wire message and return the compact serialized response.
    [[nodiscard]] std::optional<std::string> HandleRaw(
        std::string_view raw, const RequestContext& ctx = {});

    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message, const RequestContext& ctx = {});

    // Cancels in-flight tool calls and moves to Closed. Idempotent.
    void Shutdown();

    [[nodiscard]] EngineState State() const noexcept { return state_.load(); }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return *registry_; }
    [[nodiscard]] const ResourceCatalog* Resources() const noexcept {
        return resources_.get();
    }
    [[nodiscard]] const Authenticator& Auth() const noexcept { return *authenticator_; }

    // Token that is cancelled on Shutdown(); parent of every call context.
    [[nodiscard]] CancellationToken NewCallToken() const { return root_.MakeChild(); }

    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message,
                                    const nlohmann::json& data = nullptr);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);
    // Error object for an application error; never carries internals.
    static nlohmann::json MakeError(const nlohmann::json& id, const Error& error);

private:
    nlohmann::json Dispatch(const std::string& method, const nlohmann::json& params,
                            const nlohmann::json& id, const RequestContext& ctx);
    std::optional<nlohmann::json> HandleNotification(const std::string& method,
                                                     const nlohmann::json* id);

    nlohmann::json HandleInitialize(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params, const nlohmann::json& id,
                                   const RequestContext& ctx);
    nlohmann::json HandleResourcesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesRead(const nlohmann::json& params, const nlohmann::json& id,
                                       const RequestContext& ctx);

    // An Unauthorized error response when denied; fills identity otherwise.
    std::optional<nlohmann::json> CheckAuth(const nlohmann::json& id,
                                            const RequestContext& ctx,
                                            std::string& identity) const;

    void MarkReady();

    std::shared_ptr<const ToolRegistry> registry_;
    std::shared_ptr<const ResourceCatalog> resources_;
    std::shared_ptr<const Authenticator> authenticator_;
    EngineOptions options_;
    std::atomic<EngineState> state_{EngineState::Uninitialized};
    CancellationToken root_;
};

} // namespace op_mcp
