#include <op_mcp/mcp/protocol_engine.hpp>

#include <op_mcp/core/log.hpp>
#include <op_mcp/core/version.hpp>

namespace op_mcp {

namespace {

using json = nlohmann::json;

bool IsValidId(const json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

bool IsInitializedNotification(const std::string& method) {
    return method == "initialized" || method == "notifications/initialized";
}

bool IsNotificationMethod(const std::string& method) {
    return method == "initialized" || method.rfind("notifications/", 0) == 0;
}

} // anonymous namespace

std::string EngineStateName(EngineState state) {
    switch (state) {
        case EngineState::Uninitialized: return "uninitialized";
        case EngineState::Ready:         return "ready";
        case EngineState::ShuttingDown:  return "shutting_down";
        case EngineState::Closed:        return "closed";
    }
    return "closed";
}

ProtocolEngine::ProtocolEngine(std::shared_ptr<const ToolRegistry> registry,
                               std::shared_ptr<const ResourceCatalog> resources,
                               std::shared_ptr<const Authenticator> authenticator,
                               EngineOptions options)
    : registry_(std::move(registry)),
      resources_(std::move(resources)),
      authenticator_(std::move(authenticator)),
      options_(options) {
    if (!authenticator_) {
        authenticator_ = std::make_shared<AllowAllAuthenticator>();
    }
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------
std::optional<std::string> ProtocolEngine::HandleRaw(std::string_view raw,
                                                     const RequestContext& ctx) {
    auto message = json::parse(raw.begin(), raw.end(), nullptr,
                               /*allow_exceptions=*/false);
    std::optional<json> response;
    if (message.is_discarded()) {
        LogDebug("mcp", "parse error on " + std::to_string(raw.size()) + " byte message");
        response = MakeError(nullptr, rpc::kParseError, "Parse error");
    } else {
        response = HandleMessage(message, ctx);
    }
    if (!response.has_value()) {
        return std::nullopt;
    }
    return response->dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<json> ProtocolEngine::HandleMessage(const json& message,
                                                  const RequestContext& ctx) {
    // -- Envelope --
    if (!message.is_object()) {
        return MakeError(nullptr, rpc::kInvalidRequest,
                         "Invalid Request: expected a single JSON object");
    }

    const auto id_it = message.find("id");
    const bool has_id = id_it != message.end();
    if (has_id && !IsValidId(*id_it)) {
        return MakeError(nullptr, rpc::kInvalidRequest,
                         "Invalid Request: id must be a string, number or null");
    }
    const json id = has_id ? *id_it : json(nullptr);

    const auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        return MakeError(id, rpc::kInvalidRequest,
                         "Invalid Request: jsonrpc must be \"2.0\"");
    }
    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return MakeError(id, rpc::kInvalidRequest,
                         "Invalid Request: method must be a string");
    }
    const auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_object() && !params_it->is_array()) {
        return MakeError(id, rpc::kInvalidRequest,
                         "Invalid Request: params must be an object or array");
    }

    const auto method = method_it->get<std::string>();
    const json params = params_it != message.end() ? *params_it : json::object();

    // -- Lifecycle --
    const auto state = state_.load();
    if (state == EngineState::ShuttingDown || state == EngineState::Closed) {
        if (!has_id) return std::nullopt;
        return MakeError(id, Error::Make(ErrorCategory::ServerClosed, method,
                                         "Server is shutting down"));
    }

    if (IsNotificationMethod(method)) {
        return HandleNotification(method, has_id ? &id : nullptr);
    }
    if (!has_id) {
        // Unknown notifications are dropped silently per JSON-RPC.
        LogDebug("mcp", "ignoring notification '" + method + "'");
        return std::nullopt;
    }

    if (options_.strict_initialization && state == EngineState::Uninitialized &&
        method != "initialize" && method != "ping") {
        return MakeError(id, Error::Make(ErrorCategory::NotInitialized, method,
                                         "Server not initialized"));
    }

    try {
        return Dispatch(method, params, id, ctx);
    } catch (const std::exception& e) {
        LogError("mcp", "internal error in '" + method + "': " + e.what());
        return MakeError(id, rpc::kInternalError, "Internal error");
    }
}

void ProtocolEngine::Shutdown() {
    auto expected = state_.load();
    while (expected != EngineState::ShuttingDown && expected != EngineState::Closed) {
        if (state_.compare_exchange_weak(expected, EngineState::ShuttingDown)) {
            LogInfo("mcp", "shutting down");
            root_.Cancel();
            state_.store(EngineState::Closed);
            return;
        }
    }
}

void ProtocolEngine::MarkReady() {
    auto expected = EngineState::Uninitialized;
    if (state_.compare_exchange_strong(expected, EngineState::Ready)) {
        LogInfo("mcp", "session ready");
    }
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
json ProtocolEngine::Dispatch(const std::string& method, const json& params,
                              const json& id, const RequestContext& ctx) {
    LogDebug("mcp", "<- " + method);
    if (method == "initialize") {
        return HandleInitialize(params, id);
    }
    if (method == "ping") {
        return MakeResult(id, json::object());
    }
    if (method == "tools/list") {
        return HandleToolsList(id);
    }
    if (method == "tools/call") {
        return HandleToolsCall(params, id, ctx);
    }
    if (method == "resources/list") {
        return HandleResourcesList(id);
    }
    if (method == "resources/read") {
        return HandleResourcesRead(params, id, ctx);
    }
    return MakeError(id, rpc::kMethodNotFound, "Method not found: " + method);
}

std::optional<json> ProtocolEngine::HandleNotification(const std::string& method,
                                                       const json* id) {
    if (IsInitializedNotification(method)) {
        MarkReady();
    }
    if (id == nullptr) {
        return std::nullopt;
    }
    return MakeResult(*id, nullptr);
}

json ProtocolEngine::HandleInitialize(const json& params, const json& id) {
    if (params.is_object()) {
        if (auto it = params.find("clientInfo"); it != params.end() && it->is_object()) {
            LogInfo("mcp", "initialize from " + it->value("name", std::string("unknown")) +
                               " " + it->value("version", std::string("")));
        }
    }
    MarkReady();

    json result;
    result["protocolVersion"] = rpc::kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", true}}},
        {"resources", {{"subscribe", false}, {"listChanged", false}}},
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion},
    };
    return MakeResult(id, result);
}

json ProtocolEngine::HandleToolsList(const json& id) {
    json tools = json::array();
    for (const auto& d : registry_->List()) {
        tools.push_back({
            {"name", d.name},
            {"description", d.description},
            {"inputSchema", d.input_schema},
        });
    }
    return MakeResult(id, {{"tools", tools}});
}

json ProtocolEngine::HandleToolsCall(const json& params, const json& id,
                                     const RequestContext& ctx) {
    if (!params.is_object()) {
        return MakeError(id, rpc::kInvalidParams, "tools/call params must be an object");
    }
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        return MakeError(id, rpc::kInvalidParams, "Missing 'name' parameter");
    }
    json arguments = json::object();
    if (auto args_it = params.find("arguments");
        args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return MakeError(id, rpc::kInvalidParams, "'arguments' must be an object");
        }
        arguments = *args_it;
    }

    std::string identity;
    if (auto denied = CheckAuth(id, ctx, identity)) {
        return *denied;
    }

    const auto tool_name = name_it->get<std::string>();
    CallContext call{NewCallToken(), std::nullopt, identity};
    LogInfo("mcp", "tools/call " + tool_name + " by " + identity);

    auto result = registry_->Invoke(tool_name, arguments, call);
    if (result.IsErr()) {
        const auto& err = result.Error();
        LogWarn("mcp", "tools/call " + tool_name + " failed: " + err.ToString());
        return MakeError(id, err);
    }

    const auto& tool_result = result.Value();
    json response_result;
    response_result["content"] = tool_result.content;
    if (tool_result.is_error) {
        response_result["isError"] = true;
    }
    return MakeResult(id, response_result);
}

json ProtocolEngine::HandleResourcesList(const json& id) {
    json list = json::array();
    if (resources_) {
        for (const auto& r : resources_->List()) {
            list.push_back(ToJson(r));
        }
    }
    return MakeResult(id, {{"resources", list}});
}

json ProtocolEngine::HandleResourcesRead(const json& params, const json& id,
                                         const RequestContext& ctx) {
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return MakeError(id, rpc::kInvalidParams, "Missing 'uri' parameter");
    }
    if (!resources_) {
        return MakeError(id, Error::Make(ErrorCategory::Validation, "resources/read",
                                         "No resources are available"));
    }

    std::string identity;
    if (auto denied = CheckAuth(id, ctx, identity)) {
        return *denied;
    }

    CallContext call{NewCallToken(), std::nullopt, identity};
    if (options_.resource_timeout.has_value()) {
        call.deadline = std::chrono::steady_clock::now() + *options_.resource_timeout;
    }
    auto result = resources_->Read(params["uri"].get<std::string>(), call);
    if (result.IsErr()) {
        return MakeError(id, result.Error());
    }
    return MakeResult(id, result.Value());
}

std::optional<json> ProtocolEngine::CheckAuth(const json& id, const RequestContext& ctx,
                                              std::string& identity) const {
    const auto decision = authenticator_->Check(ctx);
    if (!decision.allowed) {
        LogWarn("auth", "rejected " + ctx.transport + " caller: " + decision.reason);
        return MakeError(id, Error::Make(ErrorCategory::Unauthorized, "auth",
                                         decision.reason.empty() ? "Unauthorized"
                                                                 : decision.reason));
    }
    identity = decision.identity;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Response builders
// ---------------------------------------------------------------------------
json ProtocolEngine::MakeError(const json& id, int code, const std::string& message,
                               const json& data) {
    json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error},
    };
}

json ProtocolEngine::MakeError(const json& id, const Error& error) {
    const bool internal = error.category == ErrorCategory::Internal ||
                          error.category == ErrorCategory::Config;
    json data = {{"category", error.CategoryName()}};
    if (error.http_status.has_value()) {
        data["http_status"] = *error.http_status;
    }
    return MakeError(id, error.JsonRpcCode(),
                     internal ? std::string("Internal error") : error.message, data);
}

json ProtocolEngine::MakeResult(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result},
    };
}

} // namespace op_mcp
