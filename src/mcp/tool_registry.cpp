#include <op_mcp/mcp/tool_registry.hpp>

#include <op_mcp/core/log.hpp>

#include <algorithm>
#include <future>

namespace op_mcp {

namespace {

Result<ToolResult, Error> RunGuarded(const std::string& name,
                                     const ToolHandler& handler,
                                     const nlohmann::json& params,
                                     const CallContext& ctx) {
    try {
        return handler(params, ctx);
    } catch (const std::exception& e) {
        LogError("tools", "tool '" + name + "' threw: " + e.what());
        return Result<ToolResult, Error>::Err(Error::Make(
            ErrorCategory::Internal, "ToolRegistry::Invoke", "Tool failed unexpectedly"));
    }
}

} // anonymous namespace

ToolRegistry::ToolRegistry(std::optional<std::chrono::milliseconds> default_timeout)
    : default_timeout_(default_timeout) {}

void ToolRegistry::Register(ToolDescriptor descriptor, ToolHandler handler) {
    const auto name = descriptor.name;
    auto it = std::find_if(descriptors_.begin(), descriptors_.end(),
                           [&](const ToolDescriptor& d) { return d.name == name; });
    if (it != descriptors_.end()) {
        LogWarn("tools", "replacing handler for tool '" + name + "'");
        *it = std::move(descriptor);
    } else {
        descriptors_.push_back(std::move(descriptor));
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<ToolResult, Error> ToolRegistry::Invoke(const std::string& name,
                                               const nlohmann::json& params,
                                               const CallContext& ctx) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<ToolResult, Error>::Err(Error::Make(
            ErrorCategory::ToolNotFound, "ToolRegistry::Invoke", "Unknown tool: " + name));
    }

    auto desc = std::find_if(descriptors_.begin(), descriptors_.end(),
                             [&](const ToolDescriptor& d) { return d.name == name; });
    const auto timeout = (desc != descriptors_.end() && desc->timeout.has_value())
        ? desc->timeout : default_timeout_;

    if (!timeout.has_value()) {
        return RunGuarded(name, it->second, params, ctx);
    }

    // The handler gets its own token and a deadline it can pass to the backend.
    CallContext bounded = ctx;
    bounded.cancel = ctx.cancel.MakeChild();
    const auto deadline = std::chrono::steady_clock::now() + *timeout;
    bounded.deadline = ctx.deadline.has_value() ? std::min(*ctx.deadline, deadline)
                                                : deadline;

    const ToolHandler& handler = it->second;
    auto future = std::async(std::launch::async, [&name, &handler, &params, bounded]() {
        return RunGuarded(name, handler, params, bounded);
    });

    if (future.wait_until(*bounded.deadline) == std::future_status::ready) {
        return future.get();
    }

    // Cancel and wait for the handler to unwind so its pool slot is back
    // before the caller sees Timeout.
    bounded.cancel.Cancel();
    future.wait();
    LogWarn("tools", "tool '" + name + "' timed out after " +
                         std::to_string(timeout->count()) + "ms");
    Error err = Error::Make(ErrorCategory::Timeout, "ToolRegistry::Invoke",
                            "Tool '" + name + "' timed out after " +
                                std::to_string(timeout->count()) + "ms");
    return Result<ToolResult, Error>::Err(std::move(err));
}

// ---------------------------------------------------------------------------
// ToolRegistryBuilder
// ---------------------------------------------------------------------------
ToolRegistryBuilder& ToolRegistryBuilder::DefaultTimeout(std::chrono::milliseconds timeout) {
    default_timeout_ = timeout;
    return *this;
}

ToolRegistryBuilder& ToolRegistryBuilder::Add(ToolDescriptor descriptor, ToolHandler handler) {
    entries_.emplace_back(std::move(descriptor), std::move(handler));
    return *this;
}

ToolRegistry ToolRegistryBuilder::Build() const {
    ToolRegistry registry(default_timeout_);
    for (const auto& [descriptor, handler] : entries_) {
        registry.Register(descriptor, handler);
    }
    return registry;
}

} // namespace op_mcp
