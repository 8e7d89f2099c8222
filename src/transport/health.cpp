#include <op_mcp/transport/health.hpp>

#include <op_mcp/core/version.hpp>

namespace op_mcp {

HealthReporter::HealthReporter(const ProtocolEngine& engine,
                               std::shared_ptr<const BackendClient> client)
    : engine_(engine),
      client_(std::move(client)),
      started_(std::chrono::steady_clock::now()) {}

double HealthReporter::UptimeSeconds() const {
    const auto elapsed = std::chrono::steady_clock::now() - started_;
    return std::chrono::duration<double>(elapsed).count();
}

nlohmann::json HealthReporter::Snapshot() const {
    const auto state = engine_.State();
    const bool stopping = state == EngineState::ShuttingDown || state == EngineState::Closed;
    return {
        {"status", stopping ? "shutting_down" : "healthy"},
        {"version", kVersion},
        {"openproject_connected", client_ != nullptr && !client_->IsClosed()},
        {"uptime_seconds", UptimeSeconds()},
        {"state", EngineStateName(state)},
    };
}

} // namespace op_mcp
