#pragma once

#include <op_mcp/backend/backend_client.hpp>
#include <op_mcp/mcp/protocol_engine.hpp>

#include <chrono>
#include <memory>

#include <nlohmann/json.hpp>

namespace op_mcp {

// ---------------------------------------------------------------------------
// HealthReporter: the body of GET /health and of SSE heartbeat events.
//
//   {"status", "version", "openproject_connected", "uptime_seconds", "state"}
//
// openproject_connected reports whether the backend client is still open; it
// never issues a backend request. A null client reports false.
// ---------------------------------------------------------------------------
class HealthReporter {
public:
    HealthReporter(const ProtocolEngine& engine,
                   std::shared_ptr<const BackendClient> client);

    [[nodiscard]] nlohmann::json Snapshot() const;
    [[nodiscard]] double UptimeSeconds() const;

private:
    const ProtocolEngine& engine_;
    std::shared_ptr<const BackendClient> client_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace op_mcp
