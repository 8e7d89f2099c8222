#pragma once

#include <op_mcp/core/result.hpp>
#include <op_mcp/mcp/protocol_engine.hpp>
#include <op_mcp/transport/health.hpp>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace op_mcp {

struct HttpTransportOptions {
    std::string host = "127.0.0.1";
    int port = 8000;  // 0 binds any free port
};

// HTTP status used by the REST mirrors for an application error.
int HttpStatusFor(ErrorCategory category);

// {"error":{"category","message"}}. Internal and Config errors never carry
// their message.
nlohmann::json ErrorBody(const Error& error);

// ---------------------------------------------------------------------------
// HttpTransport: JSON-RPC over HTTP plus REST mirrors of the tools.
//
//   POST /mcp, POST /                 one envelope in, one response out;
//                                     notifications answer 202 with no body
//   GET  /health                      HealthReporter snapshot
//   GET  /mcp/tools                   tool descriptors
//   POST /mcp/tools/{name}            {"data": <tool result>}
//   GET  /mcp/resources               resource descriptors
//   GET  /mcp/resources/openproject://projects/{id}
//   GET  /api/v1/projects/{id}        get_project
//   POST /api/v1/reports/weekly       get_weekly_report
//
// The mirrors go through the engine's ToolRegistry and Authenticator but not
// through JSON-RPC envelope handling.
//
// Usage: Bind() once, then Serve() on a thread of its own; Stop() from any
// thread shuts the engine down, cancelling in-flight calls, and makes Serve()
// return.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(ProtocolEngine& engine,
                  const HealthReporter& health,
                  HttpTransportOptions options = {});
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Returns the bound port.
    [[nodiscard]] Result<int, Error> Bind();

    // Blocks until Stop(). Fails when Bind() did not succeed.
    [[nodiscard]] Result<void, Error> Serve();

    void Stop();
    void WaitUntilReady();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace op_mcp
