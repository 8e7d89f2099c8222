#pragma once

#include <op_mcp/core/cancellation.hpp>
#include <op_mcp/core/result.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace op_mcp {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// Per-request knobs. A cancelled token aborts the request mid-read; `timeout`
// caps the read timeout for this request only.
struct RequestOptions {
    std::optional<CancellationToken> cancel;
    std::optional<std::chrono::milliseconds> timeout;
};

// ---------------------------------------------------------------------------
// IHttpSession: abstract read-only HTTP access to the backend.
//
// Paths are absolute ("/api/v3/projects/1"). Any HTTP status is returned as
// an HttpResponse; only transport failures are errors:
//   - connect/read/write failures  -> UpstreamTransient
//   - cancellation via the token   -> Timeout
//   - call after Close()           -> ClientClosed
//
// Implementations must allow concurrent Get() calls from several threads.
// ---------------------------------------------------------------------------
class IHttpSession {
public:
    virtual ~IHttpSession() = default;

    IHttpSession(const IHttpSession&) = delete;
    IHttpSession& operator=(const IHttpSession&) = delete;
    IHttpSession(IHttpSession&&) = delete;
    IHttpSession& operator=(IHttpSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const RequestOptions& options = {}) = 0;

    // Release every connection. Idempotent.
    virtual void Close() = 0;

protected:
    IHttpSession() = default;
};

} // namespace op_mcp
