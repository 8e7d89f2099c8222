#pragma once

#include <op_mcp/core/result.hpp>
#include <op_mcp/mcp/protocol_engine.hpp>
#include <op_mcp/transport/health.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace op_mcp {

// One server-sent event frame. Multi-line data becomes several data: lines.
std::string FormatSseEvent(const std::string& event, const std::string& data);

// ---------------------------------------------------------------------------
// ISseSink: one open event stream.
//
// Write() returns false once the client is gone; the hub then drops it.
// ---------------------------------------------------------------------------
class ISseSink {
public:
    virtual ~ISseSink() = default;
    virtual bool Write(const std::string& frame) = 0;
    virtual void Close() = 0;
};

// ---------------------------------------------------------------------------
// SseHub: the set of open client streams, keyed by session id.
//
// Thread-safe. Delivery is best-effort: a failed write removes and closes
// that client and never affects the others.
// ---------------------------------------------------------------------------
class SseHub {
public:
    void Add(const std::string& session_id, std::shared_ptr<ISseSink> sink);
    void Remove(const std::string& session_id);
    [[nodiscard]] bool Has(const std::string& session_id) const;

    // False when the session is unknown or its write failed.
    bool Send(const std::string& session_id, const std::string& event,
              const std::string& data);

    // Returns the number of clients the event reached.
    size_t Broadcast(const std::string& event, const std::string& data);

    void CloseAll();
    [[nodiscard]] size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ISseSink>> sinks_;
};

struct SseTransportOptions {
    std::string host = "127.0.0.1";
    int port = 8000;  // 0 binds any free port
    std::chrono::milliseconds heartbeat_interval{30000};
};

// ---------------------------------------------------------------------------
// SseTransport: MCP over server-sent events.
//
//   GET  /sse                       opens a stream; first "endpoint" (the
//                                   POST URL carrying the session id), then
//                                   "connected"
//   POST /message?session_id=<id>   feeds the engine; the response arrives
//                                   as a "message" event on that stream and
//                                   the POST itself answers 202
//   GET  /health
//
// While serving, a "heartbeat" event with the health snapshot is broadcast
// every heartbeat_interval.
// ---------------------------------------------------------------------------
class SseTransport {
public:
    SseTransport(ProtocolEngine& engine,
                 const HealthReporter& health,
                 SseTransportOptions options = {});
    ~SseTransport();

    SseTransport(const SseTransport&) = delete;
    SseTransport& operator=(const SseTransport&) = delete;

    [[nodiscard]] Result<int, Error> Bind();

    // Blocks until Stop().
    [[nodiscard]] Result<void, Error> Serve();

    // Shuts the engine down (cancelling in-flight calls), closes every client
    // stream, then stops the listener.
    void Stop();
    void WaitUntilReady();

    [[nodiscard]] SseHub& Hub();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace op_mcp
