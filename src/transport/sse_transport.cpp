#include <op_mcp/transport/sse_transport.hpp>

#include "http_util.hpp"

#include <op_mcp/core/cancellation.hpp>
#include <op_mcp/core/log.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

namespace op_mcp {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "sse";
constexpr auto kPollInterval = std::chrono::seconds(1);

// Frames queued by the hub and drained by the httplib worker that owns the
// stream.
class QueuedSink : public ISseSink {
public:
    bool Write(const std::string& frame) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            frames_.push_back(frame);
        }
        cv_.notify_one();
        return true;
    }

    void Close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Waits up to `timeout` for frames. `closed` is set once no more frames
    // will follow the returned ones.
    std::deque<std::string> Drain(std::chrono::milliseconds timeout, bool& closed) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !frames_.empty() || closed_; });
        std::deque<std::string> out;
        out.swap(frames_);
        closed = closed_;
        return out;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_ = false;
};

} // anonymous namespace

std::string FormatSseEvent(const std::string& event, const std::string& data) {
    std::string frame = "event: " + event + "\n";
    std::istringstream lines(data);
    std::string line;
    bool any = false;
    while (std::getline(lines, line)) {
        frame += "data: " + line + "\n";
        any = true;
    }
    if (!any) {
        frame += "data: \n";
    }
    frame += "\n";
    return frame;
}

// ---------------------------------------------------------------------------
// SseHub
// ---------------------------------------------------------------------------
void SseHub::Add(const std::string& session_id, std::shared_ptr<ISseSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_[session_id] = std::move(sink);
}

void SseHub::Remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(session_id);
}

bool SseHub::Has(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.count(session_id) != 0;
}

bool SseHub::Send(const std::string& session_id, const std::string& event,
                  const std::string& data) {
    std::shared_ptr<ISseSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sinks_.find(session_id);
        if (it == sinks_.end()) {
            return false;
        }
        sink = it->second;
    }
    if (sink->Write(FormatSseEvent(event, data))) {
        return true;
    }
    LogInfo(kComponent, "dropping client " + session_id);
    sink->Close();
    Remove(session_id);
    return false;
}

size_t SseHub::Broadcast(const std::string& event, const std::string& data) {
    std::vector<std::pair<std::string, std::shared_ptr<ISseSink>>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.assign(sinks_.begin(), sinks_.end());
    }
    const auto frame = FormatSseEvent(event, data);
    size_t delivered = 0;
    std::vector<std::string> failed;
    for (const auto& [id, sink] : targets) {
        if (sink->Write(frame)) {
            ++delivered;
        } else {
            sink->Close();
            failed.push_back(id);
        }
    }
    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : failed) {
            sinks_.erase(id);
        }
        LogInfo(kComponent, "dropped " + std::to_string(failed.size()) +
                                " client(s) during broadcast");
    }
    return delivered;
}

void SseHub::CloseAll() {
    std::map<std::string, std::shared_ptr<ISseSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks.swap(sinks_);
    }
    for (auto& [id, sink] : sinks) {
        sink->Close();
    }
}

size_t SseHub::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct SseTransport::Impl {
    ProtocolEngine& engine;
    const HealthReporter& health;
    SseTransportOptions options;
    httplib::Server server;
    SseHub hub;
    CancellationToken stopping;
    std::atomic<bool> bound{false};

    std::mutex rng_mutex;
    std::mt19937_64 rng{std::random_device{}()};

    Impl(ProtocolEngine& e, const HealthReporter& h, SseTransportOptions o)
        : engine(e), health(h), options(std::move(o)) {
        RegisterRoutes();
    }

    std::string NewSessionId() {
        std::lock_guard<std::mutex> lock(rng_mutex);
        std::ostringstream out;
        out << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16)
            << rng();
        return out.str();
    }

    void OpenStream(httplib::Response& res) {
        const auto session_id = NewSessionId();
        auto sink = std::make_shared<QueuedSink>();
        sink->Write(FormatSseEvent("endpoint", "/message?session_id=" + session_id));
        sink->Write(FormatSseEvent(
            "connected",
            json{{"message", "Connected to MCP OpenProject Server"},
                 {"session_id", session_id}}.dump()));
        hub.Add(session_id, sink);
        LogInfo(kComponent, "client connected: " + session_id + " (" +
                                std::to_string(hub.Size()) + " open)");

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider(
            "text/event-stream",
            [sink](size_t, httplib::DataSink& out) {
                bool closed = false;
                auto frames = sink->Drain(
                    std::chrono::duration_cast<std::chrono::milliseconds>(kPollInterval),
                    closed);
                for (const auto& frame : frames) {
                    if (!out.write(frame.data(), frame.size())) {
                        sink->Close();
                        return false;
                    }
                }
                if (closed) {
                    out.done();
                    return true;
                }
                if (out.is_writable && !out.is_writable()) {
                    sink->Close();
                    return false;
                }
                return true;
            },
            [this, sink, session_id](bool) {
                sink->Close();
                hub.Remove(session_id);
                LogInfo(kComponent, "client disconnected: " + session_id);
            });
    }

    void PostMessage(const httplib::Request& req, httplib::Response& res) {
        const auto session_id = req.get_param_value("session_id");
        if (session_id.empty()) {
            http_util::WriteError(res, Error::Make(ErrorCategory::InvalidRequest, req.path,
                                                   "missing session_id"));
            return;
        }
        if (!hub.Has(session_id)) {
            http_util::WriteJson(res, 404,
                                 ErrorBody(Error::Make(ErrorCategory::InvalidRequest,
                                                       req.path, "unknown session")));
            return;
        }
        auto ctx = http_util::ContextFrom(req, "sse", session_id);
        auto response = engine.HandleRaw(req.body, ctx);
        if (response.has_value() && !hub.Send(session_id, "message", *response)) {
            LogWarn(kComponent, "response for " + session_id + " was not delivered");
        }
        res.status = 202;
        res.set_content("Accepted", "text/plain");
    }

    void RegisterRoutes() {
        server.Get("/sse", [this](const httplib::Request&, httplib::Response& res) {
            OpenStream(res);
        });
        server.Post("/message", [this](const httplib::Request& req, httplib::Response& res) {
            PostMessage(req, res);
        });
        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            http_util::WriteJson(res, 200, health.Snapshot());
        });
        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            http_util::LogRequest(kComponent, req, res);
        });
        server.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                        std::exception_ptr ep) {
            http_util::HandleException(kComponent, req, res, ep);
        });
    }

    void HeartbeatLoop() {
        while (!stopping.WaitFor(options.heartbeat_interval)) {
            const auto reached = hub.Broadcast("heartbeat", health.Snapshot().dump());
            LogDebug(kComponent, "heartbeat reached " + std::to_string(reached) + " client(s)");
        }
    }
};

SseTransport::SseTransport(ProtocolEngine& engine,
                           const HealthReporter& health,
                           SseTransportOptions options)
    : impl_(std::make_unique<Impl>(engine, health, std::move(options))) {}

SseTransport::~SseTransport() {
    Stop();
}

SseHub& SseTransport::Hub() {
    return impl_->hub;
}

Result<int, Error> SseTransport::Bind() {
    const auto& host = impl_->options.host;
    int port = impl_->options.port;
    if (port == 0) {
        port = impl_->server.bind_to_any_port(host);
    } else if (!impl_->server.bind_to_port(host, port)) {
        port = -1;
    }
    if (port < 0) {
        return Result<int, Error>::Err(Error::Make(
            ErrorCategory::Config, "SseTransport::Bind",
            "cannot bind " + host + ":" + std::to_string(impl_->options.port)));
    }
    impl_->bound = true;
    LogInfo(kComponent, "listening on http://" + host + ":" + std::to_string(port) + "/sse");
    return Result<int, Error>::Ok(port);
}

Result<void, Error> SseTransport::Serve() {
    if (!impl_->bound) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "SseTransport::Serve", "Serve() before Bind()"));
    }
    std::thread heartbeat([this] { impl_->HeartbeatLoop(); });
    const bool ok = impl_->server.listen_after_bind();
    impl_->stopping.Cancel();
    heartbeat.join();
    if (!ok) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "SseTransport::Serve", "listener failed"));
    }
    LogInfo(kComponent, "stopped");
    return Result<void, Error>::Ok();
}

void SseTransport::Stop() {
    impl_->engine.Shutdown();
    impl_->stopping.Cancel();
    impl_->hub.CloseAll();
    impl_->server.stop();
}

void SseTransport::WaitUntilReady() {
    impl_->server.wait_until_ready();
}

} // namespace op_mcp
