#include <op_mcp/transport/http_transport.hpp>

#include "http_util.hpp"

#include <op_mcp/core/log.hpp>
#include <op_mcp/mcp/resource_catalog.hpp>

#include <atomic>
#include <string>

namespace op_mcp {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "http";

// Body of a mirror POST. An empty body is an empty object.
Result<json, Error> ParseBody(const httplib::Request& req) {
    if (req.body.empty()) {
        return Result<json, Error>::Ok(json::object());
    }
    auto body = json::parse(req.body, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded() || !body.is_object()) {
        return Result<json, Error>::Err(Error::Make(
            ErrorCategory::ParseError, req.path, "request body must be a JSON object"));
    }
    return Result<json, Error>::Ok(std::move(body));
}

Result<long long, Error> ParseIdSegment(const std::string& digits, const std::string& path) {
    if (digits.empty() || digits.size() > 18) {
        return Result<long long, Error>::Err(
            Error::Make(ErrorCategory::Validation, path, "project_id is out of range"));
    }
    return Result<long long, Error>::Ok(std::stoll(digits));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Error rendering
// ---------------------------------------------------------------------------
int HttpStatusFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ParseError:
        case ErrorCategory::InvalidRequest:
        case ErrorCategory::InvalidParams:
            return 400;
        case ErrorCategory::Validation:
            return 422;
        case ErrorCategory::Unauthorized:
            return 401;
        case ErrorCategory::MethodNotFound:
        case ErrorCategory::ToolNotFound:
        case ErrorCategory::UpstreamNotFound:
            return 404;
        case ErrorCategory::NotInitialized:
        case ErrorCategory::ServerClosed:
        case ErrorCategory::ClientClosed:
        case ErrorCategory::UpstreamTransient:
            return 503;
        case ErrorCategory::UpstreamAuth:
        case ErrorCategory::UpstreamProtocol:
            return 502;
        case ErrorCategory::Timeout:
            return 504;
        case ErrorCategory::Config:
        case ErrorCategory::Internal:
            return 500;
    }
    return 500;
}

nlohmann::json ErrorBody(const Error& error) {
    const bool internal = error.category == ErrorCategory::Internal ||
                          error.category == ErrorCategory::Config;
    return {{"error", {
        {"category", error.CategoryName()},
        {"message", internal ? std::string("Internal error") : error.message},
    }}};
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    ProtocolEngine& engine;
    const HealthReporter& health;
    HttpTransportOptions options;
    httplib::Server server;
    std::atomic<bool> bound{false};

    Impl(ProtocolEngine& e, const HealthReporter& h, HttpTransportOptions o)
        : engine(e), health(h), options(std::move(o)) {
        RegisterRoutes();
    }

    // Auth check plus tool invocation shared by every mirror route.
    Result<ToolResult, Error> InvokeTool(const std::string& tool,
                                         const json& arguments,
                                         const httplib::Request& req) {
        const auto state = engine.State();
        if (state == EngineState::ShuttingDown || state == EngineState::Closed) {
            return Result<ToolResult, Error>::Err(
                Error::Make(ErrorCategory::ServerClosed, tool, "Server is shutting down"));
        }
        auto ctx = http_util::ContextFrom(req, "http");
        auto decision = engine.Auth().Check(ctx);
        if (!decision.allowed) {
            LogWarn("auth", "rejected http caller on " + req.path + ": " + decision.reason);
            return Result<ToolResult, Error>::Err(
                Error::Make(ErrorCategory::Unauthorized, "auth", decision.reason));
        }
        CallContext call{engine.NewCallToken(), std::nullopt, decision.identity};
        LogInfo(kComponent, req.method + " " + req.path + " -> " + tool + " by " +
                                decision.identity);
        return engine.Registry().Invoke(tool, arguments, call);
    }

    void RegisterRoutes() {
        auto rpc = [this](const httplib::Request& req, httplib::Response& res) {
            auto ctx = http_util::ContextFrom(req, "http");
            auto response = engine.HandleRaw(req.body, ctx);
            if (!response.has_value()) {
                res.status = 202;
                return;
            }
            res.status = 200;
            res.set_content(*response, http_util::kJsonType);
        };
        server.Post("/mcp", rpc);
        server.Post("/", rpc);

        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            http_util::WriteJson(res, 200, health.Snapshot());
        });

        server.Get("/mcp/tools", [this](const httplib::Request&, httplib::Response& res) {
            json tools = json::array();
            for (const auto& d : engine.Registry().List()) {
                tools.push_back({
                    {"name", d.name},
                    {"description", d.description},
                    {"inputSchema", d.input_schema},
                });
            }
            http_util::WriteJson(res, 200, tools);
        });

        server.Post(R"(/mcp/tools/([^/]+))",
                    [this](const httplib::Request& req, httplib::Response& res) {
            const std::string name = req.matches[1];
            auto body = ParseBody(req);
            if (body.IsErr()) {
                http_util::WriteError(res, body.Error());
                return;
            }
            json arguments = body.Value().value("params", json::object());
            if (!arguments.is_object()) {
                http_util::WriteError(res, Error::Make(ErrorCategory::InvalidParams, name,
                                                       "'params' must be an object"));
                return;
            }
            auto result = InvokeTool(name, arguments, req);
            if (result.IsErr()) {
                http_util::WriteError(res, result.Error());
                return;
            }
            http_util::WriteJson(res, 200, {{"data", result.Value().data}});
        });

        server.Get("/mcp/resources", [this](const httplib::Request&, httplib::Response& res) {
            json list = json::array();
            if (const auto* catalog = engine.Resources()) {
                for (const auto& r : catalog->List()) {
                    list.push_back(ToJson(r));
                }
            }
            http_util::WriteJson(res, 200, list);
        });

        server.Get(R"(/mcp/resources/openproject://projects/(\d+))",
                   [this](const httplib::Request& req, httplib::Response& res) {
            const auto* catalog = engine.Resources();
            if (catalog == nullptr) {
                http_util::WriteError(res, Error::Make(ErrorCategory::UpstreamNotFound,
                                                       req.path, "No resources are available"));
                return;
            }
            auto ctx = http_util::ContextFrom(req, "http");
            auto decision = engine.Auth().Check(ctx);
            if (!decision.allowed) {
                http_util::WriteError(res, Error::Make(ErrorCategory::Unauthorized, "auth",
                                                       decision.reason));
                return;
            }
            const std::string uri = "openproject://projects/" + std::string(req.matches[1]);
            CallContext call{engine.NewCallToken(), std::nullopt, decision.identity};
            auto read = catalog->Read(uri, call);
            if (read.IsErr()) {
                http_util::WriteError(res, read.Error());
                return;
            }
            res.status = 200;
            res.set_content(read.Value()["contents"][0]["text"].get<std::string>(),
                            http_util::kJsonType);
        });

        server.Get(R"(/api/v1/projects/(\d+))",
                   [this](const httplib::Request& req, httplib::Response& res) {
            auto id = ParseIdSegment(req.matches[1], req.path);
            if (id.IsErr()) {
                http_util::WriteError(res, id.Error());
                return;
            }
            auto result = InvokeTool("get_project", {{"project_id", id.Value()}}, req);
            if (result.IsErr()) {
                http_util::WriteError(res, result.Error());
                return;
            }
            http_util::WriteJson(res, 200, result.Value().data);
        });

        server.Post("/api/v1/reports/weekly",
                    [this](const httplib::Request& req, httplib::Response& res) {
            auto body = ParseBody(req);
            if (body.IsErr()) {
                http_util::WriteError(res, body.Error());
                return;
            }
            auto result = InvokeTool("get_weekly_report", body.Value(), req);
            if (result.IsErr()) {
                http_util::WriteError(res, result.Error());
                return;
            }
            http_util::WriteJson(res, 200, result.Value().data);
        });

        server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            http_util::LogRequest(kComponent, req, res);
        });
        server.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                        std::exception_ptr ep) {
            http_util::HandleException(kComponent, req, res, ep);
        });
    }
};

HttpTransport::HttpTransport(ProtocolEngine& engine,
                             const HealthReporter& health,
                             HttpTransportOptions options)
    : impl_(std::make_unique<Impl>(engine, health, std::move(options))) {}

HttpTransport::~HttpTransport() {
    Stop();
}

Result<int, Error> HttpTransport::Bind() {
    const auto& host = impl_->options.host;
    int port = impl_->options.port;
    if (port == 0) {
        port = impl_->server.bind_to_any_port(host);
    } else if (!impl_->server.bind_to_port(host, port)) {
        port = -1;
    }
    if (port < 0) {
        return Result<int, Error>::Err(Error::Make(
            ErrorCategory::Config, "HttpTransport::Bind",
            "cannot bind " + host + ":" + std::to_string(impl_->options.port)));
    }
    impl_->bound = true;
    LogInfo(kComponent, "listening on http://" + host + ":" + std::to_string(port) + "/mcp");
    return Result<int, Error>::Ok(port);
}

Result<void, Error> HttpTransport::Serve() {
    if (!impl_->bound) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "HttpTransport::Serve", "Serve() before Bind()"));
    }
    if (!impl_->server.listen_after_bind()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "HttpTransport::Serve", "listener failed"));
    }
    LogInfo(kComponent, "stopped");
    return Result<void, Error>::Ok();
}

void HttpTransport::Stop() {
    // Cancel in-flight tool calls first so the workers can be joined.
    impl_->engine.Shutdown();
    impl_->server.stop();
}

void HttpTransport::WaitUntilReady() {
    impl_->server.wait_until_ready();
}

} // namespace op_mcp
