#pragma once

#include <op_mcp/core/log.hpp>
#include <op_mcp/core/result.hpp>
#include <op_mcp/mcp/auth.hpp>
#include <op_mcp/transport/http_transport.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <string>

namespace op_mcp::http_util {

constexpr const char* kJsonType = "application/json";

inline RequestContext ContextFrom(const httplib::Request& req,
                                  const std::string& transport,
                                  const std::string& session_id = {}) {
    RequestContext ctx;
    ctx.transport = transport;
    ctx.session_id = session_id;
    if (req.has_header("Authorization")) {
        ctx.bearer_token = ParseBearerToken(req.get_header_value("Authorization"));
    }
    return ctx;
}

inline void WriteJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    kJsonType);
}

inline void WriteError(httplib::Response& res, const Error& error) {
    WriteJson(res, HttpStatusFor(error.category), ErrorBody(error));
}

inline void LogRequest(const std::string& component,
                       const httplib::Request& req,
                       const httplib::Response& res) {
    LogDebug(component, req.method + " " + req.path + " -> " + std::to_string(res.status));
}

// Turns an escaped handler exception into a 500 with a generic error body.
inline void HandleException(const std::string& component,
                            const httplib::Request& req,
                            httplib::Response& res,
                            const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        LogError(component, req.method + " " + req.path + " failed: " + e.what());
    }
    WriteError(res, Error::Make(ErrorCategory::Internal, req.path, "unhandled exception"));
}

} // namespace op_mcp::http_util
