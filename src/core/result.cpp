#include <op_mcp/core/result.hpp>

#include <sstream>

namespace op_mcp {

namespace {

// OpenProject reports failures as HAL error resources:
//   {"_type":"Error","errorIdentifier":"...","message":"..."}
std::optional<std::string> ExtractBackendMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_object()) return std::nullopt;
    auto it = parsed.find("message");
    if (it == parsed.end() || !it->is_string()) return std::nullopt;
    auto msg = it->get<std::string>();
    if (msg.empty()) return std::nullopt;
    return msg;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto backend_message = ExtractBackendMessage(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 401:
            category = ErrorCategory::UpstreamAuth;
            message = "Authentication failed - check the API key";
            break;
        case 403:
            category = ErrorCategory::UpstreamAuth;
            message = "Access denied by backend";
            break;
        case 404:
            category = ErrorCategory::UpstreamNotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::UpstreamTransient;
            message = "Backend request timed out";
            break;
        case 429:
            category = ErrorCategory::UpstreamTransient;
            message = "Too many requests";
            break;
        case 500:
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::UpstreamTransient;
            message = "Backend unavailable";
            break;
        default:
            category = ErrorCategory::UpstreamProtocol;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    return Error{operation, endpoint, status_code, message,
                 backend_message, category};
}

Error Error::Make(ErrorCategory category, std::string operation,
                  std::string message) {
    Error e;
    e.operation = std::move(operation);
    e.message = std::move(message);
    e.category = category;
    return e;
}

int Error::JsonRpcCode() const noexcept {
    switch (category) {
        case ErrorCategory::ParseError:        return -32700;
        case ErrorCategory::InvalidRequest:    return -32600;
        case ErrorCategory::MethodNotFound:    return -32601;
        case ErrorCategory::InvalidParams:     return -32602;
        case ErrorCategory::Validation:        return -32001;
        case ErrorCategory::ToolNotFound:      return -32002;
        case ErrorCategory::NotInitialized:    return -32003;
        case ErrorCategory::ServerClosed:      return -32004;
        case ErrorCategory::Unauthorized:      return -32005;
        case ErrorCategory::UpstreamTransient: return -32010;
        case ErrorCategory::UpstreamAuth:      return -32011;
        case ErrorCategory::UpstreamNotFound:  return -32012;
        case ErrorCategory::UpstreamProtocol:  return -32013;
        case ErrorCategory::Timeout:           return -32014;
        case ErrorCategory::ClientClosed:      return -32015;
        case ErrorCategory::Config:            return -32603;
        case ErrorCategory::Internal:          return -32603;
    }
    return -32603;
}

std::string CategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ParseError:        return "parse_error";
        case ErrorCategory::InvalidRequest:    return "invalid_request";
        case ErrorCategory::MethodNotFound:    return "method_not_found";
        case ErrorCategory::InvalidParams:     return "invalid_params";
        case ErrorCategory::Validation:        return "validation";
        case ErrorCategory::ToolNotFound:      return "tool_not_found";
        case ErrorCategory::NotInitialized:    return "not_initialized";
        case ErrorCategory::ServerClosed:      return "server_closed";
        case ErrorCategory::Unauthorized:      return "unauthorized";
        case ErrorCategory::UpstreamTransient: return "upstream_transient";
        case ErrorCategory::UpstreamAuth:      return "upstream_auth";
        case ErrorCategory::UpstreamNotFound:  return "upstream_not_found";
        case ErrorCategory::UpstreamProtocol:  return "upstream_protocol";
        case ErrorCategory::Timeout:           return "timeout";
        case ErrorCategory::ClientClosed:      return "client_closed";
        case ErrorCategory::Config:            return "config";
        case ErrorCategory::Internal:          return "internal";
    }
    return "internal";
}

std::string Error::CategoryName() const {
    return op_mcp::CategoryName(category);
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (backend_message.has_value()) {
        oss << " - backend: " << *backend_message;
    }
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!endpoint.empty()) {
        j["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        j["http_status"] = *http_status;
    }
    j["message"] = message;
    if (backend_message.has_value()) {
        j["backend_message"] = *backend_message;
    }
    return j;
}

} // namespace op_mcp
