#include <op_mcp/backend/http_session.hpp>

#include <op_mcp/core/log.hpp>
#include <op_mcp/core/version.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace op_mcp {

namespace {

Error MakeSessionError(const std::string& endpoint,
                       const std::string& message,
                       ErrorCategory category) {
    Error e = Error::Make(category, "HttpSession::Get", message);
    e.endpoint = endpoint;
    return e;
}

bool IEquals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool IsSensitiveHeader(std::string_view key) {
    return IEquals(key, "authorization") || IEquals(key, "cookie") ||
           IEquals(key, "set-cookie");
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " +
                             (IsSensitiveHeader(k) ? std::string("<redacted>") : v));
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        LogDebug("http", "  < body: " + (body.size() <= kMaxBodyLog
                                             ? body
                                             : body.substr(0, kMaxBodyLog) + "... (truncated)"));
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders out;
    for (const auto& [k, v] : hdrs) {
        out[k] = v;
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: idle client list plus the set of clients currently in use.
// ---------------------------------------------------------------------------
struct HttpSession::Impl {
    std::string origin;
    std::string api_key;
    HttpSessionOptions options;

    mutable std::mutex mutex;
    std::vector<std::unique_ptr<httplib::Client>> idle;
    std::unordered_set<httplib::Client*> in_use;
    size_t created = 0;
    bool closed = false;

    std::unique_ptr<httplib::Client> NewClient() {
        auto client = std::make_unique<httplib::Client>(origin);
        client->set_bearer_token_auth(api_key);
        client->set_keep_alive(true);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (options.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
        ++created;
        return client;
    }

    // Returns nullptr once closed.
    std::unique_ptr<httplib::Client> Checkout() {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) return nullptr;
        std::unique_ptr<httplib::Client> client;
        if (idle.empty()) {
            client = NewClient();
        } else {
            client = std::move(idle.back());
            idle.pop_back();
        }
        in_use.insert(client.get());
        return client;
    }

    void Checkin(std::unique_ptr<httplib::Client> client, bool reusable) {
        std::lock_guard<std::mutex> lock(mutex);
        in_use.erase(client.get());
        if (reusable && !closed) {
            idle.push_back(std::move(client));
        }
    }
};

HttpSession::HttpSession(const BaseUrl& base_url,
                         std::string api_key,
                         const HttpSessionOptions& options)
    : impl_(std::make_unique<Impl>()) {
    impl_->origin = base_url.Origin();
    impl_->api_key = std::move(api_key);
    impl_->options = options;
}

HttpSession::~HttpSession() {
    Close();
}

Result<HttpResponse, Error> HttpSession::Get(std::string_view path,
                                             const RequestOptions& options) {
    const std::string endpoint(path);

    if (options.cancel.has_value() && options.cancel->IsCancelled()) {
        return Result<HttpResponse, Error>::Err(
            MakeSessionError(endpoint, "Request cancelled", ErrorCategory::Timeout));
    }

    auto client = impl_->Checkout();
    if (!client) {
        return Result<HttpResponse, Error>::Err(
            MakeSessionError(endpoint, "Session is closed", ErrorCategory::ClientClosed));
    }

    // Clamp the read timeout to what is left of the caller's budget.
    auto read_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        impl_->options.read_timeout);
    if (options.timeout.has_value()) {
        read_timeout = std::max(std::chrono::milliseconds(1),
                                std::min(read_timeout, *options.timeout));
    }
    client->set_read_timeout(read_timeout);

    httplib::Headers hdrs{
        {"Accept", "application/hal+json"},
        {"User-Agent", std::string(kServerName) + "/" + kVersion},
    };

    LogInfo("http", "GET " + endpoint);
    LogRequestHeaders(hdrs);

    const auto cancel = options.cancel;
    auto res = client->Get(endpoint, hdrs,
                           [cancel](uint64_t, uint64_t) {
                               return !(cancel.has_value() && cancel->IsCancelled());
                           });

    if (!res) {
        const auto http_error = res.error();
        impl_->Checkin(std::move(client), false);

        if (http_error == httplib::Error::Canceled ||
            (cancel.has_value() && cancel->IsCancelled())) {
            return Result<HttpResponse, Error>::Err(
                MakeSessionError(endpoint, "Request cancelled", ErrorCategory::Timeout));
        }
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (impl_->closed) {
                return Result<HttpResponse, Error>::Err(
                    MakeSessionError(endpoint, "Session closed during request",
                                     ErrorCategory::ClientClosed));
            }
        }
        LogWarn("http", "GET " + endpoint + " failed: " + httplib::to_string(http_error));
        return Result<HttpResponse, Error>::Err(
            MakeSessionError(endpoint,
                             "HTTP request failed: " + httplib::to_string(http_error),
                             ErrorCategory::UpstreamTransient));
    }

    LogResponse(res->status, res->body);
    HttpResponse response{res->status, ToHttpHeaders(res->headers), res->body};
    impl_->Checkin(std::move(client), true);
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

void HttpSession::Close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->closed) return;
    impl_->closed = true;
    impl_->idle.clear();
    for (auto* client : impl_->in_use) {
        client->stop();
    }
    LogDebug("http", "session to " + impl_->origin + " closed");
}

size_t HttpSession::ClientsCreated() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->created;
}

} // namespace op_mcp
