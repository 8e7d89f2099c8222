#pragma once

#include <op_mcp/backend/i_http_session.hpp>
#include <op_mcp/core/types.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace op_mcp {

struct HttpSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttpSession: IHttpSession over cpp-httplib.
//
// httplib::Client is not safe for concurrent requests, so each Get() checks a
// client out of an idle list (creating one when the list is empty) and
// returns it afterwards. Keep-alive connections are reused this way. The
// number of clients is bounded by the caller's ConnectionPool.
//
// Every request carries:
//   Authorization: Bearer <api key>
//   Accept: application/hal+json
//   User-Agent: op-mcp/<version>
// ---------------------------------------------------------------------------
class HttpSession : public IHttpSession {
public:
    HttpSession(const BaseUrl& base_url,
                std::string api_key,
                const HttpSessionOptions& options = {});
    ~HttpSession() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const RequestOptions& options = {}) override;

    void Close() override;

    // Number of clients created so far (idle + checked out).
    [[nodiscard]] size_t ClientsCreated() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace op_mcp
