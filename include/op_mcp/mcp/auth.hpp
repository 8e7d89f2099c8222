#pragma once

#include <optional>
#include <string>

namespace op_mcp {

// Transport-supplied facts about the caller of one message.
struct RequestContext {
    std::string transport = "stdio";
    std::optional<std::string> bearer_token;  // from "Authorization: Bearer ..."
    std::string session_id;
};

struct AuthDecision {
    bool allowed = false;
    std::string identity;
    std::string reason;
};

// ---------------------------------------------------------------------------
// Authenticator: checked before every tools/call and resources/read.
// ---------------------------------------------------------------------------
class Authenticator {
public:
    virtual ~Authenticator() = default;
    [[nodiscard]] virtual AuthDecision Check(const RequestContext& ctx) const = 0;
};

// Allows everything; the identity is the transport name.
class AllowAllAuthenticator : public Authenticator {
public:
    [[nodiscard]] AuthDecision Check(const RequestContext& ctx) const override;
};

// Requires the exact configured token. An empty expected token allows all.
class BearerTokenAuthenticator : public Authenticator {
public:
    explicit BearerTokenAuthenticator(std::string expected_token);
    [[nodiscard]] AuthDecision Check(const RequestContext& ctx) const override;

private:
    std::string expected_;
};

// Extract the token from an Authorization header value. Scheme match is
// case-insensitive.
std::optional<std::string> ParseBearerToken(const std::string& header_value);

} // namespace op_mcp
