#include <op_mcp/mcp/auth.hpp>

#include <cctype>

namespace op_mcp {

namespace {

// Compares every byte regardless of where the first mismatch is.
bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

} // anonymous namespace

AuthDecision AllowAllAuthenticator::Check(const RequestContext& ctx) const {
    return AuthDecision{true, ctx.transport, ""};
}

BearerTokenAuthenticator::BearerTokenAuthenticator(std::string expected_token)
    : expected_(std::move(expected_token)) {}

AuthDecision BearerTokenAuthenticator::Check(const RequestContext& ctx) const {
    if (expected_.empty()) {
        return AuthDecision{true, ctx.transport, ""};
    }
    if (!ctx.bearer_token.has_value()) {
        return AuthDecision{false, "", "Missing bearer token"};
    }
    if (!ConstantTimeEquals(*ctx.bearer_token, expected_)) {
        return AuthDecision{false, "", "Invalid bearer token"};
    }
    return AuthDecision{true, ctx.transport + ":bearer", ""};
}

std::optional<std::string> ParseBearerToken(const std::string& header_value) {
    constexpr size_t kSchemeLen = 7;  // "Bearer "
    if (header_value.size() <= kSchemeLen) return std::nullopt;
    const std::string scheme = "bearer ";
    for (size_t i = 0; i < kSchemeLen; ++i) {
        if (std::tolower(static_cast<unsigned char>(header_value[i])) != scheme[i]) {
            return std::nullopt;
        }
    }
    auto token = header_value.substr(kSchemeLen);
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
        token.pop_back();
    }
    if (token.empty()) return std::nullopt;
    return token;
}

} // namespace op_mcp
