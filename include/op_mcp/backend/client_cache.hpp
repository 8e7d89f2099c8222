#pragma once

#include <op_mcp/backend/backend_client.hpp>
#include <op_mcp/config/app_config.hpp>
#include <op_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace op_mcp {

// Stable identity of a backend client. The API key enters only as a
// fingerprint so keys never sit in maps or logs.
struct ClientKey {
    std::string base_url;
    std::string key_fingerprint;
    int max_connections = 0;

    static ClientKey From(const BackendConfig& config);
    [[nodiscard]] std::string ToString() const;

    bool operator<(const ClientKey& other) const;
    bool operator==(const ClientKey& other) const;
};

using BackendClientFactory =
    std::function<Result<std::shared_ptr<BackendClient>, Error>(const BackendConfig&)>;

// Builds an HttpSession-backed client from config.
Result<std::shared_ptr<BackendClient>, Error> MakeHttpBackendClient(
    const BackendConfig& config);

// ---------------------------------------------------------------------------
// BackendClientCache: owns one shared BackendClient per ClientKey.
//
// Acquiring a key whose base_url matches an existing entry with different
// credentials or pool size evicts and closes the old entry first, so a
// config change never leaves a stale client serving requests.
// ---------------------------------------------------------------------------
class BackendClientCache {
public:
    explicit BackendClientCache(BackendClientFactory factory = MakeHttpBackendClient);
    ~BackendClientCache();

    BackendClientCache(const BackendClientCache&) = delete;
    BackendClientCache& operator=(const BackendClientCache&) = delete;

    [[nodiscard]] Result<std::shared_ptr<BackendClient>, Error> Acquire(
        const BackendConfig& config);

    // Close and drop the entry. Returns false if there was none.
    bool Evict(const ClientKey& key);

    // Close every client. The cache stays usable afterwards.
    void CloseAll();

    [[nodiscard]] size_t Size() const;

private:
    BackendClientFactory factory_;
    mutable std::mutex mutex_;
    std::map<ClientKey, std::shared_ptr<BackendClient>> clients_;
};

} // namespace op_mcp
