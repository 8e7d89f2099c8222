#include <op_mcp/backend/client_cache.hpp>

#include <op_mcp/backend/http_session.hpp>
#include <op_mcp/core/log.hpp>
#include <op_mcp/core/types.hpp>

#include <iomanip>
#include <sstream>
#include <tuple>
#include <vector>

namespace op_mcp {

namespace {

// FNV-1a, 64 bit. Used only to tell keys apart, not for secrecy.
std::string Fingerprint(const std::string& secret) {
    std::uint64_t hash = 1469598103934665603ULL;
    for (unsigned char c : secret) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return oss.str();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ClientKey
// ---------------------------------------------------------------------------
ClientKey ClientKey::From(const BackendConfig& config) {
    return ClientKey{config.base_url, Fingerprint(config.api_key),
                     config.max_connections};
}

std::string ClientKey::ToString() const {
    return base_url + "#" + key_fingerprint + "/" + std::to_string(max_connections);
}

bool ClientKey::operator<(const ClientKey& other) const {
    return std::tie(base_url, key_fingerprint, max_connections) <
           std::tie(other.base_url, other.key_fingerprint, other.max_connections);
}

bool ClientKey::operator==(const ClientKey& other) const {
    return base_url == other.base_url && key_fingerprint == other.key_fingerprint &&
           max_connections == other.max_connections;
}

Result<std::shared_ptr<BackendClient>, Error> MakeHttpBackendClient(
    const BackendConfig& config) {
    using R = Result<std::shared_ptr<BackendClient>, Error>;
    auto url = BaseUrl::Create(config.base_url);
    if (url.IsErr()) {
        return R::Err(Error::Make(ErrorCategory::Config, "MakeHttpBackendClient",
                                  "Invalid base_url: " + url.Error()));
    }

    HttpSessionOptions session_options;
    session_options.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    session_options.read_timeout = std::chrono::seconds(config.read_timeout_seconds);
    auto session = std::make_shared<HttpSession>(url.Value(), config.api_key,
                                                 session_options);

    BackendClientOptions options;
    options.max_connections = config.max_connections;
    options.acquire_timeout = std::chrono::seconds(config.acquire_timeout_seconds);
    options.retry = config.retry;

    return R::Ok(std::make_shared<BackendClient>(std::move(session),
                                                 url.Value().PathPrefix(), options));
}

// ---------------------------------------------------------------------------
// BackendClientCache
// ---------------------------------------------------------------------------
BackendClientCache::BackendClientCache(BackendClientFactory factory)
    : factory_(std::move(factory)) {}

BackendClientCache::~BackendClientCache() {
    CloseAll();
}

Result<std::shared_ptr<BackendClient>, Error> BackendClientCache::Acquire(
    const BackendConfig& config) {
    using R = Result<std::shared_ptr<BackendClient>, Error>;
    const auto key = ClientKey::From(config);

    std::vector<std::shared_ptr<BackendClient>> stale;
    std::shared_ptr<BackendClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(key);
        if (it != clients_.end() && !it->second->IsClosed()) {
            return R::Ok(it->second);
        }

        for (auto cur = clients_.begin(); cur != clients_.end();) {
            if (cur->first.base_url == key.base_url) {
                LogInfo("cache", "evicting client " + cur->first.ToString());
                stale.push_back(std::move(cur->second));
                cur = clients_.erase(cur);
            } else {
                ++cur;
            }
        }

        auto created = factory_(config);
        if (created.IsErr()) {
            return created;
        }
        client = created.Value();
        clients_.emplace(key, client);
        LogDebug("cache", "created client " + key.ToString());
    }

    // In-flight callers still holding the old client see ClientClosed.
    for (auto& old : stale) {
        old->Close();
    }
    return R::Ok(std::move(client));
}

bool BackendClientCache::Evict(const ClientKey& key) {
    std::shared_ptr<BackendClient> victim;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(key);
        if (it == clients_.end()) return false;
        victim = std::move(it->second);
        clients_.erase(it);
    }
    victim->Close();
    return true;
}

void BackendClientCache::CloseAll() {
    std::map<ClientKey, std::shared_ptr<BackendClient>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(clients_);
    }
    for (auto& [key, client] : drained) {
        client->Close();
    }
}

size_t BackendClientCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

} // namespace op_mcp
