#include <catch2/catch_test_macros.hpp>

#include <op_mcp/backend/client_cache.hpp>

#include "mocks/mock_http_session.hpp"

#include <memory>
#include <vector>

using namespace op_mcp;
using op_mcp::testing::MockHttpSession;

namespace {

// Factory that builds mock-backed clients and remembers their sessions.
struct RecordingFactory {
    std::vector<std::shared_ptr<MockHttpSession>> sessions;
    int calls = 0;
    bool fail = false;

    BackendClientFactory Make() {
        return [this](const BackendConfig& config)
                   -> Result<std::shared_ptr<BackendClient>, Error> {
            ++calls;
            if (fail) {
                return Result<std::shared_ptr<BackendClient>, Error>::Err(
                    Error::Make(ErrorCategory::Config, "factory", "refused"));
            }
            auto session = std::make_shared<MockHttpSession>();
            sessions.push_back(session);
            BackendClientOptions options;
            options.max_connections = config.max_connections;
            return Result<std::shared_ptr<BackendClient>, Error>::Ok(
                std::make_shared<BackendClient>(session, "/api/v3", options));
        };
    }
};

BackendConfig Config(const std::string& key = "key-a", int max_connections = 10) {
    BackendConfig config;
    config.base_url = "https://op.example.com/api/v3";
    config.api_key = key;
    config.max_connections = max_connections;
    return config;
}

} // anonymous namespace

TEST_CASE("ClientKey: equal configs give equal keys", "[backend][cache]") {
    CHECK(ClientKey::From(Config()) == ClientKey::From(Config()));
    CHECK_FALSE(ClientKey::From(Config("key-a")) == ClientKey::From(Config("key-b")));
    CHECK_FALSE(ClientKey::From(Config("key-a", 10)) == ClientKey::From(Config("key-a", 5)));
}

TEST_CASE("ClientKey: the API key never appears in the key text", "[backend][cache]") {
    auto key = ClientKey::From(Config("super-secret-token"));
    CHECK(key.ToString().find("super-secret-token") == std::string::npos);
    CHECK(key.key_fingerprint.size() == 16);
}

TEST_CASE("BackendClientCache: same config reuses the client", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto first = cache.Acquire(Config());
    auto second = cache.Acquire(Config());
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    CHECK(first.Value() == second.Value());
    CHECK(factory.calls == 1);
    CHECK(cache.Size() == 1);
}

TEST_CASE("BackendClientCache: credential change evicts and closes the old client", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto old_client = cache.Acquire(Config("key-a")).Value();
    auto new_client = cache.Acquire(Config("key-b")).Value();

    CHECK(old_client != new_client);
    CHECK(old_client->IsClosed());
    CHECK_FALSE(new_client->IsClosed());
    CHECK(factory.sessions[0]->IsClosed());
    CHECK(cache.Size() == 1);
}

TEST_CASE("BackendClientCache: pool size change also evicts", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto small = cache.Acquire(Config("key-a", 2)).Value();
    auto large = cache.Acquire(Config("key-a", 20)).Value();
    CHECK(small->IsClosed());
    CHECK(large->Pool().Capacity() == 20);
    CHECK(cache.Size() == 1);
}

TEST_CASE("BackendClientCache: different base URLs coexist", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto other = Config();
    other.base_url = "https://other.example.com/api/v3";
    auto a = cache.Acquire(Config()).Value();
    auto b = cache.Acquire(other).Value();
    CHECK_FALSE(a->IsClosed());
    CHECK_FALSE(b->IsClosed());
    CHECK(cache.Size() == 2);
}

TEST_CASE("BackendClientCache: a closed entry is replaced on acquire", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto first = cache.Acquire(Config()).Value();
    first->Close();
    auto second = cache.Acquire(Config()).Value();
    CHECK(first != second);
    CHECK_FALSE(second->IsClosed());
    CHECK(factory.calls == 2);
}

TEST_CASE("BackendClientCache: Evict closes the entry", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto client = cache.Acquire(Config()).Value();
    CHECK(cache.Evict(ClientKey::From(Config())));
    CHECK(client->IsClosed());
    CHECK(cache.Size() == 0);
    CHECK_FALSE(cache.Evict(ClientKey::From(Config())));
}

TEST_CASE("BackendClientCache: CloseAll closes everything and stays usable", "[backend][cache]") {
    RecordingFactory factory;
    BackendClientCache cache(factory.Make());

    auto other = Config();
    other.base_url = "https://other.example.com/api/v3";
    auto a = cache.Acquire(Config()).Value();
    auto b = cache.Acquire(other).Value();

    cache.CloseAll();
    CHECK(a->IsClosed());
    CHECK(b->IsClosed());
    CHECK(cache.Size() == 0);

    auto again = cache.Acquire(Config());
    REQUIRE(again.IsOk());
    CHECK_FALSE(again.Value()->IsClosed());
}

TEST_CASE("BackendClientCache: factory errors propagate and cache nothing", "[backend][cache]") {
    RecordingFactory factory;
    factory.fail = true;
    BackendClientCache cache(factory.Make());

    auto result = cache.Acquire(Config());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(cache.Size() == 0);
}

TEST_CASE("MakeHttpBackendClient: rejects an invalid base URL", "[backend][cache]") {
    auto config = Config();
    config.base_url = "ftp://op.example.com";
    auto result = MakeHttpBackendClient(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("MakeHttpBackendClient: builds an open client", "[backend][cache]") {
    auto result = MakeHttpBackendClient(Config());
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value()->IsClosed());
    CHECK(result.Value()->Pool().Capacity() == 10);
}
