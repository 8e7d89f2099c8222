#include <catch2/catch_test_macros.hpp>

#include <op_mcp/backend/backend_client.hpp>

#include "mocks/mock_http_session.hpp"

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

using namespace op_mcp;
using op_mcp::testing::MockHttpSession;
using namespace std::chrono_literals;

namespace {

constexpr const char* kProjectRoute = "/api/v3/projects/42";
constexpr const char* kPackagesRoute = "/api/v3/work_packages";

const char* kProjectBody =
    R"({"_type":"Project","id":42,"name":"Apollo","identifier":"apollo"})";

const char* kPackagesBody = R"({
    "_type":"Collection","total":2,
    "_embedded":{"elements":[
        {"id":1,"subject":"First","_links":{"status":{"title":"New"}}},
        {"id":2,"subject":"Second","_embedded":{"status":{"name":"Closed"}}}
    ]}})";

BackendClientOptions FastOptions(int max_connections = 10) {
    BackendClientOptions options;
    options.max_connections = max_connections;
    options.acquire_timeout = 2000ms;
    options.retry.max_attempts = 3;
    options.retry.base_delay = 1ms;
    options.retry.max_delay = 5ms;
    options.jitter_seed = 1234;
    return options;
}

struct Fixture {
    std::shared_ptr<MockHttpSession> mock = std::make_shared<MockHttpSession>();
    std::unique_ptr<BackendClient> client;

    explicit Fixture(BackendClientOptions options = FastOptions()) {
        client = std::make_unique<BackendClient>(mock, "/api/v3", options);
    }
};

ProjectId Id(std::int64_t v) {
    return ProjectId::Create(v).Value();
}

} // anonymous namespace

// ===========================================================================
// GetProject
// ===========================================================================

TEST_CASE("BackendClient: GetProject maps the backend response", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));

    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsOk());
    CHECK(result.Value().id == 42);
    CHECK(result.Value().name == "Apollo");
    REQUIRE(f.mock->Calls().size() == 1);
    CHECK(f.mock->Calls()[0] == "/api/v3/projects/42");
}

TEST_CASE("BackendClient: 404 is UpstreamNotFound with no retry", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(
        404, R"({"_type":"Error","message":"The requested resource could not be found."})"));

    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamNotFound);
    CHECK(result.Error().http_status == 404);
    CHECK(result.Error().backend_message ==
          std::optional<std::string>("The requested resource could not be found."));
    CHECK(f.mock->CallCount(kProjectRoute) == 1);
}

TEST_CASE("BackendClient: 401 is UpstreamAuth with no retry", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(401, "{}"));

    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamAuth);
    CHECK(f.mock->CallCount(kProjectRoute) == 1);
}

TEST_CASE("BackendClient: other statuses are UpstreamProtocol", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(422, "{}"));
    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamProtocol);
    CHECK(f.mock->CallCount(kProjectRoute) == 1);
}

TEST_CASE("BackendClient: invalid JSON body is UpstreamProtocol", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, "<html>login</html>"));
    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamProtocol);
}

TEST_CASE("BackendClient: project missing name is UpstreamProtocol", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute,
                        MockHttpSession::Json(200, R"({"id":42,"identifier":"apollo"})"));
    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamProtocol);
}

// ===========================================================================
// Retry
// ===========================================================================

TEST_CASE("BackendClient: transient failures are retried until success", "[backend][client][retry]") {
    Fixture f;
    f.mock->Enqueue(kProjectRoute, MockHttpSession::Json(503, ""));
    f.mock->Enqueue(kProjectRoute, MockHttpSession::TransportFailure());
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));

    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsOk());
    CHECK(f.mock->CallCount(kProjectRoute) == 3);
}

TEST_CASE("BackendClient: gives up after max_attempts", "[backend][client][retry]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(502, ""));

    auto result = f.client->GetProject(Id(42));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamTransient);
    CHECK(result.Error().http_status == 502);
    CHECK(f.mock->CallCount(kProjectRoute) == 3);
}

TEST_CASE("BackendClient: 429 and 408 are retried", "[backend][client][retry]") {
    Fixture f;
    f.mock->Enqueue(kProjectRoute, MockHttpSession::Json(429, ""));
    f.mock->Enqueue(kProjectRoute, MockHttpSession::Json(408, ""));
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    CHECK(f.client->GetProject(Id(42)).IsOk());
    CHECK(f.mock->CallCount(kProjectRoute) == 3);
}

TEST_CASE("BackendClient: single attempt policy does not retry", "[backend][client][retry]") {
    auto options = FastOptions();
    options.retry.max_attempts = 1;
    Fixture f(options);
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(503, ""));
    CHECK(f.client->GetProject(Id(42)).IsErr());
    CHECK(f.mock->CallCount(kProjectRoute) == 1);
}

TEST_CASE("BackendClient: backoff that overruns the deadline is a Timeout", "[backend][client][retry]") {
    auto options = FastOptions();
    options.retry.base_delay = 10000ms;
    options.retry.max_delay = 10000ms;
    options.jitter_seed = 7;
    Fixture f(options);
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(503, ""));

    CallOptions call;
    call.deadline = std::chrono::steady_clock::now() + 50ms;
    const auto start = std::chrono::steady_clock::now();
    auto result = f.client->GetProject(Id(42), call);
    REQUIRE(result.IsErr());
    // A zero jitter draw retries immediately; either way the call ends fast.
    CHECK((result.Error().category == ErrorCategory::Timeout ||
           result.Error().category == ErrorCategory::UpstreamTransient));
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
}

TEST_CASE("BackendClient: expired deadline fails before any request", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    CallOptions call;
    call.deadline = std::chrono::steady_clock::now() - 1ms;
    auto result = f.client->GetProject(Id(42), call);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(f.mock->CallCount() == 0);
}

// ===========================================================================
// GetWorkPackages
// ===========================================================================

TEST_CASE("BackendClient: GetWorkPackages sends filters and project id", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(200, kPackagesBody));

    auto result = f.client->GetWorkPackages(Id(42));
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 2);
    CHECK(result.Value()[0].status == std::optional<std::string>("New"));
    CHECK(result.Value()[1].status == std::optional<std::string>("Closed"));

    auto calls = f.mock->Calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].rfind("/api/v3/work_packages?filters=", 0) == 0);
    CHECK(calls[0].find("&project_id=42") != std::string::npos);
}

TEST_CASE("BackendClient: custom filters replace the default", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(200, "[]"));
    auto filters = nlohmann::json::array(
        {{{"assignee", {{"operator", "="}, {"values", {"me"}}}}}});

    auto result = f.client->GetWorkPackages(Id(42), filters);
    REQUIRE(result.IsOk());
    CHECK(result.Value().empty());
    CHECK(f.mock->Calls()[0].find("assignee") != std::string::npos);
    CHECK(f.mock->Calls()[0].find("status_id") == std::string::npos);
}

// ===========================================================================
// Concurrency
// ===========================================================================

TEST_CASE("BackendClient: in-flight requests never exceed max_connections", "[backend][client][pool]") {
    constexpr int kMax = 3;
    Fixture f(FastOptions(kMax));
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    f.mock->SetDelay(30ms);

    std::vector<std::future<Result<Project, Error>>> calls;
    for (int i = 0; i < kMax + 5; ++i) {
        calls.push_back(std::async(std::launch::async,
                                   [&f] { return f.client->GetProject(Id(42)); }));
    }
    for (auto& c : calls) {
        CHECK(c.get().IsOk());
    }
    CHECK(f.mock->PeakInFlight() <= kMax);
    CHECK(f.client->Pool().PeakInFlight() <= kMax);
    CHECK(f.client->Pool().InFlight() == 0);
    CHECK(f.mock->CallCount() == static_cast<size_t>(kMax + 5));
}

// ===========================================================================
// GetWeeklyReport
// ===========================================================================

TEST_CASE("BackendClient: weekly report combines both fetches", "[backend][client][report]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(200, kPackagesBody));

    auto result = f.client->GetWeeklyReport(Id(42), std::string("2025-W41"));
    REQUIRE(result.IsOk());
    const auto& report = result.Value();
    CHECK(report.project.id == 42);
    CHECK(report.week == "2025-W41");
    CHECK(report.work_packages.size() == 2);
    CHECK(report.summary == "Found 2 work packages");

    auto j = ToJson(report);
    CHECK(j["total_packages"] == 2);
    CHECK(j["project"]["name"] == "Apollo");
}

TEST_CASE("BackendClient: weekly report defaults the week to current", "[backend][client][report]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(200, "[]"));

    auto result = f.client->GetWeeklyReport(Id(42));
    REQUIRE(result.IsOk());
    CHECK(result.Value().week == "current");
    CHECK(result.Value().summary == "Found 0 work packages");
}

TEST_CASE("BackendClient: weekly report fails as a whole on one failure", "[backend][client][report]") {
    auto options = FastOptions();
    options.retry.max_attempts = 1;
    Fixture f(options);
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(503, ""));

    auto result = f.client->GetWeeklyReport(Id(42), std::string("2025-W41"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamTransient);
    CHECK(result.Error().operation == "GetWorkPackages");
}

TEST_CASE("BackendClient: weekly report fails with the error left after retries",
          "[backend][client][report][retry]") {
    Fixture f;  // three attempts
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(503, ""));

    auto result = f.client->GetWeeklyReport(Id(42), std::string("2025-W41"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::UpstreamTransient);
    CHECK(result.Error().operation == "GetWorkPackages");
    CHECK(f.mock->CallCount(kPackagesRoute) == 3);
    CHECK(f.mock->CallCount(kProjectRoute) == 1);
}

TEST_CASE("BackendClient: weekly report failure cancels the slow sibling", "[backend][client][report]") {
    auto options = FastOptions();
    options.retry.max_attempts = 1;
    Fixture f(options);
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(404, ""));
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(200, "[]"));
    f.mock->SetDelay(2000ms);

    // Both calls are delayed; whichever finishes first is cancelled or wins,
    // but the report must come back well before two full delays.
    const auto start = std::chrono::steady_clock::now();
    auto result = f.client->GetWeeklyReport(Id(42));
    REQUIRE(result.IsErr());
    CHECK(std::chrono::steady_clock::now() - start < 3900ms);
    CHECK(f.client->Pool().InFlight() == 0);
}

// ===========================================================================
// Close
// ===========================================================================

TEST_CASE("BackendClient: Close is idempotent and fails later calls", "[backend][client]") {
    Fixture f;
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));

    f.client->Close();
    f.client->Close();
    CHECK(f.client->IsClosed());
    CHECK(f.mock->CloseCount() == 1);

    auto project = f.client->GetProject(Id(42));
    REQUIRE(project.IsErr());
    CHECK(project.Error().category == ErrorCategory::ClientClosed);

    auto report = f.client->GetWeeklyReport(Id(42));
    REQUIRE(report.IsErr());
    CHECK(report.Error().category == ErrorCategory::ClientClosed);
    CHECK(f.mock->CallCount() == 0);
}

TEST_CASE("BackendClient: Close interrupts a retry backoff", "[backend][client][retry]") {
    auto options = FastOptions();
    options.retry.base_delay = 5000ms;
    options.retry.max_delay = 5000ms;
    options.retry.max_attempts = 2;
    options.jitter_seed = 99;
    Fixture f(options);
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(503, ""));

    auto pending = std::async(std::launch::async, [&f] { return f.client->GetProject(Id(42)); });
    std::this_thread::sleep_for(50ms);
    const auto start = std::chrono::steady_clock::now();
    f.client->Close();
    auto result = pending.get();
    CHECK(result.IsErr());
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
}

namespace {

BackendClientOptions SlowBackoffOptions() {
    auto options = FastOptions();
    options.retry.base_delay = 5000ms;
    options.retry.max_delay = 5000ms;
    options.retry.max_attempts = 10;
    return options;
}

} // anonymous namespace

TEST_CASE("BackendClient: Close interrupts the backoff of a call with a token",
          "[backend][client][retry]") {
    Fixture f(SlowBackoffOptions());
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(503, ""));

    CallOptions call{CancellationToken{}, std::nullopt};
    auto pending = std::async(std::launch::async,
                              [&f, call] { return f.client->GetProject(Id(42), call); });
    std::this_thread::sleep_for(50ms);
    const auto start = std::chrono::steady_clock::now();
    f.client->Close();
    auto result = pending.get();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ClientClosed);
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
    CHECK_FALSE(call.cancel->IsCancelled());
}

TEST_CASE("BackendClient: Close interrupts a weekly report that is retrying",
          "[backend][client][report][retry]") {
    Fixture f(SlowBackoffOptions());
    f.mock->SetResponse(kProjectRoute, MockHttpSession::Json(200, kProjectBody));
    f.mock->SetResponse(kPackagesRoute, MockHttpSession::Json(503, ""));

    auto pending = std::async(std::launch::async,
                              [&f] { return f.client->GetWeeklyReport(Id(42)); });
    std::this_thread::sleep_for(50ms);
    const auto start = std::chrono::steady_clock::now();
    f.client->Close();
    auto result = pending.get();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ClientClosed);
    CHECK(std::chrono::steady_clock::now() - start < 2000ms);
    CHECK(f.client->Pool().InFlight() == 0);
}
