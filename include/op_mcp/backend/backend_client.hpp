#pragma once

#include <op_mcp/backend/connection_pool.hpp>
#include <op_mcp/backend/domain.hpp>
#include <op_mcp/backend/i_http_session.hpp>
#include <op_mcp/config/app_config.hpp>
#include <op_mcp/core/cancellation.hpp>
#include <op_mcp/core/result.hpp>
#include <op_mcp/core/types.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace op_mcp {

struct BackendClientOptions {
    int max_connections = 10;
    std::chrono::milliseconds acquire_timeout{30000};
    RetryConfig retry;
    std::uint32_t jitter_seed = std::random_device{}();
};

// Budget for one logical call. Both fields are optional; without a deadline
// only the retry policy and the acquire timeout bound the call.
struct CallOptions {
    std::optional<CancellationToken> cancel;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

// The default work package filter: status is not empty.
nlohmann::json DefaultWorkPackageFilters();

// ---------------------------------------------------------------------------
// BackendClient: the single point of contact with the OpenProject API.
//
// Every request holds a ConnectionPool lease for exactly one attempt; the
// lease is released before any backoff sleep. UpstreamTransient failures are
// retried with exponential backoff and full jitter:
//   delay(n) = uniform(0, min(max_delay, base_delay * 2^(n-1)))
// All other errors are returned immediately.
//
// Thread-safe. After Close() every operation fails with ClientClosed.
// ---------------------------------------------------------------------------
class BackendClient {
public:
    BackendClient(std::shared_ptr<IHttpSession> session,
                  std::string path_prefix,
                  const BackendClientOptions& options = {});
    ~BackendClient();

    BackendClient(const BackendClient&) = delete;
    BackendClient& operator=(const BackendClient&) = delete;

    [[nodiscard]] Result<Project, Error> GetProject(
        ProjectId id, const CallOptions& call = {});

    // `filters` defaults to DefaultWorkPackageFilters() when absent.
    [[nodiscard]] Result<std::vector<WorkPackage>, Error> GetWorkPackages(
        ProjectId id,
        const std::optional<nlohmann::json>& filters = std::nullopt,
        const CallOptions& call = {});

    // Fetches project and work packages concurrently. If either fails the
    // other is cancelled and the first error observed is returned.
    // `week` defaults to "current".
    [[nodiscard]] Result<WeeklyReport, Error> GetWeeklyReport(
        ProjectId id,
        const std::optional<std::string>& week = std::nullopt,
        const CallOptions& call = {});

    // Idempotent.
    void Close();
    [[nodiscard]] bool IsClosed() const noexcept { return closed_.load(); }

    [[nodiscard]] const ConnectionPool& Pool() const noexcept { return pool_; }

private:
    Result<nlohmann::json, Error> FetchJson(const std::string& operation,
                                            const std::string& path,
                                            const CallOptions& call);
    std::chrono::milliseconds BackoffDelay(int attempt);

    std::shared_ptr<IHttpSession> session_;
    std::string path_prefix_;
    BackendClientOptions options_;
    ConnectionPool pool_;
    std::atomic<bool> closed_{false};
    CancellationToken shutdown_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace op_mcp
