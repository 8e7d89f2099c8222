#include <op_mcp/backend/backend_client.hpp>

#include <op_mcp/core/log.hpp>
#include <op_mcp/core/url.hpp>

#include <algorithm>
#include <future>

namespace op_mcp {

namespace {

using Clock = std::chrono::steady_clock;
using json = nlohmann::json;

Error ClosedError(const std::string& operation) {
    return Error::Make(ErrorCategory::ClientClosed, operation,
                       "Backend client is closed");
}

Error DeadlineError(const std::string& operation, const std::string& detail) {
    return Error::Make(ErrorCategory::Timeout, operation, detail);
}

std::chrono::milliseconds Remaining(Clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
}

} // anonymous namespace

json DefaultWorkPackageFilters() {
    return json::array({
        {{"status_id", {{"operator", "!"}, {"values", json::array({""})}}}},
    });
}

BackendClient::BackendClient(std::shared_ptr<IHttpSession> session,
                             std::string path_prefix,
                             const BackendClientOptions& options)
    : session_(std::move(session)),
      path_prefix_(std::move(path_prefix)),
      options_(options),
      pool_(options.max_connections),
      rng_(options.jitter_seed) {}

BackendClient::~BackendClient() {
    Close();
}

void BackendClient::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    shutdown_.Cancel();
    pool_.Close();
    session_->Close();
    LogInfo("backend", "client closed");
}

std::chrono::milliseconds BackendClient::BackoffDelay(int attempt) {
    const auto& retry = options_.retry;
    auto ceiling = retry.base_delay.count();
    for (int i = 1; i < attempt && ceiling < retry.max_delay.count(); ++i) {
        ceiling *= 2;
    }
    ceiling = std::min<long long>(ceiling, retry.max_delay.count());
    if (ceiling <= 0) {
        return std::chrono::milliseconds(0);
    }
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<long long> dist(0, ceiling);
    return std::chrono::milliseconds(dist(rng_));
}

// ---------------------------------------------------------------------------
// FetchJson: one logical GET with pooling, retry and deadline handling.
// ---------------------------------------------------------------------------
Result<json, Error> BackendClient::FetchJson(const std::string& operation,
                                             const std::string& path,
                                             const CallOptions& call) {
    using R = Result<json, Error>;
    const int max_attempts = std::max(1, options_.retry.max_attempts);

    // Close() must wake every wait of the call, caller token or not.
    const CancellationToken token =
        call.cancel.has_value() ? call.cancel->LinkedWith(shutdown_) : shutdown_.MakeChild();

    for (int attempt = 1;; ++attempt) {
        if (closed_.load()) {
            return R::Err(ClosedError(operation));
        }
        if (token.IsCancelled()) {
            return R::Err(DeadlineError(operation, "Call cancelled"));
        }

        auto acquire_deadline = Clock::now() + options_.acquire_timeout;
        if (call.deadline.has_value()) {
            if (Clock::now() >= *call.deadline) {
                return R::Err(DeadlineError(operation, "Call deadline exceeded"));
            }
            acquire_deadline = std::min(acquire_deadline, *call.deadline);
        }

        auto lease = pool_.Acquire(acquire_deadline, token);
        if (lease.IsErr()) {
            if (closed_.load()) {
                return R::Err(ClosedError(operation));
            }
            auto err = lease.Error();
            err.operation = operation;
            err.endpoint = path;
            return R::Err(std::move(err));
        }

        Lease slot = std::move(lease).Value();

        RequestOptions request;
        request.cancel = token;
        if (call.deadline.has_value()) {
            request.timeout = std::max(std::chrono::milliseconds(1),
                                       Remaining(*call.deadline));
        }

        auto response = session_->Get(path, request);
        slot.Release();
        if (response.IsErr() && closed_.load()) {
            return R::Err(ClosedError(operation));
        }

        Error failure;
        if (response.IsErr()) {
            failure = response.Error();
            failure.operation = operation;
        } else {
            const auto& resp = response.Value();
            if (resp.status_code >= 200 && resp.status_code < 300) {
                auto parsed = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
                if (parsed.is_discarded()) {
                    Error e = Error::Make(ErrorCategory::UpstreamProtocol, operation,
                                          "Backend returned invalid JSON");
                    e.endpoint = path;
                    e.http_status = resp.status_code;
                    return R::Err(std::move(e));
                }
                return R::Ok(std::move(parsed));
            }
            failure = Error::FromHttpStatus(operation, path, resp.status_code, resp.body);
        }

        if (!failure.IsRetryable() || attempt >= max_attempts) {
            if (failure.IsRetryable()) {
                LogWarn("backend", operation + " giving up after " +
                                       std::to_string(attempt) + " attempts: " +
                                       failure.ToString());
            }
            return R::Err(std::move(failure));
        }

        const auto delay = BackoffDelay(attempt);
        if (call.deadline.has_value() && Clock::now() + delay >= *call.deadline) {
            return R::Err(DeadlineError(
                operation, "Deadline reached while retrying: " + failure.message));
        }
        LogWarn("backend", operation + " attempt " + std::to_string(attempt) + "/" +
                               std::to_string(max_attempts) + " failed (" +
                               failure.message + "), retrying in " +
                               std::to_string(delay.count()) + "ms");

        if (token.WaitFor(delay)) {
            if (closed_.load()) {
                return R::Err(ClosedError(operation));
            }
            return R::Err(DeadlineError(operation, "Call cancelled"));
        }
    }
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------
Result<Project, Error> BackendClient::GetProject(ProjectId id, const CallOptions& call) {
    const std::string path = path_prefix_ + "/projects/" + id.ToString();
    return FetchJson("GetProject", path, call).AndThen(
        [](const json& body) { return MapProject(body); });
}

Result<std::vector<WorkPackage>, Error> BackendClient::GetWorkPackages(
    ProjectId id, const std::optional<json>& filters, const CallOptions& call) {
    const json& effective = filters.has_value() ? *filters : DefaultWorkPackageFilters();
    const std::string path = path_prefix_ + "/work_packages" +
        BuildQuery({{"filters", effective.dump()}, {"project_id", id.ToString()}});
    return FetchJson("GetWorkPackages", path, call).AndThen(
        [](const json& body) { return MapWorkPackageCollection(body); });
}

Result<WeeklyReport, Error> BackendClient::GetWeeklyReport(
    ProjectId id, const std::optional<std::string>& week, const CallOptions& call) {
    using R = Result<WeeklyReport, Error>;
    if (closed_.load()) {
        return R::Err(ClosedError("GetWeeklyReport"));
    }

    const CancellationToken parent = call.cancel.value_or(CancellationToken{});
    CallOptions project_call{parent.MakeChild(), call.deadline};
    CallOptions packages_call{parent.MakeChild(), call.deadline};

    std::mutex error_mutex;
    std::optional<Error> first_error;
    const auto record = [&](const Error& e, CancellationToken& sibling) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error.has_value()) {
            first_error = e;
            sibling.Cancel();
        }
    };

    auto project_future = std::async(std::launch::async, [&]() {
        auto r = GetProject(id, project_call);
        if (r.IsErr()) record(r.Error(), *packages_call.cancel);
        return r;
    });
    auto packages_future = std::async(std::launch::async, [&]() {
        auto r = GetWorkPackages(id, std::nullopt, packages_call);
        if (r.IsErr()) record(r.Error(), *project_call.cancel);
        return r;
    });

    auto project = project_future.get();
    auto packages = packages_future.get();

    if (first_error.has_value()) {
        LogWarn("backend", "weekly report for project " + id.ToString() +
                               " failed: " + first_error->ToString());
        return R::Err(std::move(*first_error));
    }

    return R::Ok(MakeWeeklyReport(std::move(project).Value(),
                                  std::move(packages).Value(),
                                  week.value_or("current")));
}

} // namespace op_mcp
