#pragma once

#include <op_mcp/backend/i_http_session.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace op_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpSession: hand-written, thread-safe IHttpSession for offline tests.
//
// Usage:
//   auto mock = std::make_shared<MockHttpSession>();
//   mock->Enqueue("/api/v3/projects/42", MockHttpSession::Json(503, "{}"));
//   mock->SetResponse("/api/v3/projects/42", MockHttpSession::Json(200, body));
//   ... // first call sees 503, every later call sees 200
//   CHECK(mock->CallCount("/api/v3/projects/42") == 2);
//
// Routes are the request path without its query string. Queued responses are
// consumed FIFO before the route's sticky response. A route with neither
// yields an Internal error rather than crashing.
//
// SetDelay() holds every call for a while, counting it as in flight. A
// cancelled request token ends the wait early with a Timeout error, the way
// the real session aborts a read.
// ---------------------------------------------------------------------------
class MockHttpSession : public IHttpSession {
public:
    using Response = Result<HttpResponse, Error>;

    MockHttpSession() = default;

    // -- Canned responses ---------------------------------------------------

    static Response Json(int status, std::string body) {
        return Response::Ok(HttpResponse{status, {{"Content-Type", "application/hal+json"}},
                                         std::move(body)});
    }

    static Response TransportFailure(const std::string& message = "connection refused") {
        return Response::Err(Error::Make(ErrorCategory::UpstreamTransient,
                                         "HttpSession::Get", message));
    }

    void SetResponse(const std::string& route, Response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        sticky_.insert_or_assign(route, std::move(response));
    }

    void Enqueue(const std::string& route, Response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_[route].push_back(std::move(response));
    }

    void SetDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    // -- IHttpSession -------------------------------------------------------

    Response Get(std::string_view path, const RequestOptions& options = {}) override {
        const std::string full(path);
        const std::string route = full.substr(0, full.find('?'));
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(full);
            if (closed_) {
                return Response::Err(Error::Make(ErrorCategory::ClientClosed,
                                                 "HttpSession::Get", "session closed"));
            }
            ++in_flight_;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
            delay = delay_;
        }

        bool cancelled = false;
        if (delay.count() > 0) {
            if (options.cancel.has_value()) {
                cancelled = options.cancel->WaitFor(delay);
            } else {
                std::this_thread::sleep_for(delay);
            }
        } else if (options.cancel.has_value()) {
            cancelled = options.cancel->IsCancelled();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
        if (cancelled) {
            return Response::Err(Error::Make(ErrorCategory::Timeout, "HttpSession::Get",
                                             "request cancelled"));
        }
        auto queued = queued_.find(route);
        if (queued != queued_.end() && !queued->second.empty()) {
            auto response = std::move(queued->second.front());
            queued->second.pop_front();
            return response;
        }
        auto sticky = sticky_.find(route);
        if (sticky != sticky_.end()) {
            return sticky->second;
        }
        return Response::Err(Error::Make(ErrorCategory::Internal, "MockHttpSession::Get",
                                         "no canned response for " + route));
    }

    void Close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        ++close_count_;
    }

    // -- Inspection ---------------------------------------------------------

    std::vector<std::string> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    size_t CallCount(const std::string& route) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(
            calls_.begin(), calls_.end(), [&route](const std::string& call) {
                return call.substr(0, call.find('?')) == route;
            }));
    }

    int InFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    int PeakInFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_in_flight_;
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    int CloseCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Response>> queued_;
    std::map<std::string, Response> sticky_;
    std::vector<std::string> calls_;
    std::chrono::milliseconds delay_{0};
    int in_flight_ = 0;
    int peak_in_flight_ = 0;
    bool closed_ = false;
    int close_count_ = 0;
};

} // namespace testing
} // namespace op_mcp
