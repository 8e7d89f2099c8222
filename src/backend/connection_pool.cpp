#include <op_mcp/backend/connection_pool.hpp>

#include <op_mcp/core/log.hpp>

#include <algorithm>

namespace op_mcp {

namespace {

// Cancellation is observed at this granularity while waiting for a slot.
constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);

} // anonymous namespace

// ---------------------------------------------------------------------------
// Lease
// ---------------------------------------------------------------------------
Lease::~Lease() {
    Release();
}

Lease::Lease(Lease&& other) noexcept : pool_(other.pool_) {
    other.pool_ = nullptr;
}

Lease& Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

void Lease::Release() {
    if (pool_ != nullptr) {
        pool_->ReleaseSlot();
        pool_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// ConnectionPool
// ---------------------------------------------------------------------------
ConnectionPool::ConnectionPool(int capacity)
    : capacity_(std::max(1, capacity)) {}

Result<Lease, Error> ConnectionPool::Acquire(
    std::chrono::steady_clock::time_point deadline,
    const std::optional<CancellationToken>& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (closed_) {
            return Result<Lease, Error>::Err(Error::Make(
                ErrorCategory::ClientClosed, "ConnectionPool::Acquire",
                "Backend client is closed"));
        }
        if (in_flight_ < capacity_) {
            ++in_flight_;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
            return Result<Lease, Error>::Ok(Lease(this));
        }
        if (cancel.has_value() && cancel->IsCancelled()) {
            return Result<Lease, Error>::Err(Error::Make(
                ErrorCategory::Timeout, "ConnectionPool::Acquire",
                "Cancelled while waiting for a backend connection"));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Result<Lease, Error>::Err(Error::Make(
                ErrorCategory::Timeout, "ConnectionPool::Acquire",
                "Timed out waiting for a backend connection (" +
                    std::to_string(capacity_) + " in flight)"));
        }
        auto wake = deadline;
        if (cancel.has_value()) {
            wake = std::min(deadline, now + kCancelPollInterval);
        }
        cv_.wait_until(lock, wake);
    }
}

void ConnectionPool::ReleaseSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_flight_;
    }
    cv_.notify_one();
}

bool ConnectionPool::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        closed_ = true;
    }
    cv_.notify_all();
    LogDebug("pool", "connection pool closed");
    return true;
}

int ConnectionPool::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

int ConnectionPool::PeakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_flight_;
}

bool ConnectionPool::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace op_mcp
