#pragma once

#include <op_mcp/core/cancellation.hpp>
#include <op_mcp/core/result.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace op_mcp {

class ConnectionPool;

// ---------------------------------------------------------------------------
// Lease: RAII permission to have one backend request in flight.
//
// Move-only. The slot is returned when the lease is destroyed or Release()d,
// whichever comes first.
// ---------------------------------------------------------------------------
class Lease {
public:
    Lease() = default;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    [[nodiscard]] bool Valid() const noexcept { return pool_ != nullptr; }
    void Release();

private:
    friend class ConnectionPool;
    explicit Lease(ConnectionPool* pool) : pool_(pool) {}
    ConnectionPool* pool_ = nullptr;
};

// ---------------------------------------------------------------------------
// ConnectionPool: counting semaphore over `capacity` slots.
//
// Acquire() blocks while all slots are taken. It fails with:
//   - Timeout       when the deadline passes or the token is cancelled
//   - ClientClosed  when the pool is closed (before or during the wait)
//
// The pool must outlive every Lease it hands out.
// ---------------------------------------------------------------------------
class ConnectionPool {
public:
    explicit ConnectionPool(int capacity);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    [[nodiscard]] Result<Lease, Error> Acquire(
        std::chrono::steady_clock::time_point deadline,
        const std::optional<CancellationToken>& cancel = std::nullopt);

    // Wake all waiters and refuse new acquisitions. Returns false if the pool
    // was already closed.
    bool Close();

    [[nodiscard]] int Capacity() const noexcept { return capacity_; }
    [[nodiscard]] int InFlight() const;
    [[nodiscard]] int PeakInFlight() const;
    [[nodiscard]] bool IsClosed() const;

private:
    friend class Lease;
    void ReleaseSlot();

    const int capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int in_flight_ = 0;
    int peak_in_flight_ = 0;
    bool closed_ = false;
};

} // namespace op_mcp
