#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace op_mcp {

// ---------------------------------------------------------------------------
// CancellationToken: shared, copyable cancel flag.
//
// Copies share state. Cancelling a token cancels every child created from it
// with MakeChild(); cancelling a child never affects its parent.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken();

    void Cancel();
    [[nodiscard]] bool IsCancelled() const;

    /// Sleep for up to `duration`. Returns true if woken by cancellation.
    bool WaitFor(std::chrono::milliseconds duration) const;

    /// A new token cancelled together with this one.
    [[nodiscard]] CancellationToken MakeChild() const;

    /// A new token cancelled when either this token or `other` is.
    [[nodiscard]] CancellationToken LinkedWith(const CancellationToken& other) const;

private:
    struct State {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        bool cancelled = false;
        std::vector<std::weak_ptr<State>> children;
    };

    explicit CancellationToken(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    static void CancelState(const std::shared_ptr<State>& state);
    // Registers `child` under `parent`; false if `parent` is already cancelled.
    static bool Attach(const std::shared_ptr<State>& parent,
                       const std::shared_ptr<State>& child);

    std::shared_ptr<State> state_;
};

} // namespace op_mcp
