#include <op_mcp/core/cancellation.hpp>

#include <algorithm>

namespace op_mcp {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() {
    CancelState(state_);
}

void CancellationToken::CancelState(const std::shared_ptr<State>& state) {
    std::vector<std::weak_ptr<State>> children;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->cancelled) return;
        state->cancelled = true;
        children.swap(state->children);
    }
    state->cv.notify_all();

    // Children are cancelled outside the parent's lock.
    for (auto& weak : children) {
        if (auto child = weak.lock()) {
            CancelState(child);
        }
    }
}

bool CancellationToken::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration,
                               [this] { return state_->cancelled; });
}

bool CancellationToken::Attach(const std::shared_ptr<State>& parent,
                               const std::shared_ptr<State>& child) {
    std::lock_guard<std::mutex> lock(parent->mutex);
    if (parent->cancelled) {
        return false;
    }
    // Drop expired entries so long-lived parents do not grow.
    auto& kids = parent->children;
    kids.erase(std::remove_if(kids.begin(), kids.end(),
                              [](const std::weak_ptr<State>& w) {
                                  return w.expired();
                              }),
               kids.end());
    kids.push_back(child);
    return true;
}

CancellationToken CancellationToken::MakeChild() const {
    auto child = std::make_shared<State>();
    if (!Attach(state_, child)) {
        child->cancelled = true;
    }
    return CancellationToken(std::move(child));
}

CancellationToken CancellationToken::LinkedWith(const CancellationToken& other) const {
    auto linked = MakeChild();
    if (!Attach(other.state_, linked.state_)) {
        linked.Cancel();
    }
    return linked;
}

} // namespace op_mcp
