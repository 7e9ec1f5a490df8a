#include "cancellation.hpp"
#include "error.hpp"
#include <algorithm>
#include <thread>

namespace switchyard {

namespace {
constexpr std::chrono::milliseconds kPollSlice{5};
} // namespace

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

CancellationToken CancellationToken::child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancellationToken(std::move(state));
}

void CancellationToken::cancel() const {
    state_->flag.store(true);
}

bool CancellationToken::cancelled() const {
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (s->flag.load()) return true;
    }
    return false;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kPollSlice));
    }
    return false;
}

void CancellationToken::throw_if_cancelled(const std::string& what) const {
    if (cancelled()) throw Error::cancelled(what);
}

} // namespace switchyard
