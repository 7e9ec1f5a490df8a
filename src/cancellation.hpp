#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace switchyard {

// Shared cancellation flag. Copies refer to the same flag; a child token
// also reports cancelled once any ancestor is cancelled. Cancellation is
// cooperative: long-running work polls cancelled() or sleeps via wait_for().
class CancellationToken {
public:
    CancellationToken();

    CancellationToken child() const;

    void cancel() const;
    bool cancelled() const;

    // Sleep for up to `duration`, waking early on cancellation.
    // Returns false if the token was cancelled.
    bool wait_for(std::chrono::milliseconds duration) const;

    // Throws Error::cancelled(what) if cancelled
    void throw_if_cancelled(const std::string& what) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::shared_ptr<State> parent;
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace switchyard
