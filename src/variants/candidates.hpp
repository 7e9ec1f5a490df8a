#pragma once
#include "../cancellation.hpp"
#include "../error.hpp"
#include "../inference/context.hpp"
#include "../inference/types.hpp"
#include "../model.hpp"
#include "../template.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace switchyard {

class FunctionConfig;
class VariantConfig;

struct CandidateOutcome {
    size_t index;
    std::string candidate_name;
    std::optional<InferenceResult> result;
    std::optional<Error> error; // set iff result is not
};

// Runs candidate tasks on their own threads, each under a child of the
// parent cancellation token and its own deadline. Outcomes are handed out
// in completion order. A candidate past its deadline is reported as
// InferenceTimeout and cancelled; anything it produces afterwards is
// discarded. The destructor cancels and joins every worker.
class CandidateFanOut {
public:
    using Task = std::function<InferenceResult(const CancellationToken& cancel)>;

    CandidateFanOut(std::chrono::milliseconds timeout, const CancellationToken& parent);
    ~CandidateFanOut();

    CandidateFanOut(const CandidateFanOut&) = delete;
    CandidateFanOut& operator=(const CandidateFanOut&) = delete;

    void spawn(const std::string& candidate_name, Task task);

    // Blocks until the next candidate resolves; nullopt once all have
    std::optional<CandidateOutcome> next();

    void cancel_all();

private:
    struct Slot {
        std::string name;
        CancellationToken token;
        std::chrono::steady_clock::time_point deadline;
        bool resolved = false;
    };

    void finish(size_t index, std::optional<InferenceResult> result, std::optional<Error> error);

    std::chrono::milliseconds timeout_;
    CancellationToken parent_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Slot> slots_;
    std::deque<CandidateOutcome> completed_;
    std::vector<std::thread> workers_;
};

struct CandidateResults {
    std::vector<InferenceResult> results; // successes, in candidate order
    std::vector<Error> errors;            // failures and timeouts, tagged by candidate
};

// Runs every named candidate to completion (or timeout) and keeps all
// outcomes. Throws UnknownCandidate before starting anything if a name is
// not a variant of `function`.
CandidateResults infer_candidates(const std::vector<std::string>& candidates,
                                  std::chrono::milliseconds timeout, const Input& input,
                                  const ModelTable& models, const FunctionConfig& function,
                                  const InferenceContext& ctx, const std::string& log_tag);

// Looks up candidate `name` for a fan-out running under `ctx`. Throws
// UnknownCandidate if the function has no such variant, and
// InvalidCandidate if it is already running further up this request.
const VariantConfig& resolve_candidate(const FunctionConfig& function, const std::string& name,
                                       const InferenceContext& ctx);

// Validates each candidate variant, wrapping failures as InvalidCandidate
// naming `variant_name`. A candidate chain that leads back to a variant
// already on it is rejected before anything recurses.
void validate_candidates(const std::vector<std::string>& candidates,
                         const FunctionConfig& function, const ModelTable& models,
                         const TemplateConfig& templates, const std::string& variant_name);

// Compact text of a finished candidate for judge and fuser prompts.
// Nullopt for a json candidate whose output never parsed.
std::optional<std::string> candidate_prompt_text(const InferenceResult& result);

// Longest accepted timeout_s; deadlines stay far from clock overflow
constexpr double kMaxCandidateTimeoutSeconds = 365.0 * 24 * 60 * 60;

// Throws Error(Config) unless 0 < timeout_s <= kMaxCandidateTimeoutSeconds
void validate_timeout(double timeout_s, const std::string& variant_name);

// Clamped to [0, kMaxCandidateTimeoutSeconds]; NaN maps to zero
std::chrono::milliseconds timeout_from_seconds(double seconds);

} // namespace switchyard
