#include "candidates.hpp"
#include "../function.hpp"
#include "../serialize.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace switchyard {

CandidateFanOut::CandidateFanOut(std::chrono::milliseconds timeout,
                                 const CancellationToken& parent)
    : timeout_(std::clamp(timeout, std::chrono::milliseconds(0),
                          timeout_from_seconds(kMaxCandidateTimeoutSeconds))),
      parent_(parent) {}

CandidateFanOut::~CandidateFanOut() {
    cancel_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void CandidateFanOut::spawn(const std::string& candidate_name, Task task) {
    CancellationToken token = parent_.child();
    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        index = slots_.size();
        slots_.push_back(Slot{candidate_name, token,
                              std::chrono::steady_clock::now() + timeout_, false});
    }
    workers_.emplace_back([this, index, token, task = std::move(task)]() {
        std::optional<InferenceResult> result;
        std::optional<Error> error;
        try {
            result = task(token);
        } catch (const Error& e) {
            error = e;
        } catch (const std::exception& e) {
            error = Error::inference(e.what());
        }
        finish(index, std::move(result), std::move(error));
    });
}

void CandidateFanOut::finish(size_t index, std::optional<InferenceResult> result,
                             std::optional<Error> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot& slot = slots_[index];
    if (slot.resolved) return; // timed out or cancelled; late output is dropped
    slot.resolved = true;
    if (error) error = error->with_source(slot.name);
    completed_.push_back(CandidateOutcome{index, slot.name, std::move(result), std::move(error)});
    cv_.notify_all();
}

std::optional<CandidateOutcome> CandidateFanOut::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!completed_.empty()) {
            CandidateOutcome outcome = std::move(completed_.front());
            completed_.pop_front();
            return outcome;
        }

        auto earliest = std::chrono::steady_clock::time_point::max();
        for (const auto& slot : slots_) {
            if (!slot.resolved) earliest = std::min(earliest, slot.deadline);
        }
        if (earliest == std::chrono::steady_clock::time_point::max()) return std::nullopt;

        cv_.wait_until(lock, earliest);

        auto now = std::chrono::steady_clock::now();
        for (size_t i = 0; i < slots_.size(); ++i) {
            Slot& slot = slots_[i];
            if (slot.resolved || slot.deadline > now) continue;
            slot.resolved = true;
            slot.token.cancel();
            completed_.push_back(CandidateOutcome{
                i, slot.name, std::nullopt,
                Error::inference_timeout(slot.name).with_source(slot.name)});
        }
    }
}

void CandidateFanOut::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
        slot.token.cancel();
    }
}

CandidateResults infer_candidates(const std::vector<std::string>& candidates,
                                  std::chrono::milliseconds timeout, const Input& input,
                                  const ModelTable& models, const FunctionConfig& function,
                                  const InferenceContext& ctx, const std::string& log_tag) {
    std::vector<const VariantConfig*> variants;
    for (const auto& name : candidates) {
        variants.push_back(&resolve_candidate(function, name, ctx));
    }

    std::vector<std::optional<InferenceResult>> slots(candidates.size());
    CandidateResults out;
    {
        CandidateFanOut fan_out(timeout, ctx.cancel);
        for (size_t i = 0; i < candidates.size(); ++i) {
            const VariantConfig* variant = variants[i];
            const std::string& name = candidates[i];
            fan_out.spawn(name, [&, variant, name](const CancellationToken& token) {
                return variant->infer(input, models, function, ctx.for_candidate(name, token));
            });
        }
        while (auto outcome = fan_out.next()) {
            if (outcome->result) {
                slots[outcome->index] = std::move(outcome->result);
            } else {
                std::cerr << "[" << log_tag << "] Candidate " << outcome->candidate_name
                          << " failed: " << outcome->error->what() << '\n';
                out.errors.push_back(std::move(*outcome->error));
            }
        }
    }
    for (auto& slot : slots) {
        if (slot) out.results.push_back(std::move(*slot));
    }
    return out;
}

const VariantConfig& resolve_candidate(const FunctionConfig& function, const std::string& name,
                                       const InferenceContext& ctx) {
    const VariantConfig* variant = function.variant(name);
    if (!variant) throw Error::unknown_candidate(name);
    if (name == ctx.variant_name ||
        std::find(ctx.variant_path.begin(), ctx.variant_path.end(), name) !=
            ctx.variant_path.end()) {
        throw Error::invalid_candidate(ctx.variant_name,
                                       "candidate " + name + " is already running in this request");
    }
    return *variant;
}

namespace {

// Depth-first walk over candidate lists; `path` holds the chain so far
void check_candidate_cycles(const std::vector<std::string>& candidates,
                            const FunctionConfig& function, std::vector<std::string>& path) {
    for (const auto& name : candidates) {
        if (std::find(path.begin(), path.end(), name) != path.end()) {
            path.push_back(name);
            throw Error::invalid_candidate(path.front(), "candidate cycle " + join(path, " -> "));
        }
        const VariantConfig* variant = function.variant(name);
        if (!variant) continue;
        path.push_back(name);
        check_candidate_cycles(variant->candidates(), function, path);
        path.pop_back();
    }
}

} // namespace

void validate_candidates(const std::vector<std::string>& candidates,
                         const FunctionConfig& function, const ModelTable& models,
                         const TemplateConfig& templates, const std::string& variant_name) {
    for (const auto& name : candidates) {
        if (!function.variant(name)) throw Error::unknown_candidate(name);
    }
    std::vector<std::string> path{variant_name};
    check_candidate_cycles(candidates, function, path);

    for (const auto& name : candidates) {
        try {
            function.variant(name)->validate(function, models, templates, name);
        } catch (const Error& e) {
            throw Error::invalid_candidate(variant_name, e.what());
        }
    }
}

std::optional<std::string> candidate_prompt_text(const InferenceResult& result) {
    if (result.type == FunctionType::Chat) {
        return serialize_content(result.content);
    }
    if (result.json_output.parsed) {
        return result.json_output.raw;
    }
    return std::nullopt;
}

void validate_timeout(double timeout_s, const std::string& variant_name) {
    if (!std::isfinite(timeout_s) || timeout_s <= 0) {
        throw Error::config("timeout_s must be positive for variant " + variant_name);
    }
    if (timeout_s > kMaxCandidateTimeoutSeconds) {
        throw Error::config("timeout_s for variant " + variant_name + " exceeds the maximum of " +
                            std::to_string(static_cast<long long>(kMaxCandidateTimeoutSeconds)) +
                            " seconds");
    }
}

std::chrono::milliseconds timeout_from_seconds(double seconds) {
    if (!(seconds > 0)) return std::chrono::milliseconds(0);
    double clamped = std::min(seconds, kMaxCandidateTimeoutSeconds);
    return std::chrono::milliseconds(std::llround(clamped * 1000.0));
}

} // namespace switchyard
