#pragma once
#include "../cancellation.hpp"
#include "../error.hpp"
#include "../inference/context.hpp"
#include "../inference/stream.hpp"
#include "../inference/types.hpp"
#include "../model.hpp"
#include "../template.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

class FunctionConfig;

struct RetryConfig {
    uint32_t num_retries = 0;
    double max_delay_s = 10.0;
};

// Runs `fn`, re-running it up to num_retries times on failure with
// exponential back-off (0.1 s doubling, capped at max_delay_s).
// Cancellation is never retried.
template <typename F>
auto with_retries(const RetryConfig& retries, const CancellationToken& cancel,
                  const std::string& what, F&& fn) -> decltype(fn()) {
    for (uint32_t attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const Error& e) {
            if (e.kind() == ErrorKind::Cancelled || attempt >= retries.num_retries) throw;
            double delay_s = std::min(0.1 * std::pow(2.0, attempt), retries.max_delay_s);
            auto delay = std::chrono::milliseconds(static_cast<long>(delay_s * 1000));
            std::cerr << "[chat_completion] " << what << " attempt " << (attempt + 1) << "/"
                      << (retries.num_retries + 1) << " failed: " << e.what()
                      << "; retrying in " << delay.count() << "ms\n";
            if (!cancel.wait_for(delay)) throw Error::cancelled(what);
        }
    }
}

// Maps one logical call onto one physical model call
struct ChatCompletionConfig {
    std::optional<double> weight;
    std::string model;
    std::optional<std::string> system_template;
    std::optional<std::string> user_template;
    std::optional<std::string> assistant_template;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<double> presence_penalty;
    std::optional<double> frequency_penalty;
    std::optional<uint32_t> max_tokens;
    std::optional<uint32_t> seed;
    std::optional<JsonMode> json_mode; // unset: strict for json functions, off for chat
    RetryConfig retries;

    InferenceResult infer(const Input& input, const ModelTable& models,
                          const FunctionConfig& function, const InferenceContext& ctx) const;

    InferenceResultStream infer_stream(const Input& input, const ModelTable& models,
                                       const FunctionConfig& function,
                                       const InferenceContext& ctx) const;

    void validate(const FunctionConfig& function, const ModelTable& models,
                  const TemplateConfig& templates) const;

    std::vector<std::string> get_all_template_paths() const;

    // ── Request building (shared with judge and fuser calls) ─────

    // Rendered system prompt from System-role inputs, or from the system
    // template alone when the input has none
    std::optional<std::string> render_system(const Input& input,
                                             const TemplateConfig& templates) const;

    // User and assistant inputs rendered through their role templates
    std::vector<RequestMessage> render_messages(const Input& input,
                                                const TemplateConfig& templates) const;

    void apply_inference_params(ModelInferenceRequest& request) const;

    JsonMode effective_json_mode(FunctionType type) const;

    ModelInferenceRequest prepare_request(const Input& input, const FunctionConfig& function,
                                          const InferenceContext& ctx, bool stream) const;

    // Resolves `model`; throws ModelNotFound
    std::shared_ptr<const ModelConfig> resolve_model(const ModelTable& models) const;

    // Sends a prepared request to `model` under this variant's retry policy
    ModelInferenceResult run_request(const ModelInferenceRequest& request,
                                     const ModelTable& models, const InferenceContext& ctx) const;

    InferenceResultStream run_request_stream(const ModelInferenceRequest& request,
                                             const ModelTable& models, FunctionType type,
                                             const InferenceContext& ctx) const;
};

} // namespace switchyard
