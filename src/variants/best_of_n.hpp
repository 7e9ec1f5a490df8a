#pragma once
#include "chat_completion.hpp"
#include "first_of_n.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchyard {

class FunctionConfig;

// Judge call: asks a model to pick the best candidate by index
struct EvaluatorConfig {
    ChatCompletionConfig inner;

    // Returns the chosen index into `results` and the judge's model call.
    // Throws Inference if the judge's answer is malformed or out of range.
    std::pair<size_t, ModelInferenceResult> select(const Input& input, const ModelTable& models,
                                                   const InferenceContext& ctx,
                                                   const std::vector<InferenceResult>& results) const;

    ModelInferenceRequest prepare_request(const Input& input, const InferenceContext& ctx,
                                          const std::vector<std::string>& candidate_texts) const;
};

struct BestOfNConfig {
    std::optional<double> weight;
    double timeout_s = kDefaultCandidateTimeoutSeconds;
    std::vector<std::string> candidates;
    EvaluatorConfig evaluator;

    InferenceResult infer(const Input& input, const ModelTable& models,
                          const FunctionConfig& function, const InferenceContext& ctx) const;

    InferenceResultStream infer_stream(const Input& input, const ModelTable& models,
                                       const FunctionConfig& function,
                                       const InferenceContext& ctx) const;

    void validate(const FunctionConfig& function, const ModelTable& models,
                  const TemplateConfig& templates, const std::string& variant_name) const;

    std::vector<std::string> get_all_template_paths() const {
        return evaluator.inner.get_all_template_paths();
    }
};

// ── Judge prompt ─────────────────────────────────────────────────

std::string best_of_n_system_message(const std::optional<std::string>& inner_system,
                                     size_t max_index);
std::string best_of_n_candidates_message(const std::vector<std::string>& candidates);

// {thinking: string, answer_choice: integer}, both required, nothing else
const nlohmann::json& best_of_n_evaluator_schema();

} // namespace switchyard
