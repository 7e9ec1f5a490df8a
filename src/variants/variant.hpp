#pragma once
#include "best_of_n.hpp"
#include "chain_of_thought.hpp"
#include "chat_completion.hpp"
#include "first_of_n.hpp"
#include "mixture_of_n.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace switchyard {

class FunctionConfig;

// Closed set of execution strategies. Every operation dispatches with
// std::visit, so each alternative must provide all of them.
class VariantConfig {
public:
    using Kind = std::variant<ChatCompletionConfig, FirstOfNConfig, BestOfNConfig, MixtureOfNConfig,
                              ChainOfThoughtConfig>;

    explicit VariantConfig(Kind kind) : kind_(std::move(kind)) {}

    const Kind& kind() const { return kind_; }

    // Config `type` string for this strategy
    const char* type_name() const;

    std::optional<double> weight() const;

    InferenceResult infer(const Input& input, const ModelTable& models,
                          const FunctionConfig& function, const InferenceContext& ctx) const;

    InferenceResultStream infer_stream(const Input& input, const ModelTable& models,
                                       const FunctionConfig& function,
                                       const InferenceContext& ctx) const;

    // Checks that referenced models, templates and candidates exist
    void validate(const FunctionConfig& function, const ModelTable& models,
                  const TemplateConfig& templates, const std::string& variant_name) const;

    std::vector<std::string> get_all_template_paths() const;

    // Candidate variants this strategy fans out to; empty for single-model
    // strategies
    const std::vector<std::string>& candidates() const;

    // No strategy here has a batch path; always throws
    // UnsupportedVariantForBatchInference
    void start_batch_inference() const;

private:
    Kind kind_;
};

} // namespace switchyard
