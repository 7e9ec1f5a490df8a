#pragma once
#include "../inference/context.hpp"
#include "../inference/stream.hpp"
#include "../inference/types.hpp"
#include "../model.hpp"
#include "../template.hpp"
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

class FunctionConfig;

constexpr double kDefaultCandidateTimeoutSeconds = 300.0;

// Races the candidates and returns the first success
struct FirstOfNConfig {
    std::optional<double> weight;
    std::vector<std::string> candidates;
    double timeout_s = kDefaultCandidateTimeoutSeconds;

    InferenceResult infer(const Input& input, const ModelTable& models,
                          const FunctionConfig& function, const InferenceContext& ctx) const;

    // Runs the race to completion, then replays the winner as one chunk
    InferenceResultStream infer_stream(const Input& input, const ModelTable& models,
                                       const FunctionConfig& function,
                                       const InferenceContext& ctx) const;

    void validate(const FunctionConfig& function, const ModelTable& models,
                  const TemplateConfig& templates, const std::string& variant_name) const;

    // Candidates are enumerated as variants in their own right
    std::vector<std::string> get_all_template_paths() const { return {}; }
};

} // namespace switchyard
