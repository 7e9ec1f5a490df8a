#pragma once
#include "chat_completion.hpp"
#include "first_of_n.hpp"
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

class FunctionConfig;

// Fuser call: asks a model to synthesize one answer from all candidates
struct FuserConfig {
    ChatCompletionConfig inner;

    ModelInferenceRequest prepare_request(const Input& input, const FunctionConfig& function,
                                          const InferenceContext& ctx,
                                          const std::vector<InferenceResult>& results,
                                          bool stream) const;

    InferenceResult fuse(const Input& input, const ModelTable& models,
                         const FunctionConfig& function, const InferenceContext& ctx,
                         const std::vector<InferenceResult>& results) const;

    InferenceResultStream fuse_stream(const Input& input, const ModelTable& models,
                                      const FunctionConfig& function, const InferenceContext& ctx,
                                      const std::vector<InferenceResult>& results) const;
};

struct MixtureOfNConfig {
    std::optional<double> weight;
    double timeout_s = kDefaultCandidateTimeoutSeconds;
    std::vector<std::string> candidates;
    FuserConfig fuser;

    // If the fuser fails, the first successful candidate is returned instead
    InferenceResult infer(const Input& input, const ModelTable& models,
                          const FunctionConfig& function, const InferenceContext& ctx) const;

    // Streams the fuser's output; if the fuser cannot start, the first
    // successful candidate is replayed as a one-chunk stream
    InferenceResultStream infer_stream(const Input& input, const ModelTable& models,
                                       const FunctionConfig& function,
                                       const InferenceContext& ctx) const;

    void validate(const FunctionConfig& function, const ModelTable& models,
                  const TemplateConfig& templates, const std::string& variant_name) const;

    std::vector<std::string> get_all_template_paths() const {
        return fuser.inner.get_all_template_paths();
    }
};

// ── Fuser prompt ─────────────────────────────────────────────────

std::string mixture_of_n_system_message(const std::optional<std::string>& inner_system);
std::string mixture_of_n_candidates_message(const std::vector<std::string>& candidates);

} // namespace switchyard
