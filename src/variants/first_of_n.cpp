#include "first_of_n.hpp"
#include "candidates.hpp"
#include "../function.hpp"
#include <iostream>

namespace switchyard {

InferenceResult FirstOfNConfig::infer(const Input& input, const ModelTable& models,
                                      const FunctionConfig& function,
                                      const InferenceContext& ctx) const {
    if (candidates.empty()) {
        throw Error::inference("First of N variant " + ctx.variant_name + " has no candidates");
    }

    std::vector<Error> errors;
    CandidateFanOut fan_out(timeout_from_seconds(timeout_s), ctx.cancel);
    for (const auto& name : candidates) {
        fan_out.spawn(name, [&, name](const CancellationToken& token) {
            const VariantConfig& variant = resolve_candidate(function, name, ctx);
            return variant.infer(input, models, function, ctx.for_candidate(name, token));
        });
    }

    while (auto outcome = fan_out.next()) {
        if (outcome->result) {
            fan_out.cancel_all();
            return std::move(*outcome->result);
        }
        std::cerr << "[first_of_n] Candidate " << outcome->candidate_name
                  << " failed: " << outcome->error->what() << '\n';
        errors.push_back(std::move(*outcome->error));
    }
    throw Error::inference("All candidates failed in first of n variant " + ctx.variant_name,
                           std::move(errors));
}

InferenceResultStream FirstOfNConfig::infer_stream(const Input& input, const ModelTable& models,
                                                   const FunctionConfig& function,
                                                   const InferenceContext& ctx) const {
    return stream_inference_from_non_stream(infer(input, models, function, ctx));
}

void FirstOfNConfig::validate(const FunctionConfig& function, const ModelTable& models,
                              const TemplateConfig& templates,
                              const std::string& variant_name) const {
    if (weight && *weight < 0) {
        throw Error::config("Negative weight for variant " + variant_name);
    }
    validate_timeout(timeout_s, variant_name);
    validate_candidates(candidates, function, models, templates, variant_name);
}

} // namespace switchyard
