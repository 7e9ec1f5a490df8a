#pragma once
#include "../cancellation.hpp"
#include "../json_schema.hpp"
#include "../template.hpp"
#include <memory>
#include <string>
#include <vector>

namespace switchyard {

// Per-request state handed down through a variant and its candidates
struct InferenceContext {
    std::string inference_id;
    std::string function_name;
    std::string variant_name;
    std::shared_ptr<const TemplateConfig> templates = std::make_shared<TemplateConfig>();
    const JSONSchema* dynamic_output_schema = nullptr;
    CancellationToken cancel;
    // Variants that fanned out to reach this one, outermost first
    std::vector<std::string> variant_path;

    // Same request, running as candidate `variant` under `token`
    InferenceContext for_candidate(const std::string& variant, const CancellationToken& token) const {
        InferenceContext ctx = *this;
        ctx.variant_path.push_back(variant_name);
        ctx.variant_name = variant;
        ctx.cancel = token;
        return ctx;
    }
};

} // namespace switchyard
