#pragma once
#include "chat_completion.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchyard {

class FunctionConfig;

// Chat completion for json functions that has the model reason before it
// answers. The output schema is wrapped as {"thinking", "response"}; the
// thinking is split back out of the result as a thought block.
struct ChainOfThoughtConfig {
    ChatCompletionConfig inner;

    InferenceResult infer(const Input& input, const ModelTable& models,
                          const FunctionConfig& function, const InferenceContext& ctx) const;

    // Always throws UnsupportedVariantForStreamingInference
    InferenceResultStream infer_stream(const Input& input, const ModelTable& models,
                                       const FunctionConfig& function,
                                       const InferenceContext& ctx) const;

    // Throws Error(Config) for a chat function
    void validate(const FunctionConfig& function, const ModelTable& models,
                  const TemplateConfig& templates, const std::string& variant_name) const;

    std::vector<std::string> get_all_template_paths() const {
        return inner.get_all_template_paths();
    }
};

nlohmann::json chain_of_thought_output_schema(const nlohmann::json& response_schema);

// Replaces a parsed {"thinking", "response"} object by its response and
// inserts the thinking as a thought where the JSON block was. Output that
// did not parse, or lacks either field, is left as it is.
void split_thinking(JsonInferenceOutput& output);

} // namespace switchyard
