#pragma once
#include "inference/types.hpp"
#include "json_schema.hpp"
#include "variants/variant.hpp"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace switchyard {

// A logical function: its output type, its variants, and for json
// functions the schema its output is checked against
class FunctionConfig {
public:
    FunctionConfig(FunctionType type, std::string name);

    FunctionType type() const { return type_; }
    const std::string& name() const { return name_; }

    // Throws Error(Config) on a duplicate name
    void add_variant(const std::string& name, VariantConfig variant);

    // Null when absent
    const VariantConfig* variant(const std::string& name) const;
    const std::map<std::string, VariantConfig>& variants() const { return variants_; }

    void set_output_schema(JSONSchema schema) { output_schema_ = std::move(schema); }
    const JSONSchema* output_schema() const { return output_schema_ ? &*output_schema_ : nullptr; }

    void set_tools(std::vector<ToolSpec> tools) { tools_ = std::move(tools); }
    const std::vector<ToolSpec>& tools() const { return tools_; }

    // Packages finished content as this function's result type. For json
    // functions the raw output is parsed and checked against
    // `dynamic_output_schema` (or the function's own schema); a parse or
    // validation failure leaves `parsed` empty. A schema that cannot be
    // loaded throws Error(JsonSchema).
    InferenceResult prepare_response(const std::string& inference_id,
                                     std::vector<ContentBlock> content,
                                     std::vector<ModelInferenceResult> model_inference_results,
                                     const JSONSchema* dynamic_output_schema,
                                     std::optional<FinishReason> finish_reason) const;

    // Picks a variant with probability proportional to its weight.
    // Throws Error(Config) if no variant has a positive weight.
    std::string sample_variant(std::mt19937_64& rng) const;

private:
    FunctionType type_;
    std::string name_;
    std::map<std::string, VariantConfig> variants_;
    std::optional<JSONSchema> output_schema_;
    std::vector<ToolSpec> tools_;
};

} // namespace switchyard
