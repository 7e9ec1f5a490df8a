#include "chain_of_thought.hpp"
#include "../function.hpp"
#include <algorithm>
#include <iostream>

namespace switchyard {

nlohmann::json chain_of_thought_output_schema(const nlohmann::json& response_schema) {
    nlohmann::json schema = {
        {"type", "object"},
        {"properties",
         {{"thinking",
           {{"type", "string"},
            {"description", "A detailed description of the thought process used to arrive at "
                            "the final answer."}}},
          {"response", response_schema}}},
        {"required", nlohmann::json::array({"thinking", "response"})},
        {"additionalProperties", false},
    };
    return schema;
}

void split_thinking(JsonInferenceOutput& output) {
    if (!output.parsed) return;
    nlohmann::json& parsed = *output.parsed;
    if (!parsed.is_object() || !parsed.contains("thinking") || !parsed["thinking"].is_string() ||
        !parsed.contains("response")) {
        std::cerr << "[chain_of_thought] Parsed output has no thinking and response fields\n";
        return;
    }
    Thought thought{parsed["thinking"].get<std::string>(), std::nullopt};
    nlohmann::json response = std::move(parsed["response"]);
    output.raw = response.dump();
    output.parsed = std::move(response);

    auto& aux = output.auxiliary_content;
    size_t at = std::min(output.json_block_index.value_or(aux.size()), aux.size());
    aux.insert(aux.begin() + static_cast<std::ptrdiff_t>(at), std::move(thought));
}

InferenceResult ChainOfThoughtConfig::infer(const Input& input, const ModelTable& models,
                                            const FunctionConfig& function,
                                            const InferenceContext& ctx) const {
    if (function.type() != FunctionType::Json) {
        throw Error::inference("Chain of thought variant " + ctx.variant_name +
                               " can only be used with json functions");
    }
    const JSONSchema* original =
        ctx.dynamic_output_schema ? ctx.dynamic_output_schema : function.output_schema();
    nlohmann::json response_schema = original ? original->value() : nlohmann::json::object();
    JSONSchema augmented = JSONSchema::from_value(chain_of_thought_output_schema(response_schema));

    InferenceContext inner_ctx = ctx;
    inner_ctx.dynamic_output_schema = &augmented;
    InferenceResult result = inner.infer(input, models, function, inner_ctx);

    split_thinking(result.json_output);
    if (original) {
        result.output_schema = std::move(response_schema);
    } else {
        result.output_schema.reset();
    }
    return result;
}

InferenceResultStream ChainOfThoughtConfig::infer_stream(const Input&, const ModelTable&,
                                                         const FunctionConfig&,
                                                         const InferenceContext&) const {
    throw Error::unsupported_streaming("experimental_chain_of_thought");
}

void ChainOfThoughtConfig::validate(const FunctionConfig& function, const ModelTable& models,
                                    const TemplateConfig& templates,
                                    const std::string& variant_name) const {
    if (function.type() != FunctionType::Json) {
        throw Error::config("Chain of thought variant " + variant_name + " in function " +
                            function.name() + " requires a json function");
    }
    inner.validate(function, models, templates);
}

} // namespace switchyard
