#include "function.hpp"
#include "error.hpp"
#include <iostream>

namespace switchyard {

FunctionConfig::FunctionConfig(FunctionType type, std::string name)
    : type_(type), name_(std::move(name)) {}

void FunctionConfig::add_variant(const std::string& name, VariantConfig variant) {
    if (variants_.count(name) > 0) {
        throw Error::config("Duplicate variant " + name + " in function " + name_);
    }
    variants_.emplace(name, std::move(variant));
}

const VariantConfig* FunctionConfig::variant(const std::string& name) const {
    auto it = variants_.find(name);
    return it == variants_.end() ? nullptr : &it->second;
}

InferenceResult FunctionConfig::prepare_response(
    const std::string& inference_id, std::vector<ContentBlock> content,
    std::vector<ModelInferenceResult> model_inference_results,
    const JSONSchema* dynamic_output_schema, std::optional<FinishReason> finish_reason) const {
    InferenceResult result;
    result.type = type_;
    result.inference_id = inference_id;
    result.usage = sum_usage(model_inference_results);
    result.model_inference_results = std::move(model_inference_results);
    result.finish_reason = finish_reason;

    if (type_ == FunctionType::Chat) {
        result.content = std::move(content);
        return result;
    }

    // Json: raw output is the first text block, or the first tool call's
    // arguments when the model answered through the implicit tool. Every
    // other block is kept as auxiliary content.
    for (size_t i = 0; i < content.size(); ++i) {
        auto& block = content[i];
        if (!result.json_output.raw) {
            if (auto* text = std::get_if<Text>(&block)) {
                result.json_output.raw = std::move(text->text);
                result.json_output.json_block_index = i;
                continue;
            }
            if (auto* call = std::get_if<ToolCall>(&block)) {
                result.json_output.raw = std::move(call->arguments);
                result.json_output.json_block_index = i;
                continue;
            }
        }
        result.json_output.auxiliary_content.push_back(std::move(block));
    }

    const JSONSchema* schema = dynamic_output_schema ? dynamic_output_schema : output_schema();
    if (schema) result.output_schema = schema->value();

    if (!result.json_output.raw) return result;
    try {
        nlohmann::json parsed = nlohmann::json::parse(*result.json_output.raw);
        if (schema) schema->validate(parsed);
        result.json_output.parsed = std::move(parsed);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[function] " << name_ << ": output is not valid JSON: " << e.what() << '\n';
    } catch (const Error& e) {
        std::cerr << "[function] " << name_ << ": output failed schema validation: "
                  << e.what() << '\n';
    }
    return result;
}

std::string FunctionConfig::sample_variant(std::mt19937_64& rng) const {
    double total = 0.0;
    for (const auto& [name, variant] : variants_) {
        total += variant.weight().value_or(0.0);
    }
    if (total <= 0.0) {
        throw Error::config("Function " + name_ + " has no variant with a positive weight");
    }
    double pick = std::uniform_real_distribution<double>(0.0, total)(rng);
    std::string last;
    for (const auto& [name, variant] : variants_) {
        double w = variant.weight().value_or(0.0);
        if (w <= 0.0) continue;
        if (pick < w) return name;
        pick -= w;
        last = name;
    }
    return last;
}

} // namespace switchyard
