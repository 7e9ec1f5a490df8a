#include "variant.hpp"
#include "../function.hpp"
#include <type_traits>

namespace switchyard {

const char* VariantConfig::type_name() const {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ChatCompletionConfig>) {
            return "chat_completion";
        } else if constexpr (std::is_same_v<T, FirstOfNConfig>) {
            return "experimental_first_of_n";
        } else if constexpr (std::is_same_v<T, BestOfNConfig>) {
            return "experimental_best_of_n_sampling";
        } else if constexpr (std::is_same_v<T, MixtureOfNConfig>) {
            return "experimental_mixture_of_n";
        } else {
            static_assert(std::is_same_v<T, ChainOfThoughtConfig>, "unhandled variant type");
            return "experimental_chain_of_thought";
        }
    }, kind_);
}

std::optional<double> VariantConfig::weight() const {
    return std::visit([](const auto& v) -> std::optional<double> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ChainOfThoughtConfig>) {
            return v.inner.weight;
        } else {
            return v.weight;
        }
    }, kind_);
}

InferenceResult VariantConfig::infer(const Input& input, const ModelTable& models,
                                     const FunctionConfig& function,
                                     const InferenceContext& ctx) const {
    return std::visit([&](const auto& v) { return v.infer(input, models, function, ctx); }, kind_);
}

InferenceResultStream VariantConfig::infer_stream(const Input& input, const ModelTable& models,
                                                  const FunctionConfig& function,
                                                  const InferenceContext& ctx) const {
    return std::visit(
        [&](const auto& v) { return v.infer_stream(input, models, function, ctx); }, kind_);
}

void VariantConfig::validate(const FunctionConfig& function, const ModelTable& models,
                             const TemplateConfig& templates,
                             const std::string& variant_name) const {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ChatCompletionConfig>) {
            v.validate(function, models, templates);
        } else {
            v.validate(function, models, templates, variant_name);
        }
    }, kind_);
}

std::vector<std::string> VariantConfig::get_all_template_paths() const {
    return std::visit([](const auto& v) { return v.get_all_template_paths(); }, kind_);
}

const std::vector<std::string>& VariantConfig::candidates() const {
    static const std::vector<std::string> kNone;
    return std::visit([](const auto& v) -> const std::vector<std::string>& {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ChatCompletionConfig> ||
                      std::is_same_v<T, ChainOfThoughtConfig>) {
            return kNone;
        } else {
            return v.candidates;
        }
    }, kind_);
}

void VariantConfig::start_batch_inference() const {
    throw Error::unsupported_batch(type_name());
}

} // namespace switchyard
