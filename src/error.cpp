#include "error.hpp"

namespace switchyard {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidTemplatePath: return "InvalidTemplatePath";
        case ErrorKind::InvalidMessage: return "InvalidMessage";
        case ErrorKind::Templating: return "Templating";
        case ErrorKind::ModelNotFound: return "ModelNotFound";
        case ErrorKind::ModelProvidersExhausted: return "ModelProvidersExhausted";
        case ErrorKind::InferenceClient: return "InferenceClient";
        case ErrorKind::UnknownCandidate: return "UnknownCandidate";
        case ErrorKind::InferenceTimeout: return "InferenceTimeout";
        case ErrorKind::InvalidCandidate: return "InvalidCandidate";
        case ErrorKind::UnsupportedVariantForBatchInference:
            return "UnsupportedVariantForBatchInference";
        case ErrorKind::UnsupportedVariantForStreamingInference:
            return "UnsupportedVariantForStreamingInference";
        case ErrorKind::Inference: return "Inference";
        case ErrorKind::TypeConversion: return "TypeConversion";
        case ErrorKind::JsonSchema: return "JsonSchema";
        case ErrorKind::Config: return "Config";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : Error(kind, message, "", "", {}) {}

Error::Error(ErrorKind kind, const std::string& message, std::string variant_name,
             std::string source, std::vector<Error> sub_errors)
    : std::runtime_error(describe(message, sub_errors)),
      kind_(kind),
      message_(message),
      variant_name_(std::move(variant_name)),
      source_(std::move(source)),
      sub_errors_(std::move(sub_errors)) {}

std::string Error::describe(const std::string& message, const std::vector<Error>& subs) {
    if (subs.empty()) return message;
    std::string out = message + " (";
    for (size_t i = 0; i < subs.size(); ++i) {
        if (i > 0) out += "; ";
        if (!subs[i].source().empty()) out += subs[i].source() + ": ";
        out += subs[i].what();
    }
    out += ")";
    return out;
}

Error Error::with_source(const std::string& source) const {
    return Error(kind_, message_, variant_name_, source, sub_errors_);
}

Error Error::invalid_template_path(const std::string& detail) {
    return Error(ErrorKind::InvalidTemplatePath, "Invalid template path: " + detail);
}

Error Error::invalid_message(const std::string& message) {
    return Error(ErrorKind::InvalidMessage, message);
}

Error Error::templating(const std::string& template_name, const std::string& message) {
    return Error(ErrorKind::Templating,
                 "Failed to render template " + template_name + ": " + message);
}

Error Error::model_not_found(const std::string& model_name) {
    return Error(ErrorKind::ModelNotFound, "Model not found: " + model_name);
}

Error Error::model_providers_exhausted(std::vector<Error> provider_errors) {
    return Error(ErrorKind::ModelProvidersExhausted, "All model providers failed to infer",
                 "", "", std::move(provider_errors));
}

Error Error::inference_client(const std::string& provider_name, const std::string& message) {
    return Error(ErrorKind::InferenceClient, message, "", provider_name, {});
}

Error Error::unknown_candidate(const std::string& candidate_name) {
    return Error(ErrorKind::UnknownCandidate, "Unknown candidate variant: " + candidate_name,
                 candidate_name, "", {});
}

Error Error::inference_timeout(const std::string& variant_name) {
    return Error(ErrorKind::InferenceTimeout, "Variant " + variant_name + " timed out",
                 variant_name, "", {});
}

Error Error::invalid_candidate(const std::string& variant_name, const std::string& message) {
    return Error(ErrorKind::InvalidCandidate,
                 "Invalid candidate variant " + variant_name + ": " + message,
                 variant_name, "", {});
}

Error Error::unsupported_batch(const std::string& variant_type) {
    return Error(ErrorKind::UnsupportedVariantForBatchInference,
                 "Variant type " + variant_type + " does not support batch inference");
}

Error Error::unsupported_streaming(const std::string& variant_type) {
    return Error(ErrorKind::UnsupportedVariantForStreamingInference,
                 "Variant type " + variant_type + " does not support streaming inference");
}

Error Error::inference(const std::string& message, std::vector<Error> sub_errors) {
    return Error(ErrorKind::Inference, message, "", "", std::move(sub_errors));
}

Error Error::type_conversion(const std::string& message) {
    return Error(ErrorKind::TypeConversion, message);
}

Error Error::json_schema(const std::string& message) {
    return Error(ErrorKind::JsonSchema, message);
}

Error Error::config(const std::string& message) {
    return Error(ErrorKind::Config, message);
}

Error Error::cancelled(const std::string& what) {
    return Error(ErrorKind::Cancelled, what + " was cancelled");
}

} // namespace switchyard
