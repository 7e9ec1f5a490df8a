#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace switchyard {

enum class ErrorKind {
    InvalidTemplatePath,
    InvalidMessage,
    Templating,
    ModelNotFound,
    ModelProvidersExhausted,
    InferenceClient,
    UnknownCandidate,
    InferenceTimeout,
    InvalidCandidate,
    UnsupportedVariantForBatchInference,
    UnsupportedVariantForStreamingInference,
    Inference,
    TypeConversion,
    JsonSchema,
    Config,
    Cancelled,
};

const char* error_kind_to_string(ErrorKind kind);

// Single exception type for the gateway. Aggregate failures keep every
// cause in sub_errors(), each tagged with the provider or candidate it
// came from.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const std::string& variant_name() const { return variant_name_; }
    const std::string& source() const { return source_; }
    const std::vector<Error>& sub_errors() const { return sub_errors_; }

    // Copy of this error tagged with the provider/candidate that produced it
    Error with_source(const std::string& source) const;

    static Error invalid_template_path(const std::string& detail);
    static Error invalid_message(const std::string& message);
    static Error templating(const std::string& template_name, const std::string& message);
    static Error model_not_found(const std::string& model_name);
    static Error model_providers_exhausted(std::vector<Error> provider_errors);
    static Error inference_client(const std::string& provider_name, const std::string& message);
    static Error unknown_candidate(const std::string& candidate_name);
    static Error inference_timeout(const std::string& variant_name);
    static Error invalid_candidate(const std::string& variant_name, const std::string& message);
    static Error unsupported_batch(const std::string& variant_type);
    static Error unsupported_streaming(const std::string& variant_type);
    static Error inference(const std::string& message, std::vector<Error> sub_errors = {});
    static Error type_conversion(const std::string& message);
    static Error json_schema(const std::string& message);
    static Error config(const std::string& message);
    static Error cancelled(const std::string& what);

private:
    Error(ErrorKind kind, const std::string& message, std::string variant_name,
          std::string source, std::vector<Error> sub_errors);

    static std::string describe(const std::string& message, const std::vector<Error>& subs);

    ErrorKind kind_;
    std::string message_;
    std::string variant_name_;
    std::string source_;
    std::vector<Error> sub_errors_;
};

} // namespace switchyard
