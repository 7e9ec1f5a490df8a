#include "model.hpp"
#include "error.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace switchyard {

namespace {

// Records a provider failure; cancellation is not a provider failure and
// propagates unchanged.
void record_failure(const std::string& provider_name, std::vector<Error>& errors) {
    try {
        throw;
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        std::cerr << "[model] Provider " << provider_name << " failed: " << e.what() << '\n';
        errors.push_back(e.with_source(provider_name));
    } catch (const std::exception& e) {
        std::cerr << "[model] Provider " << provider_name << " failed: " << e.what() << '\n';
        errors.push_back(Error::inference_client(provider_name, e.what()));
    }
}

} // namespace

void ModelConfig::add_provider(const std::string& name, std::unique_ptr<Provider> provider) {
    if (providers_.count(name) > 0) {
        throw Error::config("Duplicate provider name: " + name);
    }
    routing_.push_back(name);
    providers_[name] = std::move(provider);
}

ModelInferenceResult ModelConfig::infer(const ModelInferenceRequest& request,
                                        const std::string& model_name,
                                        const CancellationToken& cancel) const {
    std::vector<Error> provider_errors;
    for (const auto& name : routing_) {
        cancel.throw_if_cancelled("Inference for model " + model_name);
        try {
            ProviderInferenceResponse response = providers_.at(name)->infer(request, cancel);

            ModelInferenceResult result;
            result.id = generate_inference_id();
            result.model_name = model_name;
            result.model_provider_name = name;
            result.output = std::move(response.output);
            result.system = request.system;
            result.input_messages = request.messages;
            result.raw_request = std::move(response.raw_request);
            result.raw_response = std::move(response.raw_response);
            result.usage = response.usage;
            result.latency = response.latency;
            result.finish_reason = response.finish_reason;
            return result;
        } catch (const std::exception&) {
            record_failure(name, provider_errors);
        }
    }
    throw Error::model_providers_exhausted(std::move(provider_errors));
}

ModelStream ModelConfig::infer_stream(const ModelInferenceRequest& request,
                                      const CancellationToken& cancel) const {
    std::vector<Error> provider_errors;
    for (const auto& name : routing_) {
        cancel.throw_if_cancelled("Streaming inference");
        try {
            ProviderStream stream = providers_.at(name)->infer_stream(request, cancel);

            ModelStream out;
            out.first_chunk = std::move(stream.first_chunk);
            out.rest = std::move(stream.rest);
            out.raw_request = std::move(stream.raw_request);
            out.model_provider_name = name;
            return out;
        } catch (const std::exception&) {
            record_failure(name, provider_errors);
        }
    }
    throw Error::model_providers_exhausted(std::move(provider_errors));
}

void ModelTable::add(const std::string& name, std::shared_ptr<ModelConfig> model) {
    models_[name] = std::move(model);
}

std::shared_ptr<const ModelConfig> ModelTable::get(const std::string& name) const {
    auto it = models_.find(name);
    return it == models_.end() ? nullptr : it->second;
}

std::vector<std::string> ModelTable::names() const {
    std::vector<std::string> names;
    names.reserve(models_.size());
    for (const auto& [name, _] : models_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace switchyard
