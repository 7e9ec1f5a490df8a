#pragma once
#include "cancellation.hpp"
#include "provider.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace switchyard {

// Streaming counterpart of ModelInferenceResult: the first chunk has
// arrived, the rest is still pending.
struct ModelStream {
    ProviderInferenceResponseChunk first_chunk;
    std::unique_ptr<ChunkStream<ProviderInferenceResponseChunk>> rest;
    std::string raw_request;
    std::string model_provider_name;
};

// A logical model served by an ordered fallback chain of providers
class ModelConfig {
public:
    // Appends to the routing order; throws Error(Config) on a duplicate name
    void add_provider(const std::string& name, std::unique_ptr<Provider> provider);

    const std::vector<std::string>& routing() const { return routing_; }

    // Tries providers in routing order and returns the first success.
    // Throws ModelProvidersExhausted carrying every provider's error.
    ModelInferenceResult infer(const ModelInferenceRequest& request,
                               const std::string& model_name,
                               const CancellationToken& cancel) const;

    // A provider counts as successful once its first chunk is in hand
    ModelStream infer_stream(const ModelInferenceRequest& request,
                             const CancellationToken& cancel) const;

private:
    std::vector<std::string> routing_;
    std::unordered_map<std::string, std::unique_ptr<Provider>> providers_;
};

class ModelTable {
public:
    void add(const std::string& name, std::shared_ptr<ModelConfig> model);

    // Null when absent
    std::shared_ptr<const ModelConfig> get(const std::string& name) const;

    bool contains(const std::string& name) const { return models_.count(name) > 0; }
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const ModelConfig>> models_;
};

} // namespace switchyard
