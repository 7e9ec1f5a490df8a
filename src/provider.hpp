#pragma once
#include "cancellation.hpp"
#include "inference/stream.hpp"
#include "inference/types.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace switchyard {

struct ProviderStream {
    ProviderInferenceResponseChunk first_chunk;
    std::unique_ptr<ChunkStream<ProviderInferenceResponseChunk>> rest;
    std::string raw_request;
};

// Abstract physical backend. One instance may serve many requests at once,
// so implementations must be safe to call concurrently.
class Provider {
public:
    virtual ~Provider() = default;

    // Throws on failure; should return early with Error::cancelled once
    // `cancel` fires.
    virtual ProviderInferenceResponse infer(const ModelInferenceRequest& request,
                                            const CancellationToken& cancel) = 0;

    // Default: run infer() and deliver the whole response as one chunk
    virtual ProviderStream infer_stream(const ModelInferenceRequest& request,
                                        const CancellationToken& cancel);

    virtual std::string provider_type() const = 0;
};

// Factory: create provider by type via the plugin registry
std::unique_ptr<Provider> create_provider(const std::string& type, const nlohmann::json& config);

} // namespace switchyard
