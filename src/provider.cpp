#include "provider.hpp"
#include "plugin.hpp"

namespace switchyard {

ProviderStream Provider::infer_stream(const ModelInferenceRequest& request,
                                      const CancellationToken& cancel) {
    ProviderInferenceResponse response = infer(request, cancel);

    ProviderInferenceResponseChunk chunk;
    chunk.content = content_to_chunks(std::move(response.output));
    chunk.usage = response.usage;
    chunk.raw_response = std::move(response.raw_response);
    chunk.latency = response.latency.response_time;
    chunk.finish_reason = response.finish_reason;

    ProviderStream stream;
    stream.first_chunk = std::move(chunk);
    stream.rest = std::make_unique<VectorChunkStream<ProviderInferenceResponseChunk>>(
        std::vector<ProviderInferenceResponseChunk>{});
    stream.raw_request = std::move(response.raw_request);
    return stream;
}

std::unique_ptr<Provider> create_provider(const std::string& type, const nlohmann::json& config) {
    return PluginRegistry::instance().create_provider(type, config);
}

} // namespace switchyard
