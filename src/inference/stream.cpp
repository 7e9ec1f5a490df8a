#include "stream.hpp"
#include "../error.hpp"

namespace switchyard {

InferenceResultStream stream_inference_from_non_stream(InferenceResult result) {
    if (result.model_inference_results.empty()) {
        throw Error::inference("Cannot stream an inference result with no model inference results");
    }
    ModelInferenceResult first = std::move(result.model_inference_results.front());
    std::vector<ModelInferenceResult> previous(
        std::make_move_iterator(result.model_inference_results.begin() + 1),
        std::make_move_iterator(result.model_inference_results.end()));

    InferenceResultChunk chunk;
    chunk.type = result.type;
    chunk.usage = first.usage;
    chunk.raw_response = first.raw_response;
    chunk.latency = first.latency.response_time;
    chunk.finish_reason = result.finish_reason;

    if (result.type == FunctionType::Chat) {
        chunk.content = content_to_chunks(std::move(result.content));
    } else {
        chunk.raw = std::move(result.json_output.raw);
    }

    InferenceResultStream stream;
    stream.first_chunk = std::move(chunk);
    stream.rest = std::make_unique<VectorChunkStream<InferenceResultChunk>>(
        std::vector<InferenceResultChunk>{});
    stream.model_used_info.model_name = first.model_name;
    stream.model_used_info.model_provider_name = first.model_provider_name;
    stream.model_used_info.raw_request = first.raw_request;
    stream.model_used_info.raw_response = first.raw_response;
    stream.model_used_info.system = first.system;
    stream.model_used_info.input_messages = first.input_messages;
    stream.model_used_info.previous_model_inference_results = std::move(previous);
    stream.model_used_info.cached = first.cached;
    return stream;
}

} // namespace switchyard
