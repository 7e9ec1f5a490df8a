#pragma once
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace switchyard {

// Pull-based chunk source. next() returns nullopt at end of stream and
// throws switchyard::Error if the underlying source fails.
template <typename T>
class ChunkStream {
public:
    virtual ~ChunkStream() = default;
    virtual std::optional<T> next() = 0;
};

template <typename T>
class VectorChunkStream : public ChunkStream<T> {
public:
    explicit VectorChunkStream(std::vector<T> chunks) : chunks_(std::move(chunks)) {}

    std::optional<T> next() override {
        if (pos_ >= chunks_.size()) return std::nullopt;
        return std::move(chunks_[pos_++]);
    }

private:
    std::vector<T> chunks_;
    size_t pos_ = 0;
};

// Applies `fn` to each chunk of an inner stream
template <typename From, typename To>
class MappedChunkStream : public ChunkStream<To> {
public:
    MappedChunkStream(std::unique_ptr<ChunkStream<From>> inner, std::function<To(From)> fn)
        : inner_(std::move(inner)), fn_(std::move(fn)) {}

    std::optional<To> next() override {
        auto chunk = inner_->next();
        if (!chunk) return std::nullopt;
        return fn_(std::move(*chunk));
    }

private:
    std::unique_ptr<ChunkStream<From>> inner_;
    std::function<To(From)> fn_;
};

// Describes the model call behind a stream, for building provenance
// once the stream has been drained.
struct ModelUsedInfo {
    std::string model_name;
    std::string model_provider_name;
    std::string raw_request;
    std::optional<std::string> raw_response; // overrides the joined chunk payloads
    std::optional<std::string> system;
    std::vector<RequestMessage> input_messages;
    std::vector<ModelInferenceResult> previous_model_inference_results;
    bool cached = false;
};

struct InferenceResultStream {
    InferenceResultChunk first_chunk;
    std::unique_ptr<ChunkStream<InferenceResultChunk>> rest;
    ModelUsedInfo model_used_info;
};

// Presents a finished result as a single-chunk stream. The first model
// call becomes the stream's model; the rest travel as previous results.
InferenceResultStream stream_inference_from_non_stream(InferenceResult result);

} // namespace switchyard
