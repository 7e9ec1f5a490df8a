#pragma once
#include "context.hpp"
#include "stream.hpp"
#include "types.hpp"
#include "../json_schema.hpp"
#include <optional>
#include <string>
#include <vector>

namespace switchyard {

class FunctionConfig;

struct CollectChunksArgs {
    std::vector<InferenceResultChunk> value;
    std::string inference_id;
    std::string model_name;
    std::string model_provider_name;
    std::string raw_request;
    std::optional<std::string> raw_response; // replaces the newline-joined chunk payloads
    std::optional<std::string> system;
    std::vector<RequestMessage> input_messages;
    const JSONSchema* dynamic_output_schema = nullptr;
    bool cached = false;
};

// Folds a finished chunk sequence into one result with a single model
// inference record. Blocks keep the order in which their (kind, id) was
// first seen. Throws TypeConversion for an empty sequence or one that never
// carries content.
InferenceResult collect_chunks(const FunctionConfig& function, CollectChunksArgs args);

// Drains the stream and collects it; the stream's previous model inference
// results are appended after the collected call's record
InferenceResult collect_stream(InferenceResultStream stream, const FunctionConfig& function,
                               const InferenceContext& ctx);

} // namespace switchyard
