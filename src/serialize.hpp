#pragma once
#include "error.hpp"
#include "inference/types.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchyard {

// Content blocks as {"type": "text", "text": ...} etc., keys in fixed order
nlohmann::ordered_json content_to_json(const ContentBlock& block);
nlohmann::ordered_json content_to_json(const std::vector<ContentBlock>& blocks);

// Compact serialization of a chat output, as shown to judges and fusers
std::string serialize_content(const std::vector<ContentBlock>& blocks);

nlohmann::ordered_json usage_to_json(const Usage& usage);
nlohmann::ordered_json result_to_json(const InferenceResult& result);
nlohmann::ordered_json chunk_to_json(const InferenceResultChunk& chunk);
nlohmann::ordered_json error_to_json(const Error& error);

// Parses {"messages": [{"role": ..., "content": ...}, ...]}.
// Throws Error(InvalidMessage) on malformed input.
Input input_from_json(const nlohmann::json& j);

} // namespace switchyard
