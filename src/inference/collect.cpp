#include "collect.hpp"
#include "../error.hpp"
#include "../function.hpp"
#include "../ordered_map.hpp"
#include "../util.hpp"

namespace switchyard {

namespace {

enum class BlockKind { Text, ToolCall, Thought };

using BlockKey = std::pair<BlockKind, std::string>;
using BlockMap = OrderedMap<BlockKey, ContentBlock>;

void append_text(BlockMap& blocks, const std::string& id, const std::string& text) {
    auto [block, inserted] = blocks.try_emplace({BlockKind::Text, id}, Text{text});
    if (!inserted) std::get<Text>(*block).text += text;
}

void append_thought(BlockMap& blocks, const std::string& id,
                    const std::optional<std::string>& text,
                    const std::optional<std::string>& signature) {
    auto [block, inserted] = blocks.try_emplace({BlockKind::Thought, id}, Thought{text, signature});
    if (inserted) return;
    auto& thought = std::get<Thought>(*block);
    if (text) thought.text = thought.text.value_or("") + *text;
    if (signature) thought.signature = thought.signature.value_or("") + *signature;
}

void append_tool_call(BlockMap& blocks, const ToolCallChunk& chunk) {
    auto [block, inserted] = blocks.try_emplace(
        {BlockKind::ToolCall, chunk.id},
        ToolCall{chunk.id, chunk.raw_name.value_or(""), chunk.raw_arguments});
    if (inserted) return;
    auto& call = std::get<ToolCall>(*block);
    if (chunk.raw_name) call.name += *chunk.raw_name;
    call.arguments += chunk.raw_arguments;
}

bool has_text(const std::optional<std::string>& s) {
    return s && !s->empty();
}

// Merges one chunk's content; returns true if it contributed anything
bool merge_chunk(BlockMap& blocks, const InferenceResultChunk& chunk) {
    bool contributed = false;
    if (chunk.type == FunctionType::Chat) {
        for (const auto& fragment : chunk.content) {
            if (auto* text = std::get_if<TextChunk>(&fragment)) {
                if (text->text.empty()) continue;
                append_text(blocks, text->id, text->text);
                contributed = true;
            } else if (auto* call = std::get_if<ToolCallChunk>(&fragment)) {
                // An empty fragment still claims the call's position
                append_tool_call(blocks, *call);
                if (has_text(call->raw_name) || !call->raw_arguments.empty()) contributed = true;
            } else if (auto* thought = std::get_if<ThoughtChunk>(&fragment)) {
                if (!has_text(thought->text) && !has_text(thought->signature)) continue;
                append_thought(blocks, thought->id, thought->text, thought->signature);
                contributed = true;
            }
        }
        return contributed;
    }

    // Json responses have one implicit text block and one implicit thought
    // block, both under the empty id
    if (has_text(chunk.raw)) {
        append_text(blocks, "", *chunk.raw);
        contributed = true;
    }
    if (has_text(chunk.thought)) {
        append_thought(blocks, "", chunk.thought, std::nullopt);
        contributed = true;
    }
    return contributed;
}

} // namespace

InferenceResult collect_chunks(const FunctionConfig& function, CollectChunksArgs args) {
    if (args.value.empty()) {
        throw Error::type_conversion(
            "Attempted to create an InferenceResult from an empty response chunk vector");
    }

    BlockMap blocks;
    Usage usage;
    std::optional<std::chrono::milliseconds> ttft;
    std::optional<FinishReason> finish_reason;
    std::vector<std::string> raw_parts;
    raw_parts.reserve(args.value.size());

    for (const auto& chunk : args.value) {
        if (chunk.usage) usage += *chunk.usage;
        if (chunk.finish_reason) finish_reason = chunk.finish_reason;
        raw_parts.push_back(chunk.raw_response);
        if (merge_chunk(blocks, chunk) && !ttft) {
            ttft = chunk.latency;
        }
    }
    if (!ttft) {
        throw Error::type_conversion(
            "Never got TTFT because there was never content in the response.");
    }

    std::vector<ContentBlock> content;
    content.reserve(blocks.size());
    for (auto& entry : blocks) {
        content.push_back(std::move(entry.second));
    }

    ModelInferenceResult record;
    record.id = generate_inference_id();
    record.model_name = std::move(args.model_name);
    record.model_provider_name = std::move(args.model_provider_name);
    record.output = content;
    record.system = std::move(args.system);
    record.input_messages = std::move(args.input_messages);
    record.raw_request = std::move(args.raw_request);
    record.raw_response = args.raw_response ? std::move(*args.raw_response) : join(raw_parts, "\n");
    record.usage = usage;
    record.latency.kind = Latency::Kind::Streaming;
    record.latency.ttft = *ttft;
    record.latency.response_time = args.value.back().latency;
    record.finish_reason = finish_reason;
    record.cached = args.cached;

    return function.prepare_response(args.inference_id, std::move(content), {std::move(record)},
                                     args.dynamic_output_schema, finish_reason);
}

InferenceResult collect_stream(InferenceResultStream stream, const FunctionConfig& function,
                               const InferenceContext& ctx) {
    CollectChunksArgs args;
    args.value.push_back(std::move(stream.first_chunk));
    if (stream.rest) {
        while (auto chunk = stream.rest->next()) {
            args.value.push_back(std::move(*chunk));
        }
    }
    ModelUsedInfo& info = stream.model_used_info;
    args.inference_id = ctx.inference_id;
    args.model_name = info.model_name;
    args.model_provider_name = info.model_provider_name;
    args.raw_request = info.raw_request;
    args.raw_response = info.raw_response;
    args.system = info.system;
    args.input_messages = info.input_messages;
    args.dynamic_output_schema = ctx.dynamic_output_schema;
    args.cached = info.cached;

    InferenceResult result = collect_chunks(function, std::move(args));
    result.append_model_inference_results(std::move(info.previous_model_inference_results));
    return result;
}

} // namespace switchyard
