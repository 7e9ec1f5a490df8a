#include "types.hpp"
#include "../util.hpp"

namespace switchyard {

const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

std::optional<Role> role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    return std::nullopt;
}

const char* function_type_to_string(FunctionType type) {
    return type == FunctionType::Json ? "json" : "chat";
}

std::vector<ContentBlockChunk> content_to_chunks(std::vector<ContentBlock> blocks) {
    std::vector<ContentBlockChunk> chunks;
    chunks.reserve(blocks.size());
    size_t next_id = 0;
    for (auto& block : blocks) {
        if (auto* text = std::get_if<Text>(&block)) {
            chunks.push_back(TextChunk{std::to_string(next_id++), std::move(text->text)});
        } else if (auto* call = std::get_if<ToolCall>(&block)) {
            chunks.push_back(ToolCallChunk{call->id, call->name, std::move(call->arguments)});
        } else if (auto* thought = std::get_if<Thought>(&block)) {
            chunks.push_back(ThoughtChunk{std::to_string(next_id++), std::move(thought->text),
                                          std::move(thought->signature)});
        }
    }
    return chunks;
}

Usage& Usage::operator+=(const Usage& other) {
    input_tokens = saturating_add(input_tokens, other.input_tokens);
    output_tokens = saturating_add(output_tokens, other.output_tokens);
    return *this;
}

bool operator==(const Usage& a, const Usage& b) {
    return a.input_tokens == b.input_tokens && a.output_tokens == b.output_tokens;
}

const char* finish_reason_to_string(FinishReason reason) {
    switch (reason) {
        case FinishReason::Stop: return "stop";
        case FinishReason::Length: return "length";
        case FinishReason::ToolCall: return "tool_call";
        case FinishReason::ContentFilter: return "content_filter";
        case FinishReason::Unknown: return "unknown";
    }
    return "unknown";
}

std::optional<JsonMode> json_mode_from_string(const std::string& s) {
    if (s == "off") return JsonMode::Off;
    if (s == "on") return JsonMode::On;
    if (s == "strict") return JsonMode::Strict;
    if (s == "implicit_tool") return JsonMode::ImplicitTool;
    return std::nullopt;
}

Usage sum_usage(const std::vector<ModelInferenceResult>& results) {
    Usage total;
    for (const auto& r : results) {
        total += r.usage;
    }
    return total;
}

void InferenceResult::append_model_inference_results(std::vector<ModelInferenceResult> results) {
    for (auto& r : results) {
        usage += r.usage;
        model_inference_results.push_back(std::move(r));
    }
}

InferenceResultChunk InferenceResultChunk::from_provider(FunctionType type,
                                                         ProviderInferenceResponseChunk chunk) {
    InferenceResultChunk out;
    out.type = type;
    out.usage = chunk.usage;
    out.raw_response = std::move(chunk.raw_response);
    out.latency = chunk.latency;
    out.finish_reason = chunk.finish_reason;

    if (type == FunctionType::Chat) {
        out.content = std::move(chunk.content);
        return out;
    }

    // Json functions: text and tool-call arguments both carry the raw JSON
    // output (the latter for implicit-tool mode); thoughts pass through.
    for (auto& block : chunk.content) {
        if (auto* text = std::get_if<TextChunk>(&block)) {
            out.raw = out.raw.value_or("") + text->text;
        } else if (auto* call = std::get_if<ToolCallChunk>(&block)) {
            out.raw = out.raw.value_or("") + call->raw_arguments;
        } else if (auto* thought = std::get_if<ThoughtChunk>(&block)) {
            if (thought->text) {
                out.thought = out.thought.value_or("") + *thought->text;
            }
        }
    }
    return out;
}

} // namespace switchyard
