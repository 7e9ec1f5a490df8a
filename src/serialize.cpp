#include "serialize.hpp"

namespace switchyard {

using ojson = nlohmann::ordered_json;

ojson content_to_json(const ContentBlock& block) {
    ojson j;
    if (auto* text = std::get_if<Text>(&block)) {
        j["type"] = "text";
        j["text"] = text->text;
    } else if (auto* call = std::get_if<ToolCall>(&block)) {
        j["type"] = "tool_call";
        j["id"] = call->id;
        j["name"] = call->name;
        j["arguments"] = call->arguments;
    } else if (auto* thought = std::get_if<Thought>(&block)) {
        j["type"] = "thought";
        j["text"] = thought->text ? ojson(*thought->text) : ojson(nullptr);
        j["signature"] = thought->signature ? ojson(*thought->signature) : ojson(nullptr);
    }
    return j;
}

ojson content_to_json(const std::vector<ContentBlock>& blocks) {
    ojson arr = ojson::array();
    for (const auto& block : blocks) {
        arr.push_back(content_to_json(block));
    }
    return arr;
}

std::string serialize_content(const std::vector<ContentBlock>& blocks) {
    return content_to_json(blocks).dump();
}

ojson usage_to_json(const Usage& usage) {
    ojson j;
    j["input_tokens"] = usage.input_tokens;
    j["output_tokens"] = usage.output_tokens;
    return j;
}

namespace {

ojson model_inference_to_json(const ModelInferenceResult& r) {
    ojson j;
    j["id"] = r.id;
    j["model_name"] = r.model_name;
    j["model_provider_name"] = r.model_provider_name;
    j["output"] = content_to_json(r.output);
    j["raw_request"] = r.raw_request;
    j["raw_response"] = r.raw_response;
    j["usage"] = usage_to_json(r.usage);
    j["response_time_ms"] = r.latency.response_time.count();
    if (r.latency.kind == Latency::Kind::Streaming) {
        j["ttft_ms"] = r.latency.ttft.count();
    }
    j["cached"] = r.cached;
    return j;
}

} // namespace

ojson result_to_json(const InferenceResult& result) {
    ojson j;
    j["inference_id"] = result.inference_id;
    if (result.type == FunctionType::Chat) {
        j["content"] = content_to_json(result.content);
    } else {
        ojson output;
        output["raw"] = result.json_output.raw ? ojson(*result.json_output.raw) : ojson(nullptr);
        output["parsed"] = result.json_output.parsed
                               ? ojson::parse(result.json_output.parsed->dump())
                               : ojson(nullptr);
        if (!result.json_output.auxiliary_content.empty()) {
            output["auxiliary_content"] = content_to_json(result.json_output.auxiliary_content);
        }
        j["output"] = output;
    }
    j["usage"] = usage_to_json(result.usage);
    if (result.finish_reason) {
        j["finish_reason"] = finish_reason_to_string(*result.finish_reason);
    }
    j["model_inferences"] = ojson::array();
    for (const auto& r : result.model_inference_results) {
        j["model_inferences"].push_back(model_inference_to_json(r));
    }
    return j;
}

ojson chunk_to_json(const InferenceResultChunk& chunk) {
    ojson j;
    if (chunk.type == FunctionType::Chat) {
        ojson content = ojson::array();
        for (const auto& block : chunk.content) {
            ojson b;
            if (auto* text = std::get_if<TextChunk>(&block)) {
                b["type"] = "text";
                b["id"] = text->id;
                b["text"] = text->text;
            } else if (auto* call = std::get_if<ToolCallChunk>(&block)) {
                b["type"] = "tool_call";
                b["id"] = call->id;
                b["raw_name"] = call->raw_name ? ojson(*call->raw_name) : ojson(nullptr);
                b["raw_arguments"] = call->raw_arguments;
            } else if (auto* thought = std::get_if<ThoughtChunk>(&block)) {
                b["type"] = "thought";
                b["id"] = thought->id;
                b["text"] = thought->text ? ojson(*thought->text) : ojson(nullptr);
                b["signature"] = thought->signature ? ojson(*thought->signature) : ojson(nullptr);
            }
            content.push_back(b);
        }
        j["content"] = content;
    } else {
        j["raw"] = chunk.raw ? ojson(*chunk.raw) : ojson(nullptr);
    }
    if (chunk.usage) j["usage"] = usage_to_json(*chunk.usage);
    if (chunk.finish_reason) j["finish_reason"] = finish_reason_to_string(*chunk.finish_reason);
    return j;
}

ojson error_to_json(const Error& error) {
    ojson j;
    j["kind"] = error_kind_to_string(error.kind());
    j["message"] = error.message();
    if (!error.variant_name().empty()) j["variant_name"] = error.variant_name();
    if (!error.source().empty()) j["source"] = error.source();
    if (!error.sub_errors().empty()) {
        j["errors"] = ojson::array();
        for (const auto& sub : error.sub_errors()) {
            j["errors"].push_back(error_to_json(sub));
        }
    }
    return j;
}

Input input_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("messages") || !j["messages"].is_array()) {
        throw Error::invalid_message("Input must be an object with a \"messages\" array");
    }
    Input input;
    for (const auto& m : j["messages"]) {
        if (!m.is_object() || !m.contains("role") || !m["role"].is_string() ||
            !m.contains("content")) {
            throw Error::invalid_message("Input message must have a role and content: " +
                                         m.dump());
        }
        auto role = role_from_string(m["role"].get<std::string>());
        if (!role) {
            throw Error::invalid_message("Unknown role: " + m["role"].get<std::string>());
        }
        input.messages.push_back(InputMessage{*role, m["content"]});
    }
    return input;
}

} // namespace switchyard
