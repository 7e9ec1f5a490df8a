#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace switchyard {

enum class Role { System, User, Assistant };

const char* role_to_string(Role role);
std::optional<Role> role_from_string(const std::string& s);

enum class FunctionType { Chat, Json };

const char* function_type_to_string(FunctionType type);

// Caller-supplied message. `content` is a plain string, or the argument
// object for the variant's template for this role.
struct InputMessage {
    Role role;
    nlohmann::json content;
};

struct Input {
    std::vector<InputMessage> messages;
};

// ── Content blocks ───────────────────────────────────────────────

struct Text {
    std::string text;
};

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string
};

struct Thought {
    std::optional<std::string> text;
    std::optional<std::string> signature;
};

using ContentBlock = std::variant<Text, ToolCall, Thought>;

struct RequestMessage {
    Role role;
    std::vector<ContentBlock> content;
};

// Streaming fragments. Fragments sharing a (kind, id) belong to one block.
struct TextChunk {
    std::string id;
    std::string text;
};

struct ToolCallChunk {
    std::string id;
    std::optional<std::string> raw_name;
    std::string raw_arguments;
};

struct ThoughtChunk {
    std::string id;
    std::optional<std::string> text;
    std::optional<std::string> signature;
};

using ContentBlockChunk = std::variant<TextChunk, ToolCallChunk, ThoughtChunk>;

// Finished blocks as one fragment each. Text and thought fragments are
// numbered "0", "1", ... in order; tool calls keep their own id.
std::vector<ContentBlockChunk> content_to_chunks(std::vector<ContentBlock> blocks);

// ── Accounting ───────────────────────────────────────────────────

struct Usage {
    uint32_t input_tokens = 0;
    uint32_t output_tokens = 0;

    // Saturates at UINT32_MAX per field
    Usage& operator+=(const Usage& other);
};

bool operator==(const Usage& a, const Usage& b);

enum class FinishReason { Stop, Length, ToolCall, ContentFilter, Unknown };

const char* finish_reason_to_string(FinishReason reason);

struct Latency {
    enum class Kind { NonStreaming, Streaming };

    Kind kind = Kind::NonStreaming;
    std::chrono::milliseconds response_time{0};
    std::chrono::milliseconds ttft{0}; // Streaming only
};

// ── Requests ─────────────────────────────────────────────────────

struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json parameters; // JSON schema for parameters
    bool strict = false;
};

enum class JsonMode { Off, On, Strict, ImplicitTool };

std::optional<JsonMode> json_mode_from_string(const std::string& s);

struct ModelInferenceRequest {
    std::vector<RequestMessage> messages;
    std::optional<std::string> system;
    std::vector<ToolSpec> tools;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<double> presence_penalty;
    std::optional<double> frequency_penalty;
    std::optional<uint32_t> max_tokens;
    std::optional<uint32_t> seed;
    bool stream = false;
    JsonMode json_mode = JsonMode::Off;
    FunctionType function_type = FunctionType::Chat;
    std::optional<nlohmann::json> output_schema;
};

// ── Provider responses ───────────────────────────────────────────

struct ProviderInferenceResponse {
    std::vector<ContentBlock> output;
    std::string raw_request;
    std::string raw_response;
    Usage usage;
    Latency latency;
    std::optional<FinishReason> finish_reason;
};

struct ProviderInferenceResponseChunk {
    std::vector<ContentBlockChunk> content;
    std::optional<Usage> usage;
    std::string raw_response;
    std::chrono::milliseconds latency{0}; // since request start
    std::optional<FinishReason> finish_reason;
};

// Record of one physical model call, kept for provenance
struct ModelInferenceResult {
    std::string id;
    std::string model_name;
    std::string model_provider_name;
    std::vector<ContentBlock> output;
    std::optional<std::string> system;
    std::vector<RequestMessage> input_messages;
    std::string raw_request;
    std::string raw_response;
    Usage usage;
    Latency latency;
    std::optional<FinishReason> finish_reason;
    bool cached = false;
};

Usage sum_usage(const std::vector<ModelInferenceResult>& results);

// ── Inference results ────────────────────────────────────────────

struct JsonInferenceOutput {
    std::optional<std::string> raw;
    std::optional<nlohmann::json> parsed;
    // Blocks other than the one carrying the JSON, in model order
    std::vector<ContentBlock> auxiliary_content;
    // Position the JSON block held among the model's output blocks
    std::optional<size_t> json_block_index;
};

struct InferenceResult {
    FunctionType type = FunctionType::Chat;
    std::string inference_id;
    std::vector<ContentBlock> content;           // Chat
    JsonInferenceOutput json_output;             // Json
    std::optional<nlohmann::json> output_schema; // Json
    Usage usage;
    std::vector<ModelInferenceResult> model_inference_results;
    std::optional<FinishReason> finish_reason;
    std::optional<std::string> original_response;

    // Appends provenance records and adds their usage to `usage`
    void append_model_inference_results(std::vector<ModelInferenceResult> results);
};

// One streamed fragment, already shaped for the function type
struct InferenceResultChunk {
    FunctionType type = FunctionType::Chat;
    std::vector<ContentBlockChunk> content; // Chat
    std::optional<std::string> raw;         // Json
    std::optional<std::string> thought;     // Json
    std::optional<Usage> usage;
    std::string raw_response;
    std::chrono::milliseconds latency{0};
    std::optional<FinishReason> finish_reason;

    static InferenceResultChunk from_provider(FunctionType type,
                                              ProviderInferenceResponseChunk chunk);
};

} // namespace switchyard
