#include <catch2/catch.hpp>
#include "function.hpp"
#include "inference/collect.hpp"
#include <limits>

using namespace switchyard;
using namespace std::chrono_literals;

static InferenceResultChunk chat_chunk(std::vector<ContentBlockChunk> content,
                                       std::chrono::milliseconds latency,
                                       const std::string& raw = "") {
    InferenceResultChunk chunk;
    chunk.type = FunctionType::Chat;
    chunk.content = std::move(content);
    chunk.latency = latency;
    chunk.raw_response = raw;
    return chunk;
}

static CollectChunksArgs args_with(std::vector<InferenceResultChunk> chunks) {
    CollectChunksArgs args;
    args.value = std::move(chunks);
    args.inference_id = "inf-1";
    args.model_name = "model";
    args.model_provider_name = "provider";
    args.raw_request = "raw-request";
    return args;
}

static ErrorKind collect_error(const FunctionConfig& function, CollectChunksArgs args) {
    try {
        collect_chunks(function, std::move(args));
    } catch (const Error& e) {
        return e.kind();
    }
    return ErrorKind::Config; // sentinel: collection succeeded
}

// ── Empty input ──────────────────────────────────────────────────

TEST_CASE("collect_chunks: empty sequence is a TypeConversion error", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    REQUIRE(collect_error(chat, args_with({})) == ErrorKind::TypeConversion);
}

TEST_CASE("collect_chunks: chunks without content never set TTFT", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto usage_only = chat_chunk({}, 5ms);
    usage_only.usage = Usage{10, 1};
    auto empty_text = chat_chunk({TextChunk{"0", ""}}, 6ms);
    try {
        collect_chunks(chat, args_with({usage_only, empty_text}));
        FAIL("expected throw");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::TypeConversion);
        REQUIRE(e.message() ==
                "Never got TTFT because there was never content in the response.");
    }
}

// ── Merging by id ────────────────────────────────────────────────

TEST_CASE("collect_chunks: text fragments merge by id in first-seen order", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({TextChunk{"1", "Hello"}}, 10ms),
        chat_chunk({TextChunk{"2", "Goodbye"}}, 20ms),
        chat_chunk({TextChunk{"1", " world"}}, 30ms),
    }));

    REQUIRE(result.content.size() == 2);
    REQUIRE(std::get<Text>(result.content[0]).text == "Hello world");
    REQUIRE(std::get<Text>(result.content[1]).text == "Goodbye");
    REQUIRE(result.inference_id == "inf-1");
}

TEST_CASE("collect_chunks: tool call name and arguments accumulate", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({ToolCallChunk{"123", std::string("get_temp"), "{\"loc"}}, 10ms),
        chat_chunk({ToolCallChunk{"123", std::nullopt, "ation\":"}}, 11ms),
        chat_chunk({ToolCallChunk{"123", std::string("erature"), "\"NYC\"}"}}, 12ms),
    }));

    REQUIRE(result.content.size() == 1);
    const auto& call = std::get<ToolCall>(result.content[0]);
    REQUIRE(call.id == "123");
    REQUIRE(call.name == "get_temperature");
    REQUIRE(call.arguments == "{\"location\":\"NYC\"}");
}

TEST_CASE("collect_chunks: same id in different kinds stays separate", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({ThoughtChunk{"0", std::string("think"), std::nullopt},
                    TextChunk{"0", "say"}}, 10ms),
        chat_chunk({ThoughtChunk{"0", std::string("ing"), std::string("sig")},
                    TextChunk{"0", "ing"}}, 11ms),
    }));

    REQUIRE(result.content.size() == 2);
    const auto& thought = std::get<Thought>(result.content[0]);
    REQUIRE(thought.text == std::optional<std::string>("thinking"));
    REQUIRE(thought.signature == std::optional<std::string>("sig"));
    REQUIRE(std::get<Text>(result.content[1]).text == "saying");
}

TEST_CASE("collect_chunks: text keeps its slot around an interleaved thought", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({TextChunk{"0", "Hello "}}, 10ms),
        chat_chunk({ThoughtChunk{"0", std::string("Something"), std::nullopt}}, 11ms),
        chat_chunk({TextChunk{"0", "World"}}, 12ms),
    }));

    REQUIRE(result.content.size() == 2);
    REQUIRE(std::get<Text>(result.content[0]).text == "Hello World");
    REQUIRE(std::get<Thought>(result.content[1]).text == std::optional<std::string>("Something"));
}

TEST_CASE("collect_chunks: tool call name split across chunks", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({ToolCallChunk{"a", std::string("get_"), "{\"city\":"}}, 10ms),
        chat_chunk({ToolCallChunk{"a", std::string("weather"), "\"SF\"}"}}, 11ms),
    }));

    REQUIRE(result.content.size() == 1);
    const auto& call = std::get<ToolCall>(result.content[0]);
    REQUIRE(call.name == "get_weather");
    REQUIRE(call.arguments == "{\"city\":\"SF\"}");
}

TEST_CASE("collect_chunks: thought signature without text", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({ThoughtChunk{"t", std::nullopt, std::string("abc")}}, 10ms),
        chat_chunk({ThoughtChunk{"t", std::nullopt, std::string("def")}}, 11ms),
    }));
    const auto& thought = std::get<Thought>(result.content[0]);
    REQUIRE_FALSE(thought.text.has_value());
    REQUIRE(thought.signature == std::optional<std::string>("abcdef"));
}

// ── Latency ──────────────────────────────────────────────────────

TEST_CASE("collect_chunks: TTFT is the first chunk with content", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({}, 100ms),
        chat_chunk({TextChunk{"0", ""}}, 150ms),
        chat_chunk({TextChunk{"0", "x"}}, 200ms),
        chat_chunk({TextChunk{"0", "y"}}, 250ms),
        chat_chunk({}, 400ms),
    }));

    REQUIRE(result.model_inference_results.size() == 1);
    const auto& latency = result.model_inference_results[0].latency;
    REQUIRE(latency.kind == Latency::Kind::Streaming);
    REQUIRE(latency.ttft == 200ms);
    REQUIRE(latency.response_time == 400ms);
}

TEST_CASE("collect_chunks: an empty tool call fragment holds its position", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({ToolCallChunk{"a", std::nullopt, ""}}, 10ms),
        chat_chunk({TextChunk{"0", "x"}}, 20ms),
        chat_chunk({ToolCallChunk{"a", std::string("f"), "{}"}}, 30ms),
    }));

    REQUIRE(result.content.size() == 2);
    const auto& call = std::get<ToolCall>(result.content[0]);
    REQUIRE(call.id == "a");
    REQUIRE(call.name == "f");
    REQUIRE(call.arguments == "{}");
    REQUIRE(std::get<Text>(result.content[1]).text == "x");
    REQUIRE(result.model_inference_results[0].latency.ttft == 20ms);
}

// ── Usage and finish reason ──────────────────────────────────────

TEST_CASE("collect_chunks: usage sums across chunks", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto a = chat_chunk({TextChunk{"0", "a"}}, 1ms);
    a.usage = Usage{3, 1};
    auto b = chat_chunk({TextChunk{"0", "b"}}, 2ms);
    auto c = chat_chunk({}, 3ms);
    c.usage = Usage{0, 4};

    auto result = collect_chunks(chat, args_with({a, b, c}));
    REQUIRE(result.usage == Usage{3, 5});
    REQUIRE(result.model_inference_results[0].usage == Usage{3, 5});
}

TEST_CASE("collect_chunks: usage saturates instead of wrapping", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    uint32_t max = std::numeric_limits<uint32_t>::max();
    auto a = chat_chunk({TextChunk{"0", "a"}}, 1ms);
    a.usage = Usage{max - 1, 5};
    auto b = chat_chunk({TextChunk{"0", "b"}}, 2ms);
    b.usage = Usage{10, 5};

    auto result = collect_chunks(chat, args_with({a, b}));
    REQUIRE(result.usage.input_tokens == max);
    REQUIRE(result.usage.output_tokens == 10);
}

TEST_CASE("collect_chunks: last finish reason wins", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto a = chat_chunk({TextChunk{"0", "a"}}, 1ms);
    a.finish_reason = FinishReason::Length;
    auto b = chat_chunk({TextChunk{"0", "b"}}, 2ms);
    auto c = chat_chunk({}, 3ms);
    c.finish_reason = FinishReason::Stop;

    auto result = collect_chunks(chat, args_with({a, b, c}));
    REQUIRE(result.finish_reason == std::optional<FinishReason>(FinishReason::Stop));
    REQUIRE(result.model_inference_results[0].finish_reason ==
            std::optional<FinishReason>(FinishReason::Stop));
}

// ── Provenance ───────────────────────────────────────────────────

TEST_CASE("collect_chunks: raw response joins chunk payloads", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto result = collect_chunks(chat, args_with({
        chat_chunk({TextChunk{"0", "a"}}, 1ms, "{\"d\":\"a\"}"),
        chat_chunk({TextChunk{"0", "b"}}, 2ms, "{\"d\":\"b\"}"),
    }));
    const auto& record = result.model_inference_results[0];
    REQUIRE(record.raw_response == "{\"d\":\"a\"}\n{\"d\":\"b\"}");
    REQUIRE(record.raw_request == "raw-request");
    REQUIRE(record.model_name == "model");
    REQUIRE(record.model_provider_name == "provider");
}

TEST_CASE("collect_chunks: explicit raw response overrides the join", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");
    auto args = args_with({chat_chunk({TextChunk{"0", "a"}}, 1ms, "piece")});
    args.raw_response = "original provider response";
    args.cached = true;
    auto result = collect_chunks(chat, std::move(args));
    REQUIRE(result.model_inference_results[0].raw_response == "original provider response");
    REQUIRE(result.model_inference_results[0].cached);
}

// ── Json functions ───────────────────────────────────────────────

TEST_CASE("collect_chunks: json chunks build raw and parsed output", "[collect]") {
    FunctionConfig json_fn(FunctionType::Json, "extract");
    json_fn.set_output_schema(JSONSchema::from_value(nlohmann::json::parse(
        R"({"type": "object", "required": ["answer"]})")));

    InferenceResultChunk a;
    a.type = FunctionType::Json;
    a.raw = "{\"answer\":";
    a.latency = 5ms;
    InferenceResultChunk b;
    b.type = FunctionType::Json;
    b.raw = "\"Hello\"}";
    b.thought = "considering";
    b.latency = 6ms;

    auto result = collect_chunks(json_fn, args_with({a, b}));
    REQUIRE(result.type == FunctionType::Json);
    REQUIRE(result.json_output.raw == std::optional<std::string>("{\"answer\":\"Hello\"}"));
    REQUIRE(result.json_output.parsed.has_value());
    REQUIRE((*result.json_output.parsed)["answer"] == "Hello");
    REQUIRE(result.output_schema.has_value());
}

TEST_CASE("collect_chunks: json output failing the schema is left unparsed", "[collect]") {
    FunctionConfig json_fn(FunctionType::Json, "extract");
    json_fn.set_output_schema(JSONSchema::from_value(nlohmann::json::parse(
        R"({"type": "object", "required": ["answer"]})")));

    InferenceResultChunk a;
    a.type = FunctionType::Json;
    a.raw = "{\"other\": 1}";
    a.latency = 5ms;

    auto result = collect_chunks(json_fn, args_with({a}));
    REQUIRE(result.json_output.raw.has_value());
    REQUIRE_FALSE(result.json_output.parsed.has_value());
}

// ── collect_stream ───────────────────────────────────────────────

TEST_CASE("collect_stream: drains the stream and appends earlier records", "[collect]") {
    FunctionConfig chat(FunctionType::Chat, "chat");

    InferenceResultStream stream;
    stream.first_chunk = chat_chunk({TextChunk{"0", "fused "}}, 10ms);
    auto last = chat_chunk({TextChunk{"0", "answer"}}, 20ms);
    last.usage = Usage{4, 2};
    stream.rest = std::make_unique<VectorChunkStream<InferenceResultChunk>>(
        std::vector<InferenceResultChunk>{last});
    stream.model_used_info.model_name = "fuser";
    stream.model_used_info.model_provider_name = "fuser_provider";

    ModelInferenceResult candidate;
    candidate.model_name = "candidate";
    candidate.usage = Usage{10, 1};
    stream.model_used_info.previous_model_inference_results = {candidate};

    InferenceContext ctx;
    ctx.inference_id = "inf-stream";
    auto result = collect_stream(std::move(stream), chat, ctx);

    REQUIRE(result.inference_id == "inf-stream");
    REQUIRE(std::get<Text>(result.content[0]).text == "fused answer");
    REQUIRE(result.model_inference_results.size() == 2);
    REQUIRE(result.model_inference_results[0].model_name == "fuser");
    REQUIRE(result.model_inference_results[1].model_name == "candidate");
    REQUIRE(result.usage == Usage{14, 3});
}
