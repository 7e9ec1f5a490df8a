#include "dummy.hpp"
#include "../error.hpp"
#include "../plugin.hpp"
#include "../serialize.hpp"
#include "../util.hpp"
#include <cctype>
#include <stdexcept>

static switchyard::ProviderRegistrar reg_dummy("dummy",
    [](const nlohmann::json& config) {
        std::string model_name = "good";
        if (config.contains("model_name") && config["model_name"].is_string()) {
            model_name = config["model_name"].get<std::string>();
        }
        long delay_ms = 0;
        if (config.contains("delay_ms") && config["delay_ms"].is_number_integer()) {
            delay_ms = config["delay_ms"].get<long>();
        }
        return std::make_unique<switchyard::DummyProvider>(
            model_name, std::chrono::milliseconds(delay_ms));
    });

namespace switchyard {

const char* const kDummyResponseText =
    "Megumin gleefully chanted her spell, unleashing a thunderous explosion that lit up "
    "the sky and left a massive crater in its wake.";

namespace {

constexpr uint32_t kDummyInputTokens = 10;
constexpr uint32_t kDummyOutputTokens = 1;
constexpr std::chrono::milliseconds kSlowDelay{5000};

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

std::string judge_answer(const std::string& index) {
    return "{\"thinking\": \"hmmm\", \"answer_choice\": " + index + "}";
}

// Splits text after each space so concatenating the pieces restores it
std::vector<std::string> word_pieces(const std::string& text) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < text.size()) {
        size_t space = text.find(' ', start);
        size_t end = space == std::string::npos ? text.size() : space + 1;
        pieces.push_back(text.substr(start, end - start));
        start = end;
    }
    return pieces;
}

} // namespace

DummyProvider::DummyProvider(std::string model_name, std::chrono::milliseconds delay)
    : model_name_(std::move(model_name)), delay_(delay) {}

void DummyProvider::simulate_call(const CancellationToken& cancel) {
    uint32_t call = calls_.fetch_add(1);
    auto delay = model_name_ == "slow" ? kSlowDelay : delay_;
    if (delay.count() > 0 && !cancel.wait_for(delay)) {
        throw Error::cancelled("Dummy provider request for model " + model_name_);
    }
    if (starts_with(model_name_, "error")) {
        throw std::runtime_error("Dummy provider error for model " + model_name_);
    }
    if (starts_with(model_name_, "flaky_") && call % 2 == 0) {
        throw std::runtime_error("Dummy provider flaked on call " + std::to_string(call) +
                                 " for model " + model_name_);
    }
}

std::vector<ContentBlock> DummyProvider::output_for(const ModelInferenceRequest& request) const {
    if (model_name_ == "json") {
        return {Text{"{\"answer\":\"Hello\"}"}};
    }
    if (model_name_ == "json_cot") {
        return {Text{"{\"thinking\":\"hmmm\",\"response\":{\"answer\":\"Hello\"}}"}};
    }
    if (model_name_ == "tool") {
        return {ToolCall{"0", "get_temperature", "{\"location\":\"Brooklyn\",\"units\":\"celsius\"}"}};
    }
    if (model_name_ == "reasoner") {
        return {Thought{std::string("hmmm"), std::nullopt}, Text{kDummyResponseText}};
    }
    if (model_name_ == "echo") {
        nlohmann::ordered_json echo;
        echo["system"] = request.system ? nlohmann::ordered_json(*request.system)
                                        : nlohmann::ordered_json(nullptr);
        echo["messages"] = nlohmann::ordered_json::array();
        for (const auto& msg : request.messages) {
            echo["messages"].push_back({{"role", role_to_string(msg.role)},
                                        {"content", content_to_json(msg.content)}});
        }
        return {Text{echo.dump()}};
    }
    if (model_name_ == "best_of_n_big") {
        return {Text{judge_answer("100")}};
    }
    if (starts_with(model_name_, "best_of_n_") && all_digits(model_name_.substr(10))) {
        return {Text{judge_answer(model_name_.substr(10))}};
    }
    if (model_name_ == "bad_judge") {
        return {Text{"I cannot decide between these."}};
    }
    return {Text{kDummyResponseText}};
}

std::string DummyProvider::raw_request_for(const ModelInferenceRequest& request) const {
    nlohmann::ordered_json raw;
    raw["model"] = model_name_;
    raw["stream"] = request.stream;
    raw["messages"] = request.messages.size();
    return raw.dump();
}

ProviderInferenceResponse DummyProvider::infer(const ModelInferenceRequest& request,
                                               const CancellationToken& cancel) {
    auto start = std::chrono::steady_clock::now();
    simulate_call(cancel);

    ProviderInferenceResponse response;
    response.output = output_for(request);
    response.raw_request = raw_request_for(request);
    response.raw_response = content_to_json(response.output).dump();
    response.usage = Usage{kDummyInputTokens, kDummyOutputTokens};
    response.latency.kind = Latency::Kind::NonStreaming;
    response.latency.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    response.finish_reason = model_name_ == "tool" ? FinishReason::ToolCall : FinishReason::Stop;
    return response;
}

ProviderStream DummyProvider::infer_stream(const ModelInferenceRequest& request,
                                           const CancellationToken& cancel) {
    auto start = std::chrono::steady_clock::now();
    simulate_call(cancel);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::vector<ProviderInferenceResponseChunk> chunks;
    for (const auto& block : output_for(request)) {
        if (auto* text = std::get_if<Text>(&block)) {
            for (const auto& piece : word_pieces(text->text)) {
                ProviderInferenceResponseChunk chunk;
                chunk.content.push_back(TextChunk{"0", piece});
                chunk.raw_response = piece;
                chunks.push_back(std::move(chunk));
            }
        } else if (auto* call = std::get_if<ToolCall>(&block)) {
            ProviderInferenceResponseChunk head;
            head.content.push_back(ToolCallChunk{call->id, call->name, ""});
            head.raw_response = call->name;
            chunks.push_back(std::move(head));
            ProviderInferenceResponseChunk args;
            args.content.push_back(ToolCallChunk{call->id, std::nullopt, call->arguments});
            args.raw_response = call->arguments;
            chunks.push_back(std::move(args));
        } else if (auto* thought = std::get_if<Thought>(&block)) {
            ProviderInferenceResponseChunk chunk;
            chunk.content.push_back(ThoughtChunk{"0", thought->text, thought->signature});
            chunk.raw_response = thought->text.value_or("");
            chunks.push_back(std::move(chunk));
        }
    }
    // Latencies grow by a millisecond per chunk from the time of the first
    for (size_t i = 0; i < chunks.size(); ++i) {
        chunks[i].latency = elapsed + std::chrono::milliseconds(i);
    }
    ProviderInferenceResponseChunk last;
    last.usage = Usage{kDummyInputTokens, kDummyOutputTokens};
    last.finish_reason = model_name_ == "tool" ? FinishReason::ToolCall : FinishReason::Stop;
    last.latency = elapsed + std::chrono::milliseconds(chunks.size());
    chunks.push_back(std::move(last));

    ProviderStream stream;
    stream.first_chunk = std::move(chunks.front());
    chunks.erase(chunks.begin());
    stream.rest = std::make_unique<VectorChunkStream<ProviderInferenceResponseChunk>>(
        std::move(chunks));
    stream.raw_request = raw_request_for(request);
    return stream;
}

} // namespace switchyard
