#include "best_of_n.hpp"
#include "candidates.hpp"
#include "../function.hpp"
#include "../json_schema.hpp"
#include <iostream>

namespace switchyard {

std::string best_of_n_system_message(const std::optional<std::string>& inner_system,
                                     size_t max_index) {
    std::string out;
    if (inner_system) {
        out = "You are an assistant tasked with re-ranking candidate answers to the following "
              "problem:\n------\n" + *inner_system + "\n------\n";
    } else {
        out = "You are an assistant tasked with re-ranking candidate answers to a problem.\n";
    }
    out += "The messages below are the conversation history between the user and the assistant "
           "along with a final message giving a set of candidate responses.\n"
           "Please evaluate the following candidate responses and provide your reasoning along "
           "with the index of the best candidate in the following JSON format:\n"
           "{\n"
           "    \"thinking\": \"your reasoning here\",\n"
           "    \"answer_choice\": int  // Range: 0 to " + std::to_string(max_index) + "\n"
           "}\n"
           "In the \"thinking\" block:\n"
           "First, you should analyze each response itself against the conversation history and "
           "determine if it is a good response or not.\n"
           "Then you should think out loud about which is best and most faithful to instructions.\n"
           "In the \"answer_choice\" block: you should output the index of the best response.";
    return out;
}

std::string best_of_n_candidates_message(const std::vector<std::string>& candidates) {
    std::string out = "Here are the candidate answers (with the index and a row of ------ "
                      "separating):";
    for (size_t i = 0; i < candidates.size(); ++i) {
        out += "\n" + std::to_string(i) + ": " + candidates[i] + "\n------";
    }
    out += "\nPlease evaluate these candidates and provide the index of the best one.";
    return out;
}

const nlohmann::json& best_of_n_evaluator_schema() {
    static const nlohmann::json schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "thinking": {"type": "string"},
            "answer_choice": {"type": "integer"}
        },
        "required": ["thinking", "answer_choice"],
        "additionalProperties": false
    })");
    return schema;
}

// ── EvaluatorConfig ──────────────────────────────────────────────

ModelInferenceRequest EvaluatorConfig::prepare_request(
    const Input& input, const InferenceContext& ctx,
    const std::vector<std::string>& candidate_texts) const {
    ModelInferenceRequest request;
    request.system = best_of_n_system_message(inner.render_system(input, *ctx.templates),
                                              candidate_texts.size() - 1);
    request.messages = inner.render_messages(input, *ctx.templates);
    request.messages.push_back(
        RequestMessage{Role::User, {Text{best_of_n_candidates_message(candidate_texts)}}});
    request.function_type = FunctionType::Json;
    request.json_mode = inner.effective_json_mode(FunctionType::Json);
    if (request.json_mode != JsonMode::Off) {
        request.output_schema = best_of_n_evaluator_schema();
        if (request.json_mode == JsonMode::ImplicitTool) {
            request.tools = {ToolSpec{"respond", "Respond with the index of the best candidate.",
                                      best_of_n_evaluator_schema(), false}};
        }
    }
    inner.apply_inference_params(request);
    return request;
}

std::pair<size_t, ModelInferenceResult> EvaluatorConfig::select(
    const Input& input, const ModelTable& models, const InferenceContext& ctx,
    const std::vector<InferenceResult>& results) const {
    // Json candidates that never parsed are left out; `shown` maps prompt
    // positions back to indices into `results`.
    std::vector<std::string> texts;
    std::vector<size_t> shown;
    for (size_t i = 0; i < results.size(); ++i) {
        if (auto text = candidate_prompt_text(results[i])) {
            texts.push_back(std::move(*text));
            shown.push_back(i);
        }
    }
    if (texts.empty()) {
        throw Error::inference("No valid candidates to select from in best of n");
    }

    auto model = inner.resolve_model(models);
    ModelInferenceRequest request = prepare_request(input, ctx, texts);
    ModelInferenceResult record = with_retries(inner.retries, ctx.cancel,
                                               "Evaluator model " + inner.model, [&] {
        return model->infer(request, inner.model, ctx.cancel);
    });

    std::optional<std::string> raw;
    for (const auto& block : record.output) {
        if (auto* text = std::get_if<Text>(&block)) {
            raw = text->text;
            break;
        }
        if (auto* call = std::get_if<ToolCall>(&block)) {
            raw = call->arguments;
            break;
        }
    }
    if (!raw) {
        throw Error::inference("Best of n evaluator returned no text or tool call");
    }

    nlohmann::json answer;
    try {
        answer = nlohmann::json::parse(*raw);
        JSONSchema::from_value(best_of_n_evaluator_schema()).validate(answer);
    } catch (const nlohmann::json::exception& e) {
        throw Error::inference("Failed to parse best of n evaluator output " + *raw + ": " +
                               e.what());
    } catch (const Error& e) {
        throw Error::inference("Malformed best of n evaluator output " + *raw + ": " +
                               e.message());
    }

    if (!answer["answer_choice"].is_number_integer()) {
        throw Error::inference("Best of n evaluator answer_choice is not an integer: " + *raw);
    }
    long long choice = answer["answer_choice"].get<long long>();
    if (choice < 0 || static_cast<unsigned long long>(choice) >= shown.size()) {
        throw Error::inference("Invalid index " + std::to_string(choice) +
                               " from best of n evaluator; expected 0 to " +
                               std::to_string(shown.size() - 1));
    }
    return {shown[static_cast<size_t>(choice)], std::move(record)};
}

// ── BestOfNConfig ────────────────────────────────────────────────

InferenceResult BestOfNConfig::infer(const Input& input, const ModelTable& models,
                                     const FunctionConfig& function,
                                     const InferenceContext& ctx) const {
    CandidateResults candidates_out = infer_candidates(
        candidates, timeout_from_seconds(timeout_s), input, models, function, ctx, "best_of_n");
    std::vector<InferenceResult>& results = candidates_out.results;

    if (results.empty()) {
        throw Error::inference("No candidates to select from in best of n",
                               std::move(candidates_out.errors));
    }
    if (results.size() == 1) {
        return std::move(results.front());
    }

    auto [selected, judge_record] = evaluator.select(input, models, ctx, results);

    InferenceResult chosen = std::move(results[selected]);
    std::vector<ModelInferenceResult> others;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i == selected) continue;
        for (auto& record : results[i].model_inference_results) {
            others.push_back(std::move(record));
        }
    }
    chosen.original_response = judge_record.raw_response;
    chosen.append_model_inference_results(std::move(others));
    chosen.append_model_inference_results({std::move(judge_record)});
    return chosen;
}

InferenceResultStream BestOfNConfig::infer_stream(const Input& input, const ModelTable& models,
                                                  const FunctionConfig& function,
                                                  const InferenceContext& ctx) const {
    return stream_inference_from_non_stream(infer(input, models, function, ctx));
}

void BestOfNConfig::validate(const FunctionConfig& function, const ModelTable& models,
                             const TemplateConfig& templates,
                             const std::string& variant_name) const {
    if (weight && *weight < 0) {
        throw Error::config("Negative weight for variant " + variant_name);
    }
    validate_timeout(timeout_s, variant_name);
    validate_candidates(candidates, function, models, templates, variant_name);
    try {
        evaluator.inner.validate(function, models, templates);
    } catch (const Error& e) {
        throw Error::config("Invalid evaluator for variant " + variant_name + ": " + e.what());
    }
}

} // namespace switchyard
