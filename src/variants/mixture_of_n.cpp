#include "mixture_of_n.hpp"
#include "candidates.hpp"
#include "../function.hpp"
#include <iostream>

namespace switchyard {

std::string mixture_of_n_system_message(const std::optional<std::string>& inner_system) {
    std::string out;
    if (inner_system) {
        out = "You have been provided with a set of responses from various models to the "
              "following problem:\n------\n" + *inner_system + "\n------\n";
    } else {
        out = "You have been provided with a set of responses from various models to the "
              "latest user\nquery.\n";
    }
    out += "Your task is to synthesize these responses into a single, high-quality response. "
           "It is crucial to critically evaluate the information provided in these responses, "
           "recognizing that some of it may be biased or incorrect. Your response should not "
           "simply replicate the given answers but should offer a refined, accurate, and "
           "comprehensive reply to the instruction and take the best from all the responses. "
           "Ensure your response is well-structured, coherent, and adheres to the highest "
           "standards of accuracy and reliability.  Below will be: first, any messages leading "
           "up to this point, and then, a final message containing the set of candidate "
           "responses.";
    return out;
}

std::string mixture_of_n_candidates_message(const std::vector<std::string>& candidates) {
    std::string out = "Here are the candidate answers (with the index and a row of ------ "
                      "separating):";
    for (size_t i = 0; i < candidates.size(); ++i) {
        out += "\n" + std::to_string(i) + ":\n" + candidates[i] + "\n------";
    }
    return out;
}

namespace {

// All records of every result except `skip`, in candidate order
std::vector<ModelInferenceResult> records_except(std::vector<InferenceResult>& results,
                                                 size_t skip) {
    std::vector<ModelInferenceResult> records;
    for (size_t i = 0; i < results.size(); ++i) {
        if (i == skip) continue;
        for (auto& record : results[i].model_inference_results) {
            records.push_back(std::move(record));
        }
    }
    return records;
}

// The first candidate stands in for a failed fuser, carrying the other
// candidates' records with it
InferenceResult fallback_candidate(std::vector<InferenceResult>& results) {
    std::vector<ModelInferenceResult> others = records_except(results, 0);
    InferenceResult chosen = std::move(results.front());
    chosen.append_model_inference_results(std::move(others));
    return chosen;
}

void log_fuser_failure(const Error& e) {
    std::cerr << "[mixture_of_n] Fuser failed, falling back to first candidate: " << e.what()
              << '\n';
}

} // namespace

// ── FuserConfig ──────────────────────────────────────────────────

ModelInferenceRequest FuserConfig::prepare_request(const Input& input,
                                                   const FunctionConfig& function,
                                                   const InferenceContext& ctx,
                                                   const std::vector<InferenceResult>& results,
                                                   bool stream) const {
    std::vector<std::string> texts;
    for (const auto& result : results) {
        if (auto text = candidate_prompt_text(result)) texts.push_back(std::move(*text));
    }
    if (texts.empty()) {
        throw Error::inference("No valid candidates to fuse in the mixture of n");
    }

    ModelInferenceRequest request = inner.prepare_request(input, function, ctx, stream);
    request.system = mixture_of_n_system_message(inner.render_system(input, *ctx.templates));
    request.messages.push_back(
        RequestMessage{Role::User, {Text{mixture_of_n_candidates_message(texts)}}});
    return request;
}

InferenceResult FuserConfig::fuse(const Input& input, const ModelTable& models,
                                  const FunctionConfig& function, const InferenceContext& ctx,
                                  const std::vector<InferenceResult>& results) const {
    ModelInferenceRequest request = prepare_request(input, function, ctx, results, false);
    ModelInferenceResult record = inner.run_request(request, models, ctx);
    std::vector<ContentBlock> output = record.output;
    std::optional<FinishReason> finish_reason = record.finish_reason;
    return function.prepare_response(ctx.inference_id, std::move(output), {std::move(record)},
                                     ctx.dynamic_output_schema, finish_reason);
}

InferenceResultStream FuserConfig::fuse_stream(const Input& input, const ModelTable& models,
                                               const FunctionConfig& function,
                                               const InferenceContext& ctx,
                                               const std::vector<InferenceResult>& results) const {
    ModelInferenceRequest request = prepare_request(input, function, ctx, results, true);
    return inner.run_request_stream(request, models, function.type(), ctx);
}

// ── MixtureOfNConfig ─────────────────────────────────────────────

InferenceResult MixtureOfNConfig::infer(const Input& input, const ModelTable& models,
                                        const FunctionConfig& function,
                                        const InferenceContext& ctx) const {
    CandidateResults candidates_out = infer_candidates(
        candidates, timeout_from_seconds(timeout_s), input, models, function, ctx, "mixture_of_n");
    std::vector<InferenceResult>& results = candidates_out.results;

    if (results.empty()) {
        throw Error::inference("No candidates to fuse in the mixture of n",
                               std::move(candidates_out.errors));
    }
    if (results.size() == 1) {
        return std::move(results.front());
    }

    std::optional<InferenceResult> fused;
    try {
        fused = fuser.fuse(input, models, function, ctx, results);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        log_fuser_failure(e);
    }
    if (!fused) {
        return fallback_candidate(results);
    }
    fused->append_model_inference_results(records_except(results, results.size()));
    return std::move(*fused);
}

InferenceResultStream MixtureOfNConfig::infer_stream(const Input& input, const ModelTable& models,
                                                     const FunctionConfig& function,
                                                     const InferenceContext& ctx) const {
    CandidateResults candidates_out = infer_candidates(
        candidates, timeout_from_seconds(timeout_s), input, models, function, ctx, "mixture_of_n");
    std::vector<InferenceResult>& results = candidates_out.results;

    if (results.empty()) {
        throw Error::inference("No candidates to fuse in the mixture of n",
                               std::move(candidates_out.errors));
    }
    if (results.size() == 1) {
        return stream_inference_from_non_stream(std::move(results.front()));
    }

    std::optional<InferenceResultStream> fused;
    try {
        fused = fuser.fuse_stream(input, models, function, ctx, results);
    } catch (const Error& e) {
        if (e.kind() == ErrorKind::Cancelled) throw;
        log_fuser_failure(e);
    }
    if (!fused) {
        return stream_inference_from_non_stream(fallback_candidate(results));
    }
    fused->model_used_info.previous_model_inference_results =
        records_except(results, results.size());
    return std::move(*fused);
}

void MixtureOfNConfig::validate(const FunctionConfig& function, const ModelTable& models,
                                const TemplateConfig& templates,
                                const std::string& variant_name) const {
    if (weight && *weight < 0) {
        throw Error::config("Negative weight for variant " + variant_name);
    }
    validate_timeout(timeout_s, variant_name);
    validate_candidates(candidates, function, models, templates, variant_name);
    try {
        fuser.inner.validate(function, models, templates);
    } catch (const Error& e) {
        throw Error::config("Invalid fuser for variant " + variant_name + ": " + e.what());
    }
}

} // namespace switchyard
