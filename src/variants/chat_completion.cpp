#include "chat_completion.hpp"
#include "../function.hpp"
#include "../util.hpp"

namespace switchyard {

namespace {

std::string render_content(const std::optional<std::string>& template_name, Role role,
                           const nlohmann::json& content, const TemplateConfig& templates) {
    if (template_name) {
        if (trim(*template_name).empty()) {
            throw Error::invalid_template_path(std::string("empty path for ") +
                                               role_to_string(role) + " template");
        }
        return templates.template_message(*template_name, content);
    }
    if (!content.is_string()) {
        if (role == Role::System) {
            throw Error::invalid_message("System message content " + content.dump() +
                                         " is not a string but there is no variant template");
        }
        throw Error::invalid_message("Request message content " + content.dump() +
                                     " is not a string but there is no variant template for Role " +
                                     role_to_string(role));
    }
    return content.get<std::string>();
}

void check_template(const std::optional<std::string>& name, const TemplateConfig& templates) {
    if (!name) return;
    if (trim(*name).empty()) throw Error::invalid_template_path("empty template path");
    if (!templates.has_template(*name)) throw Error::templating(*name, "template not found");
}

} // namespace

std::optional<std::string> ChatCompletionConfig::render_system(
    const Input& input, const TemplateConfig& templates) const {
    std::vector<std::string> parts;
    for (const auto& msg : input.messages) {
        if (msg.role == Role::System) {
            parts.push_back(render_content(system_template, Role::System, msg.content, templates));
        }
    }
    if (!parts.empty()) return join(parts, "\n");
    if (system_template) {
        return render_content(system_template, Role::System, nlohmann::json::object(), templates);
    }
    return std::nullopt;
}

std::vector<RequestMessage> ChatCompletionConfig::render_messages(
    const Input& input, const TemplateConfig& templates) const {
    std::vector<RequestMessage> messages;
    for (const auto& msg : input.messages) {
        if (msg.role == Role::System) continue;
        const auto& tmpl = msg.role == Role::User ? user_template : assistant_template;
        messages.push_back(RequestMessage{
            msg.role, {Text{render_content(tmpl, msg.role, msg.content, templates)}}});
    }
    return messages;
}

void ChatCompletionConfig::apply_inference_params(ModelInferenceRequest& request) const {
    request.temperature = temperature;
    request.top_p = top_p;
    request.presence_penalty = presence_penalty;
    request.frequency_penalty = frequency_penalty;
    request.max_tokens = max_tokens;
    request.seed = seed;
}

JsonMode ChatCompletionConfig::effective_json_mode(FunctionType type) const {
    if (json_mode) return *json_mode;
    return type == FunctionType::Json ? JsonMode::Strict : JsonMode::Off;
}

ModelInferenceRequest ChatCompletionConfig::prepare_request(const Input& input,
                                                            const FunctionConfig& function,
                                                            const InferenceContext& ctx,
                                                            bool stream) const {
    ModelInferenceRequest request;
    request.system = render_system(input, *ctx.templates);
    request.messages = render_messages(input, *ctx.templates);
    request.stream = stream;
    request.function_type = function.type();
    if (function.type() == FunctionType::Chat) {
        request.tools = function.tools();
    }
    apply_inference_params(request);

    if (function.type() == FunctionType::Json) {
        request.json_mode = effective_json_mode(FunctionType::Json);
        const JSONSchema* schema =
            ctx.dynamic_output_schema ? ctx.dynamic_output_schema : function.output_schema();
        if (request.json_mode != JsonMode::Off && schema) {
            request.output_schema = schema->value();
            if (request.json_mode == JsonMode::ImplicitTool) {
                request.tools = {ToolSpec{"respond",
                                          "Respond to the user using the output schema provided.",
                                          schema->value(), false}};
            }
        }
    }
    return request;
}

std::shared_ptr<const ModelConfig> ChatCompletionConfig::resolve_model(
    const ModelTable& models) const {
    auto resolved = models.get(model);
    if (!resolved) throw Error::model_not_found(model);
    return resolved;
}

ModelInferenceResult ChatCompletionConfig::run_request(const ModelInferenceRequest& request,
                                                       const ModelTable& models,
                                                       const InferenceContext& ctx) const {
    auto resolved = resolve_model(models);
    return with_retries(retries, ctx.cancel, "Model " + model, [&] {
        return resolved->infer(request, model, ctx.cancel);
    });
}

InferenceResultStream ChatCompletionConfig::run_request_stream(const ModelInferenceRequest& request,
                                                               const ModelTable& models,
                                                               FunctionType type,
                                                               const InferenceContext& ctx) const {
    auto resolved = resolve_model(models);
    ModelStream stream = with_retries(retries, ctx.cancel, "Model " + model, [&] {
        return resolved->infer_stream(request, ctx.cancel);
    });

    InferenceResultStream out;
    out.first_chunk = InferenceResultChunk::from_provider(type, std::move(stream.first_chunk));
    out.rest = std::make_unique<MappedChunkStream<ProviderInferenceResponseChunk, InferenceResultChunk>>(
        std::move(stream.rest), [type](ProviderInferenceResponseChunk chunk) {
            return InferenceResultChunk::from_provider(type, std::move(chunk));
        });
    out.model_used_info.model_name = model;
    out.model_used_info.model_provider_name = stream.model_provider_name;
    out.model_used_info.raw_request = std::move(stream.raw_request);
    out.model_used_info.system = request.system;
    out.model_used_info.input_messages = request.messages;
    return out;
}

InferenceResult ChatCompletionConfig::infer(const Input& input, const ModelTable& models,
                                            const FunctionConfig& function,
                                            const InferenceContext& ctx) const {
    resolve_model(models);
    ModelInferenceRequest request = prepare_request(input, function, ctx, false);
    ModelInferenceResult record = run_request(request, models, ctx);
    std::vector<ContentBlock> output = record.output;
    std::optional<FinishReason> finish_reason = record.finish_reason;
    return function.prepare_response(ctx.inference_id, std::move(output), {std::move(record)},
                                     ctx.dynamic_output_schema, finish_reason);
}

InferenceResultStream ChatCompletionConfig::infer_stream(const Input& input,
                                                         const ModelTable& models,
                                                         const FunctionConfig& function,
                                                         const InferenceContext& ctx) const {
    resolve_model(models);
    ModelInferenceRequest request = prepare_request(input, function, ctx, true);
    return run_request_stream(request, models, function.type(), ctx);
}

void ChatCompletionConfig::validate(const FunctionConfig& function, const ModelTable& models,
                                    const TemplateConfig& templates) const {
    if (weight && *weight < 0) {
        throw Error::config("Negative weight " + std::to_string(*weight));
    }
    if (!models.contains(model)) throw Error::model_not_found(model);
    check_template(system_template, templates);
    check_template(user_template, templates);
    check_template(assistant_template, templates);
    if (retries.max_delay_s < 0) {
        throw Error::config("retries.max_delay_s must be non-negative");
    }
    if (function.type() == FunctionType::Json && function.output_schema()) {
        function.output_schema()->value();
    }
}

std::vector<std::string> ChatCompletionConfig::get_all_template_paths() const {
    std::vector<std::string> paths;
    for (const auto* t : {&system_template, &user_template, &assistant_template}) {
        if (*t) paths.push_back(**t);
    }
    return paths;
}

} // namespace switchyard
