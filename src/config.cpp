#include "config.hpp"
#include "error.hpp"
#include "plugin.hpp"
#include "util.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace switchyard {

namespace {

std::string resolve_path(const std::string& base_dir, const std::string& path) {
    std::filesystem::path p(expand_home(path));
    if (p.is_absolute() || base_dir.empty()) return p.string();
    return (std::filesystem::path(base_dir) / p).string();
}

std::optional<std::string> parse_template(const nlohmann::json& v, const std::string& key,
                                          const std::string& where,
                                          const std::string& base_dir,
                                          TemplateConfig& templates) {
    if (!v.contains(key)) return std::nullopt;
    if (!v[key].is_string()) {
        throw Error::invalid_template_path(where + "." + key + " must be a string");
    }
    std::string name = v[key].get<std::string>();
    if (trim(name).empty()) {
        throw Error::invalid_template_path(where + "." + key + " is empty");
    }
    if (!templates.has_template(name)) {
        std::string file = resolve_path(base_dir, name);
        try {
            templates.add_template(name, read_file(file));
        } catch (const std::runtime_error& e) {
            throw Error::config(where + "." + key + ": " + e.what());
        }
    }
    return name;
}

std::optional<double> parse_number(const nlohmann::json& v, const std::string& key,
                                   const std::string& where) {
    if (!v.contains(key)) return std::nullopt;
    if (!v[key].is_number()) throw Error::config(where + "." + key + " must be a number");
    return v[key].get<double>();
}

std::optional<uint32_t> parse_unsigned(const nlohmann::json& v, const std::string& key,
                                       const std::string& where) {
    if (!v.contains(key)) return std::nullopt;
    if (!v[key].is_number_integer() || v[key].get<int64_t>() < 0) {
        throw Error::config(where + "." + key + " must be a non-negative integer");
    }
    return v[key].get<uint32_t>();
}

std::vector<std::string> parse_candidates(const nlohmann::json& v, const std::string& where) {
    std::vector<std::string> candidates;
    if (!v.contains("candidates")) return candidates;
    if (!v["candidates"].is_array()) throw Error::config(where + ".candidates must be an array");
    for (const auto& c : v["candidates"]) {
        if (!c.is_string()) throw Error::config(where + ".candidates must contain strings");
        candidates.push_back(c.get<std::string>());
    }
    return candidates;
}

ChatCompletionConfig parse_chat_completion(const nlohmann::json& v, const std::string& where,
                                           const std::string& base_dir,
                                           TemplateConfig& templates) {
    if (!v.is_object()) throw Error::config(where + " must be an object");
    ChatCompletionConfig cc;
    if (!v.contains("model") || !v["model"].is_string()) {
        throw Error::config(where + " is missing \"model\"");
    }
    cc.model = v["model"].get<std::string>();
    cc.weight = parse_number(v, "weight", where);
    cc.system_template = parse_template(v, "system_template", where, base_dir, templates);
    cc.user_template = parse_template(v, "user_template", where, base_dir, templates);
    cc.assistant_template = parse_template(v, "assistant_template", where, base_dir, templates);
    cc.temperature = parse_number(v, "temperature", where);
    cc.top_p = parse_number(v, "top_p", where);
    cc.presence_penalty = parse_number(v, "presence_penalty", where);
    cc.frequency_penalty = parse_number(v, "frequency_penalty", where);
    cc.max_tokens = parse_unsigned(v, "max_tokens", where);
    cc.seed = parse_unsigned(v, "seed", where);
    if (v.contains("json_mode")) {
        std::optional<JsonMode> mode;
        if (v["json_mode"].is_string()) mode = json_mode_from_string(v["json_mode"].get<std::string>());
        if (!mode) throw Error::config(where + ".json_mode must be off, on, strict or implicit_tool");
        cc.json_mode = mode;
    }
    if (v.contains("retries")) {
        const auto& r = v["retries"];
        if (!r.is_object()) throw Error::config(where + ".retries must be an object");
        if (auto n = parse_unsigned(r, "num_retries", where + ".retries")) cc.retries.num_retries = *n;
        if (auto d = parse_number(r, "max_delay_s", where + ".retries")) cc.retries.max_delay_s = *d;
    }
    return cc;
}

VariantConfig parse_variant(const nlohmann::json& v, const std::string& where,
                            const std::string& base_dir, TemplateConfig& templates) {
    if (!v.is_object() || !v.contains("type") || !v["type"].is_string()) {
        throw Error::config(where + " is missing \"type\"");
    }
    std::string type = v["type"].get<std::string>();

    if (type == "chat_completion") {
        return VariantConfig{parse_chat_completion(v, where, base_dir, templates)};
    }
    if (type == "experimental_chain_of_thought") {
        return VariantConfig{ChainOfThoughtConfig{parse_chat_completion(v, where, base_dir, templates)}};
    }
    if (type == "experimental_first_of_n") {
        FirstOfNConfig cfg;
        cfg.weight = parse_number(v, "weight", where);
        cfg.candidates = parse_candidates(v, where);
        if (auto t = parse_number(v, "timeout_s", where)) cfg.timeout_s = *t;
        return VariantConfig{cfg};
    }
    if (type == "experimental_best_of_n_sampling") {
        if (!v.contains("evaluator")) throw Error::config(where + " is missing \"evaluator\"");
        BestOfNConfig cfg;
        cfg.weight = parse_number(v, "weight", where);
        cfg.candidates = parse_candidates(v, where);
        if (auto t = parse_number(v, "timeout_s", where)) cfg.timeout_s = *t;
        cfg.evaluator.inner =
            parse_chat_completion(v["evaluator"], where + ".evaluator", base_dir, templates);
        return VariantConfig{cfg};
    }
    if (type == "experimental_mixture_of_n") {
        if (!v.contains("fuser")) throw Error::config(where + " is missing \"fuser\"");
        MixtureOfNConfig cfg;
        cfg.weight = parse_number(v, "weight", where);
        cfg.candidates = parse_candidates(v, where);
        if (auto t = parse_number(v, "timeout_s", where)) cfg.timeout_s = *t;
        cfg.fuser.inner = parse_chat_completion(v["fuser"], where + ".fuser", base_dir, templates);
        return VariantConfig{cfg};
    }
    throw Error::config(where + ": unknown variant type " + type);
}

std::vector<ToolSpec> parse_tools(const nlohmann::json& f, const std::string& where) {
    std::vector<ToolSpec> tools;
    if (!f.contains("tools")) return tools;
    if (!f["tools"].is_array()) throw Error::config(where + ".tools must be an array");
    for (const auto& t : f["tools"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
            throw Error::config(where + ".tools entries need a name");
        }
        ToolSpec spec;
        spec.name = t["name"].get<std::string>();
        if (t.contains("description") && t["description"].is_string())
            spec.description = t["description"].get<std::string>();
        spec.parameters = t.contains("parameters") ? t["parameters"] : nlohmann::json::object();
        if (t.contains("strict") && t["strict"].is_boolean())
            spec.strict = t["strict"].get<bool>();
        tools.push_back(std::move(spec));
    }
    return tools;
}

FunctionConfig parse_function(const std::string& name, const nlohmann::json& f,
                              const std::string& base_dir, TemplateConfig& templates) {
    std::string where = "functions." + name;
    if (!f.is_object()) throw Error::config(where + " must be an object");
    FunctionType type = FunctionType::Chat;
    if (f.contains("type")) {
        std::string t = f["type"].is_string() ? f["type"].get<std::string>() : "";
        if (t == "json") {
            type = FunctionType::Json;
        } else if (t != "chat") {
            throw Error::config(where + ".type must be chat or json");
        }
    }

    FunctionConfig function(type, name);
    if (f.contains("output_schema")) {
        if (type != FunctionType::Json) {
            std::cerr << "[config] " << where << ": output_schema ignored for chat function\n";
        } else if (f["output_schema"].is_object()) {
            function.set_output_schema(JSONSchema::from_value(f["output_schema"]));
        } else if (f["output_schema"].is_string()) {
            function.set_output_schema(JSONSchema::from_path(
                resolve_path(base_dir, f["output_schema"].get<std::string>())));
        } else {
            throw Error::config(where + ".output_schema must be an object or a path");
        }
    }
    function.set_tools(parse_tools(f, where));

    if (f.contains("variants")) {
        if (!f["variants"].is_object()) throw Error::config(where + ".variants must be an object");
        for (const auto& [variant_name, v] : f["variants"].items()) {
            function.add_variant(variant_name,
                                 parse_variant(v, where + ".variants." + variant_name,
                                               base_dir, templates));
        }
    }
    return function;
}

std::shared_ptr<ModelConfig> parse_model(const std::string& name, const nlohmann::json& m) {
    std::string where = "models." + name;
    if (!m.is_object() || !m.contains("providers") || !m["providers"].is_object()) {
        throw Error::config(where + " is missing \"providers\"");
    }
    const auto& providers = m["providers"];

    // Routing defaults to the providers in name order
    std::vector<std::string> routing;
    if (m.contains("routing")) {
        if (!m["routing"].is_array()) throw Error::config(where + ".routing must be an array");
        for (const auto& r : m["routing"]) {
            if (!r.is_string()) throw Error::config(where + ".routing must contain strings");
            routing.push_back(r.get<std::string>());
        }
    } else {
        for (const auto& [provider_name, _] : providers.items()) {
            routing.push_back(provider_name);
        }
    }

    auto model = std::make_shared<ModelConfig>();
    for (const auto& provider_name : routing) {
        if (!providers.contains(provider_name)) {
            throw Error::config(where + ".routing names unknown provider " + provider_name);
        }
        const auto& p = providers[provider_name];
        if (!p.is_object() || !p.contains("type") || !p["type"].is_string()) {
            throw Error::config(where + ".providers." + provider_name + " is missing \"type\"");
        }
        model->add_provider(provider_name, create_provider(p["type"].get<std::string>(), p));
    }
    if (model->routing().empty()) {
        throw Error::config(where + " has no providers");
    }
    return model;
}

} // namespace

Config Config::load(const std::string& path) {
    std::string resolved = expand_home(path);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(read_file(resolved));
    } catch (const nlohmann::json::parse_error& e) {
        throw Error::config("Failed to parse " + resolved + ": " + e.what());
    } catch (const std::runtime_error& e) {
        throw Error::config(e.what());
    }
    return from_json(j, std::filesystem::path(resolved).parent_path().string());
}

Config Config::from_json(const nlohmann::json& j, const std::string& base_dir) {
    if (!j.is_object()) throw Error::config("Config must be a JSON object");
    Config cfg;

    if (j.contains("templates") && j["templates"].is_object()) {
        for (const auto& [name, contents] : j["templates"].items()) {
            if (!contents.is_string()) throw Error::config("templates." + name + " must be a string");
            cfg.templates->add_template(name, contents.get<std::string>());
        }
    }

    if (j.contains("models") && j["models"].is_object()) {
        for (const auto& [name, m] : j["models"].items()) {
            cfg.models.add(name, parse_model(name, m));
        }
    }

    if (j.contains("functions") && j["functions"].is_object()) {
        for (const auto& [name, f] : j["functions"].items()) {
            cfg.functions.emplace(name, parse_function(name, f, base_dir, *cfg.templates));
        }
    }
    return cfg;
}

const FunctionConfig* Config::function(const std::string& name) const {
    auto it = functions.find(name);
    return it == functions.end() ? nullptr : &it->second;
}

void Config::validate() const {
    for (const auto& [function_name, function] : functions) {
        for (const auto& [variant_name, variant] : function.variants()) {
            try {
                variant.validate(function, models, *templates, variant_name);
            } catch (const Error& e) {
                std::cerr << "[config] functions." << function_name << ".variants." << variant_name
                          << " is invalid: " << e.what() << '\n';
                throw;
            }
        }
    }
}

} // namespace switchyard
