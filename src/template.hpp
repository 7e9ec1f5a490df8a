#pragma once
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace switchyard {

// Named message templates with `{{ key }}` / `{{ key.sub }}` placeholders.
// Strings are substituted verbatim, other values as compact JSON.
class TemplateConfig {
public:
    void add_template(const std::string& name, const std::string& contents);
    bool has_template(const std::string& name) const;

    // Throws Error(Templating) for an unknown template, an undefined
    // variable or an unterminated placeholder
    std::string template_message(const std::string& name, const nlohmann::json& args) const;

    // Renders `contents` directly; `name` is only used in error messages
    static std::string render(const std::string& name, const std::string& contents,
                              const nlohmann::json& args);

private:
    std::unordered_map<std::string, std::string> templates_;
};

} // namespace switchyard
