#pragma once
#include "function.hpp"
#include "model.hpp"
#include "template.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace switchyard {

// Gateway configuration: models, functions with their variants, and the
// templates the variants reference. Immutable once loaded.
struct Config {
    ModelTable models;
    std::unordered_map<std::string, FunctionConfig> functions;
    std::shared_ptr<TemplateConfig> templates = std::make_shared<TemplateConfig>();

    // Reads and parses a config file; relative paths inside it resolve
    // against the file's directory. Throws Error(Config).
    static Config load(const std::string& path);

    // Template files are read relative to `base_dir`
    static Config from_json(const nlohmann::json& j, const std::string& base_dir);

    // Null when absent
    const FunctionConfig* function(const std::string& name) const;

    // Validates every variant of every function; throws on the first error
    void validate() const;
};

} // namespace switchyard
