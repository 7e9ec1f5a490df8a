#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace switchyard {

// JSON schema given inline or by file path. A path is read lazily on the
// first value() call; copies share the loaded document.
class JSONSchema {
public:
    static JSONSchema from_value(nlohmann::json value);
    static JSONSchema from_path(const std::string& path);

    // Throws Error(JsonSchema) if the schema file cannot be read or parsed
    const nlohmann::json& value() const;

    // Throws Error(JsonSchema) naming the first violation. Supports type,
    // required, properties, additionalProperties:false, items, enum,
    // minimum and maximum.
    void validate(const nlohmann::json& instance) const;

    const std::string& path() const { return state_->path; }

private:
    struct State {
        std::string path;
        std::once_flag loaded;
        std::optional<nlohmann::json> value;
        std::string load_error;
    };

    JSONSchema() : state_(std::make_shared<State>()) {}

    std::shared_ptr<State> state_;
};

} // namespace switchyard
