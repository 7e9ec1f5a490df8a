#include "json_schema.hpp"
#include "error.hpp"
#include "util.hpp"
#include <cmath>

namespace switchyard {

namespace {

bool matches_type(const std::string& type, const nlohmann::json& v) {
    if (type == "object") return v.is_object();
    if (type == "array") return v.is_array();
    if (type == "string") return v.is_string();
    if (type == "boolean") return v.is_boolean();
    if (type == "null") return v.is_null();
    if (type == "number") return v.is_number();
    if (type == "integer") {
        if (v.is_number_integer()) return true;
        if (v.is_number_float()) {
            double d = v.get<double>();
            return std::floor(d) == d;
        }
        return false;
    }
    return true; // unknown type keywords are not enforced
}

void check(const nlohmann::json& schema, const nlohmann::json& v, const std::string& at) {
    if (!schema.is_object()) return;
    const std::string where = at.empty() ? "instance" : at;

    if (schema.contains("type")) {
        const auto& t = schema["type"];
        bool ok = false;
        if (t.is_string()) {
            ok = matches_type(t.get<std::string>(), v);
        } else if (t.is_array()) {
            for (const auto& alt : t) {
                if (alt.is_string() && matches_type(alt.get<std::string>(), v)) {
                    ok = true;
                    break;
                }
            }
        } else {
            ok = true;
        }
        if (!ok) {
            throw Error::json_schema(where + " is not of type " + t.dump());
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& option : schema["enum"]) {
            if (option == v) {
                found = true;
                break;
            }
        }
        if (!found) throw Error::json_schema(where + " is not one of " + schema["enum"].dump());
    }

    if (v.is_number()) {
        if (schema.contains("minimum") && schema["minimum"].is_number() &&
            v.get<double>() < schema["minimum"].get<double>()) {
            throw Error::json_schema(where + " is less than the minimum of " +
                                     schema["minimum"].dump());
        }
        if (schema.contains("maximum") && schema["maximum"].is_number() &&
            v.get<double>() > schema["maximum"].get<double>()) {
            throw Error::json_schema(where + " is greater than the maximum of " +
                                     schema["maximum"].dump());
        }
    }

    if (v.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& key : schema["required"]) {
                if (key.is_string() && !v.contains(key.get<std::string>())) {
                    throw Error::json_schema("\"" + key.get<std::string>() +
                                             "\" is a required property of " + where);
                }
            }
        }
        const nlohmann::json* props = nullptr;
        if (schema.contains("properties") && schema["properties"].is_object()) {
            props = &schema["properties"];
        }
        bool closed = schema.contains("additionalProperties") &&
                      schema["additionalProperties"].is_boolean() &&
                      !schema["additionalProperties"].get<bool>();
        for (auto it = v.begin(); it != v.end(); ++it) {
            std::string child = at.empty() ? it.key() : at + "." + it.key();
            if (props && props->contains(it.key())) {
                check((*props)[it.key()], it.value(), child);
            } else if (closed) {
                throw Error::json_schema("Additional property \"" + it.key() +
                                         "\" is not allowed in " + where);
            }
        }
    }

    if (v.is_array() && schema.contains("items") && schema["items"].is_object()) {
        for (size_t i = 0; i < v.size(); ++i) {
            check(schema["items"], v[i], at + "[" + std::to_string(i) + "]");
        }
    }
}

} // namespace

JSONSchema JSONSchema::from_value(nlohmann::json value) {
    JSONSchema schema;
    std::call_once(schema.state_->loaded, [&] { schema.state_->value = std::move(value); });
    return schema;
}

JSONSchema JSONSchema::from_path(const std::string& path) {
    JSONSchema schema;
    schema.state_->path = path;
    return schema;
}

const nlohmann::json& JSONSchema::value() const {
    std::call_once(state_->loaded, [this] {
        try {
            state_->value = nlohmann::json::parse(read_file(state_->path));
        } catch (const std::exception& e) {
            state_->load_error = e.what();
        }
    });
    if (!state_->value) {
        throw Error::json_schema("Failed to load JSON schema " + state_->path + ": " +
                                 state_->load_error);
    }
    return *state_->value;
}

void JSONSchema::validate(const nlohmann::json& instance) const {
    check(value(), instance, "");
}

} // namespace switchyard
