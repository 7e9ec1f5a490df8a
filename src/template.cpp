#include "template.hpp"
#include "error.hpp"
#include "util.hpp"

namespace switchyard {

namespace {

const nlohmann::json* lookup(const nlohmann::json& args, const std::string& key) {
    const nlohmann::json* cur = &args;
    for (const auto& part : split(key, '.')) {
        if (!cur->is_object() || !cur->contains(part)) return nullptr;
        cur = &(*cur)[part];
    }
    return cur;
}

} // namespace

void TemplateConfig::add_template(const std::string& name, const std::string& contents) {
    templates_[name] = contents;
}

bool TemplateConfig::has_template(const std::string& name) const {
    return templates_.count(name) > 0;
}

std::string TemplateConfig::template_message(const std::string& name,
                                             const nlohmann::json& args) const {
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        throw Error::templating(name, "template not found");
    }
    return render(name, it->second, args);
}

std::string TemplateConfig::render(const std::string& name, const std::string& contents,
                                   const nlohmann::json& args) {
    std::string out;
    out.reserve(contents.size());
    size_t pos = 0;
    while (pos < contents.size()) {
        size_t open = contents.find("{{", pos);
        if (open == std::string::npos) {
            out.append(contents, pos, std::string::npos);
            break;
        }
        out.append(contents, pos, open - pos);
        size_t close = contents.find("}}", open + 2);
        if (close == std::string::npos) {
            throw Error::templating(name, "unterminated placeholder");
        }
        std::string key = trim(contents.substr(open + 2, close - open - 2));
        const nlohmann::json* value = key.empty() ? nullptr : lookup(args, key);
        if (!value) {
            throw Error::templating(name, "undefined variable `" + key + "`");
        }
        out += value->is_string() ? value->get<std::string>() : value->dump();
        pos = close + 2;
    }
    return out;
}

} // namespace switchyard
