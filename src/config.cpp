#include "taskgate/config.hpp"
#include "taskgate/log.hpp"

#include <fstream>
#include <stdexcept>

namespace taskgate {

using nlohmann::json;

namespace {

std::vector<std::string> string_list(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_array()) throw std::invalid_argument(std::string("policy: '") + key + "' must be an array");
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.is_string()) throw std::invalid_argument(std::string("policy: '") + key + "' holds a non-string");
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

PolicyConfig policy_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("policy: document must be an object");
    PolicyConfig p = PolicyConfig::defaults();

    if (j.contains("blocked_patterns")) p.blocked_patterns = string_list(j, "blocked_patterns");
    if (j.contains("extra_blocked_patterns")) {
        for (auto& s : string_list(j, "extra_blocked_patterns")) p.blocked_patterns.push_back(std::move(s));
    }
    if (j.contains("critical_actions")) {
        auto names = string_list(j, "critical_actions");
        p.critical_actions = std::set<std::string>(names.begin(), names.end());
    }
    if (j.contains("approval_categories")) {
        p.approval_categories.clear();
        for (const auto& name : string_list(j, "approval_categories")) {
            auto cat = parse_category(name);
            if (!cat || *cat == ActionCategory::None)
                throw std::invalid_argument("policy: unknown approval category '" + name + "'");
            p.approval_categories.insert(*cat);
        }
    }
    if (j.contains("protected_paths")) p.protected_paths = string_list(j, "protected_paths");
    return p;
}

json policy_to_json(const PolicyConfig& policy) {
    std::vector<std::string> categories;
    for (auto c : policy.approval_categories) categories.push_back(to_string(c));
    return json{
        {"blocked_patterns", policy.blocked_patterns},
        {"critical_actions", policy.critical_actions},
        {"approval_categories", categories},
        {"protected_paths", policy.protected_paths},
    };
}

PolicyConfig load_policy(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) throw std::runtime_error("policy file not readable: " + path);
    json j;
    try {
        ifs >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("policy file " + path + ": " + e.what());
    }
    auto p = policy_from_json(j);
    log::info("policy", "loaded " + path + " (" + std::to_string(p.blocked_patterns.size()) + " blocked patterns, "
                            + std::to_string(p.critical_actions.size()) + " critical actions)");
    return p;
}

} // namespace taskgate
