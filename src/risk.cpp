#include "taskgate/risk.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace taskgate {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalize_path(const std::string& path) {
    auto p = std::filesystem::path(path).lexically_normal().generic_string();
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

} // namespace

const char* to_string(RiskTier tier) {
    switch (tier) {
    case RiskTier::Safe: return "safe";
    case RiskTier::Warning: return "warning";
    case RiskTier::Danger: return "danger";
    case RiskTier::Blocked: return "blocked";
    }
    return "unknown";
}

PolicyConfig PolicyConfig::defaults() {
    PolicyConfig p;
    p.blocked_patterns = {
        "rm -rf", "sudo ", "mkfs", "dd if=/dev", "del /s /f /q", "format_drive", "format c:",
        "diskpart", "reg add", "reg delete", "regedit", "runas ",
    };
    p.critical_actions = {
        "delete_system_file", "modify_registry", "disable_security", "execute_untrusted_code",
    };
    p.approval_categories = {
        ActionCategory::FileMutation, ActionCategory::ProgramExecution, ActionCategory::NetworkAccess,
        ActionCategory::Download, ActionCategory::SystemCommand,
    };
    return p;
}

std::string serialize_details(const Details& details) {
    std::string out;
    for (const auto& kv : details) {
        if (!out.empty()) out += "; ";
        out += kv.first + "=" + kv.second;
    }
    return out;
}

RiskClassifier::RiskClassifier(PolicyConfig policy) : policy_(std::move(policy)) {
    for (const auto& pat : policy_.blocked_patterns) {
        if (!pat.empty()) lowered_patterns_.push_back(lower(pat));
    }
    for (const auto& path : policy_.protected_paths) {
        if (!path.empty()) normalized_protected_.push_back(normalize_path(path));
    }
}

Classification RiskClassifier::classify(const Action& action) const {
    return classify(action.name(), action.describe(), action.details(), action.category(),
                    action.target_path().value_or(std::string{}));
}

Classification RiskClassifier::classify(const std::string& action_name, const std::string& description,
                                        const Details& details, ActionCategory category,
                                        const std::string& target_path) const {
    Classification c;
    c.description = description;

    const std::string haystack = lower(description) + "\n" + lower(serialize_details(details));
    for (const auto& pat : lowered_patterns_) {
        if (haystack.find(pat) != std::string::npos) {
            c.tier = RiskTier::Blocked;
            c.rule = "blocked_pattern:" + pat;
            return c;
        }
    }

    if (!target_path.empty() && is_protected(target_path)) {
        c.tier = RiskTier::Blocked;
        c.rule = "protected_path:" + target_path;
        return c;
    }

    if (policy_.critical_actions.count(action_name)) {
        c.tier = RiskTier::Danger;
        c.description = std::string(kCriticalMarker) + description;
        c.rule = "critical_action:" + action_name;
        return c;
    }

    if (category != ActionCategory::None && policy_.approval_categories.count(category)) {
        c.tier = RiskTier::Warning;
        c.rule = std::string("category:") + to_string(category);
        return c;
    }

    c.tier = RiskTier::Safe;
    c.rule = "default";
    return c;
}

bool RiskClassifier::is_protected(const std::string& path) const {
    const auto target = normalize_path(path);
    for (const auto& root : normalized_protected_) {
        if (target == root) return true;
        if (root == "/" || (target.size() > root.size() && target.compare(0, root.size(), root) == 0
                            && target[root.size()] == '/'))
            return true;
    }
    return false;
}

} // namespace taskgate
