#pragma once
#include "action.hpp"
#include <set>
#include <string>
#include <vector>

namespace taskgate {

enum class RiskTier { Safe, Warning, Danger, Blocked };

const char* to_string(RiskTier tier);

// Prefix put on the description of critical actions.
inline constexpr const char kCriticalMarker[] = "[CRITICAL] ";

struct PolicyConfig {
    std::vector<std::string> blocked_patterns;     // case-insensitive substrings
    std::set<std::string> critical_actions;        // exact action names
    std::set<ActionCategory> approval_categories;  // Warning unless critical
    std::vector<std::string> protected_paths;      // no mutation/execution below these

    static PolicyConfig defaults();
};

struct Classification {
    RiskTier tier{RiskTier::Safe};
    std::string description;  // marker-prefixed for Danger
    std::string rule;         // which rule decided, for the audit trail
};

/// Pure mapping from an action to a risk tier. Holds no mutable state, so one
/// instance may be shared by any number of threads.
class RiskClassifier {
public:
    explicit RiskClassifier(PolicyConfig policy);

    Classification classify(const Action& action) const;
    Classification classify(const std::string& action_name, const std::string& description,
                            const Details& details, ActionCategory category,
                            const std::string& target_path = {}) const;

    const PolicyConfig& policy() const { return policy_; }

private:
    bool is_protected(const std::string& path) const;

    PolicyConfig policy_;
    std::vector<std::string> lowered_patterns_;
    std::vector<std::string> normalized_protected_;
};

std::string serialize_details(const Details& details);

} // namespace taskgate
