#pragma once
#include "risk.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace taskgate {

// Keys absent from the document keep PolicyConfig::defaults(). Throws
// std::invalid_argument for malformed values.
PolicyConfig policy_from_json(const nlohmann::json& j);
nlohmann::json policy_to_json(const PolicyConfig& policy);

// Throws std::runtime_error when the file cannot be read or parsed.
PolicyConfig load_policy(const std::string& path);

} // namespace taskgate
