#include "taskgate/decomposer.hpp"
#include "taskgate/json.hpp"
#include "taskgate/log.hpp"

#include <fstream>
#include <stdexcept>

namespace taskgate {

std::vector<StepSpec> fallback_steps(const std::string& goal) {
    return {
        {"", "Analyze: " + goal},
        {"", "Plan: Break down " + goal + " into smaller parts"},
        {"", "Setup: Prepare environment for " + goal},
        {"", "Execute: Perform main " + goal},
        {"", "Validate: Check if " + goal + " completed"},
        {"", "Optimize: Improve " + goal + " execution"},
        {"", "Document: Log results of " + goal},
    };
}

std::vector<StepSpec> JsonStepsDecomposer::decompose(const std::string& goal) {
    std::ifstream ifs(path_);
    if (!ifs) throw std::runtime_error("steps file not readable: " + path_);
    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("steps file " + path_ + ": " + e.what());
    }
    auto steps = steps_from_json(j);
    log::debug("decomposer", "loaded " + std::to_string(steps.size()) + " steps for \"" + goal + "\" from " + path_);
    return steps;
}

} // namespace taskgate
