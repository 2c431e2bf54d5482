#pragma once
#include "action.hpp"
#include "task.hpp"
#include <optional>
#include <string>
#include <vector>

namespace taskgate {

struct StepSpec {
    Task::TaskId id;  // empty -> "step_<index>"
    std::string description;
    std::optional<Action> action;  // empty -> Action::step(description)
    std::vector<Task::TaskId> depends_on{};
    std::optional<unsigned> max_retries{};
    int priority{0};
};

/// Turns a goal into ordered steps. May throw; the scheduler then falls back
/// to fallback_steps().
class Decomposer {
public:
    virtual ~Decomposer() = default;
    virtual std::vector<StepSpec> decompose(const std::string& goal) = 0;
};

// Generic seven-step skeleton used when no decomposition is available.
std::vector<StepSpec> fallback_steps(const std::string& goal);

/// Reads steps from a JSON file: either {"steps": [...]} or a bare array of
/// strings / step objects.
class JsonStepsDecomposer : public Decomposer {
public:
    explicit JsonStepsDecomposer(std::string path) : path_(std::move(path)) {}
    std::vector<StepSpec> decompose(const std::string& goal) override;
private:
    std::string path_;
};

} // namespace taskgate
