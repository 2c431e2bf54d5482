#pragma once
#include "task.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace taskgate {

struct ExecutionResult {
    bool ok{false};
    std::string message;
    std::chrono::milliseconds runtime{0};
};

/// Performs a task's side effect once it has been approved. A false `ok` or
/// a thrown std::exception both count as a retryable failure.
class Executor {
public:
    virtual ~Executor() = default;
    virtual std::string name() const = 0;
    virtual ExecutionResult run(const Task& task) = 0;
};

using ExecuteFn = std::function<ExecutionResult(const Task&)>;

/// Factory helpers (implemented in executors.cpp)
std::unique_ptr<Executor> make_simulated_executor(std::chrono::milliseconds delay = std::chrono::milliseconds(10));
std::unique_ptr<Executor> make_function_executor(std::string name, ExecuteFn fn);

} // namespace taskgate
