#include "taskgate/executor.hpp"

#include <thread>

namespace taskgate {

namespace {

// Stands in for a real tool backend: sleeps, then reports success.
class SimulatedExecutor : public Executor {
public:
    explicit SimulatedExecutor(std::chrono::milliseconds delay) : delay_(delay) {}
    std::string name() const override { return "simulated"; }
    ExecutionResult run(const Task& task) override {
        auto t0 = std::chrono::steady_clock::now();
        std::this_thread::sleep_for(delay_);
        auto t1 = std::chrono::steady_clock::now();
        return {true, "Simulated result for: " + task.description,
                std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0)};
    }
private:
    std::chrono::milliseconds delay_;
};

class FunctionExecutor : public Executor {
public:
    FunctionExecutor(std::string name, ExecuteFn fn) : name_(std::move(name)), fn_(std::move(fn)) {}
    std::string name() const override { return name_; }
    ExecutionResult run(const Task& task) override {
        auto t0 = std::chrono::steady_clock::now();
        auto r = fn_(task);
        if (r.runtime.count() == 0)
            r.runtime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
        return r;
    }
private:
    std::string name_;
    ExecuteFn fn_;
};

} // namespace

std::unique_ptr<Executor> make_simulated_executor(std::chrono::milliseconds delay) {
    return std::make_unique<SimulatedExecutor>(delay);
}

std::unique_ptr<Executor> make_function_executor(std::string name, ExecuteFn fn) {
    return std::make_unique<FunctionExecutor>(std::move(name), std::move(fn));
}

} // namespace taskgate
