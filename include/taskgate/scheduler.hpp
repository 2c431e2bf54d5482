#pragma once
#include "audit_log.hpp"
#include "confirmation.hpp"
#include "decomposer.hpp"
#include "executor.hpp"
#include "task.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace taskgate {

struct SchedulerOptions {
    std::chrono::milliseconds confirmation_timeout{ConfirmationGateway::kDefaultTimeout};
    unsigned parallelism{1};  // concurrent tasks per plan
    unsigned max_retries{Task::kDefaultMaxRetries};
    std::chrono::milliseconds retry_backoff{0};  // linear: backoff * attempts
};

struct Reflection {
    size_t total{0};
    size_t completed{0};
    size_t failed{0};
    size_t stalled{0};
    size_t retried{0};
    size_t not_approved{0};
    double success_rate{0.0};
    std::vector<std::string> recommendations;
};

class Scheduler {
public:
    Scheduler(ConfirmationGateway& gateway, AuditLog& audit, SchedulerOptions opts = {});
    ~Scheduler();

    void set_decomposer(std::shared_ptr<Decomposer> decomposer);

    // Throws std::invalid_argument on duplicate task ids or empty descriptions.
    std::shared_ptr<Plan> build_plan(const std::string& goal, const std::vector<StepSpec>& steps);
    // Uses the decomposer; falls back to fallback_steps() if it is absent or fails.
    std::shared_ptr<Plan> build_plan(const std::string& goal);

    Task* next_runnable_task(Plan& plan);
    // Runs one attempt. Lifecycle events go to plan.execution_log; the audit
    // log only sees the gateway's decision and the executor's result.
    bool execute_task(Plan& plan, Task& task, Executor& executor);
    PlanSummary run_plan(Plan& plan, Executor& executor);
    void cancel_plan(Plan& plan);
    Reflection reflect(const Plan& plan) const;

    const SchedulerOptions& options() const;

private:
    // PIMPL-ish internal helpers kept in .cpp
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace taskgate
