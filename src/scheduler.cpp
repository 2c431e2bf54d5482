#include "taskgate/scheduler.hpp"
#include "taskgate/log.hpp"
#include "taskgate/reporting.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace taskgate {

namespace {

// Caller holds plan.mu.
bool deps_satisfied(const Plan& plan, const Task& t) {
    for (const auto& d : t.depends_on) {
        const Task* dep = plan.find_locked(d);
        if (!dep || dep->status != TaskStatus::Completed) return false;
    }
    return true;
}

std::string blocking_reason(const Plan& plan, const Task& t) {
    std::string out;
    for (const auto& d : t.depends_on) {
        const Task* dep = plan.find_locked(d);
        std::string part;
        if (!dep) part = "unknown dependency '" + d + "'";
        else if (dep->status != TaskStatus::Completed) part = "'" + d + "' " + to_string(dep->status);
        if (part.empty()) continue;
        if (!out.empty()) out += ", ";
        out += part;
    }
    return out;
}

} // namespace

class Scheduler::Impl {
public:
    Impl(ConfirmationGateway& gateway, AuditLog& audit, SchedulerOptions opts)
        : gateway_(gateway), audit_(audit), opts_(opts) {
        if (opts_.parallelism == 0) opts_.parallelism = 1;
    }

    std::shared_ptr<Plan> build_plan(const std::string& goal, const std::vector<StepSpec>& steps);
    std::shared_ptr<Plan> build_plan(const std::string& goal);
    Task* next_runnable_task(Plan& plan);
    bool execute_task(Plan& plan, Task& task, Executor& executor);
    PlanSummary run_plan(Plan& plan, Executor& executor);
    void cancel_plan(Plan& plan);
    Reflection reflect(const Plan& plan) const;

    void set_decomposer(std::shared_ptr<Decomposer> d) { decomposer_ = std::move(d); }
    const SchedulerOptions& options() const { return opts_; }

private:
    Task* next_runnable_locked(Plan& plan);
    void mark_cancelled_locked(Plan& plan, Task& task, const std::string& message);
    void finish_plan(Plan& plan);
    void worker_loop(Plan& plan, Executor& executor, unsigned& in_flight);

    ConfirmationGateway& gateway_;
    AuditLog& audit_;
    SchedulerOptions opts_;
    std::shared_ptr<Decomposer> decomposer_;
};

std::shared_ptr<Plan> Scheduler::Impl::build_plan(const std::string& goal, const std::vector<StepSpec>& steps) {
    auto plan = std::make_shared<Plan>(make_plan_id(), goal);
    std::unordered_set<std::string> seen;
    plan->tasks.reserve(steps.size());
    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& spec = steps[i];
        std::string id = spec.id.empty() ? "step_" + std::to_string(i) : spec.id;
        if (!seen.insert(id).second) throw std::invalid_argument("duplicate task id '" + id + "'");
        if (spec.description.empty()) throw std::invalid_argument("task '" + id + "' has no description");
        Task t(id, spec.description, spec.action ? *spec.action : Action::step(spec.description));
        t.depends_on = spec.depends_on;
        t.max_retries = spec.max_retries.value_or(opts_.max_retries);
        t.priority = spec.priority ? spec.priority : static_cast<int>(i);
        plan->tasks.push_back(std::move(t));
    }
    for (const auto& t : plan->tasks) {
        for (const auto& d : t.depends_on) {
            if (d == t.id) log::warn("planner", "task " + t.id + " depends on itself and will stall");
            else if (!seen.count(d)) log::warn("planner", "task " + t.id + " depends on unknown task '" + d + "'");
        }
    }
    log::info("planner", "plan " + plan->id + " built with " + std::to_string(plan->tasks.size())
                             + " tasks for goal: " + goal);
    return plan;
}

std::shared_ptr<Plan> Scheduler::Impl::build_plan(const std::string& goal) {
    if (decomposer_) {
        try {
            auto steps = decomposer_->decompose(goal);
            if (steps.empty()) throw std::runtime_error("decomposition returned no steps");
            return build_plan(goal, steps);
        } catch (const std::exception& e) {
            log::warn("planner", std::string("decomposition failed (") + e.what() + "); using fallback steps");
        }
    }
    return build_plan(goal, fallback_steps(goal));
}

Task* Scheduler::Impl::next_runnable_locked(Plan& plan) {
    for (auto& t : plan.tasks) {
        if (t.status != TaskStatus::Pending) continue;
        if (deps_satisfied(plan, t)) return &t;
    }
    return nullptr;
}

Task* Scheduler::Impl::next_runnable_task(Plan& plan) {
    std::lock_guard<std::mutex> lk(plan.mu);
    return next_runnable_locked(plan);
}

void Scheduler::Impl::mark_cancelled_locked(Plan& plan, Task& task, const std::string& message) {
    if (task.status != TaskStatus::Cancelled) {
        task.status = TaskStatus::Cancelled;
        task.failure = FailureKind::Cancelled;
        task.last_error = "cancelled";
        task.completed_at = Task::Clock::now();
    }
    plan.log_locked(task.id, "cancelled", message);
}

// One attempt at one task: gate the action, then run it. started/failed/retry
// go to the plan's execution log and not the audit log, so a denied or blocked
// action leaves only the gateway's entries there and an approved one gains a
// single completed/executor_failed entry after the executor returns.
bool Scheduler::Impl::execute_task(Plan& plan, Task& task, Executor& executor) {
    std::optional<Task> snapshot;
    std::string origin;
    {
        std::lock_guard<std::mutex> lk(plan.mu);
        if (plan.cancel_requested.load()) return false;
        if (task.status != TaskStatus::Pending && task.status != TaskStatus::Runnable) {
            log::debug("planner", "task " + task.id + " is " + to_string(task.status) + "; not executing");
            return false;
        }
        if (!deps_satisfied(plan, task)) {
            log::warn("planner", "task " + task.id + " not runnable: " + blocking_reason(plan, task));
            task.status = TaskStatus::Pending;
            return false;
        }
        task.status = TaskStatus::InProgress;
        ++task.attempts;
        task.started_at = Task::Clock::now();
        task.failure = FailureKind::None;
        plan.log_locked(task.id, "started", task.description);
        origin = plan.id + "/" + task.id;
        snapshot.emplace(task);
    }
    log::info("planner", "task " + snapshot->id + " attempt " + std::to_string(snapshot->attempts) + "/"
                             + std::to_string(snapshot->max_retries) + ": " + snapshot->description);

    auto ticket = gateway_.open_request(snapshot->action, opts_.confirmation_timeout, snapshot->description, origin);
    bool cancelled = false;
    if (!ticket.immediate()) {
        std::lock_guard<std::mutex> lk(plan.mu);
        task.confirmation_id = ticket.request_id();
        cancelled = plan.cancel_requested.load();
    }
    // cancel_plan may have run before the id was recorded.
    if (cancelled) gateway_.cancel(ticket.request_id(), "plan cancelled");
    auto outcome = gateway_.await_outcome(ticket);

    {
        std::unique_lock<std::mutex> lk(plan.mu);
        task.confirmation_id.clear();
        if (plan.cancel_requested.load() || task.status == TaskStatus::Cancelled) {
            mark_cancelled_locked(plan, task, "cancelled while awaiting approval");
            lk.unlock();
            plan.cv.notify_all();
            return false;
        }
        if (!outcome.approved()) {
            // Not approved is final: denial is not a transient failure.
            task.status = TaskStatus::Failed;
            task.failure = outcome.failure;
            task.last_error = std::string(reason_tag(outcome.failure)) + ": " + outcome.reason;
            task.completed_at = Task::Clock::now();
            plan.log_locked(task.id, "failed", "not approved: " + task.last_error);
            snapshot.emplace(task);
            lk.unlock();
            reporting::report_result(*snapshot);
            plan.cv.notify_all();
            return false;
        }
    }

    ExecutionResult r;
    std::string error;
    auto t0 = std::chrono::steady_clock::now();
    try {
        r = executor.run(*snapshot);
        if (!r.ok) error = r.message.empty() ? "executor reported failure" : r.message;
    } catch (const std::exception& e) {
        r.ok = false;
        error = e.what();
    }
    if (r.runtime.count() == 0)
        r.runtime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);

    bool retry = false;
    {
        std::unique_lock<std::mutex> lk(plan.mu);
        if (plan.cancel_requested.load() || task.status == TaskStatus::Cancelled) {
            mark_cancelled_locked(plan, task, "result discarded: plan cancelled");
            lk.unlock();
            plan.cv.notify_all();
            return false;
        }
        task.runtime = r.runtime;
        if (r.ok) {
            task.status = TaskStatus::Completed;
            task.result = r.message;
            task.last_error.clear();
            task.completed_at = Task::Clock::now();
            plan.log_locked(task.id, "completed", r.message.empty() ? "success" : r.message);
        } else {
            task.status = TaskStatus::Failed;
            task.failure = FailureKind::ExecutorFailure;
            task.last_error = "executor failure: " + error;
            plan.log_locked(task.id, "failed", error);
            retry = is_retryable(task.failure) && task.attempts < task.max_retries;
            if (!retry) task.completed_at = Task::Clock::now();
        }
        snapshot.emplace(task);
    }
    audit_.append(kActorScheduler, snapshot->description, outcome.tier, r.ok ? "completed" : "executor_failed",
                  r.ok ? std::nullopt : std::optional<std::string>(error), outcome.request_id);
    reporting::report_result(*snapshot);

    if (retry) {
        std::unique_lock<std::mutex> lk(plan.mu);
        if (opts_.retry_backoff.count() > 0) {
            plan.cv.wait_for(lk, opts_.retry_backoff * task.attempts, [&] { return plan.cancel_requested.load(); });
        }
        // Cancelled during backoff: the failure stands.
        if (!plan.cancel_requested.load()) {
            task.status = TaskStatus::Pending;
            plan.log_locked(task.id, "retry", "retrying " + std::to_string(task.attempts) + "/"
                                                  + std::to_string(task.max_retries));
            log::info("planner", "retrying task " + task.id + " (" + std::to_string(task.attempts) + "/"
                                     + std::to_string(task.max_retries) + ")");
        } else {
            task.completed_at = Task::Clock::now();
        }
    }
    plan.cv.notify_all();
    return r.ok;
}

void Scheduler::Impl::worker_loop(Plan& plan, Executor& executor, unsigned& in_flight) {
    std::unique_lock<std::mutex> lk(plan.mu);
    while (!plan.cancel_requested.load()) {
        Task* task = next_runnable_locked(plan);
        if (task) {
            task->status = TaskStatus::Runnable;
            ++in_flight;
            lk.unlock();
            execute_task(plan, *task, executor);
            lk.lock();
            --in_flight;
            plan.cv.notify_all();
            continue;
        }
        // Nothing runnable and nothing running: drained or stalled.
        if (in_flight == 0) break;
        plan.cv.wait(lk);
    }
    lk.unlock();
    plan.cv.notify_all();
}

PlanSummary Scheduler::Impl::run_plan(Plan& plan, Executor& executor) {
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lk(plan.mu);
        if (plan.cancel_requested.load()) return plan.summary_locked();
        plan.status = PlanStatus::Running;
        plan.started_at = Plan::Clock::now();
        plan.completed_at.reset();
        plan.log_locked("", "plan_started", plan.goal);
        total = plan.tasks.size();
    }
    log::info("planner", "executing plan " + plan.id + ": " + plan.goal + " (" + std::to_string(total) + " tasks)");

    unsigned in_flight = 0;  // guarded by plan.mu
    unsigned workers = static_cast<unsigned>(std::min<size_t>(opts_.parallelism, std::max<size_t>(total, 1)));
    std::vector<std::thread> pool;
    for (unsigned i = 1; i < workers; ++i)
        pool.emplace_back([this, &plan, &executor, &in_flight] { worker_loop(plan, executor, in_flight); });
    worker_loop(plan, executor, in_flight);
    for (auto& w : pool)
        if (w.joinable()) w.join();

    finish_plan(plan);
    auto summary = plan.summary();
    log::info("planner", "plan " + plan.id + " " + to_string(summary.status) + ": " + std::to_string(summary.completed)
                             + "/" + std::to_string(summary.total) + " tasks completed, "
                             + std::to_string(summary.failed) + " failed");
    return summary;
}

void Scheduler::Impl::finish_plan(Plan& plan) {
    std::vector<std::string> stalled;
    {
        std::lock_guard<std::mutex> lk(plan.mu);
        if (plan.cancel_requested.load()) {
            plan.status = PlanStatus::Cancelled;
            if (!plan.completed_at) plan.completed_at = Plan::Clock::now();
            return;
        }
        for (auto& t : plan.tasks) {
            if (t.status != TaskStatus::Pending && t.status != TaskStatus::Runnable) continue;
            t.status = TaskStatus::Pending;
            t.failure = FailureKind::DependencyStalled;
            t.last_error = "dependency stalled: " + blocking_reason(plan, t);
            plan.log_locked(t.id, "stalled", t.last_error);
            stalled.push_back(t.id + " (" + t.last_error + ")");
        }
        plan.status = stalled.empty() ? PlanStatus::Completed : PlanStatus::Stalled;
        plan.completed_at = Plan::Clock::now();
        plan.log_locked("", stalled.empty() ? "plan_completed" : "plan_stalled",
                        std::to_string(stalled.size()) + " task(s) stalled");
    }
    if (stalled.empty()) return;

    std::string detail;
    for (const auto& s : stalled) detail += (detail.empty() ? "" : "; ") + s;
    audit_.append(kActorScheduler, "plan " + plan.id + ": " + std::to_string(stalled.size()) + " task(s) stalled",
                  RiskTier::Safe, "stalled", detail);
    log::warn("planner", "plan " + plan.id + " stalled: " + detail);
}

void Scheduler::Impl::cancel_plan(Plan& plan) {
    std::vector<std::string> requests;
    size_t cancelled = 0;
    {
        std::lock_guard<std::mutex> lk(plan.mu);
        if (plan.status == PlanStatus::Cancelled || plan.status == PlanStatus::Completed
            || plan.status == PlanStatus::Stalled)
            return;
        plan.cancel_requested.store(true);
        for (auto& t : plan.tasks) {
            if (t.terminal()) continue;
            if (!t.confirmation_id.empty()) requests.push_back(t.confirmation_id);
            mark_cancelled_locked(plan, t, "plan cancelled");
            ++cancelled;
        }
        plan.status = PlanStatus::Cancelled;
        plan.completed_at = Plan::Clock::now();
        plan.log_locked("", "plan_cancelled", std::to_string(cancelled) + " task(s) cancelled");
    }
    plan.cv.notify_all();
    for (const auto& id : requests) gateway_.cancel(id, "plan cancelled");
    audit_.append(kActorScheduler, "plan " + plan.id + " cancelled", RiskTier::Safe, "cancelled",
                  std::to_string(cancelled) + " task(s) cancelled, " + std::to_string(requests.size())
                      + " confirmation(s) denied");
    log::warn("planner", "plan " + plan.id + " cancelled (" + std::to_string(cancelled) + " tasks)");
}

Reflection Scheduler::Impl::reflect(const Plan& plan) const {
    Reflection r;
    std::chrono::milliseconds runtime{0};
    {
        std::lock_guard<std::mutex> lk(plan.mu);
        r.total = plan.tasks.size();
        for (const auto& t : plan.tasks) {
            if (t.status == TaskStatus::Completed) ++r.completed;
            if (t.status == TaskStatus::Failed) ++r.failed;
            if (t.failure == FailureKind::DependencyStalled) ++r.stalled;
            if (t.attempts > 1) ++r.retried;
            if (t.failure == FailureKind::ApprovalDenied || t.failure == FailureKind::ApprovalTimedOut
                || t.failure == FailureKind::ClassificationBlocked)
                ++r.not_approved;
            runtime += t.runtime;
        }
    }
    r.success_rate = r.total ? static_cast<double>(r.completed) / static_cast<double>(r.total) : 0.0;
    if (r.failed) r.recommendations.push_back("Fix " + std::to_string(r.failed) + " failed tasks");
    if (r.not_approved)
        r.recommendations.push_back("Review " + std::to_string(r.not_approved) + " actions that were not approved");
    if (r.stalled)
        r.recommendations.push_back("Resolve dependencies of " + std::to_string(r.stalled) + " stalled tasks");
    if (r.retried) r.recommendations.push_back(std::to_string(r.retried) + " tasks needed retries; check executor stability");
    if (r.completed && runtime.count() > 0)
        r.recommendations.push_back("Average task runtime " + std::to_string(runtime.count() / static_cast<long long>(r.completed)) + " ms");
    return r;
}

// -------------- thin wrappers --------------
Scheduler::Scheduler(ConfirmationGateway& gateway, AuditLog& audit, SchedulerOptions opts)
    : impl_(std::make_unique<Impl>(gateway, audit, opts)) {}

Scheduler::~Scheduler() = default;

void Scheduler::set_decomposer(std::shared_ptr<Decomposer> d) { impl_->set_decomposer(std::move(d)); }
std::shared_ptr<Plan> Scheduler::build_plan(const std::string& goal, const std::vector<StepSpec>& steps) {
    return impl_->build_plan(goal, steps);
}
std::shared_ptr<Plan> Scheduler::build_plan(const std::string& goal) { return impl_->build_plan(goal); }
Task* Scheduler::next_runnable_task(Plan& plan) { return impl_->next_runnable_task(plan); }
bool Scheduler::execute_task(Plan& plan, Task& task, Executor& executor) {
    return impl_->execute_task(plan, task, executor);
}
PlanSummary Scheduler::run_plan(Plan& plan, Executor& executor) { return impl_->run_plan(plan, executor); }
void Scheduler::cancel_plan(Plan& plan) { impl_->cancel_plan(plan); }
Reflection Scheduler::reflect(const Plan& plan) const { return impl_->reflect(plan); }
const SchedulerOptions& Scheduler::options() const { return impl_->options(); }

} // namespace taskgate
