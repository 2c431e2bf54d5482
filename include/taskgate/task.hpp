#pragma once
#include "action.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskgate {

enum class TaskStatus { Pending, Runnable, InProgress, Completed, Failed, Cancelled };
enum class PlanStatus { Pending, Running, Completed, Cancelled, Stalled };

const char* to_string(TaskStatus status);
const char* to_string(PlanStatus status);

struct Task {
    using TaskId = std::string;
    using Clock = std::chrono::system_clock;

    static constexpr unsigned kDefaultMaxRetries = 3;

    Task(TaskId task_id, std::string desc, Action act)
        : id(std::move(task_id)), description(std::move(desc)), action(std::move(act)) {}

    TaskId id;
    std::string description;
    Action action;
    std::vector<TaskId> depends_on{};
    int priority{0};  // informational; insertion order decides ties
    TaskStatus status{TaskStatus::Pending};
    unsigned attempts{0};
    unsigned max_retries{kDefaultMaxRetries};
    std::string result{};
    std::string last_error{};
    FailureKind failure{FailureKind::None};
    std::string confirmation_id{};  // outstanding request while awaiting approval
    Clock::time_point created_at{Clock::now()};
    std::optional<Clock::time_point> started_at{};
    std::optional<Clock::time_point> completed_at{};
    std::chrono::milliseconds runtime{0};

    bool terminal() const {
        return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Cancelled;
    }
};

struct ExecutionLogEntry {
    std::chrono::system_clock::time_point timestamp{};
    Task::TaskId task_id;
    std::string event;
    std::string message;
};

struct PlanSummary {
    std::string plan_id;
    std::string goal;
    PlanStatus status{PlanStatus::Pending};
    size_t total{0};
    size_t completed{0};
    size_t failed{0};
    size_t pending{0};
    size_t in_progress{0};
    size_t cancelled{0};
    int progress_percent{0};
    std::vector<Task::TaskId> stalled{};
};

/// A goal's task DAG. Created and mutated by the Scheduler; `mu` guards every
/// field below it, readers take it too (or use snapshot()).
struct Plan {
    using Clock = std::chrono::system_clock;

    Plan(std::string plan_id, std::string plan_goal) : id(std::move(plan_id)), goal(std::move(plan_goal)) {}
    Plan(const Plan&) = delete;
    Plan& operator=(const Plan&) = delete;

    const std::string id;
    const std::string goal;

    mutable std::mutex mu;
    std::condition_variable cv;
    PlanStatus status{PlanStatus::Pending};
    std::vector<Task> tasks;  // insertion order = priority tie-break; never resized after build
    std::vector<ExecutionLogEntry> execution_log;
    Clock::time_point created_at{Clock::now()};
    std::optional<Clock::time_point> started_at{};
    std::optional<Clock::time_point> completed_at{};
    std::atomic<bool> cancel_requested{false};

    // Callers hold `mu`.
    Task* find_locked(const Task::TaskId& task_id);
    const Task* find_locked(const Task::TaskId& task_id) const;
    void log_locked(const Task::TaskId& task_id, std::string event, std::string message);
    PlanSummary summary_locked() const;

    PlanSummary summary() const;
    std::vector<Task> snapshot() const;
    std::optional<Task> task(const Task::TaskId& task_id) const;
    std::vector<ExecutionLogEntry> log_snapshot() const;
};

std::string make_plan_id();

} // namespace taskgate
