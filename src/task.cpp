#include "taskgate/task.hpp"

#include <cstdio>

namespace taskgate {

const char* to_string(TaskStatus status) {
    switch (status) {
    case TaskStatus::Pending: return "pending";
    case TaskStatus::Runnable: return "runnable";
    case TaskStatus::InProgress: return "in_progress";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Failed: return "failed";
    case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(PlanStatus status) {
    switch (status) {
    case PlanStatus::Pending: return "pending";
    case PlanStatus::Running: return "running";
    case PlanStatus::Completed: return "completed";
    case PlanStatus::Cancelled: return "cancelled";
    case PlanStatus::Stalled: return "stalled";
    }
    return "unknown";
}

std::string make_plan_id() {
    static std::atomic<unsigned> seq{0};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    char buf[48];
    std::snprintf(buf, sizeof(buf), "plan-%lld-%u", static_cast<long long>(ms), seq.fetch_add(1) + 1);
    return buf;
}

Task* Plan::find_locked(const Task::TaskId& task_id) {
    for (auto& t : tasks)
        if (t.id == task_id) return &t;
    return nullptr;
}

const Task* Plan::find_locked(const Task::TaskId& task_id) const {
    for (const auto& t : tasks)
        if (t.id == task_id) return &t;
    return nullptr;
}

void Plan::log_locked(const Task::TaskId& task_id, std::string event, std::string message) {
    execution_log.push_back({Clock::now(), task_id, std::move(event), std::move(message)});
}

PlanSummary Plan::summary_locked() const {
    PlanSummary s;
    s.plan_id = id;
    s.goal = goal;
    s.status = status;
    s.total = tasks.size();
    for (const auto& t : tasks) {
        switch (t.status) {
        case TaskStatus::Completed: ++s.completed; break;
        case TaskStatus::Failed: ++s.failed; break;
        case TaskStatus::Cancelled: ++s.cancelled; break;
        case TaskStatus::InProgress: ++s.in_progress; break;
        case TaskStatus::Pending:
        case TaskStatus::Runnable:
            ++s.pending;
            if (t.failure == FailureKind::DependencyStalled) s.stalled.push_back(t.id);
            break;
        }
    }
    s.progress_percent = s.total ? static_cast<int>(s.completed * 100 / s.total) : 0;
    return s;
}

PlanSummary Plan::summary() const {
    std::lock_guard<std::mutex> lk(mu);
    return summary_locked();
}

std::vector<Task> Plan::snapshot() const {
    std::lock_guard<std::mutex> lk(mu);
    return tasks;
}

std::optional<Task> Plan::task(const Task::TaskId& task_id) const {
    std::lock_guard<std::mutex> lk(mu);
    if (const auto* t = find_locked(task_id)) return *t;
    return std::nullopt;
}

std::vector<ExecutionLogEntry> Plan::log_snapshot() const {
    std::lock_guard<std::mutex> lk(mu);
    return execution_log;
}

} // namespace taskgate
