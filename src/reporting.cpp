#include "taskgate/reporting.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace taskgate {
namespace reporting {

static std::atomic<bool> g_csv{false};
static std::mutex g_io;

void set_csv(bool value) {
    g_csv.store(value, std::memory_order_relaxed);
}

bool csv_enabled() {
    return g_csv.load(std::memory_order_relaxed);
}

static std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

void report_result(const Task& task) {
    const std::string& msg = task.status == TaskStatus::Completed ? task.result : task.last_error;
    std::lock_guard<std::mutex> lk(g_io);
    if (csv_enabled()) {
        std::cout << csv_escape(task.id) << "," << to_string(task.status) << "," << task.attempts << ","
                  << to_string(task.failure) << "," << csv_escape(msg) << "," << task.runtime.count() << "\n";
        return;
    }
    std::cout << "[RESULT] Task " << task.id << " status=" << to_string(task.status)
              << " attempts=" << task.attempts << "/" << task.max_retries
              << " msg=\"" << msg << "\" time_ms=" << task.runtime.count() << "\n";
}

void print_summary(const PlanSummary& s, std::ostream& os) {
    if (csv_enabled()) {
        os << "plan,status,total,completed,failed,pending,cancelled,progress\n"
           << csv_escape(s.plan_id) << "," << to_string(s.status) << "," << s.total << "," << s.completed << ","
           << s.failed << "," << s.pending << "," << s.cancelled << "," << s.progress_percent << "\n";
        return;
    }
    os << "Plan " << s.plan_id << " [" << to_string(s.status) << "]: " << s.goal << "\n"
       << "  completed " << s.completed << "/" << s.total << " (" << s.progress_percent << "%)"
       << ", failed " << s.failed << ", pending " << s.pending << ", cancelled " << s.cancelled << "\n";
    if (!s.stalled.empty()) {
        os << "  stalled:";
        for (const auto& id : s.stalled) os << " " << id;
        os << "\n";
    }
}

} // namespace reporting
} // namespace taskgate
