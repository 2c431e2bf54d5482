#include "taskgate/json.hpp"
#include "taskgate/log.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>

namespace taskgate {

using nlohmann::json;

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

namespace {

json optional_time(const std::optional<std::chrono::system_clock::time_point>& tp) {
    return tp ? json(format_timestamp(*tp)) : json(nullptr);
}

std::string require_string(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string())
        throw std::invalid_argument(std::string("missing string field '") + key + "'");
    return j.at(key).get<std::string>();
}

std::string optional_string(const json& j, const char* key, const std::string& fallback = {}) {
    if (!j.contains(key)) return fallback;
    if (!j.at(key).is_string()) throw std::invalid_argument(std::string("field '") + key + "' must be a string");
    return j.at(key).get<std::string>();
}

} // namespace

void to_json(json& j, const Action& action) {
    j = json::object();
    j["name"] = action.name();
    j["kind"] = to_string(action.kind());
    j["category"] = to_string(action.category());
    j["description"] = action.describe();
    j["details"] = action.details();
}

void to_json(json& j, const AuditEntry& entry) {
    j = json{
        {"sequence", entry.sequence},
        {"timestamp", format_timestamp(entry.timestamp)},
        {"actor", entry.actor},
        {"action", entry.action},
        {"risk", to_string(entry.tier)},
        {"outcome", entry.outcome},
        {"error", entry.error ? json(*entry.error) : json(nullptr)},
    };
    if (!entry.request_id.empty()) j["request_id"] = entry.request_id;
}

void to_json(json& j, const ConfirmationRequest& request) {
    j = json{
        {"id", request.id},
        {"action", request.action_name},
        {"action_type", request.action_kind},
        {"risk", to_string(request.tier)},
        {"description", request.description},
        {"details", request.details},
        {"formatted_details", format_details_for_display(request.details)},
        {"origin", request.origin},
        {"status", to_string(request.status)},
        {"created_at", format_timestamp(request.created)},
        {"resolved_at", optional_time(request.resolved)},
        {"resolver", request.resolver},
        {"reason", request.reason},
    };
}

void to_json(json& j, const Task& task) {
    j = json{
        {"id", task.id},
        {"description", task.description},
        {"action", task.action},
        {"depends_on", task.depends_on},
        {"priority", task.priority},
        {"status", to_string(task.status)},
        {"attempts", task.attempts},
        {"max_retries", task.max_retries},
        {"result", task.result.empty() ? json(nullptr) : json(task.result)},
        {"error", task.last_error.empty() ? json(nullptr) : json(task.last_error)},
        {"failure", to_string(task.failure)},
        {"created_at", format_timestamp(task.created_at)},
        {"started_at", optional_time(task.started_at)},
        {"completed_at", optional_time(task.completed_at)},
        {"runtime_ms", task.runtime.count()},
    };
}

void to_json(json& j, const ExecutionLogEntry& entry) {
    j = json{
        {"timestamp", format_timestamp(entry.timestamp)},
        {"task_id", entry.task_id},
        {"status", entry.event},
        {"message", entry.message},
    };
}

void to_json(json& j, const PlanSummary& summary) {
    j = json{
        {"plan_id", summary.plan_id},
        {"goal", summary.goal},
        {"status", to_string(summary.status)},
        {"total_tasks", summary.total},
        {"completed", summary.completed},
        {"failed", summary.failed},
        {"pending", summary.pending},
        {"in_progress", summary.in_progress},
        {"cancelled", summary.cancelled},
        {"progress_percent", summary.progress_percent},
        {"stalled", summary.stalled},
    };
}

json plan_to_json(const Plan& plan) {
    std::lock_guard<std::mutex> lk(plan.mu);
    return json{
        {"plan_id", plan.id},
        {"goal", plan.goal},
        {"status", to_string(plan.status)},
        {"created_at", format_timestamp(plan.created_at)},
        {"started_at", optional_time(plan.started_at)},
        {"completed_at", optional_time(plan.completed_at)},
        {"tasks", plan.tasks},
        {"summary", plan.summary_locked()},
        {"execution_log", plan.execution_log},
    };
}

bool export_plan(const Plan& plan, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        log::error("planner", "failed to export plan " + plan.id + ": cannot open " + path);
        return false;
    }
    ofs << plan_to_json(plan).dump(2) << "\n";
    if (!ofs.good()) {
        log::error("planner", "failed to export plan " + plan.id + ": write error");
        return false;
    }
    return true;
}

Action action_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("action must be an object");
    auto kind_text = require_string(j, "kind");
    auto kind = parse_action_kind(kind_text);
    if (!kind) throw std::invalid_argument("unknown action kind '" + kind_text + "'");
    auto name = optional_string(j, "name");

    switch (*kind) {
    case ActionKind::Step:
        return Action::step(require_string(j, "description"), name);
    case ActionKind::FileOperation: {
        auto op_text = require_string(j, "operation");
        auto op = parse_file_op(op_text);
        if (!op) throw std::invalid_argument("unknown file operation '" + op_text + "'");
        return Action::file(*op, require_string(j, "path"), optional_string(j, "destination"), name);
    }
    case ActionKind::ProgramExecution:
        return Action::program(require_string(j, "program"),
                               j.value("arguments", std::vector<std::string>{}), name);
    case ActionKind::SystemCommand:
        return Action::command(require_string(j, "command"), name);
    case ActionKind::NetworkAccess:
        return Action::network(require_string(j, "url"), optional_string(j, "method", "GET"), name);
    case ActionKind::DownloadFile:
        return Action::download(require_string(j, "url"), optional_string(j, "file_name"),
                                j.value("size_bytes", uint64_t{0}), name);
    case ActionKind::GameInteraction:
        return Action::game(require_string(j, "game"), require_string(j, "action"), name);
    case ActionKind::ScreenControl: {
        ScreenParams region;
        region.x = j.value("x", 0);
        region.y = j.value("y", 0);
        region.width = j.value("width", 0);
        region.height = j.value("height", 0);
        region.output_path = optional_string(j, "output_path");
        return Action::screen(region, name);
    }
    case ActionKind::KeyboardInput:
        if (j.contains("keys")) return Action::keyboard_keys(j.at("keys").get<std::vector<std::string>>(), name);
        return Action::keyboard_text(require_string(j, "text"), name);
    case ActionKind::MouseControl:
        return Action::mouse(j.value("x", -1), j.value("y", -1), optional_string(j, "button", "left"), name);
    }
    throw std::invalid_argument("unhandled action kind '" + kind_text + "'");
}

std::vector<StepSpec> steps_from_json(const json& j) {
    const json& list = j.is_object() && j.contains("steps") ? j.at("steps") : j;
    if (!list.is_array()) throw std::invalid_argument("steps must be an array");

    std::vector<StepSpec> steps;
    for (const auto& item : list) {
        StepSpec spec;
        if (item.is_string()) {
            spec.description = item.get<std::string>();
        } else if (item.is_object()) {
            spec.id = optional_string(item, "id");
            spec.description = optional_string(item, "description");
            if (item.contains("action")) spec.action = action_from_json(item.at("action"));
            if (spec.description.empty() && spec.action) spec.description = spec.action->describe();
            spec.depends_on = item.value("depends_on", std::vector<std::string>{});
            if (item.contains("max_retries")) spec.max_retries = item.at("max_retries").get<unsigned>();
            spec.priority = item.value("priority", 0);
        } else {
            throw std::invalid_argument("step must be a string or an object");
        }
        if (spec.description.empty()) throw std::invalid_argument("step has no description");
        steps.push_back(std::move(spec));
    }
    return steps;
}

} // namespace taskgate
