#pragma once
#include "action.hpp"
#include "audit_log.hpp"
#include "confirmation.hpp"
#include "decomposer.hpp"
#include "task.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace taskgate {

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const Action& action);
void to_json(nlohmann::json& j, const AuditEntry& entry);
void to_json(nlohmann::json& j, const ConfirmationRequest& request);
void to_json(nlohmann::json& j, const Task& task);
void to_json(nlohmann::json& j, const ExecutionLogEntry& entry);
void to_json(nlohmann::json& j, const PlanSummary& summary);

// {plan_id, goal, status, created_at, started_at, completed_at, tasks[], summary, execution_log[]}
nlohmann::json plan_to_json(const Plan& plan);
bool export_plan(const Plan& plan, const std::string& path);

// Throws std::invalid_argument on unknown kinds or missing fields.
Action action_from_json(const nlohmann::json& j);
std::vector<StepSpec> steps_from_json(const nlohmann::json& j);

} // namespace taskgate
