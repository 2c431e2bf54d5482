#include <catch2/catch.hpp>
#include "taskgate/config.hpp"
#include "taskgate/json.hpp"
#include "taskgate/scheduler.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace taskgate;
using nlohmann::json;

TEST_CASE("Policy documents override defaults key by key", "[config]") {
    auto p = policy_from_json(json::parse(R"({
        "extra_blocked_patterns": ["curl | sh"],
        "critical_actions": ["wipe_logs"],
        "approval_categories": ["download"],
        "protected_paths": ["/opt/agent"]
    })"));
    auto defaults = PolicyConfig::defaults();
    CHECK(p.blocked_patterns.size() == defaults.blocked_patterns.size() + 1);
    CHECK(p.blocked_patterns.back() == "curl | sh");
    CHECK(p.critical_actions == std::set<std::string>{"wipe_logs"});
    CHECK(p.approval_categories.size() == 1);
    CHECK(p.approval_categories.count(ActionCategory::Download) == 1);
    CHECK(p.protected_paths == std::vector<std::string>{"/opt/agent"});

    RiskClassifier rc(p);
    CHECK(rc.classify(Action::command("curl | sh")).tier == RiskTier::Blocked);
    CHECK(rc.classify(Action::command("ls")).tier == RiskTier::Safe);
}

TEST_CASE("Malformed policies are rejected", "[config]") {
    CHECK_THROWS_AS(policy_from_json(json::array()), std::invalid_argument);
    CHECK_THROWS_AS(policy_from_json(json::parse(R"({"approval_categories": ["telepathy"]})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(policy_from_json(json::parse(R"({"approval_categories": ["none"]})")), std::invalid_argument);
    CHECK_THROWS_AS(policy_from_json(json::parse(R"({"blocked_patterns": "rm"})")), std::invalid_argument);
    CHECK_THROWS_AS(policy_from_json(json::parse(R"({"blocked_patterns": [1]})")), std::invalid_argument);
    CHECK_THROWS_AS(load_policy("/definitely/not/here.json"), std::runtime_error);
}

TEST_CASE("Policy survives a trip through JSON", "[config]") {
    auto p = PolicyConfig::defaults();
    p.protected_paths = {"/srv"};
    auto back = policy_from_json(policy_to_json(p));
    CHECK(back.blocked_patterns == p.blocked_patterns);
    CHECK(back.critical_actions == p.critical_actions);
    CHECK(back.approval_categories == p.approval_categories);
    CHECK(back.protected_paths == p.protected_paths);
}

TEST_CASE("Step files accept strings and objects", "[json]") {
    auto steps = steps_from_json(json::parse(R"({"steps": [
        "Look around",
        {"id": "dl", "action": {"kind": "download_file", "url": "https://x.org/f.zip"}},
        {"id": "rm", "description": "remove it", "depends_on": ["dl"], "max_retries": 1,
         "action": {"kind": "file_operation", "operation": "delete", "path": "/tmp/f.zip"}}
    ]})"));
    REQUIRE(steps.size() == 3);
    CHECK(steps[0].description == "Look around");
    CHECK_FALSE(steps[0].action.has_value());
    CHECK(steps[1].description == "Download file: f.zip from https://x.org/f.zip");
    REQUIRE(steps[2].action);
    CHECK(steps[2].action->name() == "file_delete");
    CHECK(steps[2].depends_on == std::vector<std::string>{"dl"});
    CHECK(steps[2].max_retries == std::optional<unsigned>(1u));

    CHECK(steps_from_json(json::parse(R"(["a", "b"])")).size() == 2);
}

TEST_CASE("Malformed steps are rejected", "[json]") {
    CHECK_THROWS_AS(steps_from_json(json::parse(R"({"steps": 3})")), std::invalid_argument);
    CHECK_THROWS_AS(steps_from_json(json::parse(R"([{"id": "x"}])")), std::invalid_argument);
    CHECK_THROWS_AS(steps_from_json(json::parse(R"([42])")), std::invalid_argument);
    CHECK_THROWS_AS(action_from_json(json::parse(R"({"kind": "teleport"})")), std::invalid_argument);
    CHECK_THROWS_AS(action_from_json(json::parse(R"({"kind": "file_operation", "operation": "shred", "path": "/a"})")),
                    std::invalid_argument);
    CHECK_THROWS_AS(action_from_json(json::parse(R"({"kind": "system_command"})")), std::invalid_argument);
}

TEST_CASE("Plans export their tasks and execution log", "[json]") {
    AuditLog audit;
    RiskClassifier rc(PolicyConfig::defaults());
    ConfirmationGateway gateway(rc, audit);
    Scheduler sched(gateway, audit);
    std::vector<StepSpec> specs(2);
    specs[0].id = "one";
    specs[0].description = "first";
    specs[1].id = "two";
    specs[1].description = "second";
    specs[1].depends_on = {"one"};
    auto plan = sched.build_plan("export me", specs);
    auto exec = make_simulated_executor(std::chrono::milliseconds(1));
    sched.run_plan(*plan, *exec);

    auto j = plan_to_json(*plan);
    CHECK(j["plan_id"] == plan->id);
    CHECK(j["status"] == "completed");
    REQUIRE(j["tasks"].size() == 2);
    CHECK(j["tasks"][1]["depends_on"][0] == "one");
    CHECK(j["tasks"][0]["result"] == "Simulated result for: first");
    CHECK(j["summary"]["total_tasks"] == 2);
    CHECK(j["summary"]["progress_percent"] == 100);
    CHECK_FALSE(j["execution_log"].empty());

    auto path = std::filesystem::temp_directory_path() / "taskgate_plan_export_test.json";
    REQUIRE(export_plan(*plan, path.string()));
    std::ifstream in(path);
    CHECK(json::parse(in)["goal"] == "export me");
    std::filesystem::remove(path);
}

TEST_CASE("Timestamps are ISO-8601 UTC with milliseconds", "[json]") {
    std::chrono::system_clock::time_point tp{std::chrono::milliseconds(1714564800123LL)};
    CHECK(format_timestamp(tp) == "2024-05-01T12:00:00.123Z");
}
