#include "taskgate/approvers.hpp"
#include "taskgate/audit_log.hpp"
#include "taskgate/confirmation.hpp"
#include "taskgate/log.hpp"
#include "taskgate/reporting.hpp"
#include "taskgate/risk.hpp"
#include "taskgate/scheduler.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace taskgate;

static bool parse_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i)
        if (flag == argv[i]) return true;
    return false;
}

int main(int argc, char** argv) {
    log::set_verbose(parse_flag(argc, argv, "--verbose"));
    const bool deny = parse_flag(argc, argv, "--deny");

    AuditLog audit;
    RiskClassifier classifier(PolicyConfig::defaults());
    ConfirmationGateway gateway(classifier, audit);
    auto responder = std::make_shared<AutoResponder>(gateway, !deny, std::chrono::milliseconds(50), "demo-operator");
    gateway.add_channel(responder);

    SchedulerOptions opts;
    opts.confirmation_timeout = std::chrono::milliseconds(2000);
    opts.parallelism = 2;
    Scheduler sched(gateway, audit, opts);

    // fetch -> inspect -> report, with an unrelated cleanup that is always blocked
    std::vector<StepSpec> steps;
    steps.push_back({"fetch", "Download the weather feed",
                     Action::download("https://example.org/weather.json", "weather.json"), {}, {}, 0});
    steps.push_back({"inspect", "Inspect the downloaded feed", std::nullopt, {"fetch"}, {}, 1});
    steps.push_back({"report", "Write the report",
                     Action::file(FileOp::Write, "/tmp/taskgate_demo/report.txt"), {"inspect"}, {}, 2});
    steps.push_back({"cleanup", "Clear the cache", Action::command("rm -rf /tmp/taskgate_demo/cache"), {}, {}, 3});

    auto plan = sched.build_plan("Build a weather report", steps);
    auto executor = make_simulated_executor(std::chrono::milliseconds(30));
    auto summary = sched.run_plan(*plan, *executor);
    responder->stop();

    reporting::print_summary(summary, std::cout);
    std::cout << "\naudit log (" << audit.size() << " entries):\n";
    for (const auto& e : audit.export_all()) {
        std::cout << "  #" << e.sequence << " " << e.actor << " " << to_string(e.tier) << " " << e.outcome << " "
                  << e.action;
        if (e.error) std::cout << " (" << *e.error << ")";
        std::cout << "\n";
    }
    return 0;
}
