#include "apps/executor_interface.hpp"
#include "taskgate/approvers.hpp"
#include "taskgate/audit_log.hpp"
#include "taskgate/config.hpp"
#include "taskgate/confirmation.hpp"
#include "taskgate/decomposer.hpp"
#include "taskgate/integrity.hpp"
#include "taskgate/json.hpp"
#include "taskgate/log.hpp"
#include "taskgate/reporting.hpp"
#include "taskgate/risk.hpp"
#include "taskgate/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <dlfcn.h>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace taskgate;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_sigint(int) { g_interrupted = 1; }

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " --goal=TEXT [--steps=FILE] [--policy=FILE] [--timeout-ms=N] "
              << "[--parallelism=N] [--max-retries=N] [--backoff-ms=N] -- [executor args...]\n";
    std::cout << "  --approver=MODE       console (default), approve, deny or none\n";
    std::cout << "  --executor-lib=PATH   executor plugin exporting taskgate_create_executor\n";
    std::cout << "  --audit-out=FILE      write the audit log as JSON when the plan ends (gzip if FILE ends in .gz)\n";
    std::cout << "  --plan-out=FILE       write the plan, its tasks and execution log as JSON\n";
    std::cout << "  --protect=FILE        protected file: mutations are blocked, tampering is audited\n";
    std::cout << "  --csv-report          emit task lines as CSV (id,status,attempts,failure,msg,time_ms)\n";
    std::cout << "  --verbose             debug logging\n";
}

unsigned parse_unsigned(const std::string& value, unsigned default_value) {
    if (value.empty()) return default_value;
    unsigned result = 0;
    for (char c : value) {
        if (c < '0' || c > '9') return default_value;
        result = result * 10 + static_cast<unsigned>(c - '0');
    }
    return result;
}

// Owns either a plugin-created executor or a built-in one.
class ExecutorHandle {
public:
    ExecutorHandle() = default;
    ExecutorHandle(const ExecutorHandle&) = delete;
    ExecutorHandle& operator=(const ExecutorHandle&) = delete;
    ~ExecutorHandle() {
        if (plugin_ && destroy_) destroy_(plugin_);
        if (handle_) dlclose(handle_);
    }

    bool load(const std::string& path, int argc, char** argv) {
        handle_ = dlopen(path.c_str(), RTLD_NOW);
        if (!handle_) {
            log::error("runner", std::string("dlopen failed: ") + dlerror());
            return false;
        }
        using create_fn = Executor* (*)(int, char**);
        auto create = reinterpret_cast<create_fn>(dlsym(handle_, "taskgate_create_executor"));
        destroy_ = reinterpret_cast<destroy_fn>(dlsym(handle_, "taskgate_destroy_executor"));
        if (!create || !destroy_) {
            log::error("runner", "failed to resolve taskgate_create_executor/taskgate_destroy_executor in " + path);
            return false;
        }
        plugin_ = create(argc, argv);
        if (!plugin_) {
            log::error("runner", "executor plugin " + path + " returned no executor");
            return false;
        }
        return true;
    }

    void use_builtin(std::unique_ptr<Executor> exec) { builtin_ = std::move(exec); }

    Executor* get() const { return plugin_ ? plugin_ : builtin_.get(); }

private:
    using destroy_fn = void (*)(Executor*);

    void* handle_ = nullptr;
    Executor* plugin_ = nullptr;
    destroy_fn destroy_ = nullptr;
    std::unique_ptr<Executor> builtin_;
};

} // namespace

int main(int argc, char** argv) {
    std::string goal;
    std::string steps_file;
    std::string policy_file;
    std::string approver = "console";
    std::string executor_lib;
    std::string audit_out;
    std::string plan_out;
    std::vector<std::string> protect;
    SchedulerOptions opts;
    bool csv_report = false;
    bool verbose = false;

    int exec_arg_start = argc;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--") {
            exec_arg_start = i + 1;
            break;
        }
        if (arg.rfind("--goal=", 0) == 0) {
            goal = arg.substr(sizeof("--goal=") - 1);
            continue;
        }
        if (arg.rfind("--steps=", 0) == 0) {
            steps_file = arg.substr(sizeof("--steps=") - 1);
            continue;
        }
        if (arg.rfind("--policy=", 0) == 0) {
            policy_file = arg.substr(sizeof("--policy=") - 1);
            continue;
        }
        if (arg.rfind("--timeout-ms=", 0) == 0) {
            opts.confirmation_timeout = std::chrono::milliseconds(
                parse_unsigned(arg.substr(sizeof("--timeout-ms=") - 1),
                               static_cast<unsigned>(opts.confirmation_timeout.count())));
            continue;
        }
        if (arg.rfind("--parallelism=", 0) == 0) {
            opts.parallelism = parse_unsigned(arg.substr(sizeof("--parallelism=") - 1), opts.parallelism);
            continue;
        }
        if (arg.rfind("--max-retries=", 0) == 0) {
            opts.max_retries = parse_unsigned(arg.substr(sizeof("--max-retries=") - 1), opts.max_retries);
            continue;
        }
        if (arg.rfind("--backoff-ms=", 0) == 0) {
            opts.retry_backoff = std::chrono::milliseconds(parse_unsigned(arg.substr(sizeof("--backoff-ms=") - 1), 0));
            continue;
        }
        if (arg.rfind("--approver=", 0) == 0) {
            approver = arg.substr(sizeof("--approver=") - 1);
            continue;
        }
        if (arg.rfind("--executor-lib=", 0) == 0) {
            executor_lib = arg.substr(sizeof("--executor-lib=") - 1);
            continue;
        }
        if (arg.rfind("--audit-out=", 0) == 0) {
            audit_out = arg.substr(sizeof("--audit-out=") - 1);
            continue;
        }
        if (arg.rfind("--plan-out=", 0) == 0) {
            plan_out = arg.substr(sizeof("--plan-out=") - 1);
            continue;
        }
        if (arg.rfind("--protect=", 0) == 0) {
            protect.push_back(arg.substr(sizeof("--protect=") - 1));
            continue;
        }
        if (arg == "--csv-report") {
            csv_report = true;
            continue;
        }
        if (arg == "--verbose") {
            verbose = true;
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (goal.empty()) {
        std::cerr << "Missing --goal=TEXT\n";
        print_usage(argv[0]);
        return 1;
    }
    if (approver != "console" && approver != "approve" && approver != "deny" && approver != "none") {
        std::cerr << "Unknown approver mode: " << approver << "\n";
        print_usage(argv[0]);
        return 1;
    }

    log::set_verbose(verbose);
    reporting::set_csv(csv_report);

    PolicyConfig policy = PolicyConfig::defaults();
    if (!policy_file.empty()) {
        try {
            policy = load_policy(policy_file);
        } catch (const std::exception& e) {
            log::error("runner", e.what());
            return 1;
        }
    }
    policy.protected_paths.insert(policy.protected_paths.end(), protect.begin(), protect.end());

    AuditLog audit;
    RiskClassifier classifier(policy);
    ConfirmationGateway gateway(classifier, audit);

    IntegrityMonitor monitor(protect, &audit);
    if (!protect.empty()) monitor.baseline();

    std::atomic<bool> running{true};
    std::thread input_thread;
    std::shared_ptr<AutoResponder> responder;
    if (approver == "console") {
        gateway.add_channel(std::make_shared<ConsoleApprover>(std::cout));
        input_thread = std::thread([&gateway, &running] { ConsoleApprover::run_input_loop(gateway, running); });
    } else if (approver == "approve" || approver == "deny") {
        responder = std::make_shared<AutoResponder>(gateway, approver == "approve");
        gateway.add_channel(responder);
    } else {
        log::warn("runner", "no approver: gated actions will time out after "
                                + std::to_string(opts.confirmation_timeout.count()) + " ms");
    }

    ExecutorHandle executor;
    if (!executor_lib.empty()) {
        if (!executor.load(executor_lib, argc - exec_arg_start, argv + exec_arg_start)) {
            running = false;
            if (input_thread.joinable()) input_thread.join();
            return 1;
        }
    } else {
        executor.use_builtin(make_simulated_executor());
    }
    log::info("runner", "executor: " + executor.get()->name());

    Scheduler sched(gateway, audit, opts);
    if (!steps_file.empty()) sched.set_decomposer(std::make_shared<JsonStepsDecomposer>(steps_file));

    std::shared_ptr<Plan> plan;
    try {
        plan = sched.build_plan(goal);
    } catch (const std::exception& e) {
        log::error("runner", std::string("cannot build plan: ") + e.what());
        running = false;
        if (input_thread.joinable()) input_thread.join();
        return 1;
    }

    // Ctrl-C cancels the plan; pending confirmations are denied.
    std::signal(SIGINT, on_sigint);
    std::atomic<bool> plan_done{false};
    std::thread interrupt_watch([&] {
        while (!plan_done.load()) {
            if (g_interrupted) {
                log::warn("runner", "interrupted; cancelling plan " + plan->id);
                sched.cancel_plan(*plan);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto summary = sched.run_plan(*plan, *executor.get());
    plan_done = true;
    interrupt_watch.join();
    std::signal(SIGINT, SIG_DFL);

    reporting::print_summary(summary, std::cout);
    auto reflection = sched.reflect(*plan);
    for (const auto& rec : reflection.recommendations) std::cout << "  - " << rec << "\n";

    if (!protect.empty()) {
        auto findings = monitor.verify();
        if (!findings.empty())
            log::warn("runner", std::to_string(findings.size()) + " protected file(s) changed during the run");
    }

    running = false;
    if (input_thread.joinable()) input_thread.join();
    if (responder) responder->stop();

    bool exports_ok = true;
    if (!audit_out.empty()) exports_ok = audit.export_json(audit_out) && exports_ok;
    if (!plan_out.empty()) exports_ok = export_plan(*plan, plan_out) && exports_ok;

    if (!exports_ok) return 1;
    return summary.status == PlanStatus::Completed && summary.failed == 0 ? 0 : 2;
}
