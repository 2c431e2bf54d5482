#include "apps/executor_interface.hpp"
#include "taskgate/log.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace {

struct EchoOptions {
    unsigned delay_ms = 20;
    unsigned fail_first = 0;  // fail this many attempts of every task before succeeding
};

unsigned parse_unsigned(const std::string& text, unsigned fallback) {
    if (text.empty()) return fallback;
    unsigned value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return fallback;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

EchoOptions parse_options(int argc, char** argv) {
    EchoOptions opts;
    for (int i = 0; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg.rfind("--delay-ms=", 0) == 0) {
            opts.delay_ms = parse_unsigned(arg.substr(sizeof("--delay-ms=") - 1), opts.delay_ms);
            continue;
        }
        if (arg.rfind("--fail-first=", 0) == 0) {
            opts.fail_first = parse_unsigned(arg.substr(sizeof("--fail-first=") - 1), opts.fail_first);
            continue;
        }
        taskgate::log::warn("echo", "ignoring unknown option " + arg);
    }
    return opts;
}

// Prints what an approved task would have done instead of doing it.
class EchoExecutor : public taskgate::Executor {
public:
    explicit EchoExecutor(EchoOptions opts) : opts_(opts) {}

    std::string name() const override { return "echo"; }

    taskgate::ExecutionResult run(const taskgate::Task& task) override {
        auto t0 = std::chrono::steady_clock::now();
        if (opts_.delay_ms) std::this_thread::sleep_for(std::chrono::milliseconds(opts_.delay_ms));

        unsigned seen = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            seen = ++calls_[task.id];
        }
        taskgate::ExecutionResult r;
        if (seen <= opts_.fail_first) {
            r.ok = false;
            r.message = "echo: simulated failure " + std::to_string(seen) + "/" + std::to_string(opts_.fail_first);
        } else {
            r.ok = true;
            r.message = "echo: " + task.action.describe();
        }
        r.runtime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
        return r;
    }

private:
    EchoOptions opts_;
    std::mutex mu_;
    std::map<std::string, unsigned> calls_;
};

} // namespace

extern "C" taskgate::Executor* taskgate_create_executor(int argc, char** argv) {
    return new EchoExecutor(parse_options(argc, argv));
}

extern "C" void taskgate_destroy_executor(taskgate::Executor* executor) {
    delete executor;
}
