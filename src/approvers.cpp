#include "taskgate/approvers.hpp"
#include "taskgate/log.hpp"

#include <cerrno>
#include <iostream>
#include <sstream>
#include <poll.h>
#include <unistd.h>

namespace taskgate {

// --------------- console ----------------
ConsoleApprover::ConsoleApprover(std::ostream& out) : out_(out) {}

void ConsoleApprover::publish(const ConfirmationRequest& request) {
    std::lock_guard<std::mutex> lk(mu_);
    out_ << "\n=== CONFIRMATION REQUIRED (" << to_string(request.tier) << ") ===\n"
         << "id:     " << request.id << "\n"
         << "action: " << request.description << "\n";
    if (!request.origin.empty()) out_ << "origin: " << request.origin << "\n";
    out_ << format_details_for_display(request.details) << "\n"
         << "reply: approve " << request.id << " | deny " << request.id << "\n"
         << std::flush;
}

std::string ConsoleApprover::handle_command(ConfirmationGateway& gateway, const std::string& line,
                                            const std::string& resolver) {
    std::istringstream iss(line);
    std::string verb, id;
    iss >> verb >> id;
    if (verb.empty()) return {};
    if (verb == "list") {
        auto pending = gateway.list_pending();
        if (pending.empty()) return "no pending confirmations";
        std::string out;
        for (const auto& r : pending) out += r.id + "  " + r.description + "\n";
        return out;
    }
    bool approve = verb == "approve" || verb == "y" || verb == "yes";
    bool deny = verb == "deny" || verb == "n" || verb == "no";
    if (!approve && !deny) return "unknown command '" + verb + "' (approve <id> | deny <id> | list)";
    if (id.empty()) {
        // Bare verdict applies to the oldest pending request.
        auto pending = gateway.list_pending();
        if (pending.empty()) return "no pending confirmations";
        id = pending.front().id;
    }
    auto st = gateway.submit_response(id, approve, resolver);
    return id + ": " + to_string(st);
}

void ConsoleApprover::run_input_loop(ConfirmationGateway& gateway, const std::atomic<bool>& running,
                                     const std::string& resolver, int fd) {
    auto apply = [&](const std::string& line) {
        auto msg = handle_command(gateway, line, resolver);
        if (!msg.empty()) log::info("console", msg);
    };

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    std::string pending;
    char buf[512];
    while (running.load()) {
        int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log::warn("console", "poll on input failed; console approvals disabled");
            return;
        }
        if (rc == 0) continue;
        if (pfd.revents & POLLNVAL) return;

        // Data that arrived with a hangup is still read; EOF shows up as a 0-byte read.
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            log::warn("console", "read on input failed; console approvals disabled");
            return;
        }
        if (n == 0) {
            if (!pending.empty()) apply(pending);
            return;
        }
        pending.append(buf, static_cast<size_t>(n));
        size_t pos = 0;
        while ((pos = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, pos);
            pending.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            apply(line);
        }
    }
}

// --------------- auto responder ----------------
AutoResponder::AutoResponder(ConfirmationGateway& gateway, bool approve, std::chrono::milliseconds delay,
                             std::string resolver)
    : gateway_(gateway), approve_(approve), delay_(delay), resolver_(std::move(resolver)) {
    worker_ = std::thread([this] { loop(); });
}

AutoResponder::~AutoResponder() {
    stop();
}

void AutoResponder::publish(const ConfirmationRequest& request) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stop_) return;
        queue_.push({std::chrono::steady_clock::now() + delay_, request.id});
    }
    cv_.notify_one();
}

void AutoResponder::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void AutoResponder::loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        if (queue_.empty()) {
            cv_.wait(lk, [&] { return stop_ || !queue_.empty(); });
            continue;
        }
        auto due = queue_.top();
        if (std::chrono::steady_clock::now() < due.at) {
            cv_.wait_until(lk, due.at);
            continue;
        }
        queue_.pop();
        lk.unlock();
        auto st = gateway_.submit_response(due.request_id, approve_, resolver_);
        log::debug(resolver_, due.request_id + " -> " + to_string(st));
        answered_.fetch_add(1);
        lk.lock();
    }
}

} // namespace taskgate
