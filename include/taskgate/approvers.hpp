#pragma once
#include "confirmation.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace taskgate {

/// Prints each request with its formatted details. Answers arrive through
/// run_input_loop or any other transport calling submit_response.
class ConsoleApprover : public ApproverChannel {
public:
    explicit ConsoleApprover(std::ostream& out);
    std::string name() const override { return "console"; }
    void publish(const ConfirmationRequest& request) override;

    // Reads "approve <id>", "deny <id>" and "list" commands from `fd` until
    // `running` drops or the input reaches EOF. Polls so shutdown is prompt.
    static void run_input_loop(ConfirmationGateway& gateway, const std::atomic<bool>& running,
                               const std::string& resolver = "console", int fd = 0);

    // Applies one command line; returns the message shown to the operator.
    static std::string handle_command(ConfirmationGateway& gateway, const std::string& line,
                                      const std::string& resolver);

private:
    std::ostream& out_;
    std::mutex mu_;
};

/// Answers every request with a fixed verdict after `delay`, from its own
/// thread, the way a remote transport would.
class AutoResponder : public ApproverChannel {
public:
    AutoResponder(ConfirmationGateway& gateway, bool approve,
                  std::chrono::milliseconds delay = std::chrono::milliseconds(0),
                  std::string resolver = "auto-responder");
    ~AutoResponder() override;

    std::string name() const override { return resolver_; }
    void publish(const ConfirmationRequest& request) override;
    void stop();

    size_t answered() const { return answered_.load(); }

private:
    struct Due {
        std::chrono::steady_clock::time_point at;
        std::string request_id;
        bool operator>(const Due& other) const { return at > other.at; }
    };

    void loop();

    ConfirmationGateway& gateway_;
    bool approve_;
    std::chrono::milliseconds delay_;
    std::string resolver_;

    std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Due, std::vector<Due>, std::greater<Due>> queue_;
    bool stop_{false};
    std::atomic<size_t> answered_{0};
    std::thread worker_;
};

} // namespace taskgate
