#include <catch2/catch.hpp>
#include "taskgate/approvers.hpp"
#include "taskgate/confirmation.hpp"
#include "test_support.hpp"

#include <future>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace taskgate;
using namespace std::chrono_literals;
using taskgate::test::eventually;

namespace {

struct GatewayFixture {
    AuditLog audit;
    RiskClassifier classifier{PolicyConfig::defaults()};
    ConfirmationGateway gateway{classifier, audit};

    std::vector<AuditEntry> entries_for(const std::string& request_id) const {
        std::vector<AuditEntry> out;
        for (const auto& e : audit.export_all())
            if (e.request_id == request_id) out.push_back(e);
        return out;
    }
};

// Records published requests without answering.
class RecordingChannel : public ApproverChannel {
public:
    std::string name() const override { return "recording"; }
    void publish(const ConfirmationRequest& request) override {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(request);
    }
    std::mutex mu;
    std::vector<ConfirmationRequest> seen;
};

class ThrowingChannel : public ApproverChannel {
public:
    std::string name() const override { return "broken"; }
    void publish(const ConfirmationRequest&) override { throw std::runtime_error("transport down"); }
};

} // namespace

TEST_CASE_METHOD(GatewayFixture, "Safe actions are auto-approved without a request", "[gateway]") {
    auto out = gateway.request_confirmation(Action::step("Analyze the data"));
    CHECK(out.decision == Decision::Approved);
    CHECK(out.request_id.empty());
    CHECK(gateway.pending_count() == 0);
    CHECK(gateway.get_history().empty());

    auto all = audit.export_all();
    REQUIRE(all.size() == 1);
    CHECK(all[0].outcome == "auto_approved");
    CHECK(all[0].actor == "system");
}

TEST_CASE_METHOD(GatewayFixture, "Blocked actions fail immediately with one audit entry", "[gateway]") {
    auto out = gateway.request_confirmation(Action::command("sudo reboot"));
    CHECK(out.decision == Decision::Blocked);
    CHECK(out.failure == FailureKind::ClassificationBlocked);
    CHECK(out.reason.find("sudo") != std::string::npos);
    CHECK(gateway.pending_count() == 0);

    auto all = audit.export_all();
    REQUIRE(all.size() == 1);
    CHECK(all[0].outcome == "blocked");
    CHECK(all[0].tier == RiskTier::Blocked);
    REQUIRE(all[0].error);
    CHECK(all[0].error->rfind("blocked: ", 0) == 0);
}

TEST_CASE_METHOD(GatewayFixture, "Description overrides are scanned for blocked patterns", "[gateway]") {
    auto out = gateway.request_confirmation(Action::step("tidy up"), 1000ms, "tidy up with rm -rf ~");
    CHECK(out.decision == Decision::Blocked);
}

TEST_CASE_METHOD(GatewayFixture, "Warning requests wait for an approver", "[gateway]") {
    auto responder = std::make_shared<AutoResponder>(gateway, true, 10ms, "alice");
    gateway.add_channel(responder);

    auto out = gateway.request_confirmation(Action::network("https://example.org"), 5000ms);
    CHECK(out.decision == Decision::Approved);
    CHECK(out.tier == RiskTier::Warning);
    CHECK(out.resolver == "alice");
    CHECK(out.reason == "approved by alice");
    CHECK(gateway.pending_count() == 0);

    auto trail = entries_for(out.request_id);
    REQUIRE(trail.size() == 2);
    CHECK(trail[0].outcome == "requested");
    CHECK(trail[1].outcome == "approved");
    CHECK(trail[0].sequence < trail[1].sequence);

    auto hist = gateway.get_history();
    REQUIRE(hist.size() == 1);
    CHECK(hist[0].status == ConfirmationStatus::Approved);
    CHECK(hist[0].resolved.has_value());
    responder->stop();
}

TEST_CASE_METHOD(GatewayFixture, "Denials carry the resolver", "[gateway]") {
    auto responder = std::make_shared<AutoResponder>(gateway, false, 0ms, "bob");
    gateway.add_channel(responder);
    auto out = gateway.request_confirmation(Action::file(FileOp::Delete, "/tmp/x"), 5000ms);
    CHECK(out.decision == Decision::Denied);
    CHECK(out.failure == FailureKind::ApprovalDenied);
    CHECK(out.reason == "rejected by bob");
    responder->stop();
}

TEST_CASE_METHOD(GatewayFixture, "Critical actions are published with the marker", "[gateway]") {
    auto channel = std::make_shared<RecordingChannel>();
    gateway.add_channel(channel);
    auto ticket = gateway.open_request(Action::program("/opt/x", {}, "disable_security"), 5000ms, "", "p/t");
    REQUIRE_FALSE(ticket.immediate());
    {
        std::lock_guard<std::mutex> lk(channel->mu);
        REQUIRE(channel->seen.size() == 1);
        CHECK(channel->seen[0].tier == RiskTier::Danger);
        CHECK(channel->seen[0].description.rfind(kCriticalMarker, 0) == 0);
        CHECK(channel->seen[0].origin == "p/t");
        CHECK(channel->seen[0].details.at("action") == "disable_security");
    }
    CHECK(gateway.submit_response(ticket.request_id(), true, "carol") == ResponseStatus::Accepted);
    CHECK(gateway.await_outcome(ticket).approved());
}

TEST_CASE_METHOD(GatewayFixture, "Unanswered requests time out", "[gateway]") {
    auto t0 = std::chrono::steady_clock::now();
    auto out = gateway.request_confirmation(Action::command("ls"), 50ms);
    auto elapsed = std::chrono::steady_clock::now() - t0;

    CHECK(out.decision == Decision::TimedOut);
    CHECK(out.failure == FailureKind::ApprovalTimedOut);
    CHECK(out.reason == "no response within 50 ms");
    CHECK(elapsed >= 50ms);
    CHECK(elapsed < 50ms + 500ms);
    CHECK(gateway.pending_count() == 0);

    auto trail = entries_for(out.request_id);
    REQUIRE(trail.size() == 2);
    CHECK(trail[1].outcome == "timed_out");
    CHECK(trail[1].actor == "system");

    // a late answer cannot flip the outcome
    CHECK(gateway.submit_response(out.request_id, true, "late") == ResponseStatus::AlreadyResolved);
    CHECK(gateway.get_history().back().status == ConfirmationStatus::TimedOut);
}

TEST_CASE_METHOD(GatewayFixture, "Expiry does not depend on a waiter", "[gateway]") {
    auto ticket = gateway.open_request(Action::network("https://example.org"), 10ms);
    const auto id = ticket.request_id();
    std::this_thread::sleep_for(100ms);

    // nobody has called await_outcome yet
    CHECK(gateway.list_pending().empty());
    CHECK(gateway.pending_count() == 0);
    CHECK(gateway.submit_response(id, true, "late") == ResponseStatus::AlreadyResolved);
    CHECK(gateway.submit_response(id, true, "later") == ResponseStatus::AlreadyResolved);

    auto out = gateway.await_outcome(ticket);
    CHECK(out.decision == Decision::TimedOut);
    CHECK(out.resolver == "system");
    CHECK(out.reason == "no response within 10 ms");

    auto trail = entries_for(id);
    REQUIRE(trail.size() == 2);
    CHECK(trail[0].outcome == "requested");
    CHECK(trail[1].outcome == "timed_out");
    REQUIRE(gateway.get_history().size() == 1);
    CHECK(gateway.get_history().back().status == ConfirmationStatus::TimedOut);
}

TEST_CASE_METHOD(GatewayFixture, "A response is recorded before the waiter returns", "[gateway]") {
    auto ticket = gateway.open_request(Action::command("ls"), 5000ms);
    CHECK(gateway.submit_response(ticket.request_id(), true, "frank") == ResponseStatus::Accepted);
    // resolved even though nobody awaited it yet
    CHECK(gateway.pending_count() == 0);
    REQUIRE(gateway.get_history().size() == 1);
    CHECK(gateway.get_history().back().resolver == "frank");

    auto out = gateway.await_outcome(ticket);
    CHECK(out.approved());
    CHECK(entries_for(ticket.request_id()).size() == 2);
}

TEST_CASE_METHOD(GatewayFixture, "Resolved ids are forgotten with their history", "[gateway]") {
    ConfirmationGateway small(classifier, audit, 2);
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        auto t = small.open_request(Action::command("echo " + std::to_string(i)), 5000ms);
        ids.push_back(t.request_id());
        CHECK(small.submit_response(t.request_id(), true, "u") == ResponseStatus::Accepted);
        small.await_outcome(t);
    }
    CHECK(small.submit_response(ids[0], true, "u") == ResponseStatus::NotFound);
    CHECK(small.submit_response(ids[1], true, "u") == ResponseStatus::AlreadyResolved);
    CHECK(small.submit_response(ids[2], false, "u") == ResponseStatus::AlreadyResolved);
}

TEST_CASE_METHOD(GatewayFixture, "Resolution happens exactly once", "[gateway]") {
    auto ticket = gateway.open_request(Action::network("https://example.org"), 5000ms);
    const auto id = ticket.request_id();
    CHECK(gateway.list_pending().size() == 1);

    CHECK(gateway.submit_response(id, false, "dave") == ResponseStatus::Accepted);
    CHECK(gateway.submit_response(id, true, "eve") == ResponseStatus::AlreadyResolved);
    CHECK(gateway.cancel(id, "too late") == ResponseStatus::AlreadyResolved);

    auto out = gateway.await_outcome(ticket);
    CHECK(out.decision == Decision::Denied);
    CHECK(out.resolver == "dave");
    CHECK(gateway.submit_response(id, true, "eve") == ResponseStatus::AlreadyResolved);
    CHECK(gateway.submit_response("cr-does-not-exist", true, "eve") == ResponseStatus::NotFound);

    // exactly one resolution entry
    size_t resolutions = 0;
    for (const auto& e : entries_for(id))
        if (e.outcome != "requested") ++resolutions;
    CHECK(resolutions == 1);
}

TEST_CASE_METHOD(GatewayFixture, "Concurrent responders race to one winner", "[gateway]") {
    auto ticket = gateway.open_request(Action::network("https://example.org"), 5000ms);
    const auto id = ticket.request_id();

    std::vector<std::future<ResponseStatus>> answers;
    for (int i = 0; i < 8; ++i)
        answers.push_back(std::async(std::launch::async, [this, id, i] {
            return gateway.submit_response(id, i % 2 == 0, "r" + std::to_string(i));
        }));
    int accepted = 0;
    for (auto& f : answers)
        if (f.get() == ResponseStatus::Accepted) ++accepted;
    CHECK(accepted == 1);
    gateway.await_outcome(ticket);
}

TEST_CASE_METHOD(GatewayFixture, "Cancel force-denies as system", "[gateway]") {
    auto fut = std::async(std::launch::async, [this] {
        return gateway.request_confirmation(Action::download("https://example.org/a.iso", "a.iso"), 10000ms);
    });
    REQUIRE(eventually([this] { return gateway.pending_count() == 1; }));
    auto id = gateway.list_pending().front().id;
    CHECK(gateway.cancel(id, "plan cancelled") == ResponseStatus::Accepted);

    auto out = fut.get();
    CHECK(out.decision == Decision::Denied);
    CHECK(out.resolver == "system");
    CHECK(out.reason == "plan cancelled");
    auto trail = entries_for(id);
    REQUIRE(trail.size() == 2);
    CHECK(trail[1].actor == "system");
}

TEST_CASE_METHOD(GatewayFixture, "A failing channel does not stall the request", "[gateway]") {
    gateway.add_channel(std::make_shared<ThrowingChannel>());
    auto ticket = gateway.open_request(Action::command("ls"), 5000ms);
    CHECK(gateway.pending_count() == 1);
    CHECK(gateway.submit_response(ticket.request_id(), true, "") == ResponseStatus::Accepted);
    auto out = gateway.await_outcome(ticket);
    CHECK(out.approved());
    CHECK(out.resolver == "user");
}

TEST_CASE_METHOD(GatewayFixture, "History is bounded and ordered", "[gateway]") {
    ConfirmationGateway small(classifier, audit, 3);
    for (int i = 0; i < 5; ++i) {
        auto t = small.open_request(Action::command("echo " + std::to_string(i)), 5000ms);
        small.submit_response(t.request_id(), true, "u");
        small.await_outcome(t);
    }
    auto hist = small.get_history(10);
    REQUIRE(hist.size() == 3);
    CHECK(hist.front().description == "System command: echo 2");
    CHECK(hist.back().description == "System command: echo 4");
    CHECK(small.get_history(1).size() == 1);
}

TEST_CASE_METHOD(GatewayFixture, "Console commands resolve requests", "[gateway][console]") {
    std::ostringstream out;
    auto console = std::make_shared<ConsoleApprover>(out);
    gateway.add_channel(console);

    auto first = gateway.open_request(Action::command("ls"), 5000ms);
    auto second = gateway.open_request(Action::command("pwd"), 5000ms);
    CHECK(out.str().find("CONFIRMATION REQUIRED") != std::string::npos);
    CHECK(out.str().find("Command: ls") != std::string::npos);

    CHECK(ConsoleApprover::handle_command(gateway, "list", "op").find(first.request_id()) != std::string::npos);
    CHECK(ConsoleApprover::handle_command(gateway, "frobnicate", "op").rfind("unknown command", 0) == 0);
    // bare verdict answers the oldest
    CHECK(ConsoleApprover::handle_command(gateway, "y", "op") == first.request_id() + ": accepted");
    CHECK(ConsoleApprover::handle_command(gateway, "deny " + second.request_id(), "op")
          == second.request_id() + ": accepted");
    CHECK(gateway.await_outcome(first).approved());
    CHECK(gateway.await_outcome(second).decision == Decision::Denied);
    CHECK(ConsoleApprover::handle_command(gateway, "approve", "op") == "no pending confirmations");
}

TEST_CASE_METHOD(GatewayFixture, "Console loop applies every piped command", "[gateway][console]") {
    auto a = gateway.open_request(Action::command("ls"), 5000ms);
    auto b = gateway.open_request(Action::command("pwd"), 5000ms);

    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    const std::string input = "approve " + a.request_id() + "\ndeny " + b.request_id() + "\nlist";
    REQUIRE(::write(fds[1], input.data(), input.size()) == static_cast<ssize_t>(input.size()));
    ::close(fds[1]);

    // returns at EOF after applying the buffered lines
    std::atomic<bool> running{true};
    ConsoleApprover::run_input_loop(gateway, running, "pipe", fds[0]);
    ::close(fds[0]);

    CHECK(gateway.pending_count() == 0);
    auto out_a = gateway.await_outcome(a);
    auto out_b = gateway.await_outcome(b);
    CHECK(out_a.decision == Decision::Approved);
    CHECK(out_a.resolver == "pipe");
    CHECK(out_b.decision == Decision::Denied);
}

TEST_CASE("Details are formatted for display", "[gateway]") {
    CHECK(format_details_for_display({{"file_path", "/a"}, {"kind", "file_operation"}})
          == "File Path: /a\nKind: file_operation");
}

TEST_CASE("Request ids are unique and ordered", "[gateway]") {
    auto a = make_request_id();
    auto b = make_request_id();
    CHECK(a != b);
    CHECK(a < b);
    CHECK(a.rfind("cr-", 0) == 0);
}
