#pragma once
#include "action.hpp"
#include "audit_log.hpp"
#include "errors.hpp"
#include "risk.hpp"
#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace taskgate {

enum class ConfirmationStatus { Pending, Approved, Denied, TimedOut };
enum class Decision { Approved, Denied, TimedOut, Blocked };
enum class ResponseStatus { Accepted, NotFound, AlreadyResolved };

const char* to_string(ConfirmationStatus status);
const char* to_string(Decision decision);
const char* to_string(ResponseStatus status);

struct ConfirmationRequest {
    std::string id;
    std::string action_name;
    std::string action_kind;
    RiskTier tier{RiskTier::Warning};
    std::string description;
    Details details;
    std::string origin;  // "<plan>/<task>" when opened by the scheduler
    ConfirmationStatus status{ConfirmationStatus::Pending};
    std::chrono::system_clock::time_point created{};
    std::optional<std::chrono::system_clock::time_point> resolved{};
    std::string resolver;
    std::string reason;
};

struct ApprovalOutcome {
    Decision decision{Decision::Denied};
    RiskTier tier{RiskTier::Safe};
    std::string request_id;  // empty for Safe/Blocked, which never open a request
    std::string resolver;
    std::string reason;
    FailureKind failure{FailureKind::None};

    bool approved() const { return decision == Decision::Approved; }
};

/// Outbound notification to a UI/chat transport. Fire-and-forget: responses
/// come back through ConfirmationGateway::submit_response.
class ApproverChannel {
public:
    virtual ~ApproverChannel() = default;
    virtual std::string name() const = 0;
    virtual void publish(const ConfirmationRequest& request) = 0;
};

class ConfirmationGateway;

/// Handle returned by open_request; pass it to await_outcome exactly once.
class PendingTicket {
public:
    const std::string& request_id() const { return request_id_; }
    bool immediate() const { return immediate_.has_value(); }

private:
    friend class ConfirmationGateway;
    struct State;

    std::optional<ApprovalOutcome> immediate_;
    std::shared_ptr<State> state_;
    std::string request_id_;
};

std::string make_request_id();

class ConfirmationGateway {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{60000};

    // Must outlive every caller suspended in await_outcome.
    ConfirmationGateway(const RiskClassifier& classifier, AuditLog& audit, size_t history_limit = 1000);

    void add_channel(std::shared_ptr<ApproverChannel> channel);

    // Classify, and for Warning/Danger block the caller until a response or
    // the timeout. Safe and Blocked return without a round-trip.
    ApprovalOutcome request_confirmation(const Action& action,
                                         std::chrono::milliseconds timeout = kDefaultTimeout,
                                         const std::string& description = {}, const std::string& origin = {});

    // Two-phase form of request_confirmation, so a caller can learn the
    // request id before it suspends.
    PendingTicket open_request(const Action& action, std::chrono::milliseconds timeout,
                               const std::string& description = {}, const std::string& origin = {});
    ApprovalOutcome await_outcome(PendingTicket& ticket);

    // A response arriving after the deadline is refused (AlreadyResolved) and
    // the request is resolved as timed out instead.
    ResponseStatus submit_response(const std::string& request_id, bool approved, const std::string& resolver);

    // Force-deny a pending request as resolver "system".
    ResponseStatus cancel(const std::string& request_id, const std::string& reason);

    // Requests past their deadline are not listed, waiter or not.
    std::vector<ConfirmationRequest> list_pending() const;
    std::vector<ConfirmationRequest> get_history(size_t limit = 50) const;
    size_t pending_count() const;

private:
    static constexpr size_t kShards = 16;

    struct Shard {
        mutable std::mutex mu;
        std::unordered_map<std::string, std::shared_ptr<PendingTicket::State>> pending;
        std::unordered_set<std::string> resolved;  // ids still in history_
    };

    Shard& shard_for(const std::string& id);
    const Shard& shard_for(const std::string& id) const;

    bool resolve(PendingTicket::State& state, ConfirmationStatus status, const std::string& resolver,
                 const std::string& reason);
    ResponseStatus respond(const std::string& request_id, ConfirmationStatus status, const std::string& resolver,
                           const std::string& reason);
    void publish(const ConfirmationRequest& request);
    ConfirmationRequest finalize_once(PendingTicket::State& state);
    void finalize(const ConfirmationRequest& request);
    std::vector<ConfirmationRequest> live_pending() const;

    const RiskClassifier& classifier_;
    AuditLog& audit_;
    size_t history_limit_;

    std::array<Shard, kShards> shards_;

    mutable std::mutex channels_mu_;
    std::vector<std::shared_ptr<ApproverChannel>> channels_;

    mutable std::mutex history_mu_;
    std::deque<ConfirmationRequest> history_;
};

// "Key Name: value" lines for display in an approver UI.
std::string format_details_for_display(const Details& details);

} // namespace taskgate
