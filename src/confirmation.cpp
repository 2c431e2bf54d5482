#include "taskgate/confirmation.hpp"
#include "taskgate/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <functional>

namespace taskgate {

struct PendingTicket::State {
    std::mutex mu;
    std::condition_variable cv;
    ConfirmationRequest request;
    std::chrono::steady_clock::time_point deadline{};
    std::chrono::milliseconds timeout{0};
    bool finalized{false};

    // Caller holds mu.
    bool expired_locked(std::chrono::steady_clock::time_point now) const {
        return request.status == ConfirmationStatus::Pending && now >= deadline;
    }
    void time_out_locked() {
        request.status = ConfirmationStatus::TimedOut;
        request.resolved = std::chrono::system_clock::now();
        request.resolver = kActorSystem;
        request.reason = "no response within " + std::to_string(timeout.count()) + " ms";
    }
};

namespace {

const char* outcome_name(ConfirmationStatus status) {
    switch (status) {
    case ConfirmationStatus::Approved: return "approved";
    case ConfirmationStatus::Denied: return "denied";
    case ConfirmationStatus::TimedOut: return "timed_out";
    case ConfirmationStatus::Pending: return "pending";
    }
    return "unknown";
}

ApprovalOutcome outcome_from(const ConfirmationRequest& req) {
    ApprovalOutcome out;
    out.tier = req.tier;
    out.request_id = req.id;
    out.resolver = req.resolver;
    out.reason = req.reason;
    switch (req.status) {
    case ConfirmationStatus::Approved:
        out.decision = Decision::Approved;
        out.failure = FailureKind::None;
        break;
    case ConfirmationStatus::TimedOut:
        out.decision = Decision::TimedOut;
        out.failure = FailureKind::ApprovalTimedOut;
        break;
    case ConfirmationStatus::Denied:
    case ConfirmationStatus::Pending:
        out.decision = Decision::Denied;
        out.failure = FailureKind::ApprovalDenied;
        break;
    }
    return out;
}

} // namespace

const char* to_string(ConfirmationStatus status) {
    return outcome_name(status);
}

const char* to_string(Decision decision) {
    switch (decision) {
    case Decision::Approved: return "approved";
    case Decision::Denied: return "denied";
    case Decision::TimedOut: return "timed_out";
    case Decision::Blocked: return "blocked";
    }
    return "unknown";
}

const char* to_string(ResponseStatus status) {
    switch (status) {
    case ResponseStatus::Accepted: return "accepted";
    case ResponseStatus::NotFound: return "not_found";
    case ResponseStatus::AlreadyResolved: return "already_resolved";
    }
    return "unknown";
}

std::string make_request_id() {
    // Strictly increasing microsecond stamp: unique and time ordered.
    static std::atomic<long long> last_us{0};
    auto now_us = std::chrono::duration_cast<std::chrono::microseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    long long prev = last_us.load(std::memory_order_relaxed);
    long long next = 0;
    do {
        next = std::max<long long>(now_us, prev + 1);
    } while (!last_us.compare_exchange_weak(prev, next, std::memory_order_relaxed));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "cr-%016lld", next);
    return buf;
}

std::string format_details_for_display(const Details& details) {
    std::string out;
    for (const auto& kv : details) {
        std::string key = kv.first;
        bool word_start = true;
        for (auto& c : key) {
            if (c == '_') {
                c = ' ';
                word_start = true;
            } else if (word_start) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                word_start = false;
            }
        }
        if (!out.empty()) out += "\n";
        out += key + ": " + kv.second;
    }
    return out;
}

ConfirmationGateway::ConfirmationGateway(const RiskClassifier& classifier, AuditLog& audit, size_t history_limit)
    : classifier_(classifier), audit_(audit), history_limit_(history_limit ? history_limit : 1) {}

void ConfirmationGateway::add_channel(std::shared_ptr<ApproverChannel> channel) {
    if (!channel) return;
    std::lock_guard<std::mutex> lk(channels_mu_);
    channels_.push_back(std::move(channel));
}

ConfirmationGateway::Shard& ConfirmationGateway::shard_for(const std::string& id) {
    return shards_[std::hash<std::string>{}(id) % kShards];
}

const ConfirmationGateway::Shard& ConfirmationGateway::shard_for(const std::string& id) const {
    return shards_[std::hash<std::string>{}(id) % kShards];
}

ApprovalOutcome ConfirmationGateway::request_confirmation(const Action& action, std::chrono::milliseconds timeout,
                                                          const std::string& description,
                                                          const std::string& origin) {
    auto ticket = open_request(action, timeout, description, origin);
    return await_outcome(ticket);
}

PendingTicket ConfirmationGateway::open_request(const Action& action, std::chrono::milliseconds timeout,
                                                const std::string& description, const std::string& origin) {
    // A caller-supplied description is scanned together with the action's own.
    const std::string own = action.describe();
    const std::string scanned = description.empty() ? own : description + "\n" + own;
    auto c = classifier_.classify(action.name(), scanned, action.details(), action.category(),
                                  action.target_path().value_or(std::string{}));
    std::string text = description.empty() ? own : description;
    if (c.tier == RiskTier::Danger && text.rfind(kCriticalMarker, 0) != 0) text = kCriticalMarker + text;

    PendingTicket ticket;
    if (c.tier == RiskTier::Safe) {
        audit_.append(kActorSystem, text, c.tier, "auto_approved");
        log::debug("gateway", "auto-approved: " + text);
        ApprovalOutcome out;
        out.decision = Decision::Approved;
        out.tier = c.tier;
        out.resolver = kActorSystem;
        out.reason = "safe";
        ticket.immediate_ = out;
        return ticket;
    }
    if (c.tier == RiskTier::Blocked) {
        std::string reason = "matched " + c.rule;
        audit_.append(kActorSystem, text, c.tier, "blocked", "blocked: " + reason);
        log::warn("gateway", "BLOCKED " + text + " (" + c.rule + ")");
        ApprovalOutcome out;
        out.decision = Decision::Blocked;
        out.tier = c.tier;
        out.resolver = kActorSystem;
        out.reason = reason;
        out.failure = FailureKind::ClassificationBlocked;
        ticket.immediate_ = out;
        return ticket;
    }

    auto state = std::make_shared<PendingTicket::State>();
    auto& req = state->request;
    req.id = make_request_id();
    req.action_name = action.name();
    req.action_kind = to_string(action.kind());
    req.tier = c.tier;
    req.description = text;
    req.details = action.details();
    req.origin = origin;
    req.created = std::chrono::system_clock::now();
    state->timeout = timeout;
    state->deadline = std::chrono::steady_clock::now() + timeout;

    // "requested" is recorded before any responder can see the request, so
    // it always precedes the resolution entry.
    audit_.append(kActorScheduler, text, c.tier, "requested", std::nullopt, req.id);
    {
        auto& shard = shard_for(req.id);
        std::lock_guard<std::mutex> lk(shard.mu);
        shard.pending.emplace(req.id, state);
    }
    if (c.tier == RiskTier::Danger) log::warn("gateway", "critical action awaiting approval: " + text);
    log::info("gateway", "confirmation " + req.id + " requested: " + text);

    ticket.state_ = state;
    ticket.request_id_ = req.id;

    // The request is visible in the pending set before any approver sees it,
    // so an immediate response always finds it.
    publish(req);
    return ticket;
}

ApprovalOutcome ConfirmationGateway::await_outcome(PendingTicket& ticket) {
    if (ticket.immediate_) return *ticket.immediate_;
    if (!ticket.state_) {
        ApprovalOutcome out;
        out.decision = Decision::Denied;
        out.failure = FailureKind::DuplicateResolution;
        out.reason = "ticket already consumed";
        return out;
    }

    auto state = std::move(ticket.state_);
    {
        std::unique_lock<std::mutex> lk(state->mu);
        state->cv.wait_until(lk, state->deadline,
                             [&] { return state->request.status != ConfirmationStatus::Pending; });
        if (state->request.status == ConfirmationStatus::Pending) state->time_out_locked();
    }
    auto out = outcome_from(finalize_once(*state));
    ticket.immediate_ = out;
    return out;
}

bool ConfirmationGateway::resolve(PendingTicket::State& state, ConfirmationStatus status, const std::string& resolver,
                                  const std::string& reason) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lk(state.mu);
        if (state.request.status != ConfirmationStatus::Pending) return false;
        if (state.expired_locked(std::chrono::steady_clock::now())) {
            state.time_out_locked();
        } else {
            state.request.status = status;
            state.request.resolved = std::chrono::system_clock::now();
            state.request.resolver = resolver;
            state.request.reason = reason;
            accepted = true;
        }
    }
    state.cv.notify_all();
    finalize_once(state);
    return accepted;
}

ResponseStatus ConfirmationGateway::respond(const std::string& request_id, ConfirmationStatus status,
                                            const std::string& resolver, const std::string& reason) {
    std::shared_ptr<PendingTicket::State> state;
    {
        auto& shard = shard_for(request_id);
        std::lock_guard<std::mutex> lk(shard.mu);
        auto it = shard.pending.find(request_id);
        if (it != shard.pending.end()) {
            state = it->second;
        } else if (shard.resolved.count(request_id)) {
            log::warn("gateway", "response for " + request_id + " ignored: already resolved");
            return ResponseStatus::AlreadyResolved;
        } else {
            log::warn("gateway", "response for unknown request " + request_id);
            return ResponseStatus::NotFound;
        }
    }
    if (!resolve(*state, status, resolver, reason)) {
        log::warn("gateway", "response for " + request_id + " ignored: already resolved");
        return ResponseStatus::AlreadyResolved;
    }
    return ResponseStatus::Accepted;
}

ResponseStatus ConfirmationGateway::submit_response(const std::string& request_id, bool approved,
                                                    const std::string& resolver) {
    std::string who = resolver.empty() ? std::string(kActorUser) : resolver;
    return respond(request_id, approved ? ConfirmationStatus::Approved : ConfirmationStatus::Denied, who,
                   approved ? "approved by " + who : "rejected by " + who);
}

ResponseStatus ConfirmationGateway::cancel(const std::string& request_id, const std::string& reason) {
    return respond(request_id, ConfirmationStatus::Denied, kActorSystem, reason);
}

void ConfirmationGateway::publish(const ConfirmationRequest& request) {
    std::vector<std::shared_ptr<ApproverChannel>> channels;
    {
        std::lock_guard<std::mutex> lk(channels_mu_);
        channels = channels_;
    }
    if (channels.empty()) log::debug("gateway", "no approver channel registered for " + request.id);
    for (auto& ch : channels) {
        try {
            ch->publish(request);
        } catch (const std::exception& e) {
            log::warn("gateway", "channel " + ch->name() + " failed to publish " + request.id + ": " + e.what());
        }
    }
}

// The waiter and the responder both call this; the first records the outcome.
// Held under state.mu so neither returns before the resolution is audited.
ConfirmationRequest ConfirmationGateway::finalize_once(PendingTicket::State& state) {
    std::lock_guard<std::mutex> lk(state.mu);
    if (!state.finalized) {
        state.finalized = true;
        finalize(state.request);
    }
    return state.request;
}

void ConfirmationGateway::finalize(const ConfirmationRequest& request) {
    {
        auto& shard = shard_for(request.id);
        std::lock_guard<std::mutex> lk(shard.mu);
        shard.pending.erase(request.id);
        shard.resolved.insert(request.id);
    }
    std::vector<std::string> evicted;
    {
        std::lock_guard<std::mutex> lk(history_mu_);
        history_.push_back(request);
        while (history_.size() > history_limit_) {
            evicted.push_back(history_.front().id);
            history_.pop_front();
        }
    }
    // Ids that fall out of history answer NotFound from then on.
    for (const auto& id : evicted) {
        auto& shard = shard_for(id);
        std::lock_guard<std::mutex> lk(shard.mu);
        shard.resolved.erase(id);
    }

    const bool by_user = request.resolver != kActorSystem;
    std::optional<std::string> error;
    if (request.status != ConfirmationStatus::Approved) error = request.reason;
    audit_.append(by_user ? kActorUser : kActorSystem, request.description, request.tier,
                  outcome_name(request.status), error, request.id);

    if (request.status == ConfirmationStatus::Approved) {
        log::info("gateway", "confirmation " + request.id + " APPROVED by " + request.resolver);
    } else {
        log::warn("gateway", "confirmation " + request.id + " " + outcome_name(request.status) + ": " + request.reason);
    }
}

std::vector<ConfirmationRequest> ConfirmationGateway::live_pending() const {
    std::vector<ConfirmationRequest> out;
    const auto now = std::chrono::steady_clock::now();
    for (const auto& shard : shards_) {
        std::vector<std::shared_ptr<PendingTicket::State>> states;
        {
            std::lock_guard<std::mutex> lk(shard.mu);
            for (const auto& kv : shard.pending) states.push_back(kv.second);
        }
        for (const auto& st : states) {
            std::lock_guard<std::mutex> lk(st->mu);
            if (st->request.status == ConfirmationStatus::Pending && !st->expired_locked(now))
                out.push_back(st->request);
        }
    }
    return out;
}

std::vector<ConfirmationRequest> ConfirmationGateway::list_pending() const {
    auto out = live_pending();
    std::sort(out.begin(), out.end(),
              [](const ConfirmationRequest& a, const ConfirmationRequest& b) { return a.id < b.id; });
    return out;
}

std::vector<ConfirmationRequest> ConfirmationGateway::get_history(size_t limit) const {
    std::lock_guard<std::mutex> lk(history_mu_);
    size_t n = std::min(limit, history_.size());
    return std::vector<ConfirmationRequest>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

size_t ConfirmationGateway::pending_count() const {
    return live_pending().size();
}

} // namespace taskgate
