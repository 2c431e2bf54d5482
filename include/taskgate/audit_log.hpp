#pragma once
#include "risk.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskgate {

inline constexpr const char kActorScheduler[] = "scheduler";
inline constexpr const char kActorUser[] = "user";
inline constexpr const char kActorSystem[] = "system";

struct AuditEntry {
    uint64_t sequence{0};
    std::chrono::system_clock::time_point timestamp{};
    std::string actor;
    std::string action;
    RiskTier tier{RiskTier::Safe};
    std::string outcome;
    std::optional<std::string> error;
    std::string request_id;  // empty when no confirmation request was opened
};

/// Append-only record of gated decisions. Appends are serialized among
/// writers; readers take a snapshot of the published chain and never block
/// an append.
class AuditLog {
public:
    AuditLog() = default;
    ~AuditLog();
    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    // Stamps sequence and timestamp; returns the stored entry.
    AuditEntry append(AuditEntry entry);
    AuditEntry append(std::string actor, std::string action, RiskTier tier, std::string outcome,
                      std::optional<std::string> error = std::nullopt, std::string request_id = {});

    std::vector<AuditEntry> tail(size_t n) const;
    std::vector<AuditEntry> export_all() const;
    size_t size() const { return size_.load(std::memory_order_acquire); }

    // Writes export_all() as a JSON array, gzip-compressed when the path ends
    // in ".gz". Returns false on I/O failure.
    bool export_json(const std::string& path) const;

private:
    struct Node {
        AuditEntry entry;
        std::shared_ptr<const Node> prev;
    };

    std::vector<AuditEntry> collect(size_t limit) const;

    std::mutex append_mu_;
    std::shared_ptr<const Node> head_;  // only touched through std::atomic_load/atomic_store
    std::atomic<size_t> size_{0};
    uint64_t next_sequence_{1};
};

} // namespace taskgate
