#include "taskgate/audit_log.hpp"
#include "taskgate/json.hpp"
#include "taskgate/log.hpp"

#include <algorithm>
#include <fstream>
#include <zlib.h>

namespace taskgate {

AuditLog::~AuditLog() {
    // Unlink iteratively; a long chain would otherwise recurse through ~shared_ptr.
    auto node = std::atomic_load(&head_);
    std::atomic_store(&head_, std::shared_ptr<const Node>{});
    while (node && node.use_count() == 1) {
        auto prev = node->prev;
        node.reset();
        node = std::move(prev);
    }
}

AuditEntry AuditLog::append(AuditEntry entry) {
    std::lock_guard<std::mutex> lk(append_mu_);
    entry.sequence = next_sequence_++;
    entry.timestamp = std::chrono::system_clock::now();
    auto node = std::make_shared<Node>();
    node->entry = std::move(entry);
    node->prev = std::atomic_load(&head_);
    std::shared_ptr<const Node> published = node;
    std::atomic_store(&head_, published);
    size_.fetch_add(1, std::memory_order_release);
    return published->entry;
}

AuditEntry AuditLog::append(std::string actor, std::string action, RiskTier tier, std::string outcome,
                            std::optional<std::string> error, std::string request_id) {
    AuditEntry e;
    e.actor = std::move(actor);
    e.action = std::move(action);
    e.tier = tier;
    e.outcome = std::move(outcome);
    e.error = std::move(error);
    e.request_id = std::move(request_id);
    return append(std::move(e));
}

std::vector<AuditEntry> AuditLog::collect(size_t limit) const {
    std::vector<AuditEntry> out;
    auto node = std::atomic_load(&head_);
    while (node && out.size() < limit) {
        out.push_back(node->entry);
        node = node->prev;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<AuditEntry> AuditLog::tail(size_t n) const {
    return collect(n);
}

std::vector<AuditEntry> AuditLog::export_all() const {
    return collect(static_cast<size_t>(-1));
}

namespace {
bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool write_gzip(const std::string& path, const std::string& body) {
    gzFile gz = gzopen(path.c_str(), "wb9");
    if (!gz) {
        log::error("audit", "cannot open " + path + " for writing");
        return false;
    }
    int written = gzwrite(gz, body.data(), static_cast<unsigned>(body.size()));
    int closed = gzclose(gz);
    if (written != static_cast<int>(body.size()) || closed != Z_OK) {
        log::error("audit", "gzip write to " + path + " failed (zlib " + std::to_string(closed) + ")");
        return false;
    }
    return true;
}
} // namespace

bool AuditLog::export_json(const std::string& path) const {
    nlohmann::json j = export_all();
    std::string body = j.dump(2) + "\n";

    if (ends_with(path, ".gz")) {
        if (!write_gzip(path, body)) return false;
    } else {
        std::ofstream ofs(path);
        if (!ofs) {
            log::error("audit", "cannot open " + path + " for writing");
            return false;
        }
        ofs << body;
        if (!ofs.good()) {
            log::error("audit", "write to " + path + " failed");
            return false;
        }
    }
    log::debug("audit", "exported " + std::to_string(j.size()) + " entries to " + path);
    return true;
}

} // namespace taskgate
