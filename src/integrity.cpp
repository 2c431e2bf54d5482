#include "taskgate/integrity.hpp"
#include "taskgate/log.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <vector>

namespace taskgate {

namespace {
constexpr size_t kChunkBytes = 64 * 1024;

using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* data, unsigned len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string short_hash(const std::string& hex) {
    return hex.substr(0, 12);
}
} // namespace

const char* to_string(IntegrityIssue issue) {
    switch (issue) {
    case IntegrityIssue::Modified: return "modified";
    case IntegrityIssue::Missing: return "missing";
    case IntegrityIssue::Unreadable: return "unreadable";
    }
    return "unknown";
}

IntegrityMonitor::IntegrityMonitor(std::vector<std::string> files, AuditLog* audit)
    : files_(std::move(files)), audit_(audit) {}

std::optional<FileDigest> IntegrityMonitor::hash_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;

    MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        log::error("integrity", "sha256 context setup failed");
        return std::nullopt;
    }

    FileDigest d;
    std::vector<char> buf(kChunkBytes);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(got)) != 1) return std::nullopt;
        d.size += static_cast<uint64_t>(got);
    }
    if (in.bad()) return std::nullopt;

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) return std::nullopt;
    d.sha256 = to_hex(md, len);
    return d;
}

size_t IntegrityMonitor::baseline() {
    baseline_.clear();
    size_t hashed = 0;
    for (const auto& f : files_) {
        auto d = hash_file(f);
        if (d) {
            ++hashed;
            log::debug("integrity", f + " sha256=" + d->sha256 + " size=" + std::to_string(d->size));
        } else {
            log::warn("integrity", "cannot hash " + f + " for baseline");
        }
        baseline_[f] = d;
    }
    log::info("integrity", "baseline recorded for " + std::to_string(hashed) + "/" + std::to_string(files_.size())
                               + " files");
    return hashed;
}

std::vector<IntegrityFinding> IntegrityMonitor::verify() {
    std::vector<IntegrityFinding> findings;
    for (const auto& f : files_) {
        auto it = baseline_.find(f);
        std::optional<FileDigest> expected;
        if (it != baseline_.end()) expected = it->second;

        std::error_code ec;
        bool exists = std::filesystem::exists(f, ec);
        auto current = exists ? hash_file(f) : std::nullopt;

        if (!exists) {
            if (expected) findings.push_back({f, IntegrityIssue::Missing, "file removed since baseline"});
            continue;
        }
        if (!current) {
            findings.push_back({f, IntegrityIssue::Unreadable, "file exists but cannot be read"});
            continue;
        }
        if (!expected) {
            findings.push_back({f, IntegrityIssue::Modified, "file appeared after baseline"});
        } else if (*current != *expected) {
            findings.push_back({f, IntegrityIssue::Modified,
                                "sha256 " + short_hash(expected->sha256) + " -> " + short_hash(current->sha256) + ", size "
                                    + std::to_string(expected->size) + " -> " + std::to_string(current->size)});
        }
    }

    for (const auto& fnd : findings) {
        log::warn("integrity", std::string("TAMPERED ") + fnd.path + " (" + to_string(fnd.issue) + "): " + fnd.detail);
        if (audit_) {
            audit_->append(kActorSystem, std::string("integrity check: ") + fnd.path, RiskTier::Danger, "tampered",
                           std::string(to_string(fnd.issue)) + ": " + fnd.detail);
        }
    }
    if (findings.empty()) log::debug("integrity", "all " + std::to_string(files_.size()) + " files intact");
    return findings;
}

std::optional<FileDigest> IntegrityMonitor::baseline_hash(const std::string& path) const {
    auto it = baseline_.find(path);
    if (it == baseline_.end()) return std::nullopt;
    return it->second;
}

} // namespace taskgate
