#pragma once
#include "audit_log.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskgate {

struct FileDigest {
    std::string sha256;  // lowercase hex
    uint64_t size{0};

    bool operator==(const FileDigest& o) const { return sha256 == o.sha256 && size == o.size; }
    bool operator!=(const FileDigest& o) const { return !(*this == o); }
};

enum class IntegrityIssue { Modified, Missing, Unreadable };

const char* to_string(IntegrityIssue issue);

struct IntegrityFinding {
    std::string path;
    IntegrityIssue issue{IntegrityIssue::Modified};
    std::string detail;
};

/// Detects tampering with a fixed set of files by comparing content digests
/// against a baseline. Not thread-safe; one monitor per owner.
class IntegrityMonitor {
public:
    explicit IntegrityMonitor(std::vector<std::string> files, AuditLog* audit = nullptr);

    // Records the current digest of every file. Files that cannot be read are
    // recorded as missing and reported by verify() once they appear.
    size_t baseline();

    // Re-hashes every file and compares against the baseline. Each finding is
    // also appended to the audit log when one is attached.
    std::vector<IntegrityFinding> verify();

    std::optional<FileDigest> baseline_hash(const std::string& path) const;
    const std::vector<std::string>& files() const { return files_; }

    // SHA-256 of the file contents, streamed in chunks. nullopt when the file
    // cannot be opened or read.
    static std::optional<FileDigest> hash_file(const std::string& path);

private:
    std::vector<std::string> files_;
    AuditLog* audit_;
    std::map<std::string, std::optional<FileDigest>> baseline_;
};

} // namespace taskgate
