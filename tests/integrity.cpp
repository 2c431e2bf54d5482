#include <catch2/catch.hpp>
#include "taskgate/integrity.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace taskgate;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path root;
    TempDir() {
        root = fs::temp_directory_path() / ("taskgate_integrity_" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    std::string write(const std::string& name, const std::string& content) const {
        auto p = root / name;
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("hash_file computes the SHA-256 of the contents", "[integrity]") {
    TempDir dir;
    auto path = dir.write("check.txt", "123456789");
    auto d = IntegrityMonitor::hash_file(path);
    REQUIRE(d);
    CHECK(d->sha256 == "15e2b0d3c33891ebb0f1ef609ec419420c20e320ce94c65fbc8c3312448eb225");
    CHECK(d->size == 9);

    auto empty = IntegrityMonitor::hash_file(dir.write("empty.txt", ""));
    REQUIRE(empty);
    CHECK(empty->sha256 == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(empty->size == 0);

    // same length, different bytes
    auto swapped = IntegrityMonitor::hash_file(dir.write("swapped.txt", "123456798"));
    REQUIRE(swapped);
    CHECK(swapped->size == d->size);
    CHECK(*swapped != *d);

    CHECK_FALSE(IntegrityMonitor::hash_file((dir.root / "nope").string()));
}

TEST_CASE("Integrity monitor reports tampering", "[integrity]") {
    TempDir dir;
    auto core = dir.write("core.cfg", "mode=strict\n");
    auto rules = dir.write("rules.json", "{}");
    AuditLog audit;
    IntegrityMonitor monitor({core, rules}, &audit);

    CHECK(monitor.baseline() == 2);
    CHECK(monitor.verify().empty());
    CHECK(audit.size() == 0);
    REQUIRE(monitor.baseline_hash(core));

    SECTION("modified content") {
        dir.write("core.cfg", "mode=off\n");
        auto findings = monitor.verify();
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].path == core);
        CHECK(findings[0].issue == IntegrityIssue::Modified);
        CHECK(findings[0].detail.find("sha256 ") == 0);

        auto entries = audit.export_all();
        REQUIRE(entries.size() == 1);
        CHECK(entries[0].outcome == "tampered");
        CHECK(entries[0].actor == "system");
        CHECK(entries[0].action.find(core) != std::string::npos);
    }
    SECTION("removed file") {
        fs::remove(rules);
        auto findings = monitor.verify();
        REQUIRE(findings.size() == 1);
        CHECK(findings[0].issue == IntegrityIssue::Missing);
        CHECK(audit.size() == 1);
    }
    SECTION("re-baselining accepts the change") {
        dir.write("core.cfg", "mode=relaxed\n");
        monitor.baseline();
        CHECK(monitor.verify().empty());
    }
}

TEST_CASE("Files absent at baseline are reported when they appear", "[integrity]") {
    TempDir dir;
    auto later = (dir.root / "later.txt").string();
    IntegrityMonitor monitor({later});
    CHECK(monitor.baseline() == 0);
    CHECK(monitor.verify().empty());

    dir.write("later.txt", "surprise");
    auto findings = monitor.verify();
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].issue == IntegrityIssue::Modified);
}
