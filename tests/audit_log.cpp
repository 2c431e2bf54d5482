#include <catch2/catch.hpp>
#include "taskgate/audit_log.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <vector>
#include <zlib.h>

using namespace taskgate;

TEST_CASE("Audit log stamps increasing sequence numbers", "[audit]") {
    AuditLog log;
    CHECK(log.size() == 0);
    CHECK(log.export_all().empty());

    auto a = log.append(kActorSystem, "first", RiskTier::Safe, "auto_approved");
    auto b = log.append(kActorUser, "second", RiskTier::Warning, "denied", std::string("rejected by user"), "cr-1");
    CHECK(a.sequence == 1);
    CHECK(b.sequence == 2);
    CHECK(b.timestamp >= a.timestamp);

    auto all = log.export_all();
    REQUIRE(all.size() == 2);
    CHECK(all[0].action == "first");
    CHECK(all[1].request_id == "cr-1");
    REQUIRE(all[1].error);
    CHECK(*all[1].error == "rejected by user");
}

TEST_CASE("Audit tail returns the newest entries oldest first", "[audit]") {
    AuditLog log;
    for (int i = 0; i < 10; ++i) log.append(kActorScheduler, "e" + std::to_string(i), RiskTier::Safe, "completed");

    auto t = log.tail(3);
    REQUIRE(t.size() == 3);
    CHECK(t[0].action == "e7");
    CHECK(t[2].action == "e9");
    CHECK(log.tail(100).size() == 10);
    CHECK(log.tail(0).empty());
}

TEST_CASE("Concurrent appends keep a gapless total order", "[audit]") {
    AuditLog log;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&log, t] {
            for (int i = 0; i < kPerThread; ++i)
                log.append(kActorScheduler, "w" + std::to_string(t), RiskTier::Safe, "completed");
        });
    }
    // readers run alongside the writers
    size_t last_seen = 0;
    for (int i = 0; i < 50; ++i) {
        auto snap = log.export_all();
        CHECK(snap.size() >= last_seen);
        for (size_t k = 0; k < snap.size(); ++k) CHECK(snap[k].sequence == k + 1);
        last_seen = snap.size();
    }
    for (auto& w : writers) w.join();

    auto all = log.export_all();
    REQUIRE(all.size() == kThreads * kPerThread);
    for (size_t i = 0; i < all.size(); ++i) CHECK(all[i].sequence == i + 1);
}

TEST_CASE("Audit log exports JSON", "[audit]") {
    AuditLog log;
    log.append(kActorSystem, "blocked thing", RiskTier::Blocked, "blocked", std::string("blocked: matched x"));
    log.append(kActorScheduler, "ok thing", RiskTier::Safe, "completed");

    auto path = std::filesystem::temp_directory_path() / "taskgate_audit_export_test.json";
    REQUIRE(log.export_json(path.string()));

    std::ifstream in(path);
    auto doc = nlohmann::json::parse(in);
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 2);
    CHECK(doc[0]["risk"] == "blocked");
    CHECK(doc[0]["outcome"] == "blocked");
    CHECK(doc[0]["sequence"] == 1);
    CHECK(doc[1]["actor"] == "scheduler");
    std::filesystem::remove(path);

    CHECK_FALSE(log.export_json("/nonexistent-dir/for/sure/audit.json"));
}

TEST_CASE("Audit log export to a .gz path is gzip-compressed", "[audit]") {
    AuditLog log;
    for (int i = 0; i < 20; ++i) log.append(kActorScheduler, "step " + std::to_string(i), RiskTier::Safe, "completed");

    auto path = std::filesystem::temp_directory_path() / "taskgate_audit_export_test.json.gz";
    REQUIRE(log.export_json(path.string()));

    // gzip magic bytes
    std::ifstream raw(path, std::ios::binary);
    unsigned char magic[2] = {0, 0};
    raw.read(reinterpret_cast<char*>(magic), 2);
    CHECK(magic[0] == 0x1f);
    CHECK(magic[1] == 0x8b);

    gzFile gz = gzopen(path.string().c_str(), "rb");
    REQUIRE(gz != nullptr);
    std::string text;
    char buf[4096];
    int n = 0;
    while ((n = gzread(gz, buf, sizeof(buf))) > 0) text.append(buf, static_cast<size_t>(n));
    CHECK(gzclose(gz) == Z_OK);
    std::filesystem::remove(path);

    auto doc = nlohmann::json::parse(text);
    REQUIRE(doc.size() == 20);
    CHECK(doc[19]["action"] == "step 19");
    CHECK(doc[19]["sequence"] == 20);
}
