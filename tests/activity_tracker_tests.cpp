#include "session/activity_tracker.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/key_manager.hpp"
#include "utilities/ledger_cipher.hpp"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace docforensics;

namespace fs = std::filesystem;

class ActivityTrackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::path(getVarDir()) / "session_tests" /
           ::testing::UnitTest::GetInstance()->current_test_info()->name();
    fs::remove_all(dir_);
    cfg_.varDir = dir_.string();
    now_ = std::make_shared<Timestamp>(Clock::now());
  }

  void TearDown() override { fs::remove_all(dir_); }

  ActivityTrackerOptions options(std::shared_ptr<LedgerCipher> cipher = nullptr) {
    ActivityTrackerOptions opts = ActivityTracker::optionsFromConfig(cfg_, cipher);
    auto now = now_;
    opts.clock = [now] { return *now; };
    return opts;
  }

  void advance(std::chrono::milliseconds d) { *now_ += d; }

  fs::path dir_;
  LedgerConfig cfg_;
  std::shared_ptr<Timestamp> now_;
};

static bool hasFinding(const std::vector<SuspiciousActivity> &findings,
                       const std::string &type, const std::string &user) {
  for (const auto &f : findings) {
    if (f.type == type && f.userId == user)
      return true;
  }
  return false;
}

TEST_F(ActivityTrackerTest, SessionLifecycle) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("alice", std::string("10.0.0.1"),
                                         std::string("firefox"));
  ASSERT_FALSE(sid.empty());

  EXPECT_TRUE(tracker.trackActivity(sid, "view", 12, {{"page", 1}}));
  advance(std::chrono::seconds(30));
  EXPECT_TRUE(tracker.trackActivity(sid, "download"));

  auto session = tracker.getSession(sid);
  ASSERT_TRUE(session.ok());
  EXPECT_TRUE(session.value().isActive);
  ASSERT_EQ(session.value().activities.size(), 2u);
  EXPECT_EQ(session.value().activities[0].details["document_id"], 12);
  EXPECT_EQ(session.value().activities[0].details["page"], 1);

  advance(std::chrono::seconds(30));
  EXPECT_TRUE(tracker.endSession(sid));
  EXPECT_FALSE(tracker.endSession(sid));
  EXPECT_FALSE(tracker.trackActivity(sid, "view"));

  auto ended = tracker.getSession(sid);
  ASSERT_TRUE(ended.ok());
  EXPECT_FALSE(ended.value().isActive);
  ASSERT_TRUE(ended.value().endTime.has_value());
  EXPECT_DOUBLE_EQ(ended.value().durationSeconds(*now_), 60.0);
}

TEST_F(ActivityTrackerTest, UnknownSession) {
  ActivityTracker tracker(options());
  EXPECT_FALSE(tracker.trackActivity("missing", "view"));
  EXPECT_FALSE(tracker.endSession("missing"));
  auto session = tracker.getSession("missing");
  ASSERT_FALSE(session.ok());
  EXPECT_EQ(session.error().kind, ErrorKind::SessionNotFound);
}

TEST_F(ActivityTrackerTest, IdleSessionsExpireLazily) {
  ActivityTracker tracker(options());
  std::string idle = tracker.startSession("alice");
  advance(std::chrono::minutes(31));

  EXPECT_FALSE(tracker.trackActivity(idle, "view"));
  auto session = tracker.getSession(idle);
  ASSERT_TRUE(session.ok());
  EXPECT_FALSE(session.value().isActive);
  EXPECT_EQ(*session.value().endTime, session.value().lastActivity + std::chrono::minutes(30));
}

TEST_F(ActivityTrackerTest, StartSessionSweepsExpired) {
  ActivityTracker tracker(options());
  std::string old = tracker.startSession("alice");
  advance(std::chrono::minutes(45));
  tracker.startSession("bob");

  auto alice = tracker.userSessions("alice", true, false);
  EXPECT_TRUE(alice.empty());
  EXPECT_FALSE(tracker.getSession(old).value().isActive);

  nlohmann::json active = tracker.activeUsers();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0]["user_id"], "bob");
}

TEST_F(ActivityTrackerTest, SweepExpiredEndsOnlyIdleSessions) {
  ActivityTracker tracker(options());
  std::string idle = tracker.startSession("alice");
  advance(std::chrono::minutes(20));
  std::string busy = tracker.startSession("bob");
  advance(std::chrono::minutes(15));

  EXPECT_EQ(tracker.sweepExpired(), 1u);
  EXPECT_FALSE(tracker.getSession(idle).value().isActive);
  EXPECT_TRUE(tracker.getSession(busy).value().isActive);
  EXPECT_EQ(tracker.sweepExpired(), 0u);
}

TEST_F(ActivityTrackerTest, ConcurrentSessionAnomaly) {
  ActivityTracker tracker(options());
  for (int i = 0; i < 4; ++i)
    tracker.startSession("dave");
  tracker.startSession("erin");

  auto findings = tracker.detectSuspiciousActivity();
  ASSERT_TRUE(hasFinding(findings, "multiple_concurrent_sessions", "dave"));
  EXPECT_FALSE(hasFinding(findings, "multiple_concurrent_sessions", "erin"));
  for (const auto &f : findings) {
    if (f.type != "multiple_concurrent_sessions")
      continue;
    EXPECT_EQ(f.severity, "medium");
    nlohmann::json j = f.toJson();
    EXPECT_EQ(j["session_count"], 4);
    EXPECT_EQ(j["user_id"], "dave");
    EXPECT_TRUE(j.contains("detected_at"));
  }

  EXPECT_TRUE(tracker.detectSuspiciousActivity(std::string("erin")).empty());
}

TEST_F(ActivityTrackerTest, RapidActivityAnomaly) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("frank");
  for (int i = 0; i < 101; ++i) {
    advance(std::chrono::milliseconds(100));
    ASSERT_TRUE(tracker.trackActivity(sid, "view"));
  }
  auto findings = tracker.detectSuspiciousActivity(std::string("frank"));
  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].type, "rapid_activity_pattern");
  EXPECT_EQ(findings[0].severity, "high");
  EXPECT_EQ(findings[0].evidence["session_id"], sid);
  EXPECT_GT(findings[0].evidence["activity_rate"].get<double>(), 2.0);
}

TEST_F(ActivityTrackerTest, SlowActivityIsNotRapid) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("grace");
  for (int i = 0; i < 101; ++i) {
    advance(std::chrono::seconds(1));
    tracker.trackActivity(sid, "view");
  }
  EXPECT_TRUE(tracker.detectSuspiciousActivity(std::string("grace")).empty());
}

TEST_F(ActivityTrackerTest, ManyIpAddressesAnomaly) {
  ActivityTracker tracker(options());
  for (int i = 0; i < 6; ++i) {
    std::string sid = tracker.startSession("heidi", "10.0.0." + std::to_string(i));
    tracker.endSession(sid);
  }
  auto findings = tracker.detectSuspiciousActivity(std::string("heidi"));
  ASSERT_EQ(findings.size(), 1u);
  EXPECT_EQ(findings[0].type, "multiple_ip_addresses");
  EXPECT_EQ(findings[0].evidence["ip_count"], 6);
  EXPECT_EQ(findings[0].evidence["ip_addresses"].size(), 6u);
}

TEST_F(ActivityTrackerTest, ThresholdsAreConfigurable) {
  cfg_.anomaly.maxConcurrentSessions = 1;
  ActivityTracker tracker(options());
  tracker.startSession("ivan");
  tracker.startSession("ivan");
  EXPECT_TRUE(hasFinding(tracker.detectSuspiciousActivity(), "multiple_concurrent_sessions",
                         "ivan"));
}

TEST_F(ActivityTrackerTest, HeuristicsAreIndependent) {
  ActivityTracker tracker(options());
  for (int i = 0; i < 6; ++i)
    tracker.startSession("judy", "192.168.1." + std::to_string(i));
  auto findings = tracker.detectSuspiciousActivity(std::string("judy"));
  EXPECT_TRUE(hasFinding(findings, "multiple_concurrent_sessions", "judy"));
  EXPECT_TRUE(hasFinding(findings, "multiple_ip_addresses", "judy"));
}

TEST_F(ActivityTrackerTest, SessionsPersistAcrossRestart) {
  std::string sid;
  {
    ActivityTracker tracker(options());
    sid = tracker.startSession("kate", std::string("10.1.1.1"));
    tracker.trackActivity(sid, "upload", 5);
    tracker.endSession(tracker.startSession("kate"));
  }
  EXPECT_TRUE(fs::exists(dir_ / "user_activity" / "sessions.json"));

  ActivityTracker reloaded(options());
  auto session = reloaded.getSession(sid);
  ASSERT_TRUE(session.ok());
  EXPECT_TRUE(session.value().isActive);
  EXPECT_EQ(session.value().ipAddress.value_or(""), "10.1.1.1");
  ASSERT_EQ(session.value().activities.size(), 1u);
  EXPECT_EQ(session.value().activities[0].action, "upload");
  EXPECT_EQ(reloaded.userSessions("kate").size(), 2u);
  EXPECT_TRUE(reloaded.trackActivity(sid, "view"));
}

TEST_F(ActivityTrackerTest, CorruptSessionsFileIsSetAside) {
  const fs::path path = dir_ / "user_activity" / "sessions.json";
  ASSERT_TRUE(writeFileDurably(path.string(), "[{\"session_id\":").ok());
  ActivityTracker tracker(options());
  EXPECT_FALSE(fs::exists(path));
  tracker.startSession("leo");
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(ActivityTrackerTest, SessionsEncryptedWithAnotherKeyAreLeftInPlace) {
  const fs::path path = dir_ / "user_activity" / "sessions.json";
  KeyManager writerKeys;
  writerKeys.initialize();
  auto writerCipher = std::make_shared<SodiumLedgerCipher>(writerKeys);
  std::string sid;
  {
    ActivityTracker tracker(options(writerCipher));
    sid = tracker.startSession("mia");
  }
  auto original = readWholeFile(path.string());
  ASSERT_TRUE(original.ok());

  KeyManager otherKeys;
  otherKeys.initialize();
  {
    ActivityTracker locked(options(std::make_shared<SodiumLedgerCipher>(otherKeys)));
    EXPECT_FALSE(locked.getSession(sid).ok());
    locked.startSession("nick");
    EXPECT_GE(locked.persistFailures(), 1u);
  }
  {
    ActivityTracker plain(options());
    plain.startSession("olga");
    EXPECT_GE(plain.persistFailures(), 1u);
  }
  auto after = readWholeFile(path.string());
  ASSERT_TRUE(after.ok());
  EXPECT_EQ(after.value(), original.value());
  for (const auto &item : fs::directory_iterator(path.parent_path()))
    EXPECT_EQ(item.path().filename().string().find(".corrupt-"), std::string::npos);

  ActivityTracker reopened(options(writerCipher));
  EXPECT_TRUE(reopened.getSession(sid).ok());
  EXPECT_EQ(reopened.persistFailures(), 0u);
}

TEST_F(ActivityTrackerTest, UserSessionsOrderAndFilters) {
  ActivityTracker tracker(options());
  std::string first = tracker.startSession("mia");
  advance(std::chrono::seconds(1));
  std::string second = tracker.startSession("mia");
  advance(std::chrono::seconds(1));
  std::string third = tracker.startSession("mia");
  tracker.endSession(second);

  auto all = tracker.userSessions("mia");
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].sessionId, third);
  EXPECT_EQ(all[2].sessionId, first);

  auto ended = tracker.userSessions("mia", false, true);
  ASSERT_EQ(ended.size(), 1u);
  EXPECT_EQ(ended[0].sessionId, second);

  EXPECT_EQ(tracker.userSessions("mia", true, true, 2).size(), 2u);
}

TEST_F(ActivityTrackerTest, ActivitySummary) {
  ActivityTracker tracker(options());
  std::string a = tracker.startSession("nina", std::string("1.1.1.1"), std::string("cli"));
  tracker.trackActivity(a, "view", 1);
  tracker.trackActivity(a, "view", 2);
  tracker.trackActivity(a, "annotate", 1);
  advance(std::chrono::seconds(10));
  tracker.endSession(a);
  tracker.startSession("nina", std::string("2.2.2.2"));

  nlohmann::json summary = tracker.userActivitySummary("nina");
  EXPECT_EQ(summary["total_sessions"], 2);
  EXPECT_EQ(summary["active_sessions"], 1);
  EXPECT_EQ(summary["total_activities"], 3);
  EXPECT_EQ(summary["unique_actions"], nlohmann::json({"annotate", "view"}));
  EXPECT_EQ(summary["documents_accessed"].size(), 2u);
  EXPECT_EQ(summary["ip_addresses"].size(), 2u);
  EXPECT_EQ(summary["user_agents"], nlohmann::json({"cli"}));
  EXPECT_FALSE(summary["first_activity"].is_null());

  nlohmann::json none = tracker.userActivitySummary(
      "nina", Clock::now() + std::chrono::hours(48), std::nullopt);
  EXPECT_EQ(none["total_activities"], 0);
}

TEST_F(ActivityTrackerTest, ForwardsToAuditTrail) {
  AuditTrail audit(AuditTrail::optionsFromConfig(cfg_, nullptr));
  ActivityTracker tracker(options(), &audit);
  std::string sid = tracker.startSession("olga", std::string("10.9.9.9"));
  tracker.trackActivity(sid, "analyze", 77, {{"engine", "ocr"}});
  tracker.endSession(sid);

  auto entries = audit.byUser("olga");
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].payload["action"], "session_start");
  EXPECT_EQ(entries[0].payload["details"]["session_id"], sid);
  EXPECT_EQ(entries[0].payload["ip_address"], "10.9.9.9");
  EXPECT_EQ(entries[1].payload["action"], "analyze");
  EXPECT_EQ(entries[1].payload["document_id"], 77);
  EXPECT_EQ(entries[1].payload["details"]["engine"], "ocr");
  EXPECT_EQ(entries[1].payload["details"]["session_id"], sid);
  EXPECT_EQ(entries[2].payload["action"], "session_end");
  EXPECT_TRUE(audit.verify().isValid);
}

TEST_F(ActivityTrackerTest, ExportUserActivity) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("pia", std::string("3.3.3.3"));
  tracker.trackActivity(sid, "view", 1);

  auto json = tracker.exportUserActivity("pia", ActivityExportFormat::Json);
  ASSERT_TRUE(json.ok());
  nlohmann::json doc = nlohmann::json::parse(json.value());
  EXPECT_EQ(doc["user_id"], "pia");
  ASSERT_EQ(doc["sessions"].size(), 1u);
  EXPECT_EQ(doc["sessions"][0]["activities"].size(), 1u);

  auto brief = tracker.exportUserActivity("pia", ActivityExportFormat::Json, false);
  ASSERT_TRUE(brief.ok());
  EXPECT_FALSE(nlohmann::json::parse(brief.value())["sessions"][0].contains("activities"));

  auto csv = tracker.exportUserActivity("pia", ActivityExportFormat::Csv);
  ASSERT_TRUE(csv.ok());
  EXPECT_EQ(csv.value().rfind("session_id,start_time,end_time,duration_seconds,"
                              "activity_count,ip_address,user_agent\r\n",
                              0),
            0u);
  EXPECT_NE(csv.value().find(sid), std::string::npos);
}

TEST_F(ActivityTrackerTest, SystemStats) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("quinn");
  tracker.trackActivity(sid, "view");
  tracker.trackActivity(sid, "view");
  tracker.startSession("rosa");

  nlohmann::json stats = tracker.systemActivityStats();
  EXPECT_EQ(stats["active_sessions"], 2);
  EXPECT_EQ(stats["total_users"], 2);
  EXPECT_EQ(stats["activity_last_hour"], 2);
  EXPECT_EQ(stats["top_active_users"][0]["user_id"], "quinn");
}

TEST_F(ActivityTrackerTest, ConcurrentTracking) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("sam");
  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&tracker, &sid] {
      for (int i = 0; i < 10; ++i)
        tracker.trackActivity(sid, "view");
    });
  }
  for (auto &w : workers)
    w.join();
  EXPECT_EQ(tracker.getSession(sid).value().activities.size(), 40u);
}

TEST_F(ActivityTrackerTest, BackgroundSweeper) {
  ActivityTracker tracker(options());
  std::string sid = tracker.startSession("tom");
  advance(std::chrono::minutes(31));
  tracker.startSweeper(std::chrono::seconds(1));
  for (int i = 0; i < 100; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    if (tracker.userSessions("tom", true, false).empty())
      break;
  }
  tracker.stopSweeper();
  EXPECT_TRUE(tracker.userSessions("tom", true, false).empty());
}
