#include "utilities/config.hpp"
#include "utilities/csv.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/var_dir.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace docforensics;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::path(getVarDir()) / "config_tests";
    fs::create_directories(dir_);
    for (const char *name : {"DOCFORENSICS_VAR_DIR", "DOCFORENSICS_HASH_ALGO",
                             "DOCFORENSICS_ENCRYPT_AT_REST", "DOCFORENSICS_SESSION_TIMEOUT"})
      ::unsetenv(name);
  }

  void TearDown() override {
    ::unsetenv("DOCFORENSICS_HASH_ALGO");
    ::unsetenv("DOCFORENSICS_SESSION_TIMEOUT");
    fs::remove_all(dir_);
  }

  std::string writeConfig(const std::string &name, const std::string &yaml) {
    std::string path = (dir_ / name).string();
    std::ofstream(path) << yaml;
    return path;
  }

  fs::path dir_;
};

TEST_F(ConfigTest, DefaultsWhenFileMissing) {
  LedgerConfig cfg = loadLedgerConfig((dir_ / "missing.yaml").string());
  EXPECT_EQ(cfg.varDir, getVarDir());
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::SHA256);
  EXPECT_FALSE(cfg.encryptAtRest);
  EXPECT_EQ(cfg.sessionTimeoutMinutes, 30);
  EXPECT_EQ(cfg.anomaly.maxConcurrentSessions, 3u);
  EXPECT_EQ(cfg.anomaly.rapidActivityCount, 100u);
  EXPECT_DOUBLE_EQ(cfg.anomaly.rapidActivityRate, 2.0);
  EXPECT_EQ(cfg.anomaly.recentSessionsForRate, 5u);
  EXPECT_EQ(cfg.anomaly.maxDistinctIps, 5u);
  EXPECT_EQ(cfg.anomaly.recentSessionsForIp, 10u);
}

TEST_F(ConfigTest, ReadsYaml) {
  std::string path = writeConfig("full.yaml", R"(
var_dir: /tmp/docforensics_cfg
hash_algorithm: blake3
encrypt_at_rest: true
cipher_algorithm: AES-256-GCM
log_level: debug
session_timeout_minutes: 5
verify_interval_seconds: 60
anomaly:
  max_concurrent_sessions: 2
  rapid_activity_rate: 4.5
  max_distinct_ips: 8
)");
  LedgerConfig cfg = loadLedgerConfig(path);
  EXPECT_EQ(cfg.varDir, "/tmp/docforensics_cfg");
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::BLAKE3);
  EXPECT_TRUE(cfg.encryptAtRest);
  EXPECT_EQ(cfg.cipherAlgorithm, "AES-256-GCM");
  EXPECT_EQ(cfg.logLevel, LogLevel::DEBUG);
  EXPECT_EQ(cfg.sessionTimeoutMinutes, 5);
  EXPECT_EQ(cfg.verifyIntervalSeconds, 60);
  EXPECT_EQ(cfg.anomaly.maxConcurrentSessions, 2u);
  EXPECT_DOUBLE_EQ(cfg.anomaly.rapidActivityRate, 4.5);
  EXPECT_EQ(cfg.anomaly.maxDistinctIps, 8u);
  EXPECT_EQ(cfg.anomaly.rapidActivityCount, 100u);
}

TEST_F(ConfigTest, MalformedYamlKeepsDefaults) {
  std::string path = writeConfig("bad.yaml", "session_timeout_minutes: [unterminated\n");
  LedgerConfig cfg = loadLedgerConfig(path);
  EXPECT_EQ(cfg.sessionTimeoutMinutes, 30);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
  std::string path = writeConfig("env.yaml", "hash_algorithm: sha256\nsession_timeout_minutes: 5\n");
  ::setenv("DOCFORENSICS_HASH_ALGO", "blake3", 1);
  ::setenv("DOCFORENSICS_SESSION_TIMEOUT", "12", 1);
  LedgerConfig cfg = loadLedgerConfig(path);
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::BLAKE3);
  EXPECT_EQ(cfg.sessionTimeoutMinutes, 12);
}

TEST_F(ConfigTest, InvalidTimeoutFromEnvironmentKeepsConfiguredValue) {
  std::string path = writeConfig("timeout.yaml", "session_timeout_minutes: 5\n");
  for (const char *bad : {"abc", "15min", "0", "-4", "99999999999999999999"}) {
    ::setenv("DOCFORENSICS_SESSION_TIMEOUT", bad, 1);
    EXPECT_EQ(loadLedgerConfig(path).sessionTimeoutMinutes, 5) << bad;
  }
}

TEST_F(ConfigTest, OutOfRangeNumbersKeepDefaults) {
  std::string path = writeConfig("ranges.yaml", R"(
hash_algorithm: blake3
session_timeout_minutes: -5
verify_interval_seconds: -1
anomaly:
  max_concurrent_sessions: -1
  rapid_activity_count: 40
  rapid_activity_rate: 0
  recent_sessions_for_rate: many
  max_distinct_ips: 7
  recent_sessions_for_ip: -10
)");
  LedgerConfig cfg = loadLedgerConfig(path);
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::BLAKE3);
  EXPECT_EQ(cfg.sessionTimeoutMinutes, 30);
  EXPECT_EQ(cfg.verifyIntervalSeconds, 0);
  EXPECT_EQ(cfg.anomaly.maxConcurrentSessions, 3u);
  EXPECT_EQ(cfg.anomaly.rapidActivityCount, 40u);
  EXPECT_DOUBLE_EQ(cfg.anomaly.rapidActivityRate, 2.0);
  EXPECT_EQ(cfg.anomaly.recentSessionsForRate, 5u);
  EXPECT_EQ(cfg.anomaly.maxDistinctIps, 7u);
  EXPECT_EQ(cfg.anomaly.recentSessionsForIp, 10u);
}

TEST_F(ConfigTest, TypeErrorDiscardsWholeFile) {
  std::string path = writeConfig("typed.yaml", R"(
hash_algorithm: blake3
session_timeout_minutes: 9
encrypt_at_rest: sometimes
)");
  LedgerConfig cfg = loadLedgerConfig(path);
  EXPECT_EQ(cfg.hashAlgorithm, HashAlgorithm::SHA256);
  EXPECT_EQ(cfg.sessionTimeoutMinutes, 30);
  EXPECT_FALSE(cfg.encryptAtRest);
}

TEST(CsvTest, EscapesFields) {
  EXPECT_EQ(csvEscape("plain"), "plain");
  EXPECT_EQ(csvEscape("a,b"), "\"a,b\"");
  EXPECT_EQ(csvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
  EXPECT_EQ(csvEscape("line\nbreak"), "\"line\nbreak\"");
  EXPECT_EQ(csvRow({"a", "b,c", ""}), "a,\"b,c\",\r\n");
  EXPECT_EQ(csvCell(nullptr), "");
  EXPECT_EQ(csvCell("text"), "text");
  EXPECT_EQ(csvCell(nlohmann::json{{"k", 1}}), "{\"k\":1}");
}

TEST(DurableFileTest, WritesAndReplaces) {
  fs::path dir = fs::path(getVarDir()) / "durable_tests";
  fs::remove_all(dir);
  const std::string path = (dir / "nested" / "file.json").string();
  ASSERT_TRUE(writeFileDurably(path, "first").ok());
  ASSERT_TRUE(writeFileDurably(path, "second").ok());
  auto text = readWholeFile(path);
  ASSERT_TRUE(text.ok());
  EXPECT_EQ(text.value(), "second");
  EXPECT_FALSE(fs::exists(path + ".tmp"));

  auto missing = readWholeFile((dir / "absent").string());
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error().kind, ErrorKind::PersistenceError);
  fs::remove_all(dir);
}
