#include "utilities/config.hpp"
#include "utilities/var_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <yaml-cpp/yaml.h>

namespace docforensics {

namespace {

bool parseBool(const std::string &value) {
  return value == "1" || value == "true" || value == "TRUE" || value == "yes" ||
         value == "on";
}

void warnKept(const std::string &file, const std::string &key, const std::string &why) {
  Logger::getInstance().log(LogLevel::WARN, "Ignoring " + key + " in " + file + ": " +
                                                why + ", keeping the default");
}

void readCount(const YAML::Node &node, const char *key, const std::string &file,
               size_t &out) {
  if (!node[key])
    return;
  try {
    long long value = node[key].as<long long>();
    if (value < 0) {
      warnKept(file, key, "must not be negative");
      return;
    }
    out = static_cast<size_t>(value);
  } catch (const YAML::BadConversion &) {
    warnKept(file, key, "not an integer");
  }
}

void readInt(const YAML::Node &node, const char *key, const std::string &file,
             int minimum, int &out) {
  if (!node[key])
    return;
  try {
    int value = node[key].as<int>();
    if (value < minimum) {
      warnKept(file, key, "must be at least " + std::to_string(minimum));
      return;
    }
    out = value;
  } catch (const YAML::BadConversion &) {
    warnKept(file, key, "not an integer");
  }
}

void readAnomaly(const YAML::Node &node, const std::string &file,
                 AnomalyThresholds &out) {
  if (!node)
    return;
  readCount(node, "max_concurrent_sessions", file, out.maxConcurrentSessions);
  readCount(node, "rapid_activity_count", file, out.rapidActivityCount);
  if (node["rapid_activity_rate"]) {
    try {
      double rate = node["rapid_activity_rate"].as<double>();
      if (rate > 0)
        out.rapidActivityRate = rate;
      else
        warnKept(file, "rapid_activity_rate", "must be positive");
    } catch (const YAML::BadConversion &) {
      warnKept(file, "rapid_activity_rate", "not a number");
    }
  }
  readCount(node, "recent_sessions_for_rate", file, out.recentSessionsForRate);
  readCount(node, "max_distinct_ips", file, out.maxDistinctIps);
  readCount(node, "recent_sessions_for_ip", file, out.recentSessionsForIp);
}

} // namespace

LedgerConfig loadLedgerConfig(const std::string &path) {
  LedgerConfig cfg;
  cfg.varDir = getVarDir();

  std::string file = path;
  if (file.empty()) {
    const char *env = std::getenv("DOCFORENSICS_CONFIG");
    file = env ? env : "docforensics_config.yaml";
  }

  try {
    YAML::Node node = YAML::LoadFile(file);
    LedgerConfig parsed = cfg;
    if (node["var_dir"])
      parsed.varDir = node["var_dir"].as<std::string>();
    if (node["hash_algorithm"]) {
      auto algo = parseAlgorithm(node["hash_algorithm"].as<std::string>());
      if (algo)
        parsed.hashAlgorithm = *algo;
      else
        Logger::getInstance().log(
            LogLevel::WARN, "Unknown hash_algorithm in " + file +
                                ", keeping " + algorithmName(parsed.hashAlgorithm));
    }
    if (node["encrypt_at_rest"])
      parsed.encryptAtRest = node["encrypt_at_rest"].as<bool>();
    if (node["cipher_algorithm"])
      parsed.cipherAlgorithm = node["cipher_algorithm"].as<std::string>();
    if (node["log_level"])
      parsed.logLevel = parseLogLevel(node["log_level"].as<std::string>());
    readInt(node, "session_timeout_minutes", file, 1, parsed.sessionTimeoutMinutes);
    readInt(node, "verify_interval_seconds", file, 0, parsed.verifyIntervalSeconds);
    readAnomaly(node["anomaly"], file, parsed.anomaly);
    cfg = parsed;
  } catch (const YAML::BadFile &) {
    // No config file: defaults apply.
  } catch (const YAML::Exception &e) {
    Logger::getInstance().log(LogLevel::WARN, "Ignoring malformed config " +
                                                  file + ": " + e.what());
  }

  applyEnvironmentOverrides(cfg);
  return cfg;
}

void applyEnvironmentOverrides(LedgerConfig &cfg) {
  if (const char *env = std::getenv("DOCFORENSICS_VAR_DIR"); env && *env)
    cfg.varDir = env;
  if (const char *env = std::getenv("DOCFORENSICS_HASH_ALGO")) {
    if (auto algo = parseAlgorithm(env))
      cfg.hashAlgorithm = *algo;
  }
  if (const char *env = std::getenv("DOCFORENSICS_ENCRYPT_AT_REST"))
    cfg.encryptAtRest = parseBool(env);
  if (const char *env = std::getenv("DOCFORENSICS_SESSION_TIMEOUT")) {
    char *end = nullptr;
    errno = 0;
    long minutes = std::strtol(env, &end, 10);
    if (end == env || *end != '\0' || errno == ERANGE || minutes <= 0 ||
        minutes > std::numeric_limits<int>::max()) {
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("Ignoring DOCFORENSICS_SESSION_TIMEOUT=") + env +
                                    ", keeping " +
                                    std::to_string(cfg.sessionTimeoutMinutes) + " minutes");
    } else {
      cfg.sessionTimeoutMinutes = static_cast<int>(minutes);
    }
  }
}

} // namespace docforensics
