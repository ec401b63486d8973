#ifndef DOCFORENSICS_CONFIG_HPP
#define DOCFORENSICS_CONFIG_HPP

#include "utilities/digest.hpp"
#include "utilities/logger.h"

#include <cstddef>
#include <string>

namespace docforensics {

/// Thresholds for the session anomaly heuristics.
struct AnomalyThresholds {
  size_t maxConcurrentSessions = 3;
  size_t rapidActivityCount = 100;
  double rapidActivityRate = 2.0; ///< activities per second
  size_t recentSessionsForRate = 5;
  size_t maxDistinctIps = 5;
  size_t recentSessionsForIp = 10;
};

/**
 * @brief Runtime options for the ledger subsystem.
 *
 * Values come from a YAML file, then environment overrides.
 */
struct LedgerConfig {
  std::string varDir;
  HashAlgorithm hashAlgorithm = HashAlgorithm::SHA256;
  bool encryptAtRest = false;
  std::string cipherAlgorithm = "XCHACHA20-POLY1305";
  LogLevel logLevel = LogLevel::INFO;
  int sessionTimeoutMinutes = 30;
  int verifyIntervalSeconds = 0;
  AnomalyThresholds anomaly;
};

/**
 * @brief Load configuration.
 *
 * @param path YAML file to read. When empty, DOCFORENSICS_CONFIG or
 *        "docforensics_config.yaml" is used. A missing or malformed file
 *        leaves the defaults in place.
 */
LedgerConfig loadLedgerConfig(const std::string &path = "");

/// Apply DOCFORENSICS_* environment overrides on top of @p cfg.
void applyEnvironmentOverrides(LedgerConfig &cfg);

} // namespace docforensics

#endif // DOCFORENSICS_CONFIG_HPP
