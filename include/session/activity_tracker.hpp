#ifndef DOCFORENSICS_ACTIVITY_TRACKER_HPP
#define DOCFORENSICS_ACTIVITY_TRACKER_HPP

#include "audit/audit_trail.hpp"
#include "ledger/ledger_entry.hpp"
#include "utilities/config.hpp"
#include "utilities/ledger_cipher.hpp"
#include "utilities/result.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace docforensics {

struct Activity {
  Timestamp timestamp;
  std::string action;
  nlohmann::json details = nlohmann::json::object();
};

struct UserSession {
  std::string sessionId;
  std::string userId;
  std::optional<std::string> ipAddress;
  std::optional<std::string> userAgent;
  Timestamp startTime;
  Timestamp lastActivity;
  std::optional<Timestamp> endTime;
  bool isActive = true;
  std::vector<Activity> activities;

  /// Seconds from start to end, or to @p now for an active session.
  double durationSeconds(Timestamp now) const;

  nlohmann::json toJson(Timestamp now, bool includeActivities = true) const;

  /// Throws nlohmann::json::exception or std::invalid_argument on bad input.
  static UserSession fromJson(const nlohmann::json &j);
};

/// One anomaly reported by ActivityTracker::detectSuspiciousActivity().
struct SuspiciousActivity {
  std::string type; ///< multiple_concurrent_sessions, rapid_activity_pattern, ...
  std::string userId;
  std::string severity; ///< "medium" or "high"
  std::string detectedAt;
  nlohmann::json evidence = nlohmann::json::object();

  /// Flat object: {type, user_id, severity, detected_at, <evidence...>}.
  nlohmann::json toJson() const;
};

enum class ActivityExportFormat { Json, Csv };

struct ActivityTrackerOptions {
  std::string sessionsPath; ///< Empty keeps sessions in memory
  std::chrono::minutes sessionTimeout{30};
  AnomalyThresholds thresholds;
  std::shared_ptr<LedgerCipher> cipher;
  std::function<Timestamp()> clock; ///< Defaults to Clock::now
};

/**
 * @brief Session lifecycle, per-session activity and anomaly heuristics.
 *
 * Sessions expire lazily: idle sessions are ended when a new session starts,
 * when they are looked up, or by sweepExpired(). startSweeper() adds a
 * periodic sweep. Every event is forwarded to the attached AuditTrail.
 */
class ActivityTracker {
public:
  explicit ActivityTracker(ActivityTrackerOptions options,
                           AuditTrail *audit = nullptr);
  ~ActivityTracker();

  ActivityTracker(const ActivityTracker &) = delete;
  ActivityTracker &operator=(const ActivityTracker &) = delete;

  static ActivityTrackerOptions optionsFromConfig(const LedgerConfig &cfg,
                                                  std::shared_ptr<LedgerCipher> cipher);

  std::string startSession(const std::string &userId,
                           std::optional<std::string> ipAddress = std::nullopt,
                           std::optional<std::string> userAgent = std::nullopt);

  /// False when the session is unknown, ended or expired.
  bool trackActivity(const std::string &sessionId, const std::string &action,
                     std::optional<DocumentId> documentId = std::nullopt,
                     nlohmann::json details = nlohmann::json::object());

  /// False when the session is unknown or already ended.
  bool endSession(const std::string &sessionId);

  Result<UserSession> getSession(const std::string &sessionId);

  /// Sessions of @p userId, most recent first.
  std::vector<UserSession> userSessions(const std::string &userId,
                                        bool includeActive = true,
                                        bool includeEnded = true,
                                        std::optional<size_t> limit = std::nullopt) const;

  /// One object per user with active sessions, most recently active first.
  nlohmann::json activeUsers() const;

  nlohmann::json userActivitySummary(const std::string &userId,
                                     std::optional<Timestamp> from = std::nullopt,
                                     std::optional<Timestamp> to = std::nullopt) const;

  /// Counts over all users: sessions, activity in the last hour/day, top users.
  nlohmann::json systemActivityStats() const;

  std::vector<SuspiciousActivity>
  detectSuspiciousActivity(const std::optional<std::string> &userId = std::nullopt) const;

  Result<std::string> exportUserActivity(const std::string &userId,
                                         ActivityExportFormat format,
                                         bool includeDetails = true) const;

  /// End every active session idle for longer than the timeout.
  size_t sweepExpired();

  void startSweeper(std::chrono::seconds interval);
  void stopSweeper();

  /// Failures writing sessions.json since construction.
  size_t persistFailures() const;

private:
  struct AuditEvent {
    std::string action;
    std::string userId;
    std::optional<DocumentId> documentId;
    nlohmann::json details;
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;
  };

  Timestamp now() const;
  bool expired(const UserSession &session, Timestamp at) const;
  AuditEvent finishLocked(UserSession &session, Timestamp at, const char *reason);
  size_t sweepLocked(Timestamp at, std::vector<AuditEvent> &events);
  void persistLocked();
  void loadSessions();
  void forward(const std::vector<AuditEvent> &events);
  void sweeperLoop();

  ActivityTrackerOptions options_;
  AuditTrail *audit_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<UserSession>> sessions_;
  std::map<std::string, std::vector<std::shared_ptr<UserSession>>> byUser_;
  size_t persistFailures_ = 0;
  bool persistBlocked_ = false; // sessions file could not be loaded, leave it untouched

  std::chrono::seconds sweepInterval_{60};
  std::atomic<bool> sweeping_{false};
  std::thread sweeper_;
};

} // namespace docforensics

#endif // DOCFORENSICS_ACTIVITY_TRACKER_HPP
