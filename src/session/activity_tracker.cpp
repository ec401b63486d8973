#include "session/activity_tracker.hpp"
#include "utilities/csv.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <stdexcept>

namespace docforensics {

namespace {

nlohmann::json optionalString(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> stringMember(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

Timestamp requireTimestamp(const nlohmann::json &j, const char *key) {
  auto parsed = parseTimestamp(j.at(key).get<std::string>());
  if (!parsed)
    throw std::invalid_argument(std::string("bad timestamp in ") + key);
  return *parsed;
}

double secondsBetween(Timestamp from, Timestamp to) {
  return std::chrono::duration<double>(to - from).count();
}

} // namespace

double UserSession::durationSeconds(Timestamp now) const {
  return secondsBetween(startTime, endTime ? *endTime : now);
}

nlohmann::json UserSession::toJson(Timestamp now, bool includeActivities) const {
  nlohmann::json j;
  j["session_id"] = sessionId;
  j["user_id"] = userId;
  j["ip_address"] = optionalString(ipAddress);
  j["user_agent"] = optionalString(userAgent);
  j["start_time"] = formatTimestamp(startTime);
  j["last_activity"] = formatTimestamp(lastActivity);
  j["end_time"] = endTime ? nlohmann::json(formatTimestamp(*endTime))
                          : nlohmann::json(nullptr);
  j["is_active"] = isActive;
  j["duration_seconds"] = durationSeconds(now);
  j["activity_count"] = activities.size();
  if (includeActivities) {
    j["activities"] = nlohmann::json::array();
    for (const auto &a : activities) {
      j["activities"].push_back({{"timestamp", formatTimestamp(a.timestamp)},
                                 {"action", a.action},
                                 {"details", a.details}});
    }
  }
  return j;
}

UserSession UserSession::fromJson(const nlohmann::json &j) {
  UserSession s;
  s.sessionId = j.at("session_id").get<std::string>();
  s.userId = j.at("user_id").get<std::string>();
  s.ipAddress = stringMember(j, "ip_address");
  s.userAgent = stringMember(j, "user_agent");
  s.startTime = requireTimestamp(j, "start_time");
  s.lastActivity = j.contains("last_activity") ? requireTimestamp(j, "last_activity")
                                               : s.startTime;
  if (j.contains("end_time") && !j["end_time"].is_null())
    s.endTime = requireTimestamp(j, "end_time");
  s.isActive = j.value("is_active", !s.endTime.has_value());
  if (j.contains("activities")) {
    for (const auto &a : j.at("activities")) {
      Activity activity;
      activity.timestamp = requireTimestamp(a, "timestamp");
      activity.action = a.at("action").get<std::string>();
      activity.details = a.value("details", nlohmann::json::object());
      s.activities.push_back(std::move(activity));
    }
  }
  return s;
}

nlohmann::json SuspiciousActivity::toJson() const {
  nlohmann::json j = evidence.is_object() ? evidence : nlohmann::json::object();
  j["type"] = type;
  j["user_id"] = userId;
  j["severity"] = severity;
  j["detected_at"] = detectedAt;
  return j;
}

ActivityTracker::ActivityTracker(ActivityTrackerOptions options, AuditTrail *audit)
    : options_(std::move(options)), audit_(audit) {
  if (!options_.clock)
    options_.clock = [] { return Clock::now(); };
  loadSessions();
}

ActivityTracker::~ActivityTracker() { stopSweeper(); }

ActivityTrackerOptions
ActivityTracker::optionsFromConfig(const LedgerConfig &cfg,
                                   std::shared_ptr<LedgerCipher> cipher) {
  ActivityTrackerOptions opts;
  opts.sessionsPath = sessionsPath(cfg.varDir);
  opts.sessionTimeout = std::chrono::minutes(cfg.sessionTimeoutMinutes);
  opts.thresholds = cfg.anomaly;
  opts.cipher = std::move(cipher);
  return opts;
}

Timestamp ActivityTracker::now() const { return options_.clock(); }

bool ActivityTracker::expired(const UserSession &session, Timestamp at) const {
  return session.isActive && at - session.lastActivity > options_.sessionTimeout;
}

ActivityTracker::AuditEvent ActivityTracker::finishLocked(UserSession &session,
                                                          Timestamp at,
                                                          const char *reason) {
  session.isActive = false;
  session.endTime = at;
  AuditEvent ev;
  ev.action = "session_end";
  ev.userId = session.userId;
  ev.details = {{"session_id", session.sessionId},
                {"duration_seconds", session.durationSeconds(at)},
                {"activity_count", session.activities.size()},
                {"reason", reason}};
  return ev;
}

size_t ActivityTracker::sweepLocked(Timestamp at, std::vector<AuditEvent> &events) {
  size_t ended = 0;
  for (auto &kv : sessions_) {
    UserSession &s = *kv.second;
    if (!expired(s, at))
      continue;
    // The session ends at its last activity, not when the sweep notices it.
    events.push_back(finishLocked(s, s.lastActivity + options_.sessionTimeout, "timeout"));
    ++ended;
  }
  if (ended > 0) {
    Logger::getInstance().log(LogLevel::INFO, "[ActivityTracker] Expired " +
                                                  std::to_string(ended) + " idle sessions");
  }
  return ended;
}

void ActivityTracker::forward(const std::vector<AuditEvent> &events) {
  if (!audit_)
    return;
  for (const auto &ev : events) {
    audit_->record(ev.action, ev.userId, ev.documentId, ev.details, ev.ipAddress,
                   ev.userAgent);
  }
}

std::string ActivityTracker::startSession(const std::string &userId,
                                          std::optional<std::string> ipAddress,
                                          std::optional<std::string> userAgent) {
  std::vector<AuditEvent> events;
  std::string sessionId;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp at = now();
    sweepLocked(at, events);

    auto session = std::make_shared<UserSession>();
    session->sessionId = generateEntryId();
    session->userId = userId;
    session->ipAddress = ipAddress;
    session->userAgent = userAgent;
    session->startTime = at;
    session->lastActivity = at;
    sessionId = session->sessionId;

    sessions_[sessionId] = session;
    byUser_[userId].push_back(session);

    AuditEvent ev;
    ev.action = "session_start";
    ev.userId = userId;
    ev.ipAddress = ipAddress;
    ev.userAgent = userAgent;
    ev.details = {{"session_id", sessionId}, {"start_time", formatTimestamp(at)}};
    events.push_back(std::move(ev));
    persistLocked();
  }
  Logger::getInstance().log(LogLevel::DEBUG, "[ActivityTracker] Session " + sessionId +
                                                 " started for " + userId);
  forward(events);
  return sessionId;
}

bool ActivityTracker::trackActivity(const std::string &sessionId,
                                    const std::string &action,
                                    std::optional<DocumentId> documentId,
                                    nlohmann::json details) {
  std::vector<AuditEvent> events;
  bool tracked = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second->isActive)
      return false;

    UserSession &s = *it->second;
    Timestamp at = now();
    if (expired(s, at)) {
      events.push_back(finishLocked(s, s.lastActivity + options_.sessionTimeout, "timeout"));
    } else {
      if (!details.is_object())
        details = details.is_null() ? nlohmann::json::object()
                                    : nlohmann::json{{"value", std::move(details)}};
      if (documentId)
        details["document_id"] = *documentId;

      s.activities.push_back(Activity{at, action, details});
      s.lastActivity = at;

      AuditEvent ev;
      ev.action = action;
      ev.userId = s.userId;
      ev.documentId = documentId;
      ev.ipAddress = s.ipAddress;
      ev.userAgent = s.userAgent;
      ev.details = details;
      ev.details["session_id"] = s.sessionId;
      events.push_back(std::move(ev));
      tracked = true;
    }
    persistLocked();
  }
  forward(events);
  return tracked;
}

bool ActivityTracker::endSession(const std::string &sessionId) {
  std::vector<AuditEvent> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second->isActive)
      return false;
    events.push_back(finishLocked(*it->second, now(), "logout"));
    persistLocked();
  }
  forward(events);
  return true;
}

Result<UserSession> ActivityTracker::getSession(const std::string &sessionId) {
  std::vector<AuditEvent> events;
  std::optional<UserSession> found;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end()) {
      UserSession &s = *it->second;
      if (expired(s, now())) {
        events.push_back(finishLocked(s, s.lastActivity + options_.sessionTimeout, "timeout"));
        persistLocked();
      }
      found = s;
    }
  }
  forward(events);
  if (!found)
    return Result<UserSession>::failure(ErrorKind::SessionNotFound,
                                        "unknown session " + sessionId);
  return std::move(*found);
}

std::vector<UserSession> ActivityTracker::userSessions(const std::string &userId,
                                                       bool includeActive,
                                                       bool includeEnded,
                                                       std::optional<size_t> limit) const {
  std::vector<UserSession> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = byUser_.find(userId);
    if (it == byUser_.end())
      return result;
    for (const auto &s : it->second) {
      if (s->isActive && !includeActive)
        continue;
      if (!s->isActive && !includeEnded)
        continue;
      result.push_back(*s);
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const UserSession &a, const UserSession &b) {
                     return a.startTime > b.startTime;
                   });
  if (limit && result.size() > *limit)
    result.resize(*limit);
  return result;
}

nlohmann::json ActivityTracker::activeUsers() const {
  struct ActiveUser {
    size_t sessionCount = 0;
    size_t totalActivities = 0;
    Timestamp firstSessionStart;
    Timestamp lastActivity;
  };
  std::map<std::string, ActiveUser> users;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &kv : sessions_) {
      const UserSession &s = *kv.second;
      if (!s.isActive)
        continue;
      auto inserted = users.emplace(s.userId, ActiveUser{});
      ActiveUser &u = inserted.first->second;
      if (inserted.second) {
        u.firstSessionStart = s.startTime;
        u.lastActivity = s.lastActivity;
      }
      ++u.sessionCount;
      u.totalActivities += s.activities.size();
      u.firstSessionStart = std::min(u.firstSessionStart, s.startTime);
      u.lastActivity = std::max(u.lastActivity, s.lastActivity);
    }
  }

  std::vector<std::pair<std::string, ActiveUser>> ordered(users.begin(), users.end());
  std::stable_sort(ordered.begin(), ordered.end(), [](const auto &a, const auto &b) {
    return a.second.lastActivity > b.second.lastActivity;
  });
  nlohmann::json out = nlohmann::json::array();
  for (const auto &kv : ordered) {
    out.push_back({{"user_id", kv.first},
                   {"session_count", kv.second.sessionCount},
                   {"first_session_start", formatTimestamp(kv.second.firstSessionStart)},
                   {"last_activity", formatTimestamp(kv.second.lastActivity)},
                   {"total_activities", kv.second.totalActivities}});
  }
  return out;
}

nlohmann::json ActivityTracker::userActivitySummary(const std::string &userId,
                                                    std::optional<Timestamp> from,
                                                    std::optional<Timestamp> to) const {
  size_t totalSessions = 0;
  size_t activeSessions = 0;
  size_t totalActivities = 0;
  double totalSeconds = 0.0;
  std::set<std::string> actions;
  std::set<std::string> ips;
  std::set<std::string> agents;
  nlohmann::json documents = nlohmann::json::array();
  std::optional<Timestamp> first;
  std::optional<Timestamp> last;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp at = now();
    auto it = byUser_.find(userId);
    if (it != byUser_.end()) {
      for (const auto &sp : it->second) {
        const UserSession &s = *sp;
        Timestamp sessionEnd = s.endTime ? *s.endTime : at;
        if (from && sessionEnd < *from)
          continue;
        if (to && s.startTime > *to)
          continue;

        ++totalSessions;
        if (s.isActive)
          ++activeSessions;
        totalSeconds += s.durationSeconds(at);
        if (s.ipAddress)
          ips.insert(*s.ipAddress);
        if (s.userAgent)
          agents.insert(*s.userAgent);

        for (const auto &a : s.activities) {
          if (from && a.timestamp < *from)
            continue;
          if (to && a.timestamp > *to)
            continue;
          ++totalActivities;
          actions.insert(a.action);
          auto doc = a.details.find("document_id");
          if (doc != a.details.end() &&
              std::find(documents.begin(), documents.end(), *doc) == documents.end())
            documents.push_back(*doc);
          if (!first || a.timestamp < *first)
            first = a.timestamp;
          if (!last || a.timestamp > *last)
            last = a.timestamp;
        }
      }
    }
  }

  nlohmann::json j;
  j["user_id"] = userId;
  j["total_sessions"] = totalSessions;
  j["active_sessions"] = activeSessions;
  j["total_activities"] = totalActivities;
  j["unique_actions"] = actions;
  j["documents_accessed"] = documents;
  j["ip_addresses"] = ips;
  j["user_agents"] = agents;
  j["first_activity"] = first ? nlohmann::json(formatTimestamp(*first)) : nlohmann::json(nullptr);
  j["last_activity"] = last ? nlohmann::json(formatTimestamp(*last)) : nlohmann::json(nullptr);
  j["total_time_seconds"] = totalSeconds;
  return j;
}

nlohmann::json ActivityTracker::systemActivityStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Timestamp at = now();
  Timestamp hourAgo = at - std::chrono::hours(1);
  Timestamp dayAgo = at - std::chrono::hours(24);

  size_t active = 0;
  size_t lastHour = 0;
  size_t lastDay = 0;
  std::map<std::string, size_t> perUser;
  for (const auto &kv : sessions_) {
    const UserSession &s = *kv.second;
    if (s.isActive)
      ++active;
    for (const auto &a : s.activities) {
      if (a.timestamp > hourAgo)
        ++lastHour;
      if (a.timestamp > dayAgo) {
        ++lastDay;
        ++perUser[s.userId];
      }
    }
  }

  std::vector<std::pair<std::string, size_t>> top(perUser.begin(), perUser.end());
  std::stable_sort(top.begin(), top.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  if (top.size() > 10)
    top.resize(10);

  nlohmann::json j;
  j["active_sessions"] = active;
  j["total_users"] = byUser_.size();
  j["total_sessions"] = sessions_.size();
  j["activity_last_hour"] = lastHour;
  j["activity_last_day"] = lastDay;
  j["top_active_users"] = nlohmann::json::array();
  for (const auto &u : top)
    j["top_active_users"].push_back({{"user_id", u.first}, {"activity_count", u.second}});
  j["generated_at"] = formatTimestamp(at);
  return j;
}

std::vector<SuspiciousActivity>
ActivityTracker::detectSuspiciousActivity(const std::optional<std::string> &userId) const {
  const AnomalyThresholds &t = options_.thresholds;
  std::vector<SuspiciousActivity> findings;

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string detectedAt = formatTimestamp(now());

  std::vector<std::string> users;
  if (userId) {
    users.push_back(*userId);
  } else {
    for (const auto &kv : byUser_)
      users.push_back(kv.first);
  }

  for (const auto &uid : users) {
    auto it = byUser_.find(uid);
    if (it == byUser_.end())
      continue;
    const auto &sessions = it->second;

    size_t activeCount = std::count_if(sessions.begin(), sessions.end(),
                                       [](const auto &s) { return s->isActive; });
    if (activeCount > t.maxConcurrentSessions) {
      findings.push_back({"multiple_concurrent_sessions", uid, "medium", detectedAt,
                          {{"session_count", activeCount}}});
    }

    size_t rateStart = sessions.size() > t.recentSessionsForRate
                           ? sessions.size() - t.recentSessionsForRate
                           : 0;
    for (size_t i = rateStart; i < sessions.size(); ++i) {
      const UserSession &s = *sessions[i];
      if (s.activities.size() <= t.rapidActivityCount)
        continue;
      double span = secondsBetween(s.startTime, s.lastActivity);
      if (span <= 0.0)
        continue;
      double rate = static_cast<double>(s.activities.size()) / span;
      if (rate > t.rapidActivityRate) {
        findings.push_back({"rapid_activity_pattern", uid, "high", detectedAt,
                            {{"session_id", s.sessionId}, {"activity_rate", rate}}});
      }
    }

    size_t ipStart = sessions.size() > t.recentSessionsForIp
                         ? sessions.size() - t.recentSessionsForIp
                         : 0;
    std::set<std::string> ips;
    for (size_t i = ipStart; i < sessions.size(); ++i) {
      if (sessions[i]->ipAddress)
        ips.insert(*sessions[i]->ipAddress);
    }
    if (ips.size() > t.maxDistinctIps) {
      findings.push_back({"multiple_ip_addresses", uid, "medium", detectedAt,
                          {{"ip_count", ips.size()}, {"ip_addresses", ips}}});
    }
  }

  for (const auto &f : findings) {
    Logger::getInstance().log(LogLevel::WARN, "[ActivityTracker] Suspicious activity: " +
                                                  f.type + " for user " + f.userId);
  }
  return findings;
}

Result<std::string> ActivityTracker::exportUserActivity(const std::string &userId,
                                                        ActivityExportFormat format,
                                                        bool includeDetails) const {
  std::vector<UserSession> sessions = userSessions(userId);
  Timestamp at = now();

  if (format == ActivityExportFormat::Json) {
    nlohmann::json j;
    j["user_id"] = userId;
    j["exported_at"] = formatTimestamp(at);
    j["sessions"] = nlohmann::json::array();
    for (const auto &s : sessions)
      j["sessions"].push_back(s.toJson(at, includeDetails));
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  std::string out = csvRow({"session_id", "start_time", "end_time", "duration_seconds",
                            "activity_count", "ip_address", "user_agent"});
  for (const auto &s : sessions) {
    out += csvRow({s.sessionId, formatTimestamp(s.startTime),
                   s.endTime ? formatTimestamp(*s.endTime) : std::string(),
                   csvCell(s.durationSeconds(at)), std::to_string(s.activities.size()),
                   s.ipAddress.value_or(""), s.userAgent.value_or("")});
  }
  return out;
}

size_t ActivityTracker::sweepExpired() {
  std::vector<AuditEvent> events;
  size_t ended = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ended = sweepLocked(now(), events);
    if (ended > 0)
      persistLocked();
  }
  forward(events);
  return ended;
}

void ActivityTracker::startSweeper(std::chrono::seconds interval) {
  if (sweeping_)
    return;
  sweepInterval_ = interval;
  sweeping_ = true;
  sweeper_ = std::thread(&ActivityTracker::sweeperLoop, this);
}

void ActivityTracker::stopSweeper() {
  if (!sweeping_)
    return;
  sweeping_ = false;
  if (sweeper_.joinable())
    sweeper_.join();
}

void ActivityTracker::sweeperLoop() {
  while (sweeping_) {
    sweepExpired();
    for (std::chrono::seconds s{0}; s < sweepInterval_ && sweeping_;
         s += std::chrono::seconds(1)) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
}

size_t ActivityTracker::persistFailures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return persistFailures_;
}

void ActivityTracker::persistLocked() {
  if (options_.sessionsPath.empty())
    return;
  if (persistBlocked_) {
    ++persistFailures_;
    Logger::getInstance().log(LogLevel::ERROR,
                              "[ActivityTracker] Refusing to overwrite " +
                                  options_.sessionsPath + ", which could not be loaded");
    return;
  }

  Timestamp at = now();
  nlohmann::json all = nlohmann::json::array();
  for (const auto &kv : byUser_) {
    for (const auto &s : kv.second)
      all.push_back(s->toJson(at));
  }
  std::string body = all.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  if (options_.cipher) {
    auto sealed = options_.cipher->encrypt(body);
    if (sealed) {
      body = std::move(sealed).value();
    } else {
      Logger::getInstance().log(LogLevel::WARN,
                                "[ActivityTracker] Failed to encrypt sessions: " +
                                    sealed.error().message + ". Writing unencrypted.");
    }
  }
  auto written = writeFileDurably(options_.sessionsPath, body);
  if (!written) {
    ++persistFailures_;
    Logger::getInstance().log(LogLevel::ERROR, "[ActivityTracker] Failed to save sessions: " +
                                                   written.error().message);
  }
}

void ActivityTracker::loadSessions() {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (options_.sessionsPath.empty() || !fs::exists(options_.sessionsPath, ec))
    return;

  auto raw = readWholeFile(options_.sessionsPath);
  if (!raw) {
    Logger::getInstance().log(LogLevel::ERROR, "[ActivityTracker] Failed to read sessions: " +
                                                   raw.error().message);
    return;
  }
  std::string text = std::move(raw).value();
  if (hasLedgerEnvelope(text)) {
    if (!options_.cipher) {
      persistBlocked_ = true;
      Logger::getInstance().log(LogLevel::ERROR,
                                "[ActivityTracker] Sessions file is encrypted but no "
                                "cipher is configured; leaving it untouched");
      return;
    }
    auto plain = options_.cipher->decrypt(text);
    if (!plain) {
      persistBlocked_ = true;
      Logger::getInstance().log(LogLevel::ERROR,
                                "[ActivityTracker] Failed to decrypt sessions: " +
                                    plain.error().message + ". Leaving file untouched.");
      return;
    }
    text = std::move(plain).value();
  }

  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_array()) {
    const std::string aside =
        options_.sessionsPath + ".corrupt-" +
        std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                           Clock::now().time_since_epoch())
                           .count());
    fs::rename(options_.sessionsPath, aside, ec);
    if (ec)
      persistBlocked_ = true;
    Logger::getInstance().log(LogLevel::ERROR,
                              "[ActivityTracker] Unreadable sessions file" +
                                  (ec ? std::string(" could not be moved aside: ") + ec.message()
                                      : ", preserved as " + aside));
    return;
  }

  size_t skipped = 0;
  for (const auto &item : doc) {
    try {
      auto session = std::make_shared<UserSession>(UserSession::fromJson(item));
      byUser_[session->userId].push_back(session);
      sessions_[session->sessionId] = session;
    } catch (const std::exception &e) {
      ++skipped;
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("[ActivityTracker] Skipping bad session record: ") +
                                    e.what());
    }
  }
  for (auto &kv : byUser_) {
    std::stable_sort(kv.second.begin(), kv.second.end(), [](const auto &a, const auto &b) {
      return a->startTime < b->startTime;
    });
  }
  Logger::getInstance().log(LogLevel::INFO, "[ActivityTracker] Loaded " +
                                                std::to_string(sessions_.size()) +
                                                " sessions (" + std::to_string(skipped) +
                                                " skipped)");
}

} // namespace docforensics
