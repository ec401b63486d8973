#include "audit/audit_trail.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace docforensics {

namespace {

std::string asciiSafe(const std::string &text) {
  std::string out = text;
  for (char &c : out) {
    if (static_cast<unsigned char>(c) > 0x7F)
      c = '?';
  }
  return out;
}

std::vector<std::pair<std::string, size_t>>
topN(const std::map<std::string, size_t> &counts, size_t n) {
  std::vector<std::pair<std::string, size_t>> items(counts.begin(), counts.end());
  std::stable_sort(items.begin(), items.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  if (items.size() > n)
    items.resize(n);
  return items;
}

nlohmann::json optionalString(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json AuditStatistics::toJson() const {
  nlohmann::json j;
  j["total_entries"] = totalEntries;
  if (earliest || latest) {
    j["date_range"] = {{"earliest", optionalString(earliest)},
                       {"latest", optionalString(latest)}};
  } else {
    j["date_range"] = nullptr;
  }
  j["top_actions"] = nlohmann::json::array();
  for (const auto &a : topActions)
    j["top_actions"].push_back({a.first, a.second});
  j["top_users"] = nlohmann::json::array();
  for (const auto &u : topUsers)
    j["top_users"].push_back({u.first, u.second});
  j["documents_accessed"] = documentsAccessed;
  j["unique_users"] = uniqueUsers;
  j["persist_failures"] = persistFailures;
  j["last_error"] = lastError;
  j["load_status"] = toString(loadStatus);
  return j;
}

AuditTrail::AuditTrail(LedgerOptions options)
    : ledger_(Ledger::open(std::move(options))) {}

LedgerOptions AuditTrail::optionsFromConfig(const LedgerConfig &cfg,
                                            std::shared_ptr<LedgerCipher> cipher) {
  LedgerOptions opts;
  opts.name = "audit";
  opts.path = auditChainPath(cfg.varDir);
  opts.algorithm = cfg.hashAlgorithm;
  opts.cipher = std::move(cipher);
  return opts;
}

std::string AuditTrail::record(const std::string &action,
                               const std::string &userId,
                               std::optional<DocumentId> documentId,
                               nlohmann::json details,
                               std::optional<std::string> ipAddress,
                               std::optional<std::string> userAgent) {
  try {
    nlohmann::json payload;
    payload["action"] = action;
    payload["user_id"] = userId.empty() ? nlohmann::json(nullptr)
                                        : nlohmann::json(userId);
    payload["document_id"] =
        documentId ? nlohmann::json(*documentId) : nlohmann::json(nullptr);
    payload["details"] =
        details.is_null() ? nlohmann::json::object() : std::move(details);
    payload["ip_address"] = optionalString(ipAddress);
    payload["user_agent"] = optionalString(userAgent);

    std::string line = "Action: " + (action.empty() ? "unknown" : asciiSafe(action)) +
                       " | User: " + (userId.empty() ? "unknown" : asciiSafe(userId)) +
                       " | Document: " +
                       (documentId ? std::to_string(*documentId) : "None");
    if (!payload["details"].empty()) {
      line += " | Details: " +
              payload["details"].dump(-1, ' ', true,
                                      nlohmann::json::error_handler_t::replace);
    }
    Logger::getInstance().log(LogLevel::INFO, line);

    AppendReceipt receipt = ledger_->append(std::move(payload));
    return receipt.entryId;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "[AuditTrail] Failed to record " +
                                                   asciiSafe(action) + ": " +
                                                   e.what());
    return "";
  }
}

std::vector<LedgerEntry> AuditTrail::byUser(const std::string &userId,
                                            std::optional<size_t> limit) const {
  LedgerQuery q;
  q.payloadEquals["user_id"] = userId;
  q.limit = limit;
  q.newestWindow = true;
  return ledger_->query(q);
}

std::vector<LedgerEntry> AuditTrail::byDocument(DocumentId documentId,
                                                std::optional<size_t> limit) const {
  LedgerQuery q;
  q.payloadEquals["document_id"] = documentId;
  q.limit = limit;
  q.newestWindow = true;
  return ledger_->query(q);
}

std::vector<LedgerEntry> AuditTrail::byActionType(const std::string &action,
                                                  std::optional<size_t> limit) const {
  LedgerQuery q;
  q.payloadEquals["action"] = action;
  q.limit = limit;
  q.newestWindow = true;
  return ledger_->query(q);
}

std::vector<LedgerEntry> AuditTrail::byTimeRange(std::optional<Timestamp> from,
                                                 std::optional<Timestamp> to) const {
  LedgerQuery q;
  q.from = from;
  q.to = to;
  return ledger_->query(q);
}

std::vector<LedgerEntry> AuditTrail::recent(size_t limit) const {
  LedgerQuery q;
  q.limit = limit;
  q.newestWindow = true;
  return ledger_->query(q);
}

std::vector<LedgerEntry> AuditTrail::query(const LedgerQuery &query) const {
  return ledger_->query(query);
}

AuditStatistics AuditTrail::statistics() const {
  AuditStatistics stats;
  Ledger::Snapshot entries = ledger_->snapshot();
  LedgerHealth h = ledger_->health();
  stats.persistFailures = h.persistFailures;
  stats.lastError = h.lastError;
  stats.loadStatus = h.loadStatus;
  stats.totalEntries = entries->size();
  if (entries->empty())
    return stats;

  std::map<std::string, size_t> actions;
  std::map<std::string, size_t> users;
  std::set<std::string> documents;
  for (const auto &e : *entries) {
    std::string action = payloadString(e.payload, "action");
    ++actions[action.empty() ? "unknown" : action];
    std::string user = payloadString(e.payload, "user_id");
    if (!user.empty())
      ++users[user];
    std::string doc = payloadString(e.payload, "document_id");
    if (!doc.empty() && doc != "0")
      documents.insert(doc);
    // Fixed-width ISO timestamps order lexicographically.
    if (!stats.earliest || e.timestamp < *stats.earliest)
      stats.earliest = e.timestamp;
    if (!stats.latest || e.timestamp > *stats.latest)
      stats.latest = e.timestamp;
  }
  stats.topActions = topN(actions, 10);
  stats.topUsers = topN(users, 10);
  stats.documentsAccessed = documents.size();
  stats.uniqueUsers = users.size();
  return stats;
}

VerificationReport AuditTrail::verify() const { return ledger_->verify(); }

Result<std::string> AuditTrail::exportTrail(ExportFormat format) const {
  return ledger_->exportData(format);
}

Result<void> AuditTrail::exportToFile(const std::string &path,
                                      ExportFormat format) const {
  auto data = exportTrail(format);
  if (!data)
    return data.error();
  return writeFileDurably(path, data.value());
}

LedgerHealth AuditTrail::health() const { return ledger_->health(); }

size_t AuditTrail::size() const { return ledger_->size(); }

} // namespace docforensics
