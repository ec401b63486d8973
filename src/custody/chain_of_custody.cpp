#include "custody/chain_of_custody.hpp"
#include "utilities/csv.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <sstream>

namespace docforensics {

namespace {

constexpr const char *CUSTODY_PREFIX = "custody_";
constexpr const char *CUSTODY_SUFFIX = ".json";

std::optional<DocumentId> documentIdFromFilename(const std::string &filename) {
  const std::string prefix = CUSTODY_PREFIX;
  const std::string suffix = CUSTODY_SUFFIX;
  if (filename.size() <= prefix.size() + suffix.size() ||
      filename.compare(0, prefix.size(), prefix) != 0 ||
      filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0)
    return std::nullopt;
  std::string digits = filename.substr(
      prefix.size(), filename.size() - prefix.size() - suffix.size());
  errno = 0;
  char *end = nullptr;
  long long id = std::strtoll(digits.c_str(), &end, 10);
  if (errno != 0 || end == digits.c_str() || *end != '\0')
    return std::nullopt;
  return id;
}

nlohmann::json optionalString(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Orders two ledger timestamps; unparsable ones compare as text.
bool timestampBefore(const std::string &a, const std::string &b) {
  auto ta = parseTimestamp(a);
  auto tb = parseTimestamp(b);
  if (ta && tb)
    return *ta < *tb;
  return a < b;
}

nlohmann::json custodyEntryJson(const LedgerEntry &entry) {
  nlohmann::json j = entry.payload;
  j["entry_id"] = entry.entryId;
  j["timestamp"] = entry.timestamp;
  return j;
}

std::string exportCustodyCsv(const std::vector<LedgerEntry> &entries) {
  static const std::vector<std::string> payloadColumns = {
      "document_id", "action", "user_id", "location", "hash_before", "hash_after"};
  std::vector<std::string> header = {"entry_id", "timestamp"};
  header.insert(header.end(), payloadColumns.begin(), payloadColumns.end());
  header.push_back("content_hash");
  header.push_back("previous_hash");
  header.push_back("chain_hash");

  std::string out = csvRow(header);
  for (const auto &e : entries) {
    std::vector<std::string> row = {e.entryId, e.timestamp};
    for (const auto &col : payloadColumns) {
      auto it = e.payload.find(col);
      row.push_back(it == e.payload.end() ? "" : csvCell(*it));
    }
    row.push_back(e.contentHash);
    row.push_back(e.previousHash);
    row.push_back(e.chainHash);
    out += csvRow(row);
  }
  return out;
}

std::string exportCustodyText(DocumentId documentId,
                              const std::vector<LedgerEntry> &entries) {
  std::ostringstream out;
  out << "Chain of Custody Report\n";
  out << "Document ID: " << documentId << "\n";
  out << "Generated: " << currentTimestamp() << "\n";
  out << "Total Entries: " << entries.size() << "\n\n";
  size_t n = 1;
  for (const auto &e : entries) {
    out << "Entry " << n++ << ":\n";
    out << "  ID: " << e.entryId << "\n";
    out << "  Action: " << payloadString(e.payload, "action") << "\n";
    out << "  User: " << payloadString(e.payload, "user_id") << "\n";
    out << "  Timestamp: " << e.timestamp << "\n";
    for (const auto &field : {std::make_pair("location", "Location"),
                              std::make_pair("hash_before", "Hash Before"),
                              std::make_pair("hash_after", "Hash After")}) {
      std::string value = payloadString(e.payload, field.first);
      if (!value.empty())
        out << "  " << field.second << ": " << value << "\n";
    }
    out << "  Chain Hash: " << e.chainHash << "\n\n";
  }
  return out.str();
}

} // namespace

nlohmann::json CustodyVerificationReport::toJson() const {
  nlohmann::json j = ledger.toJson();
  j["document_id"] = documentId;
  j["issues"] = nlohmann::json::array();
  for (const auto &v : issues)
    j["issues"].push_back(v.toJson());
  j["is_valid"] = isValid();
  return j;
}

std::optional<CustodyExportFormat>
parseCustodyExportFormat(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "json")
    return CustodyExportFormat::Json;
  if (lower == "csv")
    return CustodyExportFormat::Csv;
  if (lower == "text" || lower == "txt")
    return CustodyExportFormat::Text;
  return std::nullopt;
}

std::vector<ChainViolation> custodyIssues(const std::vector<LedgerEntry> &entries) {
  std::vector<ChainViolation> issues;
  auto issue = [&](size_t i, ViolationKind kind, std::string expected,
                   std::string actual, std::string detail) {
    ChainViolation v;
    v.entryIndex = i;
    v.entryId = entries[i].entryId;
    v.kind = kind;
    v.expectedHash = std::move(expected);
    v.actualHash = std::move(actual);
    v.detail = std::move(detail);
    issues.push_back(std::move(v));
  };

  for (size_t i = 0; i < entries.size(); ++i) {
    const LedgerEntry &entry = entries[i];
    if (payloadString(entry.payload, "user_id").empty())
      issue(i, ViolationKind::MissingField, "user_id", "",
            "Missing user_id at index " + std::to_string(i));
    if (payloadString(entry.payload, "action").empty())
      issue(i, ViolationKind::MissingField, "action", "",
            "Missing action at index " + std::to_string(i));
    if (i == 0)
      continue;

    const LedgerEntry &prev = entries[i - 1];
    if (timestampBefore(entry.timestamp, prev.timestamp)) {
      issue(i, ViolationKind::TimestampOutOfOrder, prev.timestamp, entry.timestamp,
            "Timestamp out of order at index " + std::to_string(i) + ": " +
                entry.timestamp + " precedes " + prev.timestamp);
    }
    std::string before = payloadString(entry.payload, "hash_before");
    std::string prevAfter = payloadString(prev.payload, "hash_after");
    if (!before.empty() && !prevAfter.empty() && before != prevAfter) {
      issue(i, ViolationKind::CustodyHashMismatch, prevAfter, before,
            "Hash chain broken at index " + std::to_string(i) + ": hash_before " +
                before + " does not match previous hash_after " + prevAfter);
    }
  }
  return issues;
}

ChainOfCustody::ChainOfCustody(CustodyOptions options, AuditTrail *audit)
    : options_(std::move(options)), audit_(audit) {
  loadExisting();
}

CustodyOptions ChainOfCustody::optionsFromConfig(const LedgerConfig &cfg,
                                                 std::shared_ptr<LedgerCipher> cipher) {
  CustodyOptions opts;
  opts.directory = custodyDir(cfg.varDir);
  opts.algorithm = cfg.hashAlgorithm;
  opts.cipher = std::move(cipher);
  return opts;
}

std::string ChainOfCustody::pathFor(DocumentId documentId) const {
  if (options_.directory.empty())
    return "";
  return options_.directory + "/" + CUSTODY_PREFIX + std::to_string(documentId) +
         CUSTODY_SUFFIX;
}

void ChainOfCustody::loadExisting() {
  if (options_.directory.empty())
    return;
  std::error_code ec;
  if (!std::filesystem::is_directory(options_.directory, ec))
    return;

  std::filesystem::directory_iterator it(options_.directory, ec);
  if (ec) {
    Logger::getInstance().log(LogLevel::ERROR, "[ChainOfCustody] Cannot list " +
                                                   options_.directory + ": " +
                                                   ec.message());
    return;
  }
  for (const auto &dirEntry : it) {
    if (!dirEntry.is_regular_file(ec))
      continue;
    auto documentId = documentIdFromFilename(dirEntry.path().filename().string());
    if (!documentId)
      continue;

    LedgerOptions opts;
    opts.name = CUSTODY_PREFIX + std::to_string(*documentId);
    opts.path = dirEntry.path().string();
    opts.algorithm = options_.algorithm;
    opts.cipher = options_.cipher;
    std::shared_ptr<Ledger> ledger = Ledger::open(std::move(opts));
    LedgerHealth health = ledger->health();
    if (health.loadStatus == LoadStatus::Unreadable && !health.writesBlocked) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "[ChainOfCustody] Skipping unreadable chain for document " +
                                    std::to_string(*documentId));
      continue;
    }
    chains_[*documentId] = std::move(ledger);
  }
  Logger::getInstance().log(LogLevel::INFO, "[ChainOfCustody] Loaded " +
                                                std::to_string(chains_.size()) +
                                                " custody chains");
}

std::shared_ptr<Ledger> ChainOfCustody::find(DocumentId documentId) const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  auto it = chains_.find(documentId);
  return it == chains_.end() ? nullptr : it->second;
}

std::shared_ptr<Ledger> ChainOfCustody::findOrCreate(DocumentId documentId) {
  std::lock_guard<std::mutex> lock(registryMutex_);
  auto &slot = chains_[documentId];
  if (!slot) {
    LedgerOptions opts;
    opts.name = CUSTODY_PREFIX + std::to_string(documentId);
    opts.path = pathFor(documentId);
    opts.algorithm = options_.algorithm;
    opts.cipher = options_.cipher;
    std::error_code ec;
    bool exists = !opts.path.empty() && std::filesystem::exists(opts.path, ec);
    slot = std::make_shared<Ledger>(std::move(opts));
    if (exists)
      slot->load();
  }
  return slot;
}

Result<std::string> ChainOfCustody::addEntry(DocumentId documentId,
                                             const std::string &action,
                                             const std::string &userId,
                                             nlohmann::json details,
                                             std::optional<std::string> location,
                                             std::optional<std::string> hashBefore,
                                             std::optional<std::string> hashAfter) {
  if (action.empty())
    return Result<std::string>::failure(ErrorKind::InvalidArgument,
                                        "custody action must not be empty");
  if (userId.empty())
    return Result<std::string>::failure(ErrorKind::InvalidArgument,
                                        "custody user_id must not be empty");
  if (details.is_null())
    details = nlohmann::json::object();

  nlohmann::json payload;
  payload["document_id"] = documentId;
  payload["action"] = action;
  payload["user_id"] = userId;
  payload["details"] = details;
  payload["location"] = optionalString(location);
  payload["hash_before"] = optionalString(hashBefore);
  payload["hash_after"] = optionalString(hashAfter);

  std::shared_ptr<Ledger> ledger = findOrCreate(documentId);
  AppendReceipt receipt = ledger->append(std::move(payload));

  Logger::getInstance().log(LogLevel::INFO, "[ChainOfCustody] " + action +
                                                " on document " +
                                                std::to_string(documentId) +
                                                " by " + userId);

  if (audit_) {
    nlohmann::json mirrored = details.is_object() ? details : nlohmann::json::object();
    mirrored["custody_entry_id"] = receipt.entryId;
    mirrored["location"] = optionalString(location);
    mirrored["hash_before"] = optionalString(hashBefore);
    mirrored["hash_after"] = optionalString(hashAfter);
    audit_->record("custody_" + action, userId, documentId, std::move(mirrored));
  }
  return receipt.entryId;
}

Result<CustodyVerificationReport> ChainOfCustody::verify(DocumentId documentId) const {
  std::shared_ptr<Ledger> ledger = find(documentId);
  if (!ledger)
    return Result<CustodyVerificationReport>::failure(
        ErrorKind::DocumentNotFound,
        "no custody chain for document " + std::to_string(documentId));

  LedgerHealth health = ledger->health();
  if (health.writesBlocked) {
    ErrorKind kind = health.loadStatus == LoadStatus::DecryptionFailed
                         ? ErrorKind::EncryptionError
                         : ErrorKind::UnreadableLedger;
    return Result<CustodyVerificationReport>::failure(
        kind, "custody chain for document " + std::to_string(documentId) +
                  " could not be loaded: " + health.lastError);
  }

  Ledger::Snapshot entries = ledger->snapshot();
  CustodyVerificationReport report;
  report.documentId = documentId;
  report.ledger = verifyEntries(*entries, ledger->algorithm());
  report.issues = custodyIssues(*entries);
  if (!report.isValid()) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[ChainOfCustody] Verification failed for document " +
                                  std::to_string(documentId) + ": " +
                                  std::to_string(report.ledger.tamperedEntries.size()) +
                                  " tampered, " +
                                  std::to_string(report.ledger.brokenLinks.size()) +
                                  " broken links, " +
                                  std::to_string(report.issues.size()) + " issues");
  }
  return report;
}

std::vector<CustodyVerificationReport> ChainOfCustody::verifyAll() const {
  std::vector<CustodyVerificationReport> reports;
  for (DocumentId id : documentIds()) {
    auto report = verify(id);
    if (report)
      reports.push_back(std::move(report).value());
  }
  return reports;
}

nlohmann::json ChainOfCustody::summary(DocumentId documentId) const {
  nlohmann::json j;
  j["document_id"] = documentId;
  std::shared_ptr<Ledger> ledger = find(documentId);
  Ledger::Snapshot entries =
      ledger ? ledger->snapshot() : std::make_shared<const std::vector<LedgerEntry>>();

  std::set<std::string> custodians;
  std::set<std::string> locations;
  std::set<std::string> actions;
  for (const auto &e : *entries) {
    std::string user = payloadString(e.payload, "user_id");
    if (!user.empty())
      custodians.insert(user);
    std::string location = payloadString(e.payload, "location");
    if (!location.empty())
      locations.insert(location);
    std::string action = payloadString(e.payload, "action");
    if (!action.empty())
      actions.insert(action);
  }

  j["total_entries"] = entries->size();
  j["first_custody"] =
      entries->empty() ? nlohmann::json(nullptr) : custodyEntryJson(entries->front());
  j["last_custody"] =
      entries->empty() ? nlohmann::json(nullptr) : custodyEntryJson(entries->back());
  j["custodians"] = custodians;
  j["locations"] = locations;
  j["actions"] = actions;
  if (entries->empty()) {
    j["time_span"] = nullptr;
  } else {
    j["time_span"] = {{"start", entries->front().timestamp},
                      {"end", entries->back().timestamp}};
  }
  return j;
}

std::vector<LedgerEntry> ChainOfCustody::search(const CustodySearch &filter) const {
  std::vector<std::shared_ptr<Ledger>> ledgers;
  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    for (const auto &kv : chains_) {
      if (!filter.documentId || *filter.documentId == kv.first)
        ledgers.push_back(kv.second);
    }
  }

  LedgerQuery q;
  if (filter.userId)
    q.payloadEquals["user_id"] = *filter.userId;
  if (filter.action)
    q.payloadEquals["action"] = *filter.action;
  q.from = filter.from;
  q.to = filter.to;

  std::vector<LedgerEntry> results;
  for (const auto &ledger : ledgers) {
    auto matches = ledger->query(q);
    results.insert(results.end(), std::make_move_iterator(matches.begin()),
                   std::make_move_iterator(matches.end()));
  }
  std::stable_sort(results.begin(), results.end(),
                   [](const LedgerEntry &a, const LedgerEntry &b) {
                     return timestampBefore(a.timestamp, b.timestamp);
                   });
  return results;
}

Result<std::vector<LedgerEntry>> ChainOfCustody::chain(DocumentId documentId) const {
  std::shared_ptr<Ledger> ledger = find(documentId);
  if (!ledger)
    return Result<std::vector<LedgerEntry>>::failure(
        ErrorKind::DocumentNotFound,
        "no custody chain for document " + std::to_string(documentId));
  return *ledger->snapshot();
}

Result<std::string> ChainOfCustody::exportChain(DocumentId documentId,
                                                CustodyExportFormat format) const {
  std::shared_ptr<Ledger> ledger = find(documentId);
  if (!ledger)
    return Result<std::string>::failure(
        ErrorKind::DocumentNotFound,
        "no custody chain for document " + std::to_string(documentId));

  switch (format) {
  case CustodyExportFormat::Json:
    return ledger->exportData(ExportFormat::Json);
  case CustodyExportFormat::Csv:
    return exportCustodyCsv(*ledger->snapshot());
  case CustodyExportFormat::Text:
    return exportCustodyText(documentId, *ledger->snapshot());
  }
  return Result<std::string>::failure(ErrorKind::UnsupportedFormat,
                                      "unknown custody export format");
}

std::vector<DocumentId> ChainOfCustody::documentIds() const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  std::vector<DocumentId> ids;
  ids.reserve(chains_.size());
  for (const auto &kv : chains_)
    ids.push_back(kv.first);
  return ids;
}

Result<void> ChainOfCustody::deleteChain(DocumentId documentId) {
  std::shared_ptr<Ledger> ledger;
  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = chains_.find(documentId);
    if (it == chains_.end())
      return Result<void>::failure(ErrorKind::DocumentNotFound,
                                   "no custody chain for document " +
                                       std::to_string(documentId));
    ledger = std::move(it->second);
    chains_.erase(it);
  }
  Logger::getInstance().log(LogLevel::INFO, "[ChainOfCustody] Deleted chain for document " +
                                                std::to_string(documentId));
  return ledger->removeFile();
}

std::optional<LedgerHealth> ChainOfCustody::health(DocumentId documentId) const {
  std::shared_ptr<Ledger> ledger = find(documentId);
  if (!ledger)
    return std::nullopt;
  return ledger->health();
}

} // namespace docforensics
