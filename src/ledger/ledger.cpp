#include "ledger/ledger.hpp"
#include "ledger/canonical.hpp"
#include "utilities/csv.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <set>
#include <sodium.h>
#include <sstream>

namespace docforensics {

int formatVersionFor(HashAlgorithm algo) {
  return algo == HashAlgorithm::BLAKE3 ? 2 : 1;
}

std::optional<HashAlgorithm> algorithmForVersion(int version) {
  switch (version) {
  case 1:
    return HashAlgorithm::SHA256;
  case 2:
    return HashAlgorithm::BLAKE3;
  default:
    return std::nullopt;
  }
}

std::string toString(ViolationKind kind) {
  switch (kind) {
  case ViolationKind::ContentHashMismatch:
    return "content_hash_mismatch";
  case ViolationKind::ChainHashMismatch:
    return "chain_hash_mismatch";
  case ViolationKind::BrokenLink:
    return "broken_link";
  case ViolationKind::MissingField:
    return "missing_field";
  case ViolationKind::TimestampOutOfOrder:
    return "timestamp_out_of_order";
  case ViolationKind::CustodyHashMismatch:
    return "custody_hash_mismatch";
  default:
    return "unknown";
  }
}

std::string toString(LoadStatus status) {
  switch (status) {
  case LoadStatus::Empty:
    return "empty";
  case LoadStatus::Loaded:
    return "loaded";
  case LoadStatus::LoadedPlaintextFallback:
    return "loaded_plaintext_fallback";
  case LoadStatus::Unreadable:
    return "unreadable";
  case LoadStatus::DecryptionFailed:
    return "decryption_failed";
  default:
    return "unknown";
  }
}

nlohmann::json ChainViolation::toJson() const {
  nlohmann::json j{{"entry_index", entryIndex},
                   {"entry_id", entryId},
                   {"issue", toString(kind)},
                   {"expected_hash", expectedHash},
                   {"actual_hash", actualHash}};
  if (!detail.empty())
    j["detail"] = detail;
  return j;
}

static bool sameViolations(const std::vector<ChainViolation> &a,
                           const std::vector<ChainViolation> &b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].entryIndex != b[i].entryIndex || a[i].entryId != b[i].entryId ||
        a[i].kind != b[i].kind || a[i].expectedHash != b[i].expectedHash ||
        a[i].actualHash != b[i].actualHash || a[i].detail != b[i].detail)
      return false;
  }
  return true;
}

bool VerificationReport::sameOutcome(const VerificationReport &other) const {
  return isValid == other.isValid && totalEntries == other.totalEntries &&
         verifiedEntries == other.verifiedEntries &&
         sameViolations(tamperedEntries, other.tamperedEntries) &&
         sameViolations(brokenLinks, other.brokenLinks);
}

nlohmann::json VerificationReport::toJson() const {
  nlohmann::json j;
  j["is_valid"] = isValid;
  j["total_entries"] = totalEntries;
  j["verified_entries"] = verifiedEntries;
  j["tampered_entries"] = nlohmann::json::array();
  for (const auto &v : tamperedEntries)
    j["tampered_entries"].push_back(v.toJson());
  j["broken_links"] = nlohmann::json::array();
  for (const auto &v : brokenLinks)
    j["broken_links"].push_back(v.toJson());
  j["verification_timestamp"] = verifiedAt;
  return j;
}

VerificationReport verifyEntries(const std::vector<LedgerEntry> &entries,
                                 HashAlgorithm algo) {
  VerificationReport report;
  report.totalEntries = entries.size();
  report.verifiedEntries = 0;

  for (size_t i = 0; i < entries.size(); ++i) {
    const LedgerEntry &e = entries[i];
    bool clean = true;
    const std::string canon =
        canonicalize(sealOf(e.entryId, e.timestamp, e.payload));

    const std::string expectedContent = computeContentHash(algo, canon);
    const std::string expectedChain = computeChainHash(algo, canon, e.previousHash);
    if (e.contentHash != expectedContent) {
      report.tamperedEntries.push_back({i, e.entryId,
                                        ViolationKind::ContentHashMismatch,
                                        expectedContent, e.contentHash});
      clean = false;
    } else if (e.chainHash != expectedChain) {
      report.tamperedEntries.push_back({i, e.entryId,
                                        ViolationKind::ChainHashMismatch,
                                        expectedChain, e.chainHash});
      clean = false;
    }

    const std::string expectedPrevious = i == 0 ? std::string() : entries[i - 1].chainHash;
    if (e.previousHash != expectedPrevious) {
      report.brokenLinks.push_back({i, e.entryId, ViolationKind::BrokenLink,
                                    expectedPrevious, e.previousHash});
      clean = false;
    }

    if (clean)
      ++report.verifiedEntries;
  }

  report.isValid = report.tamperedEntries.empty() && report.brokenLinks.empty();
  report.verifiedAt = currentTimestamp();
  return report;
}

bool matchesQuery(const LedgerEntry &entry, const LedgerQuery &query) {
  for (const auto &kv : query.payloadEquals) {
    auto it = entry.payload.find(kv.first);
    if (it == entry.payload.end()) {
      if (!kv.second.is_null())
        return false;
      continue;
    }
    if (*it != kv.second)
      return false;
  }
  if (query.from || query.to) {
    auto ts = parseTimestamp(entry.timestamp);
    if (!ts)
      return false;
    if (query.from && *ts < *query.from)
      return false;
    if (query.to && *ts > *query.to)
      return false;
  }
  return true;
}

std::vector<LedgerEntry> applyWindow(std::vector<LedgerEntry> matches,
                                     const LedgerQuery &query) {
  const size_t n = matches.size();
  size_t begin = 0;
  size_t end = n;
  if (query.newestWindow) {
    end = query.offset >= n ? 0 : n - query.offset;
    if (query.limit && *query.limit < end)
      begin = end - *query.limit;
  } else {
    begin = std::min(query.offset, n);
    if (query.limit)
      end = std::min(n, begin + *query.limit);
  }
  if (begin == 0 && end == n)
    return matches;
  return std::vector<LedgerEntry>(
      std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(begin)),
      std::make_move_iterator(matches.begin() + static_cast<std::ptrdiff_t>(end)));
}

std::optional<ExportFormat> parseExportFormat(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "json")
    return ExportFormat::Json;
  if (lower == "csv")
    return ExportFormat::Csv;
  return std::nullopt;
}

static Result<HashAlgorithm> parseLedgerHeader(const nlohmann::json &doc);
static Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>
parseLedgerHeaderAndEntries(const nlohmann::json &doc);

Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>
parseLedgerDocument(const std::string &text) {
  using R = Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>;
  nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    return R::failure(ErrorKind::UnreadableLedger, "Ledger is not valid JSON");
  }
  try {
    return parseLedgerHeaderAndEntries(doc);
  } catch (const nlohmann::json::exception &e) {
    return R::failure(ErrorKind::UnreadableLedger,
                      std::string("Malformed ledger: ") + e.what());
  }
}

static Result<HashAlgorithm> parseLedgerHeader(const nlohmann::json &doc) {
  using R = Result<HashAlgorithm>;
  if (!doc.is_object() || doc.value("format", "") != LEDGER_FORMAT_NAME) {
    return R::failure(ErrorKind::UnreadableLedger,
                      "Missing ledger format header");
  }
  int version = doc.value("format_version", 0);
  auto algo = algorithmForVersion(version);
  if (!algo) {
    return R::failure(ErrorKind::UnreadableLedger,
                      "Unsupported ledger format version " +
                          std::to_string(version));
  }
  auto named = parseAlgorithm(doc.value("hash_algorithm", ""));
  if (!named || *named != *algo) {
    return R::failure(ErrorKind::UnreadableLedger,
                      "hash_algorithm does not match format_version");
  }
  return *algo;
}

static Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>
parseLedgerHeaderAndEntries(const nlohmann::json &doc) {
  using R = Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>;
  auto algo = parseLedgerHeader(doc);
  if (!algo) {
    return algo.error();
  }

  const auto &arr = doc.at("entries");
  if (!arr.is_array()) {
    return R::failure(ErrorKind::UnreadableLedger, "entries is not an array");
  }
  std::vector<LedgerEntry> entries;
  entries.reserve(arr.size());
  for (const auto &item : arr)
    entries.push_back(entryFromJson(item));
  return std::make_pair(algo.value(), std::move(entries));
}

std::string exportCsv(const std::vector<LedgerEntry> &entries) {
  std::set<std::string> payloadKeys;
  for (const auto &e : entries) {
    if (e.payload.is_object()) {
      for (auto it = e.payload.begin(); it != e.payload.end(); ++it)
        payloadKeys.insert(it.key());
    }
  }

  std::vector<std::string> header{"entry_id", "timestamp", "content_hash",
                                  "previous_hash", "chain_hash"};
  header.insert(header.end(), payloadKeys.begin(), payloadKeys.end());
  std::string out = csvRow(header);

  for (const auto &e : entries) {
    std::vector<std::string> row{e.entryId, e.timestamp, e.contentHash,
                                 e.previousHash, e.chainHash};
    for (const auto &key : payloadKeys) {
      auto it = e.payload.find(key);
      row.push_back(it == e.payload.end() ? std::string() : csvCell(*it));
    }
    out += csvRow(row);
  }
  return out;
}

namespace {

std::string toBase64(const std::string &bytes) {
  std::string out(sodium_base64_ENCODED_LEN(bytes.size(),
                                            sodium_base64_VARIANT_ORIGINAL),
                  '\0');
  sodium_bin2base64(out.data(), out.size(),
                    reinterpret_cast<const unsigned char *>(bytes.data()),
                    bytes.size(), sodium_base64_VARIANT_ORIGINAL);
  out.resize(std::strlen(out.c_str()));
  return out;
}

std::optional<std::string> fromBase64(const std::string &text) {
  std::string out(text.size(), '\0');
  size_t len = 0;
  if (sodium_base642bin(reinterpret_cast<unsigned char *>(out.data()),
                        out.size(), text.c_str(), text.size(), nullptr, &len,
                        nullptr, sodium_base64_VARIANT_ORIGINAL) != 0) {
    return std::nullopt;
  }
  out.resize(len);
  return out;
}

} // namespace

Ledger::Ledger(LedgerOptions options)
    : options_(std::move(options)),
      entries_(std::make_shared<std::vector<LedgerEntry>>()) {
  if (options_.name.empty())
    options_.name = options_.path.empty() ? "ledger" : options_.path;
}

std::unique_ptr<Ledger> Ledger::open(LedgerOptions options) {
  auto ledger = std::make_unique<Ledger>(std::move(options));
  ledger->load();
  return ledger;
}

Result<std::unique_ptr<Ledger>> Ledger::fromExport(const std::string &json,
                                                   std::string name) {
  auto parsed = parseLedgerDocument(json);
  if (!parsed) {
    return parsed.error();
  }
  LedgerOptions opts;
  opts.name = std::move(name);
  opts.algorithm = parsed.value().first;
  auto ledger = std::make_unique<Ledger>(std::move(opts));
  ledger->publish(std::make_shared<std::vector<LedgerEntry>>(
      std::move(parsed.value().second)));
  std::lock_guard<std::mutex> lock(ledger->stateMutex_);
  ledger->health_.loadStatus = LoadStatus::Loaded;
  return Result<std::unique_ptr<Ledger>>(std::move(ledger));
}

void Ledger::publish(Entries entries) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  entries_ = std::move(entries);
  health_.entries = entries_->size();
}

size_t Ledger::commit(LedgerEntry entry) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  // Sole ownership means no snapshot is outstanding, and none can be taken
  // while stateMutex_ is held, so the vector can grow in place.
  if (entries_.use_count() != 1) {
    auto next = std::make_shared<std::vector<LedgerEntry>>();
    next->reserve(std::max<size_t>(16, entries_->size() * 2));
    next->assign(entries_->begin(), entries_->end());
    entries_ = std::move(next);
  }
  entries_->push_back(std::move(entry));
  health_.entries = entries_->size();
  return entries_->size() - 1;
}

void Ledger::recordFailure(const Error &error) {
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    ++health_.persistFailures;
    health_.lastError = toString(error.kind) + ": " + error.message;
  }
  Logger::getInstance().log(LogLevel::ERROR, "[Ledger " + options_.name +
                                                 "] " + toString(error.kind) +
                                                 ": " + error.message);
}

void Ledger::blockWrites(const Error &error, LoadStatus status) {
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    health_.loadStatus = status;
    health_.writesBlocked = true;
    health_.lastError = toString(error.kind) + ": " + error.message;
  }
  Logger::getInstance().log(LogLevel::ERROR,
                            "[Ledger " + options_.name + "] " +
                                toString(error.kind) + ": " + error.message +
                                ". " + options_.path +
                                " is left untouched and will not be written.");
}

void Ledger::quarantine(const std::string &reason) {
  namespace fs = std::filesystem;
  const std::string aside =
      options_.path + ".corrupt-" +
      std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                         Clock::now().time_since_epoch())
                         .count());
  std::error_code ec;
  fs::rename(options_.path, aside, ec);
  if (ec) {
    blockWrites(Error{ErrorKind::UnreadableLedger,
                      reason + " (could not be moved aside: " + ec.message() +
                          ")"},
                LoadStatus::Unreadable);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    health_.loadStatus = LoadStatus::Unreadable;
    health_.lastError = "UnreadableLedger: " + reason;
    health_.quarantinedFile = aside;
  }
  Logger::getInstance().log(LogLevel::ERROR,
                            "[Ledger " + options_.name +
                                "] Unreadable ledger (" + reason +
                                "), preserved as " + aside);
}

LoadStatus Ledger::load() {
  std::lock_guard<std::mutex> appendLock(appendMutex_);
  namespace fs = std::filesystem;

  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    health_.writesBlocked = false;
    health_.quarantinedFile.clear();
  }
  rewriteOnPersist_ = true;
  auto setStatus = [this](LoadStatus status) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    health_.loadStatus = status;
    return status;
  };
  auto clear = [this] { publish(std::make_shared<std::vector<LedgerEntry>>()); };

  std::error_code ec;
  if (options_.path.empty() || !fs::exists(options_.path, ec)) {
    clear();
    return setStatus(LoadStatus::Empty);
  }

  auto raw = readWholeFile(options_.path);
  if (!raw) {
    recordFailure(raw.error());
    quarantine(raw.error().message);
    clear();
    return LoadStatus::Unreadable;
  }
  std::string text = std::move(raw).value();
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    clear();
    return setStatus(LoadStatus::Empty);
  }

  LoadStatus status = LoadStatus::Loaded;
  if (hasLedgerEnvelope(text)) {
    // Whole-file envelope holding a single-document ledger.
    if (!options_.cipher) {
      blockWrites(Error{ErrorKind::EncryptionError,
                        "Ledger is encrypted and no cipher is configured"},
                  LoadStatus::DecryptionFailed);
      clear();
      return LoadStatus::DecryptionFailed;
    }
    auto plain = options_.cipher->decrypt(text);
    if (!plain) {
      blockWrites(plain.error(), LoadStatus::DecryptionFailed);
      clear();
      return LoadStatus::DecryptionFailed;
    }
    text = std::move(plain).value();
  }

  Parsed parsed = Parsed::failure(ErrorKind::UnreadableLedger, "empty");
  bool singleDocument = false;
  nlohmann::json whole = nlohmann::json::parse(text, nullptr, false);
  if (!whole.is_discarded() && whole.is_object() && whole.contains("entries")) {
    singleDocument = true;
    parsed = parseLedgerDocument(text);
  } else {
    parsed = parseRecords(text, status);
  }

  if (!parsed) {
    if (parsed.error().kind == ErrorKind::EncryptionError) {
      blockWrites(parsed.error(), LoadStatus::DecryptionFailed);
      clear();
      return LoadStatus::DecryptionFailed;
    }
    quarantine(parsed.error().message);
    clear();
    return LoadStatus::Unreadable;
  }
  if (status == LoadStatus::LoadedPlaintextFallback) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[Ledger " + options_.name +
                                  "] Encryption configured but ledger holds "
                                  "plaintext records; loading unencrypted.");
  }

  if (parsed.value().first != options_.algorithm) {
    Logger::getInstance().log(
        LogLevel::INFO, "[Ledger " + options_.name + "] Using " +
                            algorithmName(parsed.value().first) +
                            " from the ledger header instead of configured " +
                            algorithmName(options_.algorithm));
    std::lock_guard<std::mutex> lock(stateMutex_);
    options_.algorithm = parsed.value().first;
  }
  publish(std::make_shared<std::vector<LedgerEntry>>(
      std::move(parsed.value().second)));
  rewriteOnPersist_ = singleDocument;
  Logger::getInstance().log(LogLevel::DEBUG, "[Ledger " + options_.name +
                                                 "] Loaded " +
                                                 std::to_string(size()) +
                                                 " entries");
  return setStatus(status);
}

Ledger::Parsed Ledger::parseRecords(const std::string &text,
                                    LoadStatus &status) const {
  std::istringstream in(text);
  std::string line;
  size_t lineNo = 0;
  std::optional<HashAlgorithm> algo;
  std::vector<LedgerEntry> entries;

  while (std::getline(in, line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos)
      continue;
    const std::string where = "line " + std::to_string(lineNo);

    if (!algo) {
      nlohmann::json header = nlohmann::json::parse(line, nullptr, false);
      auto parsedAlgo = parseLedgerHeader(header);
      if (!parsedAlgo)
        return parsedAlgo.error();
      algo = parsedAlgo.value();
      continue;
    }

    std::string body;
    if (line.front() == '{') {
      if (options_.cipher)
        status = LoadStatus::LoadedPlaintextFallback;
      body = line;
    } else {
      auto envelope = fromBase64(line);
      if (!envelope || !hasLedgerEnvelope(*envelope)) {
        return Parsed::failure(ErrorKind::UnreadableLedger,
                               where + " is neither JSON nor an encrypted record");
      }
      if (!options_.cipher) {
        return Parsed::failure(ErrorKind::EncryptionError,
                               where + " is encrypted and no cipher is configured");
      }
      auto plain = options_.cipher->decrypt(*envelope);
      if (!plain) {
        return Parsed::failure(ErrorKind::EncryptionError,
                               where + ": " + plain.error().message);
      }
      body = std::move(plain).value();
    }

    nlohmann::json record = nlohmann::json::parse(body, nullptr, false);
    if (record.is_discarded()) {
      return Parsed::failure(ErrorKind::UnreadableLedger,
                             where + " is not valid JSON");
    }
    try {
      entries.push_back(entryFromJson(record));
    } catch (const nlohmann::json::exception &e) {
      return Parsed::failure(ErrorKind::UnreadableLedger,
                             where + ": " + e.what());
    }
  }
  if (!algo) {
    return Parsed::failure(ErrorKind::UnreadableLedger,
                           "Missing ledger format header");
  }
  return std::make_pair(*algo, std::move(entries));
}

std::string Ledger::serialize(const std::vector<LedgerEntry> &entries,
                              HashAlgorithm algo) const {
  nlohmann::json doc;
  doc["format"] = LEDGER_FORMAT_NAME;
  doc["format_version"] = formatVersionFor(algo);
  doc["hash_algorithm"] = algorithmName(algo);
  doc["name"] = options_.name;
  doc["entries"] = nlohmann::json::array();
  for (const auto &e : entries)
    doc["entries"].push_back(entryToJson(e));
  return doc.dump(2, ' ', true, nlohmann::json::error_handler_t::replace);
}

std::string Ledger::headerLine(HashAlgorithm algo) const {
  nlohmann::json header;
  header["format"] = LEDGER_FORMAT_NAME;
  header["format_version"] = formatVersionFor(algo);
  header["hash_algorithm"] = algorithmName(algo);
  header["name"] = options_.name;
  return header.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace) +
         "\n";
}

std::string Ledger::recordLine(const LedgerEntry &entry) const {
  std::string body = entryToJson(entry).dump(
      -1, ' ', true, nlohmann::json::error_handler_t::replace);
  if (options_.cipher) {
    auto sealed = options_.cipher->encrypt(body);
    if (sealed) {
      return toBase64(sealed.value()) + "\n";
    }
    Logger::getInstance().log(LogLevel::WARN,
                              "[Ledger " + options_.name +
                                  "] Failed to encrypt entry " + entry.entryId +
                                  ": " + sealed.error().message +
                                  ". Writing unencrypted.");
  }
  return body + "\n";
}

Result<void> Ledger::persistEntry(const LedgerEntry &entry) {
  if (options_.path.empty())
    return Result<void>::success();
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (health_.writesBlocked) {
      return Result<void>::failure(ErrorKind::PersistenceError,
                                   "Refusing to overwrite " + options_.path +
                                       ", which could not be loaded");
    }
  }

  if (!rewriteOnPersist_) {
    auto appended = appendFileDurably(options_.path, recordLine(entry));
    if (!appended)
      rewriteOnPersist_ = true;
    return appended;
  }

  Snapshot current = snapshot();
  std::string body = headerLine(algorithm());
  for (const auto &e : *current)
    body += recordLine(e);
  body += recordLine(entry);
  auto written = writeFileDurably(options_.path, body);
  if (written)
    rewriteOnPersist_ = false;
  return written;
}

AppendReceipt Ledger::append(nlohmann::json payload) {
  if (!payload.is_object()) {
    payload = nlohmann::json{{"value", std::move(payload)}};
  }

  std::lock_guard<std::mutex> appendLock(appendMutex_);
  LedgerEntry entry;
  entry.entryId = generateEntryId();
  entry.timestamp = currentTimestamp();
  entry.payload = std::move(payload);
  entry.previousHash = tailHash();
  const HashAlgorithm algo = algorithm();
  const std::string canon =
      canonicalize(sealOf(entry.entryId, entry.timestamp, entry.payload));
  entry.contentHash = computeContentHash(algo, canon);
  entry.chainHash = computeChainHash(algo, canon, entry.previousHash);

  AppendReceipt receipt;
  receipt.entryId = entry.entryId;
  receipt.chainHash = entry.chainHash;
  receipt.persisted = persistEntry(entry);
  if (!receipt.persisted) {
    recordFailure(receipt.persisted.error());
  }
  receipt.index = commit(std::move(entry));
  return receipt;
}

VerificationReport Ledger::verify() const {
  Snapshot entries = snapshot();
  return verifyEntries(*entries, algorithm());
}

std::vector<LedgerEntry> Ledger::query(const LedgerQuery &q) const {
  Snapshot entries = snapshot();
  std::vector<LedgerEntry> matches;
  for (const auto &e : *entries) {
    if (matchesQuery(e, q))
      matches.push_back(e);
  }
  return applyWindow(std::move(matches), q);
}

Result<std::string> Ledger::exportData(ExportFormat format) const {
  Snapshot entries = snapshot();
  switch (format) {
  case ExportFormat::Json:
    return serialize(*entries, algorithm());
  case ExportFormat::Csv:
    return exportCsv(*entries);
  }
  return Result<std::string>::failure(ErrorKind::UnsupportedFormat,
                                      "Unsupported export format");
}

Ledger::Snapshot Ledger::snapshot() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return entries_;
}

size_t Ledger::size() const { return snapshot()->size(); }

std::string Ledger::tailHash() const {
  Snapshot entries = snapshot();
  return entries->empty() ? std::string() : entries->back().chainHash;
}

HashAlgorithm Ledger::algorithm() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return options_.algorithm;
}

LedgerHealth Ledger::health() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return health_;
}

Result<void> Ledger::removeFile() {
  std::lock_guard<std::mutex> appendLock(appendMutex_);
  if (options_.path.empty())
    return Result<void>::success();
  std::error_code ec;
  std::filesystem::remove(options_.path, ec);
  if (ec) {
    return Result<void>::failure(ErrorKind::PersistenceError,
                                 "remove " + options_.path + ": " + ec.message());
  }
  rewriteOnPersist_ = true;
  std::lock_guard<std::mutex> lock(stateMutex_);
  health_.writesBlocked = false;
  return Result<void>::success();
}

} // namespace docforensics
