#ifndef DOCFORENSICS_LEDGER_HPP
#define DOCFORENSICS_LEDGER_HPP

#include "ledger/ledger_entry.hpp"
#include "utilities/digest.hpp"
#include "utilities/ledger_cipher.hpp"
#include "utilities/result.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace docforensics {

/// Format identifier written at the top of every ledger file.
inline constexpr const char *LEDGER_FORMAT_NAME = "docforensics-ledger";

/// Ledger file format version: 1 = SHA-256, 2 = BLAKE3.
int formatVersionFor(HashAlgorithm algo);
std::optional<HashAlgorithm> algorithmForVersion(int version);

enum class ViolationKind {
  ContentHashMismatch,
  ChainHashMismatch,
  BrokenLink,
  MissingField,
  TimestampOutOfOrder,
  CustodyHashMismatch
};

std::string toString(ViolationKind kind);

/// One diagnostic produced by verification.
struct ChainViolation {
  size_t entryIndex = 0;
  std::string entryId;
  ViolationKind kind = ViolationKind::ContentHashMismatch;
  std::string expectedHash;
  std::string actualHash;
  std::string detail; ///< Human readable description, may be empty

  nlohmann::json toJson() const;
};

/**
 * @brief Outcome of re-deriving every hash of a ledger.
 *
 * tamperedEntries lists content or chain hash mismatches, brokenLinks lists
 * previous_hash values that do not match the predecessor's chain hash. An
 * entry may appear in both lists.
 */
struct VerificationReport {
  bool isValid = true;
  size_t totalEntries = 0;
  size_t verifiedEntries = 0;
  std::vector<ChainViolation> tamperedEntries;
  std::vector<ChainViolation> brokenLinks;
  std::string verifiedAt;

  /// Equal in every respect except verifiedAt.
  bool sameOutcome(const VerificationReport &other) const;
  nlohmann::json toJson() const;
};

/// Verify an arbitrary sequence of entries with the given algorithm.
VerificationReport verifyEntries(const std::vector<LedgerEntry> &entries,
                                 HashAlgorithm algo);

/**
 * @brief Filter over committed entries.
 *
 * payloadEquals matches top-level payload members by JSON equality; from and
 * to are inclusive. Matches keep append order. offset/limit page through the
 * matches from the oldest, or from the newest when newestWindow is set.
 */
struct LedgerQuery {
  std::map<std::string, nlohmann::json> payloadEquals;
  std::optional<Timestamp> from;
  std::optional<Timestamp> to;
  size_t offset = 0;
  std::optional<size_t> limit;
  bool newestWindow = false;
};

bool matchesQuery(const LedgerEntry &entry, const LedgerQuery &query);

/// Apply offset/limit/newestWindow to an already filtered sequence.
std::vector<LedgerEntry> applyWindow(std::vector<LedgerEntry> matches,
                                     const LedgerQuery &query);

enum class ExportFormat { Json, Csv };

std::optional<ExportFormat> parseExportFormat(const std::string &name);

enum class LoadStatus {
  Empty,
  Loaded,
  LoadedPlaintextFallback,
  Unreadable,
  DecryptionFailed
};

std::string toString(LoadStatus status);

/// Persistence health of a ledger.
struct LedgerHealth {
  size_t entries = 0;
  size_t persistFailures = 0;
  std::string lastError;
  LoadStatus loadStatus = LoadStatus::Empty;
  std::string quarantinedFile; ///< Where an unreadable file was moved
  bool writesBlocked = false;  ///< The file on disk could not be loaded and is left untouched
};

struct LedgerOptions {
  std::string name;                     ///< Used in log messages
  std::string path;                     ///< Empty keeps the ledger in memory
  HashAlgorithm algorithm = HashAlgorithm::SHA256;
  std::shared_ptr<LedgerCipher> cipher; ///< Optional at-rest encryption
};

/// What append() committed, and whether it reached disk.
struct AppendReceipt {
  std::string entryId;
  size_t index = 0;
  std::string chainHash;
  Result<void> persisted;
};

/**
 * @brief Append-only, hash-linked ledger with local persistence.
 *
 * append() is linearized by a per-ledger mutex held across reading the tail,
 * hashing and committing. Readers work on immutable snapshots and never wait
 * for an in-flight append's I/O.
 *
 * The file holds a header line followed by one record line per entry. A
 * record is the entry's JSON, or its base64 "DFLE" envelope when a cipher is
 * configured. Appends add one fsynced line; the whole file is only rewritten
 * after loading a single-document ledger or after a failed append.
 */
class Ledger {
public:
  using Snapshot = std::shared_ptr<const std::vector<LedgerEntry>>;

  explicit Ledger(LedgerOptions options);

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;

  /** Construct and load from options.path. */
  static std::unique_ptr<Ledger> open(LedgerOptions options);

  /**
   * @brief Rebuild an in-memory ledger from a JSON export.
   *
   * The entries are taken as-is so verify() reports exactly what the export
   * contains.
   */
  static Result<std::unique_ptr<Ledger>> fromExport(const std::string &json,
                                                    std::string name = "import");

  /**
   * @brief Load entries from disk, replacing the in-memory state.
   *
   * An unreadable file is moved aside and reported as LoadStatus::Unreadable.
   * An encrypted file that cannot be decrypted is left in place, reported as
   * LoadStatus::DecryptionFailed, and further writes to it are refused.
   */
  LoadStatus load();

  /**
   * @brief Commit a new entry.
   *
   * Never fails because of payload content. Persistence failures are
   * reported in the receipt and in health(); the entry stays committed.
   */
  AppendReceipt append(nlohmann::json payload);

  VerificationReport verify() const;

  std::vector<LedgerEntry> query(const LedgerQuery &query) const;

  /// Serialize all entries; JSON output can be fed to fromExport().
  Result<std::string> exportData(ExportFormat format) const;

  Snapshot snapshot() const;
  size_t size() const;
  std::string tailHash() const;
  HashAlgorithm algorithm() const;
  const std::string &name() const { return options_.name; }
  const std::string &path() const { return options_.path; }
  LedgerHealth health() const;

  /// Delete the backing file. The in-memory entries are left untouched.
  Result<void> removeFile();

private:
  using Entries = std::shared_ptr<std::vector<LedgerEntry>>;
  using Parsed = Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>;

  std::string serialize(const std::vector<LedgerEntry> &entries,
                        HashAlgorithm algo) const;
  std::string headerLine(HashAlgorithm algo) const;
  std::string recordLine(const LedgerEntry &entry) const;
  Parsed parseRecords(const std::string &text, LoadStatus &status) const;
  Result<void> persistEntry(const LedgerEntry &entry);
  size_t commit(LedgerEntry entry);
  void recordFailure(const Error &error);
  void quarantine(const std::string &reason);
  void blockWrites(const Error &error, LoadStatus status);
  void publish(Entries entries);

  LedgerOptions options_;
  mutable std::mutex appendMutex_; // read tail + hash + commit
  mutable std::mutex stateMutex_;  // entries_ pointer and health_
  Entries entries_;
  LedgerHealth health_;
  bool rewriteOnPersist_ = true; // guarded by appendMutex_
};

/**
 * @brief Parse a ledger document (persisted file or JSON export).
 * @return The algorithm named by the document and its entries.
 */
Result<std::pair<HashAlgorithm, std::vector<LedgerEntry>>>
parseLedgerDocument(const std::string &text);

std::string exportCsv(const std::vector<LedgerEntry> &entries);

} // namespace docforensics

#endif // DOCFORENSICS_LEDGER_HPP
