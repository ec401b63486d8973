#ifndef DOCFORENSICS_CHAIN_OF_CUSTODY_HPP
#define DOCFORENSICS_CHAIN_OF_CUSTODY_HPP

#include "audit/audit_trail.hpp"
#include "ledger/ledger.hpp"
#include "utilities/config.hpp"
#include "utilities/result.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace docforensics {

/// Ledger verification of one custody chain plus domain checks.
struct CustodyVerificationReport {
  DocumentId documentId = 0;
  VerificationReport ledger;
  /// Non-cryptographic anomalies such as out-of-order timestamps, broken
  /// hash_before/hash_after continuity and missing fields.
  std::vector<ChainViolation> issues;

  bool isValid() const { return ledger.isValid && issues.empty(); }
  nlohmann::json toJson() const;
};

enum class CustodyExportFormat { Json, Csv, Text };

std::optional<CustodyExportFormat> parseCustodyExportFormat(const std::string &name);

/// Filters for ChainOfCustody::search(). Unset members match everything.
struct CustodySearch {
  std::optional<DocumentId> documentId;
  std::optional<std::string> userId;
  std::optional<std::string> action;
  std::optional<Timestamp> from;
  std::optional<Timestamp> to;
};

struct CustodyOptions {
  std::string directory; ///< Holds custody_<document_id>.json
  HashAlgorithm algorithm = HashAlgorithm::SHA256;
  std::shared_ptr<LedgerCipher> cipher;
};

/**
 * @brief Per-document custody ledgers.
 *
 * Each document owns one Ledger, created on its first entry. Appends to
 * different documents never contend; the registry lock only covers lookup.
 * If an AuditTrail is attached every entry is mirrored into it as
 * "custody_<action>".
 */
class ChainOfCustody {
public:
  explicit ChainOfCustody(CustodyOptions options, AuditTrail *audit = nullptr);

  ChainOfCustody(const ChainOfCustody &) = delete;
  ChainOfCustody &operator=(const ChainOfCustody &) = delete;

  static CustodyOptions optionsFromConfig(const LedgerConfig &cfg,
                                          std::shared_ptr<LedgerCipher> cipher);

  /**
   * @brief Append a custody entry for @p documentId.
   * @return The entry id. Persistence failures do not fail the call; they
   *         are logged and visible through the chain's health.
   */
  Result<std::string> addEntry(DocumentId documentId, const std::string &action,
                               const std::string &userId,
                               nlohmann::json details = nlohmann::json::object(),
                               std::optional<std::string> location = std::nullopt,
                               std::optional<std::string> hashBefore = std::nullopt,
                               std::optional<std::string> hashAfter = std::nullopt);

  Result<CustodyVerificationReport> verify(DocumentId documentId) const;
  std::vector<CustodyVerificationReport> verifyAll() const;

  /// First/last entry, custodians, locations, actions and time span.
  nlohmann::json summary(DocumentId documentId) const;

  /// Entries across all chains matching @p filter, ordered by timestamp.
  std::vector<LedgerEntry> search(const CustodySearch &filter) const;

  Result<std::vector<LedgerEntry>> chain(DocumentId documentId) const;

  Result<std::string> exportChain(DocumentId documentId,
                                  CustodyExportFormat format) const;

  std::vector<DocumentId> documentIds() const;

  /// Forget a document's chain and delete its file.
  Result<void> deleteChain(DocumentId documentId);

  std::optional<LedgerHealth> health(DocumentId documentId) const;

private:
  std::shared_ptr<Ledger> find(DocumentId documentId) const;
  std::shared_ptr<Ledger> findOrCreate(DocumentId documentId);
  std::string pathFor(DocumentId documentId) const;
  void loadExisting();

  CustodyOptions options_;
  AuditTrail *audit_;
  mutable std::mutex registryMutex_;
  std::map<DocumentId, std::shared_ptr<Ledger>> chains_;
};

/// Domain checks over a custody chain, independent of hash verification.
std::vector<ChainViolation> custodyIssues(const std::vector<LedgerEntry> &entries);

} // namespace docforensics

#endif // DOCFORENSICS_CHAIN_OF_CUSTODY_HPP
