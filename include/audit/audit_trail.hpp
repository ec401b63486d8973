#ifndef DOCFORENSICS_AUDIT_TRAIL_HPP
#define DOCFORENSICS_AUDIT_TRAIL_HPP

#include "ledger/ledger.hpp"
#include "utilities/config.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docforensics {

using DocumentId = long long;

/// Aggregate view over the audit trail.
struct AuditStatistics {
  size_t totalEntries = 0;
  std::optional<std::string> earliest;
  std::optional<std::string> latest;
  std::vector<std::pair<std::string, size_t>> topActions; ///< up to 10
  std::vector<std::pair<std::string, size_t>> topUsers;   ///< up to 10
  size_t documentsAccessed = 0;
  size_t uniqueUsers = 0;
  size_t persistFailures = 0;
  std::string lastError;
  LoadStatus loadStatus = LoadStatus::Empty;

  nlohmann::json toJson() const;
};

/**
 * @brief Global record of user and system actions.
 *
 * Payload: {action, user_id, document_id, details, ip_address, user_agent}.
 * Recording is best effort: failures are logged and surfaced through
 * statistics() and health(), never thrown at the caller.
 */
class AuditTrail {
public:
  explicit AuditTrail(LedgerOptions options);

  AuditTrail(const AuditTrail &) = delete;
  AuditTrail &operator=(const AuditTrail &) = delete;

  /// Options for the trail under cfg.varDir/audit/audit_chain.json.
  static LedgerOptions optionsFromConfig(const LedgerConfig &cfg,
                                         std::shared_ptr<LedgerCipher> cipher);

  /**
   * @brief Record an action.
   * @return The new entry id, or an empty string if the entry could not
   *         be built.
   */
  std::string record(const std::string &action, const std::string &userId,
                     std::optional<DocumentId> documentId = std::nullopt,
                     nlohmann::json details = nlohmann::json::object(),
                     std::optional<std::string> ipAddress = std::nullopt,
                     std::optional<std::string> userAgent = std::nullopt);

  std::vector<LedgerEntry> byUser(const std::string &userId,
                                  std::optional<size_t> limit = std::nullopt) const;
  std::vector<LedgerEntry> byDocument(DocumentId documentId,
                                      std::optional<size_t> limit = std::nullopt) const;
  std::vector<LedgerEntry> byActionType(const std::string &action,
                                        std::optional<size_t> limit = std::nullopt) const;
  std::vector<LedgerEntry> byTimeRange(std::optional<Timestamp> from,
                                       std::optional<Timestamp> to) const;

  /// Last @p limit entries, oldest first.
  std::vector<LedgerEntry> recent(size_t limit) const;

  std::vector<LedgerEntry> query(const LedgerQuery &query) const;

  AuditStatistics statistics() const;

  VerificationReport verify() const;

  Result<std::string> exportTrail(ExportFormat format) const;
  Result<void> exportToFile(const std::string &path, ExportFormat format) const;

  LedgerHealth health() const;
  size_t size() const;
  const Ledger &ledger() const { return *ledger_; }

private:
  std::unique_ptr<Ledger> ledger_;
};

} // namespace docforensics

#endif // DOCFORENSICS_AUDIT_TRAIL_HPP
