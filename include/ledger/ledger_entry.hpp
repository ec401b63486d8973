#ifndef DOCFORENSICS_LEDGER_ENTRY_HPP
#define DOCFORENSICS_LEDGER_ENTRY_HPP

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace docforensics {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief A single committed record of a hash-linked ledger.
 *
 * Entries are immutable once appended. The payload is opaque to the ledger;
 * the audit trail and custody chains give it their own shape.
 */
struct LedgerEntry {
  std::string entryId;      ///< RFC 4122 v4 UUID
  std::string timestamp;    ///< ISO-8601 UTC, microsecond precision
  nlohmann::json payload;   ///< Caller data, always a JSON object
  std::string contentHash;  ///< H(canonical(seal))
  std::string previousHash; ///< chainHash of the predecessor, "" for the first
  std::string chainHash;    ///< H(canonical(seal) || previousHash)
};

nlohmann::json entryToJson(const LedgerEntry &entry);

/**
 * @brief Rebuild an entry from its persisted form.
 * @throw nlohmann::json::exception If a required field is missing or mistyped.
 */
LedgerEntry entryFromJson(const nlohmann::json &j);

/// Format a time point as "YYYY-MM-DDTHH:MM:SS.ffffffZ".
std::string formatTimestamp(Timestamp tp);

/// Parse the format produced by formatTimestamp(); fractional part optional.
std::optional<Timestamp> parseTimestamp(const std::string &text);

std::string currentTimestamp();

/// New random version-4 UUID in canonical textual form.
std::string generateEntryId();

/// Read a string member, or "" when absent or null.
std::string payloadString(const nlohmann::json &payload, const char *key);

} // namespace docforensics

#endif // DOCFORENSICS_LEDGER_ENTRY_HPP
