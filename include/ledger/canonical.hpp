#ifndef DOCFORENSICS_CANONICAL_HPP
#define DOCFORENSICS_CANONICAL_HPP

#include "ledger/ledger_entry.hpp"
#include "utilities/digest.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace docforensics {

/**
 * @brief Deterministic serialization used for hashing.
 *
 * Object keys are emitted in sorted order, without whitespace, non-ASCII
 * characters escaped as \uXXXX, floats in shortest round-trip form and
 * non-finite floats as null. Invalid UTF-8 is replaced, never rejected.
 */
std::string canonicalize(const nlohmann::json &value);

/// The hashed envelope of an entry: {entry_id, payload, timestamp}.
nlohmann::json sealOf(const std::string &entryId, const std::string &timestamp,
                      const nlohmann::json &payload);

std::string computeContentHash(HashAlgorithm algo, const std::string &canonicalSeal);

std::string computeChainHash(HashAlgorithm algo, const std::string &canonicalSeal,
                             const std::string &previousHash);

} // namespace docforensics

#endif // DOCFORENSICS_CANONICAL_HPP
