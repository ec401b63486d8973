#include "ledger/canonical.hpp"

namespace docforensics {

std::string canonicalize(const nlohmann::json &value) {
  // nlohmann::json objects are std::map backed, so keys come out sorted.
  return value.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

nlohmann::json sealOf(const std::string &entryId, const std::string &timestamp,
                      const nlohmann::json &payload) {
  nlohmann::json seal = nlohmann::json::object();
  seal["entry_id"] = entryId;
  seal["payload"] = payload;
  seal["timestamp"] = timestamp;
  return seal;
}

std::string computeContentHash(HashAlgorithm algo,
                               const std::string &canonicalSeal) {
  return hashHex(algo, canonicalSeal);
}

std::string computeChainHash(HashAlgorithm algo, const std::string &canonicalSeal,
                             const std::string &previousHash) {
  Hasher h(algo);
  h.ingest(canonicalSeal);
  h.ingest(previousHash);
  return h.finalizeHex();
}

} // namespace docforensics
