#ifndef DOCFORENSICS_DIGEST_HPP
#define DOCFORENSICS_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sodium.h>
#include <string>
#include <string_view>

#include "blake3.h"

namespace docforensics {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// Name used in ledger headers and configuration ("sha256", "blake3").
std::string algorithmName(HashAlgorithm algo);

/// Parse an algorithm name, case-insensitive.
std::optional<HashAlgorithm> parseAlgorithm(const std::string &name);

/// Lowercase hex rendering of a digest.
std::string toHex(const DigestArray &digest);

/**
 * @brief Streaming hasher over SHA-256 (libsodium) or BLAKE3.
 *
 * Data is fed with ingest(); finalize() may be called once.
 */
class Hasher {
public:
  explicit Hasher(HashAlgorithm algo = HashAlgorithm::SHA256);

  void ingest(const std::byte *data, size_t size);
  void ingest(std::string_view text);

  /**
   * @brief Finish hashing and return the digest.
   * @throw std::logic_error If called more than once.
   */
  DigestArray finalize();

  /// finalize() rendered as lowercase hex.
  std::string finalizeHex();

  HashAlgorithm algorithm() const { return algo_; }

private:
  HashAlgorithm algo_;
  crypto_hash_sha256_state sha_state_;
  blake3_hasher blake3_state_;
  bool finalized_ = false;
};

/// One-shot hex digest of a string.
std::string hashHex(HashAlgorithm algo, std::string_view data);

} // namespace docforensics

#endif // DOCFORENSICS_DIGEST_HPP
