#include "utilities/digest.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace docforensics {

std::string algorithmName(HashAlgorithm algo) {
  return algo == HashAlgorithm::BLAKE3 ? "blake3" : "sha256";
}

std::optional<HashAlgorithm> parseAlgorithm(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  lower.erase(std::remove(lower.begin(), lower.end(), '-'), lower.end());
  if (lower == "sha256")
    return HashAlgorithm::SHA256;
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  return std::nullopt;
}

std::string toHex(const DigestArray &digest) {
  // sodium_bin2hex writes a NUL terminator, hence the extra byte.
  char hex[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, DIGEST_SIZE * 2);
}

Hasher::Hasher(HashAlgorithm algo) : algo_(algo) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

void Hasher::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot ingest data after finalize() has been called.");
  }
  if (!data || size == 0)
    return;
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
  } else {
    blake3_hasher_update(&blake3_state_, reinterpret_cast<const uint8_t *>(data),
                         size);
  }
}

void Hasher::ingest(std::string_view text) {
  ingest(reinterpret_cast<const std::byte *>(text.data()), text.size());
}

DigestArray Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  DigestArray digest{};
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, digest.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, digest.data(), DIGEST_SIZE);
  }
  finalized_ = true;
  return digest;
}

std::string Hasher::finalizeHex() { return toHex(finalize()); }

std::string hashHex(HashAlgorithm algo, std::string_view data) {
  Hasher h(algo);
  h.ingest(data);
  return h.finalizeHex();
}

} // namespace docforensics
