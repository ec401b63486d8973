#include "utilities/ledger_cipher.hpp"

#include <cstring>
#include <stdexcept>

namespace docforensics {

namespace {
const char kMagic[] = {'D', 'F', 'L', 'E'};
constexpr size_t kMagicSize = sizeof(kMagic);
constexpr size_t kHeaderSize = kMagicSize + 1;

size_t nonceSize(SodiumLedgerCipher::CipherAlgorithm algo) {
  return algo == SodiumLedgerCipher::CipherAlgorithm::AES_256_GCM
             ? crypto_aead_aes256gcm_NPUBBYTES
             : crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
}

size_t tagSize(SodiumLedgerCipher::CipherAlgorithm algo) {
  return algo == SodiumLedgerCipher::CipherAlgorithm::AES_256_GCM
             ? crypto_aead_aes256gcm_ABYTES
             : crypto_aead_xchacha20poly1305_ietf_ABYTES;
}
} // namespace

SodiumLedgerCipher::SodiumLedgerCipher(KeyManager &keys, CipherAlgorithm algo)
    : keys_(keys), algo_(algo) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  // AES-256-GCM needs hardware support; XChaCha20 works everywhere.
  if (algo_ == CipherAlgorithm::AES_256_GCM &&
      !crypto_aead_aes256gcm_is_available()) {
    algo_ = CipherAlgorithm::XCHACHA20_POLY1305;
  }
}

SodiumLedgerCipher::CipherAlgorithm
SodiumLedgerCipher::parseAlgorithm(const std::string &name) {
  if (name == "AES-256-GCM" || name == "aes-256-gcm" || name == "AES_256_GCM")
    return CipherAlgorithm::AES_256_GCM;
  return CipherAlgorithm::XCHACHA20_POLY1305;
}

bool hasLedgerEnvelope(const std::string &data) {
  return data.size() >= kHeaderSize &&
         std::memcmp(data.data(), kMagic, kMagicSize) == 0;
}

bool SodiumLedgerCipher::looksEncrypted(const std::string &data) const {
  return hasLedgerEnvelope(data);
}

Result<std::string> SodiumLedgerCipher::encrypt(const std::string &plaintext) {
  LedgerKey key{};
  try {
    keys_.getLedgerKey(key);
  } catch (const std::runtime_error &e) {
    return Result<std::string>::failure(ErrorKind::EncryptionError, e.what());
  }

  const size_t nlen = nonceSize(algo_);
  std::string out(kHeaderSize + nlen + plaintext.size() + tagSize(algo_), '\0');
  std::memcpy(out.data(), kMagic, kMagicSize);
  out[kMagicSize] = static_cast<char>(algo_);
  auto *nonce = reinterpret_cast<unsigned char *>(out.data() + kHeaderSize);
  randombytes_buf(nonce, nlen);
  auto *cipher = nonce + nlen;
  const auto *plain = reinterpret_cast<const unsigned char *>(plaintext.data());

  unsigned long long clen = 0;
  int rc;
  if (algo_ == CipherAlgorithm::AES_256_GCM) {
    rc = crypto_aead_aes256gcm_encrypt(cipher, &clen, plain, plaintext.size(),
                                       nullptr, 0, nullptr, nonce, key.data());
  } else {
    rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        cipher, &clen, plain, plaintext.size(), nullptr, 0, nullptr, nonce,
        key.data());
  }
  sodium_memzero(key.data(), key.size());
  if (rc != 0) {
    return Result<std::string>::failure(ErrorKind::EncryptionError,
                                        "Encryption failed.");
  }
  out.resize(kHeaderSize + nlen + static_cast<size_t>(clen));
  return out;
}

Result<std::string>
SodiumLedgerCipher::decryptWithKey(CipherAlgorithm algo, const std::string &body,
                                   const LedgerKey &key) const {
  const size_t nlen = nonceSize(algo);
  const size_t tlen = tagSize(algo);
  if (body.size() < nlen + tlen) {
    return Result<std::string>::failure(
        ErrorKind::EncryptionError,
        "Invalid ciphertext: too short to contain nonce and MAC.");
  }
  const auto *nonce = reinterpret_cast<const unsigned char *>(body.data());
  const auto *cipher = nonce + nlen;
  const size_t clen = body.size() - nlen;

  std::string plain(clen - tlen, '\0');
  unsigned long long plen = 0;
  int rc;
  if (algo == CipherAlgorithm::AES_256_GCM) {
    if (!crypto_aead_aes256gcm_is_available()) {
      return Result<std::string>::failure(
          ErrorKind::EncryptionError,
          "AES-256-GCM is not available on this CPU.");
    }
    rc = crypto_aead_aes256gcm_decrypt(
        reinterpret_cast<unsigned char *>(plain.data()), &plen, nullptr,
        cipher, clen, nullptr, 0, nonce, key.data());
  } else {
    rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        reinterpret_cast<unsigned char *>(plain.data()), &plen, nullptr,
        cipher, clen, nullptr, 0, nonce, key.data());
  }
  if (rc != 0) {
    return Result<std::string>::failure(
        ErrorKind::EncryptionError,
        "Decryption failed. Ciphertext might be invalid or tampered.");
  }
  plain.resize(static_cast<size_t>(plen));
  return plain;
}

Result<std::string> SodiumLedgerCipher::decrypt(const std::string &ciphertext) {
  if (!looksEncrypted(ciphertext)) {
    return Result<std::string>::failure(ErrorKind::EncryptionError,
                                        "Missing encryption envelope header.");
  }
  auto algo = static_cast<CipherAlgorithm>(
      static_cast<unsigned char>(ciphertext[kMagicSize]));
  if (algo != CipherAlgorithm::AES_256_GCM &&
      algo != CipherAlgorithm::XCHACHA20_POLY1305) {
    return Result<std::string>::failure(ErrorKind::EncryptionError,
                                        "Unknown cipher algorithm tag.");
  }
  const std::string body = ciphertext.substr(kHeaderSize);

  LedgerKey key{};
  try {
    keys_.getLedgerKey(key);
  } catch (const std::runtime_error &e) {
    return Result<std::string>::failure(ErrorKind::EncryptionError, e.what());
  }
  auto result = decryptWithKey(algo, body, key);
  if (!result.ok() && keys_.getPreviousLedgerKey(key)) {
    result = decryptWithKey(algo, body, key);
  }
  sodium_memzero(key.data(), key.size());
  return result;
}

std::shared_ptr<LedgerCipher> makeLedgerCipher(bool enabled,
                                               const std::string &algorithm,
                                               KeyManager &keys) {
  if (!enabled)
    return nullptr;
  if (!keys.isInitialized())
    throw std::runtime_error("KeyManager not initialized");
  return std::make_shared<SodiumLedgerCipher>(
      keys, SodiumLedgerCipher::parseAlgorithm(algorithm));
}

} // namespace docforensics
