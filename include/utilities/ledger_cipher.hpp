#ifndef DOCFORENSICS_LEDGER_CIPHER_HPP
#define DOCFORENSICS_LEDGER_CIPHER_HPP

#include "utilities/key_manager.hpp"
#include "utilities/result.hpp"

#include <memory>
#include <string>

namespace docforensics {

/**
 * @brief Byte-stream encryption service applied to ledger files at rest.
 */
class LedgerCipher {
public:
  virtual ~LedgerCipher() = default;

  /// Encrypt a serialized ledger. Fails with ErrorKind::EncryptionError.
  virtual Result<std::string> encrypt(const std::string &plaintext) = 0;

  /// Decrypt a file body produced by encrypt().
  virtual Result<std::string> decrypt(const std::string &ciphertext) = 0;

  /// True when @p data starts with this cipher's envelope header.
  virtual bool looksEncrypted(const std::string &data) const = 0;
};

/**
 * @brief libsodium AEAD implementation of LedgerCipher.
 *
 * Envelope layout: "DFLE" | algorithm byte | nonce | ciphertext+tag.
 * Decryption falls back to the key manager's previous key during a
 * rotation window.
 */
class SodiumLedgerCipher : public LedgerCipher {
public:
  enum class CipherAlgorithm : unsigned char {
    XCHACHA20_POLY1305 = 1,
    AES_256_GCM = 2
  };

  explicit SodiumLedgerCipher(
      KeyManager &keys,
      CipherAlgorithm algo = CipherAlgorithm::XCHACHA20_POLY1305);

  Result<std::string> encrypt(const std::string &plaintext) override;
  Result<std::string> decrypt(const std::string &ciphertext) override;
  bool looksEncrypted(const std::string &data) const override;

  /// Parse "AES-256-GCM" / "XCHACHA20-POLY1305"; anything else is XChaCha.
  static CipherAlgorithm parseAlgorithm(const std::string &name);

private:
  Result<std::string> decryptWithKey(CipherAlgorithm algo,
                                     const std::string &body,
                                     const LedgerKey &key) const;

  KeyManager &keys_;
  CipherAlgorithm algo_;
};

/// True when @p data starts with the "DFLE" envelope, whatever the key.
bool hasLedgerEnvelope(const std::string &data);

/// Build the cipher described by configuration, or nullptr when disabled.
/// @throw std::runtime_error If encryption is enabled and @p keys holds no key.
std::shared_ptr<LedgerCipher> makeLedgerCipher(bool enabled,
                                               const std::string &algorithm,
                                               KeyManager &keys);

} // namespace docforensics

#endif // DOCFORENSICS_LEDGER_CIPHER_HPP
