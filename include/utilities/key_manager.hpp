#ifndef DOCFORENSICS_KEY_MANAGER_HPP
#define DOCFORENSICS_KEY_MANAGER_HPP

#include <array>
#include <chrono>
#include <mutex>
#include <sodium.h>
#include <string>

namespace docforensics {

using LedgerKey = std::array<unsigned char, crypto_aead_xchacha20poly1305_ietf_KEYBYTES>;

/**
 * @brief Owns the symmetric key used to encrypt ledger files at rest.
 *
 * Key bytes live in sodium guarded memory and are wiped on destruction.
 */
class KeyManager {
public:
  /** Process-wide instance used when no key manager is injected. */
  static KeyManager &getInstance();

  KeyManager();
  ~KeyManager();
  KeyManager(const KeyManager &) = delete;
  KeyManager &operator=(const KeyManager &) = delete;

  /**
   * @brief Initialize the key manager.
   *
   * Reads DOCFORENSICS_LEDGER_KEY (64 hex characters) or generates a new
   * random key. Calling it again is a no-op.
   * @throw std::runtime_error If libsodium or secure memory is unavailable.
   */
  void initialize();

  /**
   * @brief Initialize from DOCFORENSICS_LEDGER_KEY, else from @p keyFile.
   *
   * When neither holds a key, a random key is generated and written to
   * @p keyFile (hex, mode 0600) so later processes can decrypt what this
   * one encrypts.
   * @throw std::runtime_error If @p keyFile is malformed or cannot be written.
   */
  void initialize(const std::string &keyFile);

  /** Initialize from explicit key material instead of the environment. */
  void initializeWithKey(const LedgerKey &key);

  bool isInitialized() const;

  /** Copy the current key into @p out. */
  void getLedgerKey(LedgerKey &out) const;

  /**
   * Rotates the ledger key.
   * The previous key remains available via getPreviousLedgerKey() for
   * the specified window in seconds.
   */
  void rotateLedgerKey(unsigned int windowSeconds);

  /**
   * Retrieves the previous key if it is still valid.
   * @return true if a previous key was returned, false otherwise.
   */
  bool getPreviousLedgerKey(LedgerKey &out) const;

private:
  bool loadKeyFromEnv();
  bool loadKeyFromHex(const std::string &hex);
  void allocate();
  void purgeExpiredOldKey() const;

  unsigned char *key_;
  mutable unsigned char *old_key_;
  mutable std::chrono::steady_clock::time_point old_key_expiration_;
  bool initialized_;
  mutable std::mutex mutex_;
};

} // namespace docforensics

#endif // DOCFORENSICS_KEY_MANAGER_HPP
