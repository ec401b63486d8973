#include "utilities/key_manager.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/logger.h"

#include <cstdlib> // for getenv
#include <cstring>
#include <filesystem>
#include <stdexcept>

namespace docforensics {

KeyManager &KeyManager::getInstance() {
  static KeyManager instance;
  return instance;
}

KeyManager::KeyManager()
    : key_(nullptr), old_key_(nullptr), initialized_(false) {}

KeyManager::~KeyManager() {
  if (key_) {
    sodium_memzero(key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
    sodium_free(key_);
    key_ = nullptr;
  }
  if (old_key_) {
    sodium_memzero(old_key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
    sodium_free(old_key_);
    old_key_ = nullptr;
  }
}

void KeyManager::allocate() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  if (key_) {
    return;
  }
  key_ = static_cast<unsigned char *>(
      sodium_malloc(crypto_aead_xchacha20poly1305_ietf_KEYBYTES));
  if (!key_) {
    throw std::runtime_error(
        "Unable to allocate secure memory for encryption key");
  }
}

void KeyManager::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    return;
  }
  allocate();
  if (!loadKeyFromEnv()) {
    randombytes_buf(key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
  }
  initialized_ = true;
}

void KeyManager::initialize(const std::string &keyFile) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    return;
  }
  allocate();
  if (loadKeyFromEnv()) {
    initialized_ = true;
    return;
  }

  std::error_code ec;
  if (std::filesystem::exists(keyFile, ec)) {
    auto contents = readWholeFile(keyFile);
    if (!contents) {
      throw std::runtime_error(contents.error().message);
    }
    std::string hex = contents.value();
    while (!hex.empty() && (hex.back() == '\n' || hex.back() == '\r' ||
                            hex.back() == ' ')) {
      hex.pop_back();
    }
    if (!loadKeyFromHex(hex)) {
      throw std::runtime_error("Malformed ledger key file " + keyFile);
    }
    initialized_ = true;
    return;
  }

  randombytes_buf(key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
  std::string hex(crypto_aead_xchacha20poly1305_ietf_KEYBYTES * 2 + 1, '\0');
  sodium_bin2hex(&hex[0], hex.size(), key_,
                 crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
  hex.pop_back();
  auto saved = writeFileDurably(keyFile, hex + "\n");
  sodium_memzero(&hex[0], hex.size());
  if (!saved) {
    throw std::runtime_error("Cannot save ledger key: " + saved.error().message);
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "[KeyManager] Generated ledger key " + keyFile);
  initialized_ = true;
}

void KeyManager::initializeWithKey(const LedgerKey &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!key_) {
    allocate();
  }
  std::memcpy(key_, key.data(), key.size());
  initialized_ = true;
}

bool KeyManager::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

bool KeyManager::loadKeyFromEnv() {
  const char *env_key = std::getenv("DOCFORENSICS_LEDGER_KEY");
  if (!env_key) {
    return false;
  }
  return loadKeyFromHex(env_key);
}

bool KeyManager::loadKeyFromHex(const std::string &hex) {
  if (hex.size() != crypto_aead_xchacha20poly1305_ietf_KEYBYTES * 2) {
    return false;
  }
  size_t bin_len = 0;
  if (sodium_hex2bin(key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES,
                     hex.c_str(), hex.size(), nullptr, &bin_len,
                     nullptr) != 0 ||
      bin_len != crypto_aead_xchacha20poly1305_ietf_KEYBYTES) {
    return false;
  }
  return true;
}

void KeyManager::getLedgerKey(LedgerKey &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    throw std::runtime_error("KeyManager not initialized");
  }
  std::memcpy(out.data(), key_, out.size());
}

void KeyManager::rotateLedgerKey(unsigned int windowSeconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) {
    throw std::runtime_error("KeyManager not initialized");
  }
  if (!old_key_) {
    old_key_ = static_cast<unsigned char *>(
        sodium_malloc(crypto_aead_xchacha20poly1305_ietf_KEYBYTES));
    if (!old_key_) {
      throw std::runtime_error(
          "Unable to allocate secure memory for previous key");
    }
  }
  std::memcpy(old_key_, key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
  old_key_expiration_ =
      std::chrono::steady_clock::now() + std::chrono::seconds(windowSeconds);
  randombytes_buf(key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
}

void KeyManager::purgeExpiredOldKey() const {
  if (old_key_ && std::chrono::steady_clock::now() >= old_key_expiration_) {
    sodium_memzero(old_key_, crypto_aead_xchacha20poly1305_ietf_KEYBYTES);
    sodium_free(old_key_);
    old_key_ = nullptr;
  }
}

bool KeyManager::getPreviousLedgerKey(LedgerKey &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  purgeExpiredOldKey();
  if (!old_key_) {
    return false;
  }
  std::memcpy(out.data(), old_key_, out.size());
  return true;
}

} // namespace docforensics
