#include "utilities/durable_file.hpp"
#include "utilities/key_manager.hpp"
#include "utilities/ledger_cipher.hpp"
#include "utilities/var_dir.hpp"
#include "gtest/gtest.h"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sys/stat.h>
#include <string>
#include <thread>

using namespace docforensics;

TEST(KeyManagerTest, ReturnsConsistentKey) {
  KeyManager &km = KeyManager::getInstance();
  km.initialize();
  LedgerKey key1;
  km.getLedgerKey(key1);
  LedgerKey key2;
  km.getLedgerKey(key2);
  EXPECT_EQ(key1, key2);
}

TEST(KeyManagerTest, UninitializedKeyThrows) {
  KeyManager km;
  EXPECT_FALSE(km.isInitialized());
  LedgerKey key;
  EXPECT_THROW(km.getLedgerKey(key), std::runtime_error);
}

TEST(KeyManagerTest, KeyFromEnvironment) {
  const std::string hex(64, 'a');
  ::setenv("DOCFORENSICS_LEDGER_KEY", hex.c_str(), 1);
  KeyManager km;
  km.initialize();
  ::unsetenv("DOCFORENSICS_LEDGER_KEY");

  LedgerKey key;
  km.getLedgerKey(key);
  for (unsigned char b : key)
    EXPECT_EQ(b, 0xAA);
}

TEST(KeyManagerTest, GeneratedKeyIsSavedAndReused) {
  const std::string base = getVarDir() + "/key_manager_tests/saved";
  std::filesystem::remove_all(base);
  const std::string keyFile = ledgerKeyPath(base);

  KeyManager first;
  first.initialize(keyFile);
  ASSERT_TRUE(std::filesystem::exists(keyFile));
  struct stat st {};
  ASSERT_EQ(::stat(keyFile.c_str(), &st), 0);
  EXPECT_EQ(st.st_mode & 0777, 0600u);

  KeyManager second;
  second.initialize(keyFile);
  LedgerKey a;
  LedgerKey b;
  first.getLedgerKey(a);
  second.getLedgerKey(b);
  EXPECT_EQ(a, b);

  SodiumLedgerCipher writer(first);
  SodiumLedgerCipher reader(second);
  auto sealed = writer.encrypt("survives restart");
  ASSERT_TRUE(sealed.ok());
  EXPECT_EQ(reader.decrypt(sealed.value()).value(), "survives restart");
  std::filesystem::remove_all(base);
}

TEST(KeyManagerTest, MalformedKeyFileThrows) {
  const std::string base = getVarDir() + "/key_manager_tests/malformed";
  std::filesystem::remove_all(base);
  const std::string keyFile = ledgerKeyPath(base);
  ASSERT_TRUE(writeFileDurably(keyFile, "not-a-key\n").ok());

  KeyManager km;
  EXPECT_THROW(km.initialize(keyFile), std::runtime_error);
  EXPECT_FALSE(km.isInitialized());
  auto contents = readWholeFile(keyFile);
  ASSERT_TRUE(contents.ok());
  EXPECT_EQ(contents.value(), "not-a-key\n");
  std::filesystem::remove_all(base);
}

TEST(KeyManagerTest, EnvironmentKeyTakesPrecedenceOverKeyFile) {
  const std::string base = getVarDir() + "/key_manager_tests/env";
  std::filesystem::remove_all(base);
  const std::string keyFile = ledgerKeyPath(base);
  const std::string hex(64, 'b');
  ::setenv("DOCFORENSICS_LEDGER_KEY", hex.c_str(), 1);
  KeyManager km;
  km.initialize(keyFile);
  ::unsetenv("DOCFORENSICS_LEDGER_KEY");

  LedgerKey key;
  km.getLedgerKey(key);
  for (unsigned char b : key)
    EXPECT_EQ(b, 0xBB);
  EXPECT_FALSE(std::filesystem::exists(keyFile));
}

TEST(KeyManagerTest, RotationPreservesOldKey) {
  KeyManager km;
  km.initialize();
  LedgerKey original;
  km.getLedgerKey(original);
  km.rotateLedgerKey(1);
  LedgerKey current;
  km.getLedgerKey(current);
  EXPECT_NE(original, current);
  LedgerKey prev;
  EXPECT_TRUE(km.getPreviousLedgerKey(prev));
  EXPECT_EQ(prev, original);
  std::this_thread::sleep_for(std::chrono::seconds(2));
  EXPECT_FALSE(km.getPreviousLedgerKey(prev));
}

TEST(LedgerCipherTest, RoundTrip) {
  KeyManager km;
  km.initialize();
  SodiumLedgerCipher cipher(km);
  const std::string plain = R"({"format":"docforensics-ledger","entries":[]})";

  auto sealed = cipher.encrypt(plain);
  ASSERT_TRUE(sealed.ok());
  EXPECT_TRUE(cipher.looksEncrypted(sealed.value()));
  EXPECT_FALSE(cipher.looksEncrypted(plain));
  EXPECT_EQ(sealed.value().find("docforensics"), std::string::npos);

  auto opened = cipher.decrypt(sealed.value());
  ASSERT_TRUE(opened.ok());
  EXPECT_EQ(opened.value(), plain);
}

TEST(LedgerCipherTest, TamperedCiphertextFails) {
  KeyManager km;
  km.initialize();
  SodiumLedgerCipher cipher(km);
  auto sealed = cipher.encrypt("payload");
  ASSERT_TRUE(sealed.ok());
  std::string broken = sealed.value();
  broken.back() = static_cast<char>(broken.back() ^ 0x01);

  auto opened = cipher.decrypt(broken);
  ASSERT_FALSE(opened.ok());
  EXPECT_EQ(opened.error().kind, ErrorKind::EncryptionError);
  EXPECT_FALSE(cipher.decrypt("plaintext").ok());
}

TEST(LedgerCipherTest, DecryptsWithPreviousKeyDuringRotation) {
  KeyManager km;
  km.initialize();
  SodiumLedgerCipher cipher(km);
  auto sealed = cipher.encrypt("before rotation");
  ASSERT_TRUE(sealed.ok());
  km.rotateLedgerKey(60);
  auto opened = cipher.decrypt(sealed.value());
  ASSERT_TRUE(opened.ok());
  EXPECT_EQ(opened.value(), "before rotation");
}

TEST(LedgerCipherTest, WrongKeyFails) {
  KeyManager a;
  a.initialize();
  KeyManager b;
  b.initialize();
  SodiumLedgerCipher writer(a);
  SodiumLedgerCipher reader(b);
  auto sealed = writer.encrypt("secret");
  ASSERT_TRUE(sealed.ok());
  EXPECT_FALSE(reader.decrypt(sealed.value()).ok());
}

TEST(LedgerCipherTest, FactoryHonoursConfiguration) {
  KeyManager km;
  km.initialize();
  EXPECT_TRUE(makeLedgerCipher(false, "XCHACHA20-POLY1305", km) == nullptr);
  KeyManager empty;
  EXPECT_THROW(makeLedgerCipher(true, "AES-256-GCM", empty), std::runtime_error);
  auto cipher = makeLedgerCipher(true, "AES-256-GCM", km);
  ASSERT_TRUE(cipher != nullptr);
  auto sealed = cipher->encrypt("x");
  ASSERT_TRUE(sealed.ok());
  EXPECT_EQ(cipher->decrypt(sealed.value()).value(), "x");
  EXPECT_EQ(SodiumLedgerCipher::parseAlgorithm("aes-256-gcm"),
            SodiumLedgerCipher::CipherAlgorithm::AES_256_GCM);
}

TEST(LedgerCipherTest, SharedExplicitKeyDecryptsAcrossManagers) {
  LedgerKey material;
  material.fill(0x5c);
  KeyManager a;
  a.initializeWithKey(material);
  KeyManager b;
  b.initializeWithKey(material);
  EXPECT_TRUE(b.isInitialized());

  SodiumLedgerCipher writer(a);
  SodiumLedgerCipher reader(b);
  auto sealed = writer.encrypt("shared");
  ASSERT_TRUE(sealed.ok());
  auto opened = reader.decrypt(sealed.value());
  ASSERT_TRUE(opened.ok());
  EXPECT_EQ(opened.value(), "shared");
}
