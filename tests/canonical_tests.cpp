#include "ledger/canonical.hpp"
#include "ledger/ledger_entry.hpp"
#include "utilities/digest.hpp"
#include <gtest/gtest.h>
#include <regex>
#include <set>

using namespace docforensics;

TEST(Canonical, KeyOrderDoesNotMatter) {
  nlohmann::json a;
  a["zeta"] = 1;
  a["alpha"] = {{"y", 2}, {"x", 1}};
  nlohmann::json b;
  b["alpha"] = {{"x", 1}, {"y", 2}};
  b["zeta"] = 1;
  EXPECT_EQ(canonicalize(a), canonicalize(b));
  EXPECT_EQ(canonicalize(a), R"({"alpha":{"x":1,"y":2},"zeta":1})");
}

TEST(Canonical, ValuesRenderConsistently) {
  nlohmann::json v = {{"f", 0.1}, {"i", -3}, {"b", true}, {"n", nullptr},
                      {"s", "caf\xC3\xA9"}, {"arr", {3, 1, 2}}};
  const std::string once = canonicalize(v);
  EXPECT_EQ(once, canonicalize(nlohmann::json::parse(once)));
  EXPECT_NE(once.find("\"f\":0.1"), std::string::npos);
  EXPECT_NE(once.find("\"s\":\"caf\\u00e9\""), std::string::npos);
  EXPECT_NE(once.find("[3,1,2]"), std::string::npos);
}

TEST(Canonical, InvalidUtf8DoesNotThrow) {
  nlohmann::json v = {{"bad", std::string("\xFF\xFE")}};
  EXPECT_NO_THROW(canonicalize(v));
}

TEST(Canonical, SealCoversIdTimestampAndPayload) {
  nlohmann::json payload = {{"action", "upload"}};
  const std::string base = canonicalize(sealOf("id-1", "2024-01-01T00:00:00.000000Z", payload));
  EXPECT_NE(base, canonicalize(sealOf("id-2", "2024-01-01T00:00:00.000000Z", payload)));
  EXPECT_NE(base, canonicalize(sealOf("id-1", "2024-01-01T00:00:01.000000Z", payload)));
  EXPECT_NE(base, canonicalize(sealOf("id-1", "2024-01-01T00:00:00.000000Z",
                                      {{"action", "delete"}})));
}

TEST(Canonical, ChainHashDependsOnPredecessor) {
  const std::string canon = canonicalize(sealOf("id", "t", {{"k", "v"}}));
  for (HashAlgorithm algo : {HashAlgorithm::SHA256, HashAlgorithm::BLAKE3}) {
    EXPECT_EQ(computeChainHash(algo, canon, ""), computeContentHash(algo, canon));
    EXPECT_NE(computeChainHash(algo, canon, "abc"), computeChainHash(algo, canon, ""));
    EXPECT_EQ(computeChainHash(algo, canon, "abc"), hashHex(algo, canon + "abc"));
  }
}

TEST(Digest, KnownVectors) {
  EXPECT_EQ(hashHex(HashAlgorithm::SHA256, "abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(hashHex(HashAlgorithm::SHA256, ""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(hashHex(HashAlgorithm::BLAKE3, ""),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(Digest, IncrementalMatchesOneShot) {
  Hasher h(HashAlgorithm::BLAKE3);
  h.ingest("hello ");
  h.ingest("world");
  EXPECT_EQ(h.finalizeHex(), hashHex(HashAlgorithm::BLAKE3, "hello world"));
  EXPECT_THROW(h.finalize(), std::logic_error);
}

TEST(Digest, ParseAlgorithmNames) {
  EXPECT_EQ(parseAlgorithm("SHA-256"), HashAlgorithm::SHA256);
  EXPECT_EQ(parseAlgorithm("sha256"), HashAlgorithm::SHA256);
  EXPECT_EQ(parseAlgorithm("Blake3"), HashAlgorithm::BLAKE3);
  EXPECT_FALSE(parseAlgorithm("md5").has_value());
  EXPECT_EQ(algorithmName(HashAlgorithm::BLAKE3), "blake3");
}

TEST(LedgerEntry, TimestampFormatRoundTrip) {
  const std::string text = currentTimestamp();
  EXPECT_TRUE(std::regex_match(
      text, std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)")));
  auto parsed = parseTimestamp(text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(formatTimestamp(*parsed), text);

  EXPECT_TRUE(parseTimestamp("2024-03-01T12:00:00Z").has_value());
  EXPECT_TRUE(parseTimestamp("2024-03-01T12:00:00.5+00:00").has_value());
  EXPECT_FALSE(parseTimestamp("yesterday").has_value());
}

TEST(LedgerEntry, GeneratedIdsAreUuidV4) {
  std::set<std::string> ids;
  const std::regex uuid(
      "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
  for (int i = 0; i < 100; ++i) {
    std::string id = generateEntryId();
    EXPECT_TRUE(std::regex_match(id, uuid)) << id;
    ids.insert(id);
  }
  EXPECT_EQ(ids.size(), 100u);
}

TEST(LedgerEntry, JsonRoundTrip) {
  LedgerEntry e;
  e.entryId = generateEntryId();
  e.timestamp = currentTimestamp();
  e.payload = {{"action", "upload"}, {"document_id", 7}};
  e.contentHash = "c";
  e.previousHash = "";
  e.chainHash = "h";
  LedgerEntry back = entryFromJson(entryToJson(e));
  EXPECT_EQ(back.entryId, e.entryId);
  EXPECT_EQ(back.payload, e.payload);
  EXPECT_EQ(back.chainHash, e.chainHash);
  EXPECT_EQ(payloadString(back.payload, "action"), "upload");
  EXPECT_EQ(payloadString(back.payload, "document_id"), "7");
  EXPECT_EQ(payloadString(back.payload, "missing"), "");
}
