#include "ledger/ledger_entry.hpp"

#include <cstdio>
#include <ctime>
#include <sodium.h>
#include <stdexcept>

namespace docforensics {

nlohmann::json entryToJson(const LedgerEntry &entry) {
  nlohmann::json j;
  j["entry_id"] = entry.entryId;
  j["timestamp"] = entry.timestamp;
  j["payload"] = entry.payload;
  j["content_hash"] = entry.contentHash;
  j["previous_hash"] = entry.previousHash;
  j["chain_hash"] = entry.chainHash;
  return j;
}

LedgerEntry entryFromJson(const nlohmann::json &j) {
  LedgerEntry e;
  e.entryId = j.at("entry_id").get<std::string>();
  e.timestamp = j.at("timestamp").get<std::string>();
  e.payload = j.at("payload");
  e.contentHash = j.at("content_hash").get<std::string>();
  e.previousHash = j.at("previous_hash").get<std::string>();
  e.chainHash = j.at("chain_hash").get<std::string>();
  return e;
}

std::string formatTimestamp(Timestamp tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                    tp.time_since_epoch())
                    .count();
  long long secs = micros / 1000000;
  long long frac = micros % 1000000;
  if (frac < 0) {
    frac += 1000000;
    --secs;
  }
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, frac);
  return buf;
}

std::optional<Timestamp> parseTimestamp(const std::string &text) {
  std::tm utc{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &utc.tm_year,
                  &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min,
                  &utc.tm_sec, &consumed) != 6) {
    return std::nullopt;
  }
  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

  long long micros = 0;
  size_t pos = static_cast<size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    for (; digits < 6; ++digits)
      micros *= 10;
  }
  if (pos < text.size() && text[pos] != 'Z' &&
      text.compare(pos, std::string::npos, "+00:00") != 0)
    return std::nullopt;

  std::time_t secs = timegm(&utc);
  return Timestamp(std::chrono::seconds(secs)) +
         std::chrono::microseconds(micros);
}

std::string currentTimestamp() { return formatTimestamp(Clock::now()); }

std::string generateEntryId() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  unsigned char b[16];
  randombytes_buf(b, sizeof(b));
  b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40); // version 4
  b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80); // RFC 4122 variant
  char out[37];
  std::snprintf(out, sizeof(out),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%"
                "02x%02x",
                b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7], b[8], b[9],
                b[10], b[11], b[12], b[13], b[14], b[15]);
  return out;
}

std::string payloadString(const nlohmann::json &payload, const char *key) {
  if (!payload.is_object())
    return "";
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null())
    return "";
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

} // namespace docforensics
