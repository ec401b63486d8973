#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace docforensics {

static std::string varDir = [] {
  const char *env = std::getenv("DOCFORENSICS_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/lib/docforensics"))
    return std::string("/var/lib/docforensics");
  return std::string("var/docforensics");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir(const std::string &base) { return base + "/logs"; }

std::string auditDir(const std::string &base) { return base + "/audit"; }

std::string custodyDir(const std::string &base) { return base + "/custody"; }

std::string userActivityDir(const std::string &base) {
  return base + "/user_activity";
}

std::string auditChainPath(const std::string &base) {
  return auditDir(base) + "/audit_chain.json";
}

std::string custodyChainPath(long long documentId, const std::string &base) {
  return custodyDir(base) + "/custody_" + std::to_string(documentId) + ".json";
}

std::string sessionsPath(const std::string &base) {
  return userActivityDir(base) + "/sessions.json";
}

std::string ledgerKeyPath(const std::string &base) {
  return base + "/keys/ledger.key";
}

} // namespace docforensics
