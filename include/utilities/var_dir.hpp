#ifndef DOCFORENSICS_VAR_DIR_HPP
#define DOCFORENSICS_VAR_DIR_HPP

#include <string>

namespace docforensics {

/// Root for logs and ledger files: DOCFORENSICS_VAR_DIR, /var/lib/docforensics
/// when it exists, else ./var/docforensics.
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir(const std::string &base = getVarDir());
std::string auditDir(const std::string &base = getVarDir());
std::string custodyDir(const std::string &base = getVarDir());
std::string userActivityDir(const std::string &base = getVarDir());

std::string auditChainPath(const std::string &base = getVarDir());
std::string custodyChainPath(long long documentId,
                             const std::string &base = getVarDir());
std::string sessionsPath(const std::string &base = getVarDir());
std::string ledgerKeyPath(const std::string &base = getVarDir());

} // namespace docforensics

#endif // DOCFORENSICS_VAR_DIR_HPP
