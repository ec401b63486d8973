#ifndef DOCFORENSICS_INTEGRITY_VERIFIER_HPP
#define DOCFORENSICS_INTEGRITY_VERIFIER_HPP

#include "audit/audit_trail.hpp"
#include "custody/chain_of_custody.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace docforensics {

/**
 * @brief Periodically re-verifies the audit trail and every custody chain.
 *
 * Corruption is only reported, through the log and lastResult(); the
 * ledgers keep accepting appends.
 */
class IntegrityVerifier {
public:
  IntegrityVerifier(const AuditTrail &audit, const ChainOfCustody *custody,
                    std::chrono::seconds interval);
  ~IntegrityVerifier();

  /** Start background verification. */
  void start();
  /** Stop background verification. */
  void stop();
  /** Run a single verification pass. True when everything verified. */
  bool verifyOnce();

  /** Outcome of the most recent pass; true before the first one. */
  bool lastResult() const { return lastResult_; }
  size_t passes() const { return passes_; }

private:
  void threadFunc();

  const AuditTrail &audit_;
  const ChainOfCustody *custody_;
  std::chrono::seconds interval_;
  std::atomic<bool> running_{false};
  std::atomic<bool> lastResult_{true};
  std::atomic<size_t> passes_{0};
  std::thread worker_;
};

} // namespace docforensics

#endif // DOCFORENSICS_INTEGRITY_VERIFIER_HPP
