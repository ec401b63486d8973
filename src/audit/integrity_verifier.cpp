#include "audit/integrity_verifier.hpp"
#include "utilities/logger.h"

namespace docforensics {

IntegrityVerifier::IntegrityVerifier(const AuditTrail &audit,
                                     const ChainOfCustody *custody,
                                     std::chrono::seconds interval)
    : audit_(audit), custody_(custody), interval_(interval) {}

IntegrityVerifier::~IntegrityVerifier() { stop(); }

void IntegrityVerifier::start() {
  if (running_)
    return;
  running_ = true;
  worker_ = std::thread(&IntegrityVerifier::threadFunc, this);
}

void IntegrityVerifier::stop() {
  if (!running_)
    return;
  running_ = false;
  if (worker_.joinable())
    worker_.join();
}

bool IntegrityVerifier::verifyOnce() {
  bool ok = true;
  VerificationReport audit = audit_.verify();
  if (!audit.isValid) {
    ok = false;
    Logger::getInstance().log(
        LogLevel::ERROR,
        "[IntegrityVerifier] Audit trail failed verification: " +
            std::to_string(audit.tamperedEntries.size()) + " tampered, " +
            std::to_string(audit.brokenLinks.size()) + " broken links");
  }
  if (custody_) {
    for (DocumentId id : custody_->documentIds()) {
      auto report = custody_->verify(id);
      if (report && report.value().isValid())
        continue;
      ok = false;
      Logger::getInstance().log(
          LogLevel::ERROR, "[IntegrityVerifier] Custody chain for document " +
                               std::to_string(id) + " failed verification" +
                               (report ? std::string() : ": " + report.error().message));
    }
  }
  lastResult_ = ok;
  ++passes_;
  return ok;
}

void IntegrityVerifier::threadFunc() {
  while (running_) {
    verifyOnce();
    for (std::chrono::seconds s{0}; s < interval_ && running_;
         s += std::chrono::seconds(1)) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
}

} // namespace docforensics
