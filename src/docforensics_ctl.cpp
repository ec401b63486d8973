#include "audit/audit_trail.hpp"
#include "audit/integrity_verifier.hpp"
#include "custody/chain_of_custody.hpp"
#include "ledger/ledger.hpp"
#include "session/activity_tracker.hpp"
#include "utilities/config.hpp"
#include "utilities/durable_file.hpp"
#include "utilities/key_manager.hpp"
#include "utilities/ledger_cipher.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace docforensics;

namespace {

std::atomic<bool> g_stop{false};

void handleSignal(int) { g_stop = true; }

struct Context {
  LedgerConfig cfg;
  std::shared_ptr<LedgerCipher> cipher;
};

void usage() {
  std::cout << "Usage: docforensics_ctl [--config <file>] <command>\n"
            << "  audit verify\n"
            << "  audit stats\n"
            << "  audit recent <n>\n"
            << "  audit export <json|csv>\n"
            << "  custody verify <document_id>\n"
            << "  custody summary <document_id>\n"
            << "  custody export <document_id> <json|csv|text>\n"
            << "  sessions active\n"
            << "  sessions anomalies [user_id]\n"
            << "  sessions summary <user_id>\n"
            << "  ledger verify-export <file>\n"
            << "  monitor\n";
}

bool parseDocumentId(const std::string &text, DocumentId &out) {
  char *end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0') {
    std::cout << "Invalid document id: " << text << std::endl;
    return false;
  }
  out = value;
  return true;
}

int printReport(const VerificationReport &report) {
  std::cout << report.toJson().dump(2) << std::endl;
  std::cout << (report.isValid ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return report.isValid ? 0 : 1;
}

int auditCommand(const Context &ctx, int argc, char **argv, int i) {
  if (i >= argc) {
    usage();
    return 1;
  }
  std::string cmd = argv[i];
  AuditTrail audit(AuditTrail::optionsFromConfig(ctx.cfg, ctx.cipher));
  if (cmd == "verify")
    return printReport(audit.verify());
  if (cmd == "stats") {
    std::cout << audit.statistics().toJson().dump(2) << std::endl;
    return 0;
  }
  if (cmd == "recent" && i + 1 < argc) {
    size_t n = std::strtoul(argv[i + 1], nullptr, 10);
    for (const auto &e : audit.recent(n))
      std::cout << entryToJson(e).dump() << std::endl;
    return 0;
  }
  if (cmd == "export" && i + 1 < argc) {
    auto format = parseExportFormat(argv[i + 1]);
    if (!format) {
      std::cout << "Unsupported export format: " << argv[i + 1] << std::endl;
      return 1;
    }
    auto data = audit.exportTrail(*format);
    if (!data) {
      std::cout << "Export failed: " << data.error().message << std::endl;
      return 1;
    }
    std::cout << data.value();
    return 0;
  }
  usage();
  return 1;
}

int custodyCommand(const Context &ctx, int argc, char **argv, int i) {
  DocumentId doc = 0;
  if (i + 1 >= argc || !parseDocumentId(argv[i + 1], doc)) {
    usage();
    return 1;
  }
  std::string cmd = argv[i];
  ChainOfCustody custody(ChainOfCustody::optionsFromConfig(ctx.cfg, ctx.cipher));
  if (cmd == "verify") {
    auto report = custody.verify(doc);
    if (!report) {
      std::cout << report.error().message << std::endl;
      return 1;
    }
    std::cout << report.value().toJson().dump(2) << std::endl;
    std::cout << (report.value().isValid() ? "Custody chain intact"
                                           : "Custody chain FAILED")
              << std::endl;
    return report.value().isValid() ? 0 : 1;
  }
  if (cmd == "summary") {
    std::cout << custody.summary(doc).dump(2) << std::endl;
    return 0;
  }
  if (cmd == "export" && i + 2 < argc) {
    auto format = parseCustodyExportFormat(argv[i + 2]);
    if (!format) {
      std::cout << "Unsupported export format: " << argv[i + 2] << std::endl;
      return 1;
    }
    auto data = custody.exportChain(doc, *format);
    if (!data) {
      std::cout << data.error().message << std::endl;
      return 1;
    }
    std::cout << data.value();
    return 0;
  }
  usage();
  return 1;
}

int sessionsCommand(const Context &ctx, int argc, char **argv, int i) {
  if (i >= argc) {
    usage();
    return 1;
  }
  std::string cmd = argv[i];
  ActivityTracker tracker(ActivityTracker::optionsFromConfig(ctx.cfg, ctx.cipher));
  if (cmd == "active") {
    std::cout << tracker.activeUsers().dump(2) << std::endl;
    return 0;
  }
  if (cmd == "anomalies") {
    std::optional<std::string> user;
    if (i + 1 < argc)
      user = argv[i + 1];
    auto findings = tracker.detectSuspiciousActivity(user);
    nlohmann::json out = nlohmann::json::array();
    for (const auto &f : findings)
      out.push_back(f.toJson());
    std::cout << out.dump(2) << std::endl;
    return 0;
  }
  if (cmd == "summary" && i + 1 < argc) {
    std::cout << tracker.userActivitySummary(argv[i + 1]).dump(2) << std::endl;
    return 0;
  }
  usage();
  return 1;
}

int ledgerCommand(int argc, char **argv, int i) {
  if (i + 1 >= argc || std::string(argv[i]) != "verify-export") {
    usage();
    return 1;
  }
  auto text = readWholeFile(argv[i + 1]);
  if (!text) {
    std::cout << text.error().message << std::endl;
    return 1;
  }
  auto ledger = Ledger::fromExport(text.value(), argv[i + 1]);
  if (!ledger) {
    std::cout << "Unreadable export: " << ledger.error().message << std::endl;
    return 1;
  }
  return printReport(ledger.value()->verify());
}

// Verifies the audit trail and every custody chain every
// verify_interval_seconds until SIGINT/SIGTERM. A zero interval runs one pass.
int monitorCommand(const Context &ctx) {
  AuditTrail audit(AuditTrail::optionsFromConfig(ctx.cfg, ctx.cipher));
  ChainOfCustody custody(ChainOfCustody::optionsFromConfig(ctx.cfg, ctx.cipher));
  IntegrityVerifier verifier(
      audit, &custody, std::chrono::seconds(ctx.cfg.verifyIntervalSeconds));
  if (ctx.cfg.verifyIntervalSeconds <= 0) {
    bool ok = verifier.verifyOnce();
    std::cout << (ok ? "All ledgers intact" : "Ledger verification FAILED")
              << std::endl;
    return ok ? 0 : 1;
  }

  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);
  Logger::getInstance().log(
      LogLevel::INFO, "Monitoring ledgers every " +
                          std::to_string(ctx.cfg.verifyIntervalSeconds) + "s");
  verifier.start();
  while (!g_stop)
    std::this_thread::sleep_for(std::chrono::seconds(1));
  verifier.stop();
  return verifier.lastResult() ? 0 : 1;
}

} // namespace

int main(int argc, char **argv) {
  int i = 1;
  std::string configPath;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    configPath = argv[2];
    i = 3;
  }
  if (i >= argc) {
    usage();
    return 1;
  }

  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  Context ctx;
  ctx.cfg = loadLedgerConfig(configPath);
  std::error_code ec;
  std::filesystem::create_directories(logsDir(ctx.cfg.varDir), ec);
  if (!ec)
    Logger::init(logsDir(ctx.cfg.varDir) + "/docforensics_ctl.log", ctx.cfg.logLevel);

  if (ctx.cfg.encryptAtRest) {
    KeyManager &keys = KeyManager::getInstance();
    try {
      keys.initialize(ledgerKeyPath(ctx.cfg.varDir));
    } catch (const std::exception &e) {
      std::cout << "Key initialization failed: " << e.what() << std::endl;
      return 1;
    }
    ctx.cipher = makeLedgerCipher(true, ctx.cfg.cipherAlgorithm, keys);
  }

  std::string area = argv[i];
  if (area == "audit")
    return auditCommand(ctx, argc, argv, i + 1);
  if (area == "custody")
    return custodyCommand(ctx, argc, argv, i + 1);
  if (area == "sessions")
    return sessionsCommand(ctx, argc, argv, i + 1);
  if (area == "ledger")
    return ledgerCommand(argc, argv, i + 1);
  if (area == "monitor")
    return monitorCommand(ctx);
  usage();
  return 1;
}
