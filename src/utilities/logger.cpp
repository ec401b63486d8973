#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>  // For std::rename and std::remove
#include <ctime>
#include <iostream>
#include <new> // For std::bad_alloc
#include <nlohmann/json.hpp>

namespace docforensics {

Logger *Logger::s_instance = nullptr;
std::recursive_mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

LogLevel parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return TRACE;
  if (upper == "DEBUG")
    return DEBUG;
  if (upper == "WARN" || upper == "WARNING")
    return WARN;
  if (upper == "ERROR")
    return ERROR;
  if (upper == "FATAL")
    return FATAL;
  return INFO;
}

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;

  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: new Logger FAILED due to "
                 "std::bad_alloc: "
              << bae.what() << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_instance) {
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(). Falling back to console output."
              << std::endl;
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
    if (!s_instance) {
      throw std::runtime_error("Logger not initialized. Call Logger::init() "
                               "first. Emergency init also failed.");
    }
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::logLevel() const {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  return currentLogLevel;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::formatLine(LogLevel level,
                               const std::string &message) const {
  nlohmann::json obj;
  obj["timestamp"] = getTimestamp();
  obj["level"] = levelToString(level);
  obj["message"] = message;
  // Messages may carry arbitrary bytes from callers; never throw on them.
  return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles + 1);
    std::remove(tooOldPath.c_str());
    for (int i = maxBackupFiles; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::remove(newPath.c_str());
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }
  const std::string jsonLine = formatLine(level, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  } else {
    std::cerr << jsonLine << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm utc{};
  gmtime_r(&currentTime, &utc);
  char timestamp[24];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(timestamp);
}

} // namespace docforensics
