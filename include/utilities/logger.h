#ifndef DOCFORENSICS_LOGGER_H
#define DOCFORENSICS_LOGGER_H
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace docforensics {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Parse "debug", "INFO", ... into a LogLevel; unknown names yield INFO.
LogLevel parseLogLevel(const std::string &name);

/**
 * @brief Process-wide structured logger.
 *
 * Each record is written as a single JSON line with timestamp, level and
 * message. File output rotates once the file reaches the configured size.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string formatLine(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();
  static std::string getTimestamp();
  static std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

} // namespace docforensics

#endif // DOCFORENSICS_LOGGER_H
