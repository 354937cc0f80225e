#pragma once
#ifndef CHUNKVAULT_LOGGER_H
#define CHUNKVAULT_LOGGER_H
#include <fstream>
#include <mutex> // For std::mutex and std::lock_guard
#include <string>

namespace chunkvault {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide logger writing one JSON object per line.
 *
 * Each record carries "timestamp", "level" and "message" keys. File output
 * rotates once the file reaches @p maxFileSize, keeping @p maxBackupFiles
 * numbered backups (file.1 is the most recent).
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
  void log(LogLevel level, const std::string &message);

  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  static std::string levelToString(LogLevel level);
  /// Parse "trace".."fatal" (any case). Unknown names map to INFO.
  static LogLevel levelFromString(const std::string &name);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace chunkvault

#endif // CHUNKVAULT_LOGGER_H
