#pragma once
#ifndef CHUNKVAULT_LOGGER_H
#define CHUNKVAULT_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex> // For std::mutex and std::lock_guard
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every record is written as a single JSON object per line containing the
 * timestamp, level and message. Output goes either to a file with size based
 * rotation or, when initialised with @ref CONSOLE_ONLY_OUTPUT, to stdout.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string
      CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  /**
   * @brief (Re)initialise the global logger.
   * @param logFile Path of the log file or CONSOLE_ONLY_OUTPUT.
   * @param level Minimum level that is written.
   * @param maxFileSize Rotate once the file reaches this many bytes. A value
   *        of 0 disables rotation.
   * @param maxBackupFiles Number of rotated files (`file.1` .. `file.N`) kept.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  /**
   * @brief Return the global logger, creating a console logger at WARN level
   * if init() has not been called.
   */
  static Logger &getInstance();
  /// Close the global logger. A later getInstance() starts the fallback again.
  static void shutdown();

  /**
   * @brief Parse a level name such as "debug" or "WARN".
   * @throws std::invalid_argument for unknown names.
   */
  static LogLevel parseLevel(const std::string &name);
  static std::string levelToString(LogLevel level);

  void setLogLevel(LogLevel level);
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  static void initLocked(const std::string &logFile, LogLevel level,
                         long long maxFileSize, int maxBackupFiles);
  static std::string getTimestamp();
  static std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // CHUNKVAULT_LOGGER_H
