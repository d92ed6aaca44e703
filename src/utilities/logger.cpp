#include "utilities/logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio> // For std::rename and std::remove
#include <ctime>
#include <new>
#include <string>

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  initLocked(logFile, level, maxFileSizeVal, maxBackupFilesVal);
}

// Caller holds s_mutex.
void Logger::initLocked(const std::string &logFile, LogLevel level,
                        long long maxFileSizeVal, int maxBackupFilesVal) {
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << bae.what()
              << std::endl;
    throw;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    // Nobody called init(); fall back to console output so that library code
    // used from tools without explicit setup still reports problems.
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(); logging WARN and above to console."
              << std::endl;
    initLocked(CONSOLE_ONLY_OUTPUT, LogLevel::WARN, 10 * 1024 * 1024, 5);
  }
  return *s_instance;
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
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

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return TRACE;
  if (upper == "DEBUG")
    return DEBUG;
  if (upper == "INFO")
    return INFO;
  if (upper == "WARN" || upper == "WARNING")
    return WARN;
  if (upper == "ERROR")
    return ERROR;
  if (upper == "FATAL")
    return FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
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

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

std::string Logger::formatRecord(LogLevel level, const std::string &message) {
  nlohmann::ordered_json record;
  record["timestamp"] = getTimestamp();
  record["level"] = levelToString(level);
  record["message"] = message;
  // Invalid UTF-8 in a message must not make logging throw.
  return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }
  const std::string line = formatRecord(level, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << line << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << line << std::endl;
  } else {
    // The file could not be opened; do not lose errors entirely.
    if (level >= ERROR)
      std::cerr << line << std::endl;
  }
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close();

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOldPath.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream existing(oldPath.c_str());
      if (existing.good()) {
        existing.close();
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

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
