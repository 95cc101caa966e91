#pragma once
#ifndef MERKLECLAIM_LOGGER_H
#define MERKLECLAIM_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide logger writing one JSON object per line.
 *
 * Each line carries timestamp, level, component and message. File output
 * rotates once the file reaches maxFileSize, keeping maxBackupFiles numbered
 * backups (file.1 is the newest).
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the logger. Falls back to console-only WARN output if
   * init() was never called.
   * @throw std::runtime_error If no instance could be created.
   */
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void log(LogLevel level, const std::string &message);
  void log(LogLevel level, const std::string &component,
           const std::string &message);

  static std::string levelToString(LogLevel level);

  /**
   * @brief Parse a level name ("TRACE" .. "FATAL", case-insensitive).
   * @return false if the name is unknown; @p out is left untouched.
   */
  static bool levelFromString(const std::string &name, LogLevel &out);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp() const;
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

#endif // MERKLECLAIM_LOGGER_H
