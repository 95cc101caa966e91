#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <new>
#include <sstream>

Logger *Logger::s_instance = nullptr;
std::recursive_mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

namespace {

std::string jsonEscape(const std::string &in) {
  std::ostringstream out;
  for (char c : in) {
    switch (c) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out << buf;
      } else {
        out << c;
      }
    }
  }
  return out.str();
}

} // namespace

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;

  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << bae.what()
              << std::endl;
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
    : currentLogLevel(level), logFilePath(logFile),
      maxFileSize(maxFileSizeVal), maxBackupFiles(maxBackupFilesVal) {
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

LogLevel Logger::getLogLevel() const {
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

bool Logger::levelFromString(const std::string &name, LogLevel &out) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (LogLevel l : {TRACE, DEBUG, INFO, WARN, ERROR, FATAL}) {
    if (levelToString(l) == upper) {
      out = l;
      return true;
    }
  }
  return false;
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, "merkleclaim", message);
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  std::ostringstream line;
  line << "{\"timestamp\":\"" << getTimestamp() << "\",\"level\":\""
       << levelToString(level) << "\",\"component\":\""
       << jsonEscape(component) << "\",\"message\":\"" << jsonEscape(message)
       << "\"}";

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << line.str() << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << line.str() << std::endl;
  }
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
    std::string tooOld = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOld.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string from = logFilePath + "." + std::to_string(i);
      std::string to = logFilePath + "." + std::to_string(i + 1);
      std::ifstream backup(from);
      if (backup.good()) {
        backup.close();
        std::rename(from.c_str(), to.c_str());
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

std::string Logger::getTimestamp() const {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
