#include "Plotline/core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#define PLOTLINE_ISATTY _isatty
#define PLOTLINE_FILENO _fileno
#else
#include <unistd.h>
#define PLOTLINE_ISATTY isatty
#define PLOTLINE_FILENO fileno
#endif

namespace Plotline::core {

std::optional<LogLevel> logLevelFromString(std::string_view name) {
  if (name == "trace")
    return LogLevel::Trace;
  if (name == "debug")
    return LogLevel::Debug;
  if (name == "info")
    return LogLevel::Info;
  if (name == "warning" || name == "warn")
    return LogLevel::Warning;
  if (name == "error")
    return LogLevel::Error;
  if (name == "fatal")
    return LogLevel::Fatal;
  if (name == "off")
    return LogLevel::Off;
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Info), m_useColors(PLOTLINE_ISATTY(PLOTLINE_FILENO(stderr)) != 0) {}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_consoleOutput = enabled;
}

void Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<LogCallback> callbacks;
  std::string text(message);

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level || level == LogLevel::Off) {
      return;
    }

    const std::string line =
        "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + text;

    if (m_consoleOutput) {
      if (m_useColors) {
        const char* color = "\033[0m";
        switch (level) {
        case LogLevel::Trace:
          color = "\033[90m";
          break;
        case LogLevel::Debug:
          color = "\033[36m";
          break;
        case LogLevel::Info:
          color = "\033[32m";
          break;
        case LogLevel::Warning:
          color = "\033[33m";
          break;
        case LogLevel::Error:
          color = "\033[31m";
          break;
        case LogLevel::Fatal:
          color = "\033[1;31m";
          break;
        case LogLevel::Off:
          break;
        }
        std::cerr << color << line << "\033[0m\n";
      } else {
        std::cerr << line << '\n';
      }
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << '\n';
      m_fileStream.flush();
    }

    // Callbacks run outside the lock so they may log themselves
    callbacks = m_callbacks;
  }

  for (const auto& callback : callbacks) {
    if (callback) {
      callback(level, text);
    }
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

const char* Logger::levelToString(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms.count();
  return oss.str();
}

} // namespace Plotline::core
