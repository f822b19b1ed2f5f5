#include "ChannelDeck/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(_WIN32)
#include <io.h>
#define CHANNELDECK_ISATTY _isatty
#define CHANNELDECK_FILENO _fileno
#else
#include <unistd.h>
#define CHANNELDECK_ISATTY isatty
#define CHANNELDECK_FILENO fileno
#endif

namespace ChannelDeck::core {

std::optional<LogLevel> logLevelFromString(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace")
    return LogLevel::Trace;
  if (lowered == "debug")
    return LogLevel::Debug;
  if (lowered == "info")
    return LogLevel::Info;
  if (lowered == "warning" || lowered == "warn")
    return LogLevel::Warning;
  if (lowered == "error")
    return LogLevel::Error;
  if (lowered == "fatal")
    return LogLevel::Fatal;
  if (lowered == "off")
    return LogLevel::Off;
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
#ifdef NDEBUG
    : m_level(LogLevel::Info),
#else
    : m_level(LogLevel::Debug),
#endif
      m_useColors(CHANNELDECK_ISATTY(CHANNELDECK_FILENO(stderr)) != 0) {
}

Logger::~Logger() { closeOutputFile(); }

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  if (!m_fileStream.is_open()) {
    std::cerr << "[Logger] Failed to open log file: " << path << '\n';
  }
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
  if (level == LogLevel::Off) {
    return;
  }

  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level) {
      return;
    }

    const std::string line =
        "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + std::string(message);

    if (m_useColors) {
      std::cerr << levelToColor(level) << line << "\033[0m" << '\n';
    } else {
      std::cerr << line << '\n';
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << '\n';
      if (level >= LogLevel::Error) {
        m_fileStream.flush();
      }
    }

    callbacks = m_callbacks;
  }

  // Callbacks run unlocked so they may log themselves
  const std::string text(message);
  for (const auto& callback : callbacks) {
    if (callback) {
      callback(level, text);
    }
  }
}

void Logger::trace(std::string_view message) { log(LogLevel::Trace, message); }
void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }
void Logger::info(std::string_view message) { log(LogLevel::Info, message); }
void Logger::warning(std::string_view message) { log(LogLevel::Warning, message); }
void Logger::error(std::string_view message) { log(LogLevel::Error, message); }
void Logger::fatal(std::string_view message) { log(LogLevel::Fatal, message); }

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

const char* Logger::levelToColor(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "\033[0m";
}

std::string Logger::getCurrentTimestamp() const {
  const auto now = std::chrono::system_clock::now();
  const auto time = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms.count();
  return oss.str();
}

} // namespace ChannelDeck::core
