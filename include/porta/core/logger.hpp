// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Porta, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace porta
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Thread-safe process-wide logger with level filtering, optional
/// file output and an optional external sink.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler function type
  /// Takes log level, formatted line, and the raw message without prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure level and destination. An empty path logs to stdout.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      auto stream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!stream->is_open())
      {
        throw std::runtime_error("Logger: cannot open log file " + filePath);
      }
      data.fileStream = std::move(stream);
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  static bool isEnabled(Level level) { return level >= getLevel(); }

  /// \brief Register an external log handler
  /// While a handler is registered, file and console output are suppressed.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  /// \brief Remove external log handler and restore normal logging
  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
  /// "error", "fatal"), case-insensitive.
  /// \throws std::invalid_argument on unknown names
  static Level levelFromString(std::string name)
  {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace")
      return Level::Trace;
    if (name == "debug")
      return Level::Debug;
    if (name == "info")
      return Level::Info;
    if (name == "warn" || name == "warning")
      return Level::Warning;
    if (name == "error")
      return Level::Error;
    if (name == "fatal")
      return Level::Fatal;
    throw std::invalid_argument("Unknown log level: " + name);
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  /// \param file Source file name (from __FILE__), may be null
  /// \param line Source line number (from __LINE__)
  /// \param function Function name (from __func__), may be null
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLine(level, message, file, line, function, data.timestampFormat);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel{Level::Info};
    std::string timestampFormat{"%Y-%m-%d %H:%M:%S"};
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::string timestamp(const std::string &format)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format.c_str()) << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
  }

  static std::string formatLine(Level level, const std::string &message, const char *file,
                                int line, const char *function, const std::string &timeFormat)
  {
    std::ostringstream oss;
    oss << '[' << timestamp(timeFormat) << "] [" << levelToString(level) << "] ";
    oss << "[" << std::hex << std::hash<std::thread::id>{}(std::this_thread::get_id())
        << std::dec << "] ";
    if (file)
    {
      oss << '[' << detail::basename(file) << ':' << line;
      if (function)
      {
        oss << ' ' << function;
      }
      oss << "] ";
    }
    oss << message << '\n';
    return oss.str();
  }
};

/// \brief Stream interface for composing and emitting log messages with
/// levels.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level) {}

  LoggerStream(LoggerStream &&other) noexcept
      : _level(other._level), _stream(std::move(other._stream)), _flushed(other._flushed)
  {
    other._flushed = true;
  }

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      Logger::log(_level, _stream.str());
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed{false};
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

/// \brief Stream-style logging macro with source location support
#define PORTA_LOG_WITH_LEVEL(level, msg)                                                           \
  do                                                                                               \
  {                                                                                                \
    if (porta::core::Logger::isEnabled(porta::core::Logger::Level::level))                         \
    {                                                                                              \
      std::ostringstream _oss;                                                                     \
      _oss << msg;                                                                                 \
      porta::core::Logger::log(porta::core::Logger::Level::level, _oss.str(), __FILE__, __LINE__, \
                               __func__);                                                          \
    }                                                                                              \
  } while (0)

#define PORTA_LOG_TRACE(msg) PORTA_LOG_WITH_LEVEL(Trace, msg)
#define PORTA_LOG_DEBUG(msg) PORTA_LOG_WITH_LEVEL(Debug, msg)
#define PORTA_LOG_INFO(msg) PORTA_LOG_WITH_LEVEL(Info, msg)
#define PORTA_LOG_WARN(msg) PORTA_LOG_WITH_LEVEL(Warning, msg)
#define PORTA_LOG_ERROR(msg) PORTA_LOG_WITH_LEVEL(Error, msg)
#define PORTA_LOG_FATAL(msg) PORTA_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace porta
