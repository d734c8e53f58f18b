// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of xdom, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace xdom
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

/// \brief Thread-safe logger used for diagnostics raised by the DOM.
///
/// Tree operations never throw for soft invariant violations (wrong node
/// kind, wrong extension state); they report them here at warning level and
/// return a safe default. Output goes to stdout, to a file, or to an external
/// handler installed by the embedding application.
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
  /// Takes log level, formatted message, and original message without prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Initialise the logger. An empty \p filePath logs to stdout.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.filePath = filePath;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
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

  /// \brief Flush and close the log file; subsequent output goes to stdout.
  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream && data.fileStream->is_open())
    {
      data.fileStream->close();
    }
    data.fileStream.reset();
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

  /// \brief Register an external log handler
  /// While a handler is registered, file and console output are disabled.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
    data.useExternalHandler = static_cast<bool>(data.externalHandler);
  }

  /// \brief Remove external log handler and restore normal logging
  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
    data.useExternalHandler = false;
  }

  /// \brief Set the log format string
  /// Supported placeholders:
  ///   %T - timestamp (uses timeFormat from init())
  ///   %t - thread ID
  ///   %L - log level (e.g., INFO, DEBUG, ERROR)
  ///   %m - message content
  ///   %F - source file name (only filename, no directory path)
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// \note Empty format strings are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 1, 2)))
#endif
  static void warningf(const char *fmt, ...)
  {
    va_list args;
    va_start(args, fmt);
    logFormatted(Level::Warning, fmt, args);
    va_end(args);
  }

#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 1, 2)))
#endif
  static void debugf(const char *fmt, ...)
  {
    va_list args;
    va_start(args, fmt);
    logFormatted(Level::Debug, fmt, args);
    va_end(args);
  }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }

    std::string output = formatLogMessage(level, message, file, line, function,
                                          data.compiledFormat, data.timestampFormat);
    if (data.useExternalHandler)
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

  /// \brief Map a configuration string to a level; unknown strings map to Info.
  static Level levelFromString(const std::string &s)
  {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

private:
  friend class LoggerStream;

  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::string filePath;
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    bool useExternalHandler = false;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string currentLiteral;

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        currentLiteral += format[i];
        continue;
      }

      FormatToken token = FormatToken::Literal;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        currentLiteral += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the % as literal
        currentLiteral += format[i];
        continue;
      }

      if (!currentLiteral.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
        currentLiteral.clear();
      }
      segments.push_back({token, ""});
      ++i;
    }

    if (!currentLiteral.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
    }
  }

  static void logFormatted(Level level, const char *fmt, va_list args)
  {
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);

    if (size < 0)
    {
      log(level, "[Logger] Invalid format string");
      return;
    }

    std::vector<char> buffer(static_cast<std::size_t>(size) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    log(level, std::string(buffer.data(), static_cast<std::size_t>(size)));
  }

  /// \note Caller holds the logger mutex.
  static std::string formatLogMessage(Level level, const std::string &message, const char *file,
                                      int line, const char *function,
                                      const std::vector<FormatSegment> &segments,
                                      const std::string &timestampFmt)
  {
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
      {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        oss << std::put_time(std::localtime(&t), timestampFmt.c_str());
        if (timestampFmt.find("%S") != std::string::npos)
        {
          oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        }
        break;
      }
      case FormatToken::ThreadId:
      {
        std::size_t threadHash = std::hash<std::thread::id>{}(std::this_thread::get_id());
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2) << threadHash
            << std::dec;
        break;
      }
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case FormatToken::Line:
        if (file)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        if (function)
        {
          oss << function;
        }
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Stream interface for composing and emitting log messages with
/// levels.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    flush();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_flushed && !_stream.str().empty())
    {
      flush();
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _flushed = true;
  }
};

/// \brief Proxy for streaming log messages at specific log levels.
class LoggerProxy
{
public:
  LoggerStream operator<<(Logger::Level level) { return Logger::stream(level); }
};

inline LoggerProxy Logger;

/// \brief Stream-style logging macro with source location support
#define XDOM_LOG_WITH_LEVEL(level, msg)                                                            \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    xdom::core::Logger::log(xdom::core::Logger::Level::level, _oss.str(), __FILE__, __LINE__,     \
                            __func__);                                                             \
  } while (0)

#define XDOM_LOG_TRACE(msg) XDOM_LOG_WITH_LEVEL(Trace, msg)
#define XDOM_LOG_DEBUG(msg) XDOM_LOG_WITH_LEVEL(Debug, msg)
#define XDOM_LOG_INFO(msg) XDOM_LOG_WITH_LEVEL(Info, msg)
#define XDOM_LOG_WARN(msg) XDOM_LOG_WITH_LEVEL(Warning, msg)
#define XDOM_LOG_ERROR(msg) XDOM_LOG_WITH_LEVEL(Error, msg)
#define XDOM_LOG_FATAL(msg) XDOM_LOG_WITH_LEVEL(Fatal, msg)

/// \brief Printf-style logging macros with source location support
/// \warning Messages are limited to 4096 bytes and truncated beyond that.
#define XDOM_LOG_WARNF(fmt, ...)                                                                   \
  do                                                                                               \
  {                                                                                                \
    char _buf[4096];                                                                               \
    std::snprintf(_buf, sizeof(_buf), fmt, ##__VA_ARGS__);                                         \
    xdom::core::Logger::log(xdom::core::Logger::Level::Warning, _buf, __FILE__, __LINE__,         \
                            __func__);                                                             \
  } while (0)

#define XDOM_LOG_DEBUGF(fmt, ...)                                                                  \
  do                                                                                               \
  {                                                                                                \
    char _buf[4096];                                                                               \
    std::snprintf(_buf, sizeof(_buf), fmt, ##__VA_ARGS__);                                         \
    xdom::core::Logger::log(xdom::core::Logger::Level::Debug, _buf, __FILE__, __LINE__,           \
                            __func__);                                                             \
  } while (0)

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }
} // namespace core
} // namespace xdom
