// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of RssFlow, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <cstdio>
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
#include <vector>

namespace rssflow
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

/// \brief Process-wide logger with levels, a console or file sink, an
/// optional external handler and a configurable line format.
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

  /// \brief External log handler. Receives the level, the formatted line and
  /// the raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Set the minimum level and the sink. An empty path logs to stdout.
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
      auto out = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!out->is_open())
      {
        throw std::runtime_error("Logger: cannot open log file: " + filePath);
      }
      data.fileStream = std::move(out);
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

  /// \brief Flush and close the file sink. Subsequent messages go to stdout.
  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
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

  /// \brief Route all output to \p handler instead of the console or file.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line format.
  ///
  /// Placeholders: %T timestamp, %L level, %m message, %F file, %l line,
  /// %f function, %t thread id, %% literal percent.
  static void setLogFormat(const std::string &format)
  {
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

  /// \brief Parse a level name (case-insensitive). Unknown names map to Info.
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
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }

    std::string output = formatLine(level, message, file, line, function, data.compiledFormat,
                                    data.timestampFormat);
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
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
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
    std::string literal;
    auto push = [&](FormatToken token)
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
      segments.push_back({token, ""});
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }
      switch (format[i + 1])
      {
      case 'T':
        push(FormatToken::Timestamp);
        break;
      case 't':
        push(FormatToken::ThreadId);
        break;
      case 'L':
        push(FormatToken::Level);
        break;
      case 'm':
        push(FormatToken::Message);
        break;
      case 'F':
        push(FormatToken::File);
        break;
      case 'l':
        push(FormatToken::Line);
        break;
      case 'f':
        push(FormatToken::Function);
        break;
      case '%':
        literal += '%';
        break;
      default:
        // Unknown placeholder: keep both characters verbatim
        literal += format[i];
        literal += format[i + 1];
        break;
      }
      ++i;
    }
    if (!literal.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(literal)});
    }
  }

  static std::string timestamp(const std::string &fmt)
  {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt.c_str()) << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
  }

  static std::string formatLine(Level level, const std::string &message, const char *file,
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
        oss << timestamp(timestampFmt);
        break;
      case FormatToken::ThreadId:
        oss << std::this_thread::get_id();
        break;
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

/// \brief Stream interface for composing a log line at a fixed level.
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
      try
      {
        flush();
      }
      catch (const std::exception &e)
      {
        std::cerr << "LoggerStream: " << e.what() << std::endl;
      }
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;

  void flush()
  {
    Logger::log(_level, _stream.str());
    _stream.str("");
    _flushed = true;
  }
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace rssflow

#define RSSFLOW_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    rssflow::core::Logger::log(rssflow::core::Logger::Level::level, _oss.str(), __FILE__,          \
                               __LINE__, __func__);                                                \
  } while (0)

#define RSSFLOW_LOG_TRACE(msg) RSSFLOW_LOG_WITH_LEVEL(Trace, msg)
#define RSSFLOW_LOG_DEBUG(msg) RSSFLOW_LOG_WITH_LEVEL(Debug, msg)
#define RSSFLOW_LOG_INFO(msg) RSSFLOW_LOG_WITH_LEVEL(Info, msg)
#define RSSFLOW_LOG_WARN(msg) RSSFLOW_LOG_WITH_LEVEL(Warning, msg)
#define RSSFLOW_LOG_ERROR(msg) RSSFLOW_LOG_WITH_LEVEL(Error, msg)
#define RSSFLOW_LOG_FATAL(msg) RSSFLOW_LOG_WITH_LEVEL(Fatal, msg)

/// \brief Printf-style logging. Messages are truncated at 4096 bytes.
#define RSSFLOW_LOG_WITH_LEVELF(level, fmt, ...)                                                   \
  do                                                                                               \
  {                                                                                                \
    char _buf[4096];                                                                               \
    std::snprintf(_buf, sizeof(_buf), fmt, ##__VA_ARGS__);                                         \
    rssflow::core::Logger::log(rssflow::core::Logger::Level::level, _buf, __FILE__, __LINE__,      \
                               __func__);                                                          \
  } while (0)

#define RSSFLOW_LOG_TRACEF(fmt, ...) RSSFLOW_LOG_WITH_LEVELF(Trace, fmt, ##__VA_ARGS__)
#define RSSFLOW_LOG_DEBUGF(fmt, ...) RSSFLOW_LOG_WITH_LEVELF(Debug, fmt, ##__VA_ARGS__)
#define RSSFLOW_LOG_INFOF(fmt, ...) RSSFLOW_LOG_WITH_LEVELF(Info, fmt, ##__VA_ARGS__)
#define RSSFLOW_LOG_WARNF(fmt, ...) RSSFLOW_LOG_WITH_LEVELF(Warning, fmt, ##__VA_ARGS__)
#define RSSFLOW_LOG_ERRORF(fmt, ...) RSSFLOW_LOG_WITH_LEVELF(Error, fmt, ##__VA_ARGS__)
#define RSSFLOW_LOG_FATALF(fmt, ...) RSSFLOW_LOG_WITH_LEVELF(Fatal, fmt, ##__VA_ARGS__)
