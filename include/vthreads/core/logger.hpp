// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vthreads, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vthreads
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of __FILE__ at compile time.
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

  /// \brief Where a log call was made; all fields optional.
  struct SourceLocation
  {
    const char *file = nullptr;
    int line = 0;
    const char *function = nullptr;
  };
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with levels, an optional background writer
/// thread, a configurable line format and pluggable output.
///
/// Output goes to stdout unless init() was given a file path, in which case
/// lines are appended to that file. An external handler, once installed,
/// receives every line instead.
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

  /// \brief External sink: level, formatted line, raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief (Re)configure the logger.
  /// \param level    Messages below this level are dropped.
  /// \param filePath Append to this file; empty means stdout.
  /// \param async    Hand lines to a background writer thread.
  static void init(Level level = Level::Info, const std::string &filePath = "", bool async = false)
  {
    auto &data = getData();
    stopWorker();

    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel.store(level, std::memory_order_relaxed);
    data.asyncMode = async;
    data.exit = false;
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

    if (data.asyncMode)
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  /// \brief Write out everything queued so far.
  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainLocked(data);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  /// \brief Flush, stop the background writer and close the log file.
  static void shutdown()
  {
    stopWorker();
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.asyncMode = false;
    data.fileStream.reset();
  }

  static void setLevel(Level level) { getData().minLevel.store(level, std::memory_order_relaxed); }

  static Level getLevel() { return getData().minLevel.load(std::memory_order_relaxed); }

  static bool isEnabled(Level level) { return level >= getLevel(); }

  /// \brief Parse "trace", "debug", "info", "warn"/"warning", "error" or
  /// "fatal" (case-insensitive).
  /// \throws std::invalid_argument for anything else
  static Level levelFromString(const std::string &name)
  {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warn" || lower == "warning")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
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
    }
    return "UNKNOWN";
  }

  /// \brief Route every line to \p handler instead of stdout/file.
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
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F source file, %l source line, %f function, %% literal percent.
  /// Source placeholders are only filled by the VTHREADS_LOG_* macros.
  /// Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.format = format;
    data.segments = compileFormat(format);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.format;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  /// \brief printf-style logging without source location.
#if defined(__GNUC__) || defined(__clang__)
  __attribute__((format(printf, 2, 3)))
#endif
  static void logf(Level level, const char *fmt, ...)
  {
    if (!isEnabled(level))
    {
      return;
    }
    va_list args;
    va_start(args, fmt);
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = std::vsnprintf(nullptr, 0, fmt, argsCopy);
    va_end(argsCopy);
    if (size < 0)
    {
      va_end(args);
      log(level, "[Logger] Invalid format string");
      return;
    }
    std::vector<char> buffer(static_cast<std::size_t>(size) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    va_end(args);
    log(level, std::string(buffer.data(), static_cast<std::size_t>(size)));
  }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message) { log(level, message, {}); }

  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    log(level, message, detail::SourceLocation{file, line, function});
  }

  static void log(Level level, const std::string &message, const detail::SourceLocation &where)
  {
    if (!isEnabled(level))
    {
      return;
    }

    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (data.segments.empty())
    {
      data.segments = compileFormat(data.format);
    }
    std::string line = formatLine(data.segments, level, message, where);

    if (data.externalHandler)
    {
      // Handler runs without the logger lock so it may log itself.
      auto handler = data.externalHandler;
      lock.unlock();
      handler(level, line, message);
      return;
    }

    if (data.asyncMode)
    {
      data.pending.push(std::move(line));
      lock.unlock();
      data.cv.notify_one();
      return;
    }

    writeLocked(data, line);
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
    std::string literal;
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::string> pending;
    std::thread workerThread;
    bool exit = false;
    bool asyncMode = false;
    std::atomic<Level> minLevel{Level::Info};
    std::string filePath;
    std::unique_ptr<std::ofstream> fileStream;
    ExternalHandler externalHandler;
    std::string format = "[%T] [%L] %m";
    std::vector<FormatSegment> segments;

    ~LoggerData()
    {
      {
        std::lock_guard<std::mutex> lock(mutex);
        exit = true;
      }
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void stopWorker()
  {
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_all();
    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }
  }

  static void runWorker()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.pending.empty() || data.exit; });
      drainLocked(data);
      if (data.exit)
      {
        break;
      }
    }
  }

  static void drainLocked(LoggerData &data)
  {
    while (!data.pending.empty())
    {
      writeLocked(data, data.pending.front());
      data.pending.pop();
    }
  }

  static void writeLocked(LoggerData &data, const std::string &line)
  {
    if (data.fileStream)
    {
      (*data.fileStream) << line;
      data.fileStream->flush();
    }
    else
    {
      std::cout << line;
    }
  }

  static std::vector<FormatSegment> compileFormat(const std::string &format)
  {
    std::vector<FormatSegment> segments;
    std::string literal;
    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(literal)});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 == format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token;
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
        literal += '%';
        ++i;
        continue;
      default:
        literal += '%';
        continue;
      }
      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
    return segments;
  }

  static std::string timestamp()
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
  }

  static std::string formatLine(const std::vector<FormatSegment> &segments, Level level,
                                const std::string &message, const detail::SourceLocation &where)
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
        oss << timestamp();
        break;
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (where.file)
          oss << detail::basename(where.file);
        break;
      case FormatToken::Line:
        if (where.file)
          oss << where.line;
        break;
      case FormatToken::Function:
        if (where.function)
          oss << where.function;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Collects streamed values and emits them as one log line.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level), _flushed(false) {}

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
        std::cerr << "[Logger] Failed to emit streamed message: " << e.what() << std::endl;
      }
    }
  }

private:
  void flush()
  {
    Logger::log(_level, _stream.str());
    _stream.str("");
    _flushed = true;
  }

  Logger::Level _level;
  std::ostringstream _stream;
  bool _flushed;
};

/// \brief Enables `Logger << Logger::Level::Info << "text" << Logger::endl`.
class LoggerProxy
{
public:
  LoggerStream operator<<(Logger::Level level) { return Logger::stream(level); }
};

inline LoggerProxy Logger;

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

#define VTHREADS_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    if (vthreads::core::Logger::isEnabled(vthreads::core::Logger::Level::level))                   \
    {                                                                                              \
      std::ostringstream _vtOss;                                                                   \
      _vtOss << msg;                                                                               \
      vthreads::core::Logger::log(vthreads::core::Logger::Level::level, _vtOss.str(), __FILE__,    \
                                  __LINE__, __func__);                                             \
    }                                                                                              \
  } while (0)

#define VTHREADS_LOG_TRACE(msg) VTHREADS_LOG_WITH_LEVEL(Trace, msg)
#define VTHREADS_LOG_DEBUG(msg) VTHREADS_LOG_WITH_LEVEL(Debug, msg)
#define VTHREADS_LOG_INFO(msg) VTHREADS_LOG_WITH_LEVEL(Info, msg)
#define VTHREADS_LOG_WARN(msg) VTHREADS_LOG_WITH_LEVEL(Warning, msg)
#define VTHREADS_LOG_ERROR(msg) VTHREADS_LOG_WITH_LEVEL(Error, msg)
#define VTHREADS_LOG_FATAL(msg) VTHREADS_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace vthreads
