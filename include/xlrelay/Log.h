#pragma once

#ifdef NDEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif 

#include <spdlog/spdlog.h> 
#include <memory>
#include <string>
#include <string_view>

#define XLR_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define XLR_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define XLR_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define XLR_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define XLR_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)

namespace xlrelay
{
  /// <summary>
  /// Create an initialise a spdlog logger.
  /// <param name="consoleLevel">
  ///   If set to a spdlog level other than "off", a console sink is created with
  ///   the given log level and added to the logger's sinks. On Windows this writes
  ///   to `OutputDebugString`, elsewhere to stderr.
  /// </param>
  /// <param name="makeDefault">
  ///   Make this logger the default logger, which can be accessed with `spdlog::default_logger()`
  /// </param>
  /// </summary>
  std::shared_ptr<spdlog::logger> 
    loggerInitialise(const std::string_view& consoleLevel, bool makeDefault = true);

  /// <summary>
  /// Sets the log level at which the logger's sinks should be flushed (written to disk for
  /// file based sinks).
  /// </summary>
  void loggerSetFlush(
    const std::shared_ptr<spdlog::logger>& logger,
    const std::string_view& flushLevel);

  /// <summary>
  /// Add a rotating file sink to the logger, returning the name of the file
  /// which was created.  This may be different to the requested file if that
  /// file cannot be opened.
  /// </summary>
  std::string loggerAddRotatingFileSink(
    const std::shared_ptr<spdlog::logger>& logger,
    const std::string_view& logFilePath, const char* logLevel,
    size_t maxFileSizeKb, size_t numFiles = 1);
}
