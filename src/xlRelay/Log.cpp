#include <xlrelay/Log.h>
#include <xlRelayHelpers/Environment.h>
#include <spdlog/sinks/rotating_file_sink.h>
#ifdef _WIN32
#  include <spdlog/sinks/msvc_sink.h>
#else
#  include <spdlog/sinks/stdout_color_sinks.h>
#endif
#include <filesystem>
#include <fstream>
#include <string>

using std::string;
using std::make_shared;
namespace fs = std::filesystem;

namespace xlrelay
{
  std::shared_ptr<spdlog::logger> loggerInitialise(
    const std::string_view& consoleLevel,
    bool makeDefault)
  {
    const auto consoleWriterLevel = spdlog::level::from_str(string(consoleLevel));

    auto logger = make_shared<spdlog::logger>("xlrelay");

    if (consoleWriterLevel != spdlog::level::off)
    {
#ifdef _WIN32
      auto console = make_shared<spdlog::sinks::msvc_sink_mt>();
#else
      auto console = make_shared<spdlog::sinks::stderr_color_sink_mt>();
#endif
      console->set_level(consoleWriterLevel);
      logger->sinks().push_back(console);
    }

    // The logger passes everything; sinks do the filtering
    logger->set_level(consoleWriterLevel == spdlog::level::off
      ? spdlog::level::warn : consoleWriterLevel);

    if (makeDefault)
    {
      spdlog::drop(logger->name());
      spdlog::initialize_logger(logger);
      spdlog::set_default_logger(logger);
    }

    return logger;
  }

  void loggerSetFlush(
    const std::shared_ptr<spdlog::logger>& logger,
    const std::string_view& flushLevel)
  {
    const auto flushSpdLevel = spdlog::level::from_str(string(flushLevel));
    logger->flush_on(flushSpdLevel);
  }

  std::string loggerAddRotatingFileSink(
    const std::shared_ptr<spdlog::logger>& logger,
    const std::string_view& logFilePath, const char* logLevel,
    const size_t maxFileSizeKb, const size_t numFiles)
  {
    auto filename = fs::path(string(logFilePath));

    std::error_code err;
    if (filename.has_parent_path())
      fs::create_directories(filename.parent_path(), err);

    // If we cannot append to the requested file, perhaps because another 
    // service instance holds it, write beside it instead
    {
      std::ofstream probe(filename, std::ios::app);
      if (!probe)
        filename.replace_extension(std::to_string(currentProcessId()) + ".log");
    }

    auto fileWrite = make_shared<spdlog::sinks::rotating_file_sink_mt>(
      filename.string(), maxFileSizeKb * 1024, numFiles);
    fileWrite->set_level(spdlog::level::from_str(logLevel));
    logger->sinks().push_back(fileWrite);

    if (fileWrite->level() < logger->level())
      logger->set_level(fileWrite->level());

    return fileWrite->filename();
  }
}
