#include <xlrelay/Broker.h>
#include <xlrelay/Commands.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/ServiceHost.h>
#include <xlrelay/SessionRegistry.h>
#include <xlrelay/Throw.h>
#include <xlRelay-Service/Settings.h>
#ifdef _WIN32
#  include <xlrelay/ComDriver.h>
#endif
#include <CLI/CLI.hpp>
#include <iostream>

using std::string;
using std::shared_ptr;

namespace xlrelay
{
  namespace
  {
#ifndef _WIN32
    /// <summary>
    /// Excel automation only exists on Windows. Elsewhere the service still
    /// runs, but every open or create fails with an automation error.
    /// </summary>
    class UnavailableWorkbookFactory : public WorkbookFactory
    {
    public:
      std::unique_ptr<Workbook> open(const std::filesystem::path& path) override
      {
        XLR_THROW_TYPE(AutomationError, 
          "Cannot open '{}': Excel automation requires Windows", path.string());
      }
      std::unique_ptr<Workbook> create(const std::filesystem::path& path, bool) override
      {
        XLR_THROW_TYPE(AutomationError,
          "Cannot create '{}': Excel automation requires Windows", path.string());
      }
    };
#endif

    shared_ptr<WorkbookFactory> makeWorkbookFactory()
    {
#ifdef _WIN32
      return makeComWorkbookFactory();
#else
      return std::make_shared<UnavailableWorkbookFactory>();
#endif
    }

    struct DaemonArgs
    {
      string endpoint;
      string settingsFile;
      string logLevel;
      string logFile;
      bool foreground = false;
    };

    int runDaemon(const DaemonArgs& args)
    {
      auto settings = findSettingsFile(args.settingsFile);
      auto mainSection = Settings::section(settings.get(), XLRELAY_SETTINGS_MAIN_SECTION);

      const auto logLevel = args.logLevel.empty() 
        ? Settings::logLevel(mainSection) : args.logLevel;

      // A detached daemon has nowhere useful to write console output
      auto logger = loggerInitialise(args.foreground ? logLevel : "off");

      const auto logFile = args.logFile.empty() 
        ? Settings::logFilePath(mainSection) : args.logFile;
      if (!logFile.empty())
      {
        const auto [maxSize, numFiles] = Settings::logRotation(mainSection);
        auto actualFile = loggerAddRotatingFileSink(
          logger, logFile, logLevel.c_str(), maxSize, numFiles);
        XLR_INFO("Logging to '{}'", actualFile);
      }
      loggerSetFlush(logger, Settings::logFlushLevel(mainSection));

      auto hostOptions = Settings::serviceOptions(
        Settings::section(settings.get(), XLRELAY_SETTINGS_SERVICE_SECTION));
      hostOptions.endpoint = args.endpoint.empty() 
        ? Settings::endpoint(mainSection) : args.endpoint;
      hostOptions.handleSignals = true;

      SessionRegistry registry(
        makeWorkbookFactory(),
        Settings::sessionOptions(
          Settings::section(settings.get(), XLRELAY_SETTINGS_SESSION_SECTION)));

      CommandDispatcher dispatcher;
      registerBuiltinCommands(dispatcher);

      Broker broker(registry, dispatcher, hostOptions.endpoint);
      ServiceHost host(broker, hostOptions);
      broker.setShutdownHandler([&host]() { host.requestStop(); });

      XLR_INFO("xlRelay service starting on '{}'", hostOptions.endpoint);
      host.run();
      XLR_INFO("xlRelay service stopped, closing {} sessions", registry.count());
      return 0;
    }
  }
}

int main(int argc, char** argv)
{
  using namespace xlrelay;

  CLI::App app("xlRelay service: keeps Excel workbooks open between xlrelay commands");

  DaemonArgs args;
  app.add_option("--endpoint", args.endpoint, "Socket path to listen on");
  app.add_option("--settings", args.settingsFile, "Settings file")->check(CLI::ExistingFile);
  app.add_option("--log-level", args.logLevel, "trace, debug, info, warn, error or off");
  app.add_option("--log-file", args.logFile, "Write a rotating log file");
  app.add_flag("--foreground", args.foreground, "Also log to the console");

  try
  {
    app.parse(argc, argv);
  }
  catch (const CLI::ParseError& e)
  {
    return app.exit(e);
  }

  try
  {
    return runDaemon(args);
  }
  catch (const std::exception& e)
  {
    XLR_ERROR("xlRelay service failed: {}", e.what());
    std::cerr << "xlrelayd: " << e.what() << std::endl;
    return 1;
  }
}
