#include "CommandLine.h"
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/Protocol.h>
#include <xlrelay/ServiceClient.h>
#include <xlrelay/Throw.h>
#include <xlRelay-Service/Settings.h>
#include <xlRelayHelpers/Environment.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <thread>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <Windows.h>
#else
#  include <sys/types.h>
#  include <sys/wait.h>
#  include <fcntl.h>
#  include <unistd.h>
#endif

using std::string;
using std::vector;
using nlohmann::json;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace xlrelay
{
  namespace
  {
    constexpr auto theServiceStartTimeout = 10s;

    struct CliArgs
    {
      string endpoint;
      string settingsFile;
      double clientTimeout = 360;

      string path;
      string sessionId;
      string commandArgs;
      double timeout = 0;
      bool save = false;
      string command;
    };

    fs::path daemonExecutable()
    {
#ifdef _WIN32
      const auto name = "xlrelayd.exe";
#else
      const auto name = "xlrelayd";
#endif
      auto dir = executableDirectory();
      return dir.empty() ? fs::path(name) : dir / name;
    }

    vector<string> daemonArguments(const CliArgs& args, const string& endpoint)
    {
      vector<string> result{ "--endpoint", endpoint };
      if (!args.settingsFile.empty())
      {
        result.push_back("--settings");
        result.push_back(args.settingsFile);
      }
      return result;
    }

#ifdef _WIN32
    void spawnDetached(const fs::path& exe, const vector<string>& arguments)
    {
      auto commandLine = fmt::format("\"{}\"", exe.string());
      for (auto& arg : arguments)
        commandLine += fmt::format(" \"{}\"", arg);

      STARTUPINFOA startup = { sizeof(STARTUPINFOA) };
      PROCESS_INFORMATION process;
      if (!CreateProcessA(exe.string().c_str(), commandLine.data(), nullptr, nullptr, FALSE,
          DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr, nullptr, &startup, &process))
        XLR_THROW_TYPE(ServiceUnavailableError, 
          "Failed to start '{}': error {}", exe.string(), GetLastError());
      CloseHandle(process.hThread);
      CloseHandle(process.hProcess);
    }
#else
    void spawnDetached(const fs::path& exe, const vector<string>& arguments)
    {
      // Build argv before forking: only async-signal-safe calls are allowed 
      // in the child
      const auto exeName = exe.string();
      vector<char*> argv;
      argv.push_back(const_cast<char*>(exeName.c_str()));
      for (auto& arg : arguments)
        argv.push_back(const_cast<char*>(arg.c_str()));
      argv.push_back(nullptr);

      // Double fork so the daemon is reparented and never becomes a zombie
      const auto child = fork();
      if (child < 0)
        XLR_THROW_TYPE(ServiceUnavailableError, "Failed to start '{}': fork failed", exeName);
      if (child == 0)
      {
        setsid();
        if (fork() != 0)
          _exit(0);
        const auto devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0)
        {
          dup2(devNull, STDIN_FILENO);
          dup2(devNull, STDOUT_FILENO);
          dup2(devNull, STDERR_FILENO);
        }
        execv(argv[0], argv.data());
        _exit(127);
      }
      int status = 0;
      waitpid(child, &status, 0);
    }
#endif

    void startService(const CliArgs& args, const string& endpoint)
    {
      ServiceClient probe(endpoint, 2s);
      if (probe.ping())
        return;

      const auto exe = daemonExecutable();
      XLR_DEBUG("Starting '{}' on '{}'", exe.string(), endpoint);
      spawnDetached(exe, daemonArguments(args, endpoint));

      const auto deadline = std::chrono::steady_clock::now() + theServiceStartTimeout;
      while (std::chrono::steady_clock::now() < deadline)
      {
        if (probe.ping())
          return;
        std::this_thread::sleep_for(100ms);
      }
      XLR_THROW_TYPE(ServiceUnavailableError,
        "The xlRelay service did not start on '{}' within {} seconds",
        endpoint, theServiceStartTimeout.count());
    }

    json withTimeout(json args, double timeout)
    {
      if (timeout > 0)
        args["timeoutSeconds"] = timeout;
      return args;
    }

    json parseCommandArgs(const string& text)
    {
      if (text.empty())
        return json::object();
      auto parsed = json::parse(text, nullptr, false);
      if (parsed.is_discarded() || !parsed.is_object())
        XLR_THROW_TYPE(ArgumentError, "--args must be a JSON object");
      return parsed;
    }

    void printFailure(const string& message, ErrorKind kind)
    {
      json out = {
        { "success", false },
        { "error", message },
        { "errorKind", errorKindName(kind) }
      };
      std::cout << out.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    void printResult(const json& result)
    {
      std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    }
  }
}

int main(int argc, char** argv)
{
  using namespace xlrelay;

  // Only warnings go to the console; results go to stdout
  loggerInitialise("warn");

  CLI::App app("xlRelay: drive Excel workbooks held open by the xlRelay service");
  app.require_subcommand(1);

  CliArgs args;
  app.add_option("--endpoint", args.endpoint, "Socket path of the service");
  app.add_option("--settings", args.settingsFile, "Settings file");
  app.add_option("--client-timeout", args.clientTimeout, 
    "Seconds to wait for the service to respond")->check(CLI::PositiveNumber);

  // service start|stop|status
  auto service = app.add_subcommand("service", "Control the background service");
  service->require_subcommand(1);
  auto serviceStart = service->add_subcommand("start", "Start the service if it is not running");
  auto serviceStop = service->add_subcommand("stop", "Stop the service, closing all sessions");
  auto serviceStatus = service->add_subcommand("status", "Show service status");

  // session open|create|close|save|list
  auto session = app.add_subcommand("session", "Manage workbook sessions");
  session->require_subcommand(1);
  auto sessionOpen = session->add_subcommand("open", "Open an existing workbook");
  sessionOpen->add_option("path", args.path, "Workbook path")->required();
  sessionOpen->add_option("--timeout", args.timeout, "Default operation timeout in seconds");
  auto sessionCreate = session->add_subcommand("create", "Create and open a new workbook");
  sessionCreate->add_option("path", args.path, "Workbook path")->required();
  sessionCreate->add_option("--timeout", args.timeout, "Default operation timeout in seconds");
  auto sessionClose = session->add_subcommand("close", "Close a session");
  sessionClose->add_option("-s,--session", args.sessionId, "Session id")->required();
  sessionClose->add_flag("--save", args.save, "Save before closing");
  auto sessionSave = session->add_subcommand("save", "Save a session's workbook");
  sessionSave->add_option("-s,--session", args.sessionId, "Session id")->required();
  auto sessionList = session->add_subcommand("list", "List open sessions");

  // Anything else is <feature>.<action>, e.g. range.get-values
  auto feature = app.add_subcommand("run", "Run a workbook command: run <feature>.<action>");
  feature->add_option("command", args.command, "Command name")->required();
  feature->add_option("-s,--session", args.sessionId, "Session id")->required();
  feature->add_option("--args", args.commandArgs, "Arguments as a JSON object");
  feature->add_option("--timeout", args.timeout, "Operation timeout in seconds");

  auto argList = insertRunCommand(vector<string>(argv + 1, argv + argc));
  // CLI11 consumes a vector of arguments from the back
  std::reverse(argList.begin(), argList.end());

  try
  {
    app.parse(argList);
  }
  catch (const CLI::ParseError& e)
  {
    return app.exit(e);
  }

  try
  {
    auto settings = findSettingsFile(args.settingsFile);
    const auto endpoint = args.endpoint.empty()
      ? Settings::endpoint(Settings::section(settings.get(), XLRELAY_SETTINGS_MAIN_SECTION))
      : args.endpoint;

    ServiceClient client(endpoint, clientTimeout(args.clientTimeout));

    json result;
    if (*serviceStart)
    {
      startService(args, endpoint);
      result = client.call("service.status");
    }
    else if (*serviceStop)
    {
      if (client.ping())
        result = client.call("service.shutdown");
      else
        result = { { "shuttingDown", false }, { "running", false } };
    }
    else if (*serviceStatus)
    {
      if (client.ping())
        result = client.call("service.status");
      else
        result = { { "running", false }, { "endpoint", endpoint } };
    }
    else if (*sessionOpen || *sessionCreate)
    {
      startService(args, endpoint);
      auto path = fs::absolute(fs::path(args.path)).string();
      result = client.call(*sessionOpen ? "session.open" : "session.create", string(),
        withTimeout({ { "filePath", path } }, args.timeout));
    }
    else if (*sessionClose)
      result = client.call("session.close", args.sessionId, { { "save", args.save } });
    else if (*sessionSave)
      result = client.call("session.save", args.sessionId);
    else if (*sessionList)
      result = client.call("session.list");
    else if (*feature)
      result = client.call(args.command, args.sessionId,
        withTimeout(parseCommandArgs(args.commandArgs), args.timeout));

    printResult(result);
    return 0;
  }
  catch (const std::exception& e)
  {
    printFailure(e.what(), errorKindOf(e));
    return 1;
  }
}
