#include "Settings.h"
#include <xlrelay/Throw.h>
#include <xlRelayHelpers/Environment.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using std::string;
using std::shared_ptr;
using std::make_shared;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace xlrelay
{
  namespace Settings
  {
    namespace
    {
      auto findStr(const toml::view_node& root, const char* tag, const string& defaultValue)
      {
        return root[tag].value_or(defaultValue);
      }

      // TOML integers are always int64
      milliseconds findSeconds(const toml::view_node& root, const char* tag, milliseconds defaultValue)
      {
        auto node = root[tag];
        if (auto asInt = node.value<int64_t>())
          return milliseconds(*asInt * 1000);
        if (auto asFloat = node.value<double>())
          return milliseconds((int64_t)(*asFloat * 1000));
        return defaultValue;
      }
    }

    toml::view_node section(const toml::table* table, const char* name)
    {
      return table ? (*table)[name] : toml::view_node();
    }

    std::string logFilePath(const toml::view_node& root)
    {
      return findStr(root, "LogFile", "");
    }
    std::string logLevel(const toml::view_node& root)
    {
      return findStr(root, "LogLevel", "info");
    }
    std::string logFlushLevel(const toml::view_node& root)
    {
      return findStr(root, "LogFlushLevel", "warn");
    }
    std::pair<size_t, size_t> logRotation(const toml::view_node& root)
    {
      return std::make_pair(
        (size_t)root["LogMaxSize"].value_or(int64_t(1024)),
        (size_t)root["LogNumberOfFiles"].value_or(int64_t(2)));
    }
    std::string endpoint(const toml::view_node& root)
    {
      auto found = findStr(root, "Endpoint", "");
      if (!found.empty())
        return found;
      found = getEnvironmentVar("XLRELAY_ENDPOINT");
      return found.empty() ? defaultEndpoint() : found;
    }

    SessionOptions sessionOptions(const toml::view_node& root)
    {
      SessionOptions options;
      options.idleTimeout = findSeconds(root, "IdleTimeout", options.idleTimeout);
      options.sweepInterval = findSeconds(root, "SweepInterval", options.sweepInterval);
      options.saveOnEvict = root["SaveOnEvict"].value_or(options.saveOnEvict);

      auto& batch = options.batch;
      batch.operationTimeout = findSeconds(root, "OperationTimeout", batch.operationTimeout);
      batch.maxOperationTimeout = findSeconds(root, "MaxOperationTimeout", batch.maxOperationTimeout);
      batch.saveTimeout = findSeconds(root, "SaveTimeout", batch.saveTimeout);
      batch.closeTimeout = findSeconds(root, "CloseTimeout", batch.closeTimeout);
      if (batch.maxOperationTimeout < batch.operationTimeout)
        batch.maxOperationTimeout = batch.operationTimeout;
      return options;
    }

    ServiceHostOptions serviceOptions(const toml::view_node& root)
    {
      ServiceHostOptions options;
      options.maxConnections = (size_t)root["MaxConnections"].value_or((int64_t)options.maxConnections);
      if (options.maxConnections == 0)
        options.maxConnections = 1;
      options.idleShutdown = findSeconds(root, "IdleShutdown", options.idleShutdown);
      options.readTimeout = findSeconds(root, "RequestReadTimeout", options.readTimeout);
      return options;
    }
  }

  std::shared_ptr<const toml::table> findSettingsFile(const std::string& explicitPath)
  {
    fs::path path;
    std::error_code fsErr;

    if (!explicitPath.empty())
    {
      path = explicitPath;
      if (!fs::exists(path, fsErr))
        XLR_THROW("Settings file '{}' not found", path.string());
    }
    else
    {
      auto directoryOverride = getEnvironmentVar("XLRELAY_SETTINGS_DIR");
      path = !directoryOverride.empty()
        ? fs::path(directoryOverride) / XLRELAY_SETTINGS_FILE
        : userConfigDirectory() / XLRELAY_SETTINGS_FILE;
      if (!fs::exists(path, fsErr))
        return shared_ptr<const toml::table>();
    }

    try
    {
      auto ifs = std::ifstream{ path };
      return make_shared<toml::table>(toml::parse(ifs, path.string()));
    }
    catch (const toml::parse_error& e)
    {
      XLR_THROW("Error parsing settings file '{}' at line {}: {}",
        path.string(), e.source().begin.line, e.description());
    }
  }
}
