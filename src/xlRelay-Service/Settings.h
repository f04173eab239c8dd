#pragma once
#include <xlrelay/ServiceHost.h>
#include <xlrelay/SessionRegistry.h>
#include <toml++/toml.h>
#include <memory>
#include <string>

namespace toml {
  using view_node = toml::node_view<const toml::node>;
}

namespace xlrelay
{
  constexpr const char* XLRELAY_SETTINGS_FILE = "xlrelay.ini";
  constexpr const char* XLRELAY_SETTINGS_MAIN_SECTION = "xlRelay";
  constexpr const char* XLRELAY_SETTINGS_SESSION_SECTION = "Session";
  constexpr const char* XLRELAY_SETTINGS_SERVICE_SECTION = "Service";

  namespace Settings
  {
    /// <summary>
    /// Returns a view of the named table, or an empty view if table is null
    /// or has no such section. Lookups in an empty view yield the defaults.
    /// </summary>
    toml::view_node section(const toml::table* table, const char* name);

    std::string logFilePath(const toml::view_node& root);

    std::string logLevel(const toml::view_node& root);

    std::string logFlushLevel(const toml::view_node& root);

    std::pair<size_t, size_t> logRotation(const toml::view_node& root);

    /// <summary>
    /// The Endpoint setting, else the XLRELAY_ENDPOINT environment variable,
    /// else the platform default
    /// </summary>
    std::string endpoint(const toml::view_node& root);

    SessionOptions sessionOptions(const toml::view_node& root);

    /// <summary>
    /// Service options, not including the endpoint
    /// </summary>
    ServiceHostOptions serviceOptions(const toml::view_node& root);
  };

  /// <summary>
  /// Loads `explicitPath` if given, otherwise looks for xlrelay.ini in the 
  /// directory named by XLRELAY_SETTINGS_DIR, then the user's configuration
  /// directory. Returns null if no file exists. Throws if the file cannot be 
  /// parsed.
  /// </summary>
  std::shared_ptr<const toml::table>
    findSettingsFile(const std::string& explicitPath = std::string());
}
