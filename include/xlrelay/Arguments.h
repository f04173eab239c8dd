#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace xlrelay
{
  /// <summary>
  /// Accessors for command arguments. Each throws ArgumentError naming the
  /// argument if it is missing or has the wrong type.
  /// </summary>
  namespace Args
  {
    std::string requireString(const nlohmann::json& args, const char* name);

    std::string optionalString(
      const nlohmann::json& args, const char* name, const std::string& defaultValue);

    bool optionalBool(const nlohmann::json& args, const char* name, bool defaultValue);

    const nlohmann::json& requireArray(const nlohmann::json& args, const char* name);

    /// Larger values passed to optionalSeconds are reduced to this
    constexpr long long maxArgumentSeconds = 24 * 60 * 60;

    /// <summary>
    /// Reads a positive number of seconds, which must be at least one 
    /// millisecond
    /// </summary>
    std::optional<std::chrono::milliseconds> optionalSeconds(
      const nlohmann::json& args, const char* name);
  }
}
