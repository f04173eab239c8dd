#pragma once
#include <filesystem>
#include <string>

namespace xlrelay
{
  /// <summary>
  /// Returns the value of specified environment variable
  /// or an empty string if it does not exist
  /// </summary>
  std::string getEnvironmentVar(const char* name);

  /// <summary>
  /// Sets the enviroment variable to a given value, returning 
  /// false if the action fails. An empty value removes the variable.
  /// </summary>
  bool setEnvironmentVar(const char* name, const char* value);

  /// <summary>
  /// Sets an environment variable and restores the previous value when the 
  /// object goes out of scope.
  /// </summary>
  class PushEnvVar
  {
  private:
    std::string _previous;
    std::string _name;

  public:
    PushEnvVar(const char* name, const char* value);
    ~PushEnvVar();
    void pop();
  };

  /// <summary>
  /// Per-user configuration directory for xlRelay: %APPDATA%\xlRelay on 
  /// Windows, $XDG_CONFIG_HOME/xlRelay or ~/.config/xlRelay elsewhere.
  /// </summary>
  std::filesystem::path userConfigDirectory();

  /// <summary>
  /// Socket path used when neither settings nor XLRELAY_ENDPOINT give one
  /// </summary>
  std::string defaultEndpoint();

  /// <summary>
  /// Directory containing the running executable, or empty if it cannot be 
  /// determined.
  /// </summary>
  std::filesystem::path executableDirectory();

  long currentProcessId();
}
