#include "Environment.h"
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;
using std::string;

namespace xlrelay
{
  string getEnvironmentVar(const char* name)
  {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || !buf)
      return string();
    string result(buf);
    free(buf);
    return result;
#else
    auto value = std::getenv(name);
    return value ? string(value) : string();
#endif
  }

  bool setEnvironmentVar(const char* name, const char* value)
  {
#ifdef _WIN32
    return _putenv_s(name, value) != EINVAL;
#else
    if (!value || !*value)
      return unsetenv(name) == 0;
    return setenv(name, value, 1) == 0;
#endif
  }

  PushEnvVar::PushEnvVar(const char* name, const char* value)
    : _previous(getEnvironmentVar(name))
    , _name(name)
  {
    setEnvironmentVar(name, value);
  }

  PushEnvVar::~PushEnvVar()
  {
    pop();
  }

  void PushEnvVar::pop()
  {
    if (_name.empty())
      return;

    setEnvironmentVar(_name.c_str(), _previous.c_str());
    _name.clear();
    _previous.clear();
  }

  fs::path userConfigDirectory()
  {
#ifdef _WIN32
    return fs::path(getEnvironmentVar("APPDATA")) / "xlRelay";
#else
    auto xdg = getEnvironmentVar("XDG_CONFIG_HOME");
    if (!xdg.empty())
      return fs::path(xdg) / "xlRelay";
    return fs::path(getEnvironmentVar("HOME")) / ".config" / "xlRelay";
#endif
  }

  string defaultEndpoint()
  {
#ifdef _WIN32
    return (fs::path(getEnvironmentVar("LOCALAPPDATA")) / "xlRelay" / "xlrelay.sock").string();
#else
    auto runtimeDir = getEnvironmentVar("XDG_RUNTIME_DIR");
    if (!runtimeDir.empty())
      return (fs::path(runtimeDir) / "xlrelay.sock").string();
    return "/tmp/xlrelay-" + std::to_string(getuid()) + ".sock";
#endif
  }

  fs::path executableDirectory()
  {
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    auto len = GetModuleFileNameW(NULL, buf, MAX_PATH);
    if (len == 0 || len == MAX_PATH)
      return fs::path();
    return fs::path(std::wstring(buf, len)).parent_path();
#else
    std::error_code err;
    auto self = fs::read_symlink("/proc/self/exe", err);
    return err ? fs::path() : self.parent_path();
#endif
  }

  long currentProcessId()
  {
#ifdef _WIN32
    return (long)GetCurrentProcessId();
#else
    return (long)getpid();
#endif
  }
}
