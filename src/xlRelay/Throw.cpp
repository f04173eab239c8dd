#include <xlrelay/Throw.h>
#include <xlrelay/Log.h>
#include <cstring>

namespace xlrelay
{
  void logException(
    const char* path,
    const int line,
    const char* func,
    const char* msg) noexcept
  {
    try
    {
      auto lastSlash = strrchr(path, '/');
      auto lastBackslash = strrchr(path, '\\');
      if (lastBackslash > lastSlash)
        lastSlash = lastBackslash;
      auto filename = lastSlash ? lastSlash + 1 : path;
      XLR_DEBUG("{0} (in {2}:{3} during {1})", msg, func, filename, line);
    }
    catch (const std::exception&)
    {
      // Logging must not turn one exception into another
    }
  }
}
