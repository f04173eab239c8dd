#include "CommandLine.h"
#include <xlrelay/Arguments.h>
#include <algorithm>

using std::string;
using std::vector;
using std::chrono::milliseconds;

namespace xlrelay
{
  namespace
  {
    bool takesValue(const string& arg)
    {
      return arg == "--endpoint" || arg == "--settings" || arg == "--client-timeout";
    }
  }

  vector<string> insertRunCommand(vector<string> args)
  {
    for (size_t i = 0; i < args.size(); ++i)
    {
      auto& arg = args[i];
      if (takesValue(arg))
      {
        ++i;
        continue;
      }
      if (arg.rfind("-", 0) == 0)
        continue;
      if (arg.find('.') != string::npos)
        args.insert(args.begin() + i, "run");
      break;
    }
    return args;
  }

  milliseconds clientTimeout(double seconds)
  {
    if (!(seconds > 0))
      return milliseconds(1);
    seconds = std::min(seconds, (double)Args::maxArgumentSeconds);
    auto result = std::chrono::duration_cast<milliseconds>(std::chrono::duration<double>(seconds));
    return std::max(result, milliseconds(1));
  }
}
