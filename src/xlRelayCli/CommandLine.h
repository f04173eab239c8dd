#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace xlrelay
{
  /// <summary>
  /// Lets `xlrelay range.get-values -s ...` stand for 
  /// `xlrelay run range.get-values -s ...`. If the first positional argument,
  /// skipping the values of the global options, contains a '.', "run" is 
  /// inserted before it. Other arguments are returned unchanged.
  /// </summary>
  std::vector<std::string> insertRunCommand(std::vector<std::string> args);

  /// <summary>
  /// Converts the --client-timeout seconds to a duration of at least one
  /// millisecond
  /// </summary>
  std::chrono::milliseconds clientTimeout(double seconds);
}
