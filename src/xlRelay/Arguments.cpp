#include <xlrelay/Arguments.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Throw.h>
#include <algorithm>

using std::string;
using nlohmann::json;
using std::chrono::duration;
using std::chrono::duration_cast;
using std::chrono::milliseconds;

namespace xlrelay
{
  namespace Args
  {
    namespace
    {
      const json* find(const json& args, const char* name)
      {
        if (!args.is_object())
          return nullptr;
        auto found = args.find(name);
        return found == args.end() || found->is_null() ? nullptr : &*found;
      }
    }

    string requireString(const json& args, const char* name)
    {
      auto value = find(args, name);
      if (!value)
        XLR_THROW_TYPE(ArgumentError, "Missing required argument '{}'", name);
      if (!value->is_string() || value->get_ref<const string&>().empty())
        XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be a non-empty string", name);
      return value->get<string>();
    }

    string optionalString(const json& args, const char* name, const string& defaultValue)
    {
      auto value = find(args, name);
      if (!value)
        return defaultValue;
      if (!value->is_string())
        XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be a string", name);
      return value->get<string>();
    }

    bool optionalBool(const json& args, const char* name, bool defaultValue)
    {
      auto value = find(args, name);
      if (!value)
        return defaultValue;
      if (!value->is_boolean())
        XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be true or false", name);
      return value->get<bool>();
    }

    const json& requireArray(const json& args, const char* name)
    {
      auto value = find(args, name);
      if (!value)
        XLR_THROW_TYPE(ArgumentError, "Missing required argument '{}'", name);
      if (!value->is_array())
        XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be an array", name);
      return *value;
    }

    std::optional<std::chrono::milliseconds> optionalSeconds(const json& args, const char* name)
    {
      auto value = find(args, name);
      if (!value)
        return std::nullopt;
      auto seconds = value->is_number() ? value->get<double>() : 0.0;
      if (!(seconds > 0))
        XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be a positive number of seconds", name);

      // Operation timeouts are capped far below this by the batch
      seconds = std::min(seconds, (double)maxArgumentSeconds);
      auto result = duration_cast<milliseconds>(duration<double>(seconds));
      if (result.count() == 0)
        XLR_THROW_TYPE(ArgumentError, "Argument '{}' must be at least 0.001 seconds", name);
      return result;
    }
  }
}
