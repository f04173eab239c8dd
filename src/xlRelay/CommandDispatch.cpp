#include <xlrelay/CommandDispatch.h>
#include <xlrelay/Arguments.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Protocol.h>
#include <xlrelay/Throw.h>

using std::string;
using std::vector;
using nlohmann::json;

namespace xlrelay
{
  namespace
  {
    string commandKey(const string& command)
    {
      auto [feature, action] = splitCommand(command);
      return feature + "." + action;
    }
  }

  void CommandDispatcher::add(const string& command, CommandHandler handler, CommandAccess access)
  {
    auto [feature, action] = splitCommand(command);
    if (feature.empty() || action.empty())
      XLR_THROW_TYPE(ArgumentError, "Command '{}' must be of the form feature.action", command);
    if (!handler)
      XLR_THROW_TYPE(ArgumentError, "No handler given for command '{}'", command);
    _handlers[feature + "." + action] = Entry{ std::move(handler), access };
  }

  bool CommandDispatcher::contains(const string& command) const
  {
    return _handlers.count(commandKey(command)) > 0;
  }

  void CommandDispatcher::verify(const string& command) const
  {
    if (contains(command))
      return;

    const auto feature = splitCommand(command).first;
    const auto prefix = feature + ".";
    auto match = _handlers.lower_bound(prefix);
    if (match == _handlers.end() || match->first.compare(0, prefix.size(), prefix) != 0)
      XLR_THROW_TYPE(UnknownCommandError, "Unknown command category: {}", feature);
    XLR_THROW_TYPE(UnknownCommandError, "Unknown {} action in command '{}'", feature, command);
  }

  json CommandDispatcher::dispatch(
    const string& command,
    BatchHandle& batch,
    const json& args) const
  {
    verify(command);
    auto found = _handlers.find(commandKey(command));

    ExecuteOptions options;
    options.readOnly = found->second.access == CommandAccess::Read;
    options.description = found->first;
    options.timeout = Args::optionalSeconds(args, "timeoutSeconds");

    // Captured by value: a timed out operation outlives this call
    return batch.execute(
      [handler = found->second.handler, handlerArgs = args.is_object() ? args : json::object()]
      (Workbook& workbook)
      {
        return handler(workbook, handlerArgs);
      }, 
      options);
  }

  vector<string> CommandDispatcher::commands() const
  {
    vector<string> result;
    for (auto& [name, entry] : _handlers)
      result.push_back(name);
    return result;
  }
}
