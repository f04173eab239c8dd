#pragma once
#include <xlrelay/BatchHandle.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace xlrelay
{
  enum class CommandAccess { Read, Write };

  /// <summary>
  /// A feature command. Runs on the session's affinity thread.
  /// </summary>
  using CommandHandler = std::function<nlohmann::json(Workbook&, const nlohmann::json& args)>;

  /// <summary>
  /// Routes `feature.action` commands to handlers against an already resolved
  /// batch. Commands are matched case-insensitively.
  /// </summary>
  class CommandDispatcher
  {
  public:
    /// <summary>
    /// Registers a handler, replacing any existing one for the same name.
    /// Throws ArgumentError if the name is not of the form `feature.action`.
    /// </summary>
    void add(const std::string& command, CommandHandler handler, 
      CommandAccess access = CommandAccess::Write);

    bool contains(const std::string& command) const;

    /// <summary>
    /// Throws UnknownCommandError if no handler is registered, distinguishing
    /// an unknown feature from an unknown action.
    /// </summary>
    void verify(const std::string& command) const;

    /// <summary>
    /// Runs the command through BatchHandle::execute. A numeric 
    /// `timeoutSeconds` in args overrides the batch's default timeout.
    /// Throws UnknownCommandError if no handler is registered.
    /// </summary>
    nlohmann::json dispatch(
      const std::string& command, 
      BatchHandle& batch, 
      const nlohmann::json& args) const;

    std::vector<std::string> commands() const;

  private:
    struct Entry
    {
      CommandHandler handler;
      CommandAccess access;
    };
    std::map<std::string, Entry> _handlers;
  };
}
