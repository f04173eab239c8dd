#pragma once
#include <xlrelay/Errors.h>
#include <nlohmann/json.hpp>
#include <string>

namespace xlrelay
{
  /// Requests and responses are single lines of JSON, at most this long
  constexpr size_t XLRELAY_MAX_MESSAGE_BYTES = 16 * 1024 * 1024;

  /// <summary>
  /// `{command, sessionId, args}` sent from the CLI to the service
  /// </summary>
  struct Request
  {
    /// Dot-namespaced feature and action, e.g. `table.append`
    std::string command;
    /// Empty for service and session-creating commands
    std::string sessionId;
    /// An object, or null
    nlohmann::json args;
  };

  struct Response
  {
    bool success = false;
    nlohmann::json result;
    std::string errorMessage;
    ErrorKind errorKind = ErrorKind::Internal;

    static Response ok(nlohmann::json result = nullptr);
    static Response failure(ErrorKind kind, const std::string& message);

    /// <summary>
    /// Builds a failure response from a caught exception, see errorKindOf
    /// </summary>
    static Response failure(const std::exception& e);

    /// <summary>
    /// Returns the result or throws the typed error described by a failure
    /// </summary>
    const nlohmann::json& value() const;
  };

  /// <summary>
  /// Throws ProtocolError if `text` is not valid JSON, not an object, lacks a
  /// string `command` or has non-object `args`.
  /// </summary>
  Request parseRequest(const std::string& text);
  Response parseResponse(const std::string& text);

  /// <summary>
  /// Serialises to a single line without the terminating newline
  /// </summary>
  std::string serialise(const Request& request);
  std::string serialise(const Response& response);

  /// <summary>
  /// Splits "feature.action" into its parts. Returns an empty action if 
  /// there is no dot.
  /// </summary>
  std::pair<std::string, std::string> splitCommand(const std::string& command);
}
