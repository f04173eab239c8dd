#pragma once
#include <xlrelay/Protocol.h>
#include <chrono>
#include <string>

namespace xlrelay
{
  /// <summary>
  /// Sends requests to a running service. Each request uses a new connection.
  /// </summary>
  class ServiceClient
  {
  public:
    explicit ServiceClient(
      std::string endpoint,
      std::chrono::milliseconds timeout = std::chrono::minutes(6));

    /// <summary>
    /// Sends the request and waits for its response. Failures reported by the
    /// service are returned in the response, not thrown.
    /// 
    /// Throws ServiceUnavailableError if the service cannot be reached, 
    /// OperationTimeoutError if no response arrives within the timeout and
    /// ProtocolError if the response is malformed.
    /// </summary>
    Response send(const Request& request) const;

    /// <summary>
    /// Convenience for send(): returns the result or throws the typed error
    /// </summary>
    nlohmann::json call(
      const std::string& command,
      const std::string& sessionId = std::string(),
      nlohmann::json args = nullptr) const;

    /// <summary>
    /// True if the service answers service.ping
    /// </summary>
    bool ping() const noexcept;

    const std::string& endpoint() const noexcept { return _endpoint; }

  private:
    std::string _endpoint;
    std::chrono::milliseconds _timeout;
  };
}
