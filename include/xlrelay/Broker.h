#pragma once
#include <xlrelay/CommandDispatch.h>
#include <xlrelay/Protocol.h>
#include <xlrelay/SessionRegistry.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace xlrelay
{
  /// <summary>
  /// Executes protocol requests against a session registry. This is the 
  /// service's exception boundary: handle() never throws, every failure is 
  /// reported in the response.
  /// 
  /// Built in commands are `service.*` (ping, status, shutdown) and `session.*`
  /// (open, create, close, save, list). Anything else is a feature command 
  /// which needs a sessionId and is passed to the dispatcher.
  /// </summary>
  class Broker
  {
  public:
    Broker(
      SessionRegistry& registry, 
      const CommandDispatcher& dispatcher,
      std::string endpoint = std::string());

    Response handle(const Request& request) noexcept;

    /// <summary>
    /// Parses then handles a single request line
    /// </summary>
    Response handle(const std::string& line) noexcept;

    /// <summary>
    /// Called after a `service.shutdown` request has been handled
    /// </summary>
    void setShutdownHandler(std::function<void()> handler);

    using Clock = std::chrono::steady_clock;

    /// <summary>
    /// When the most recent request started or finished
    /// </summary>
    Clock::time_point lastRequest() const noexcept;

    size_t sessionCount() const;

  private:
    nlohmann::json handleService(const std::string& action, const Request& request);
    nlohmann::json handleSession(const std::string& action, const Request& request);
    nlohmann::json handleFeature(const Request& request);
    [[noreturn]] void dropInvalidated(
      const std::string& sessionId, const BatchHandle& batch, const HandleInvalidatedError& error);

    SessionRegistry& _registry;
    const CommandDispatcher& _dispatcher;
    std::string _endpoint;
    std::function<void()> _shutdownHandler;
    std::chrono::system_clock::time_point _startedAt;
    std::atomic<Clock::rep> _lastRequest;
  };
}
