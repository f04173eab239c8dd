#pragma once
#include <xlrelay/Broker.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace xlrelay
{
  struct ServiceHostOptions
  {
    /// Path of the local socket
    std::string endpoint;
    /// Requests handled concurrently; further connections wait to be read
    size_t maxConnections = 10;
    /// A connection which has not sent a complete request within this time 
    /// is closed
    std::chrono::milliseconds readTimeout = std::chrono::seconds(30);
    /// Stop when there have been no sessions and no requests for this long.
    /// Zero disables.
    std::chrono::milliseconds idleShutdown = std::chrono::minutes(10);
    /// How often the idle shutdown condition is checked
    std::chrono::milliseconds idleCheckInterval = std::chrono::seconds(30);
    /// Stop on SIGINT and SIGTERM
    bool handleSignals = false;
  };

  /// <summary>
  /// Serves the broker over a local stream socket. Each connection carries one
  /// request line and receives one response line. Sockets are read and written
  /// on a single io thread; requests are handled on a worker pool so that 
  /// slow workbook operations do not hold up other sessions.
  /// </summary>
  class ServiceHost
  {
  public:
    ServiceHost(Broker& broker, const ServiceHostOptions& options);

    /// <summary>
    /// Stops the service if it is running
    /// </summary>
    ~ServiceHost();

    ServiceHost(const ServiceHost&) = delete;
    ServiceHost& operator=(const ServiceHost&) = delete;

    /// <summary>
    /// Binds the endpoint and starts serving in the background. Throws 
    /// ServiceUnavailableError if the endpoint cannot be bound or another 
    /// instance is already listening on it.
    /// </summary>
    void start();

    /// <summary>
    /// Asks the service to stop. Safe to call from any thread, including
    /// request handlers.
    /// </summary>
    void requestStop() noexcept;

    /// <summary>
    /// Blocks until stop is requested, then stops accepting, lets in-flight
    /// requests finish and releases the endpoint.
    /// </summary>
    void wait();

    /// <summary>
    /// start() followed by wait()
    /// </summary>
    void run();

    const std::string& endpoint() const noexcept { return _options.endpoint; }

    class Impl;

  private:
    std::unique_ptr<Impl> _impl;
    ServiceHostOptions _options;
  };

  /// <summary>
  /// Returns true if a service is accepting connections at the endpoint
  /// </summary>
  bool isEndpointListening(const std::string& endpoint);
}
