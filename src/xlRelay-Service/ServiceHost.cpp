#include <xlrelay/ServiceHost.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/Throw.h>
#include <boost/asio.hpp>
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <future>
#include <vector>

namespace asio = boost::asio;
namespace fs = std::filesystem;
using local = boost::asio::local::stream_protocol;
using boost::system::error_code;
using std::string;
using std::shared_ptr;
using std::make_shared;

namespace xlrelay
{
  namespace detail
  {
    class Connection;
  }

  namespace
  {
    double seconds(std::chrono::milliseconds ms)
    {
      return ms.count() / 1000.0;
    }

    local::endpoint makeEndpoint(const string& path)
    {
      try
      {
        return local::endpoint(path);
      }
      catch (const boost::system::system_error& e)
      {
        XLR_THROW_TYPE(ServiceUnavailableError, "Invalid endpoint '{}': {}", path, e.what());
      }
    }
  }

  class ServiceHost::Impl
  {
  public:
    Impl(Broker& broker, const ServiceHostOptions& options)
      : broker(broker)
      , options(options)
      , acceptor(io)
      , idleTimer(io)
      , signals(io)
      , workers(std::max<size_t>(1, options.maxConnections))
      , work(asio::make_work_guard(io))
    {}

    void accept();
    void scheduleIdleCheck();
    void shutdown();

    Broker& broker;
    ServiceHostOptions options;
    asio::io_context io;
    local::acceptor acceptor;
    asio::steady_timer idleTimer;
    asio::signal_set signals;
    asio::thread_pool workers;
    asio::executor_work_guard<asio::io_context::executor_type> work;
    std::thread ioThread;
    /// Only touched on the io thread
    std::vector<std::weak_ptr<detail::Connection>> connections;
    /// Requests read but not yet answered. Only touched on the io thread.
    size_t activeRequests = 0;
    /// Set once a stop has been requested; later requests are refused
    std::atomic<bool> stopping{ false };

    std::mutex lock;
    std::condition_variable stopSignal;
    bool running = false;
    bool stopRequested = false;
  };

  namespace detail
  {
    /// <summary>
    /// One accepted socket: read a request line, handle it on the worker pool,
    /// write the response line, close.
    /// </summary>
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
      Connection(ServiceHost::Impl& host, local::socket&& socket)
        : _host(host)
        , _socket(std::move(socket))
        , _buffer(XLRELAY_MAX_MESSAGE_BYTES)
        , _deadline(_host.io)
      {}

      void start()
      {
        auto self = shared_from_this();
        _deadline.expires_after(_host.options.readTimeout);
        _deadline.async_wait([self](const error_code& ec)
        {
          if (!ec && self->_reading)
          {
            XLR_DEBUG("Closing connection: no request within {} s", 
              seconds(self->_host.options.readTimeout));
            self->close();
          }
        });
        asio::async_read_until(_socket, _buffer, '\n',
          [self](const error_code& ec, size_t length) { self->onRead(ec, length); });
      }

      bool reading() const noexcept { return _reading; }

      void close() noexcept
      {
        error_code ignored;
        _socket.shutdown(local::socket::shutdown_both, ignored);
        _socket.close(ignored);
      }

    private:
      void onRead(const error_code& ec, size_t length)
      {
        _reading = false;
        _deadline.cancel();

        if (ec == asio::error::not_found)
        {
          write(serialise(Response::failure(ErrorKind::Protocol, fmt::format(
            "Request exceeds the maximum size of {} bytes", XLRELAY_MAX_MESSAGE_BYTES))));
          return;
        }
        // A client may close its side without a trailing newline
        if (ec == asio::error::eof && _buffer.size() > 0)
          length = _buffer.size();
        else if (ec)
        {
          if (ec != asio::error::eof && ec != asio::error::operation_aborted)
            XLR_DEBUG("Failed to read request: {}", ec.message());
          close();
          return;
        }

        auto data = _buffer.data();
        string line(asio::buffers_begin(data), asio::buffers_begin(data) + length);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
          line.pop_back();

        if (_host.stopping)
        {
          write(serialise(Response::failure(ErrorKind::ServiceUnavailable, 
            "The xlRelay service is shutting down")));
          return;
        }

        ++_host.activeRequests;
        auto self = shared_from_this();
        asio::post(_host.workers, [self, line = std::move(line)]()
        {
          string text;
          try
          {
            text = serialise(self->_host.broker.handle(line));
          }
          catch (const std::exception& e)
          {
            XLR_ERROR("Failed to serialise response: {}", e.what());
            text = serialise(Response::failure(ErrorKind::Internal, "Failed to serialise response"));
          }
          asio::post(self->_host.io, [self, text = std::move(text)]() mutable
          {
            --self->_host.activeRequests;
            self->write(std::move(text));
          });
        });
      }

      void write(string&& text)
      {
        _response = std::move(text);
        _response.push_back('\n');
        auto self = shared_from_this();
        asio::async_write(_socket, asio::buffer(_response),
          [self](const error_code& ec, size_t)
          {
            if (ec)
              XLR_DEBUG("Failed to write response: {}", ec.message());
            self->close();
          });
      }

      ServiceHost::Impl& _host;
      local::socket _socket;
      asio::streambuf _buffer;
      asio::steady_timer _deadline;
      string _response;
      bool _reading = true;
    };
  }

  void ServiceHost::Impl::accept()
  {
    acceptor.async_accept([this](const error_code& ec, local::socket socket)
    {
      if (!acceptor.is_open())
        return;
      if (ec)
        XLR_WARN("Failed to accept connection: {}", ec.message());
      else
      {
        auto connection = make_shared<detail::Connection>(*this, std::move(socket));
        connections.erase(
          std::remove_if(connections.begin(), connections.end(), 
            [](auto& c) { return c.expired(); }),
          connections.end());
        connections.push_back(connection);
        connection->start();
      }
      accept();
    });
  }

  void ServiceHost::Impl::scheduleIdleCheck()
  {
    idleTimer.expires_after(options.idleCheckInterval);
    idleTimer.async_wait([this](const error_code& ec)
    {
      if (ec)
        return;
      // A request being handled may be opening a session which is not yet
      // registered
      const auto idleFor = Broker::Clock::now() - broker.lastRequest();
      if (activeRequests == 0 && broker.sessionCount() == 0 && idleFor >= options.idleShutdown)
      {
        XLR_INFO("No sessions or requests for {} s, stopping", seconds(options.idleShutdown));
        stopping = true;
        {
          std::lock_guard<std::mutex> guard(lock);
          stopRequested = true;
        }
        stopSignal.notify_all();
        return;
      }
      scheduleIdleCheck();
    });
  }

  void ServiceHost::Impl::shutdown()
  {
    // Stop accepting and drop connections which have not sent a request. 
    // Once this has run on the io thread no new work reaches the pool.
    std::promise<void> closed;
    asio::post(io, [this, &closed]()
    {
      error_code ignored;
      acceptor.close(ignored);
      idleTimer.cancel();
      signals.cancel(ignored);
      for (auto& c : connections)
        if (auto connection = c.lock(); connection && connection->reading())
          connection->close();
      closed.set_value();
    });
    closed.get_future().wait();

    // In-flight requests finish and their responses are written
    workers.join();
    work.reset();
    if (ioThread.joinable())
      ioThread.join();

    std::error_code err;
    fs::remove(options.endpoint, err);
  }

  ServiceHost::ServiceHost(Broker& broker, const ServiceHostOptions& options)
    : _impl(new Impl(broker, options))
    , _options(options)
  {}

  ServiceHost::~ServiceHost()
  {
    if (_impl->running)
    {
      requestStop();
      try
      {
        wait();
      }
      catch (const std::exception& e)
      {
        XLR_ERROR("Error stopping service: {}", e.what());
      }
    }
  }

  void ServiceHost::start()
  {
    auto& impl = *_impl;
    const auto& path = _options.endpoint;
    if (path.empty())
      XLR_THROW_TYPE(ServiceUnavailableError, "No service endpoint configured");

    std::error_code err;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty())
      fs::create_directories(parent, err);

    if (fs::exists(path, err))
    {
      if (isEndpointListening(path))
        XLR_THROW_TYPE(ServiceUnavailableError,
          "Another xlRelay service is already listening on '{}'", path);
      XLR_INFO("Removing stale socket '{}'", path);
      fs::remove(path, err);
    }

    auto endpoint = makeEndpoint(path);
    error_code ec;
    impl.acceptor.open(endpoint.protocol(), ec);
    if (!ec)
      impl.acceptor.bind(endpoint, ec);
    if (!ec)
      impl.acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
      XLR_THROW_TYPE(ServiceUnavailableError, "Cannot listen on '{}': {}", path, ec.message());

    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, err);
    if (err)
      XLR_WARN("Cannot restrict permissions of '{}': {}", path, err.message());

    impl.accept();
    if (_options.idleShutdown.count() > 0)
      impl.scheduleIdleCheck();

    if (_options.handleSignals)
    {
      impl.signals.add(SIGINT);
      impl.signals.add(SIGTERM);
      impl.signals.async_wait([this](const error_code& ec, int signal)
      {
        if (!ec)
        {
          XLR_INFO("Received signal {}, stopping", signal);
          requestStop();
        }
      });
    }

    impl.running = true;
    impl.ioThread = std::thread([&impl]()
    {
      while (true)
      {
        try
        {
          impl.io.run();
          break;
        }
        catch (const std::exception& e)
        {
          XLR_ERROR("Service io loop: {}", e.what());
        }
      }
    });

    XLR_INFO("xlRelay service listening on '{}'", path);
  }

  void ServiceHost::requestStop() noexcept
  {
    _impl->stopping = true;
    {
      std::lock_guard<std::mutex> guard(_impl->lock);
      _impl->stopRequested = true;
    }
    _impl->stopSignal.notify_all();
  }

  void ServiceHost::wait()
  {
    {
      std::unique_lock<std::mutex> guard(_impl->lock);
      _impl->stopSignal.wait(guard, [this]() { return _impl->stopRequested; });
      if (!_impl->running)
        return;
      _impl->running = false;
    }
    _impl->shutdown();
    XLR_INFO("xlRelay service on '{}' stopped", _options.endpoint);
  }

  void ServiceHost::run()
  {
    start();
    wait();
  }

  bool isEndpointListening(const string& endpoint)
  {
    asio::io_context io;
    local::socket socket(io);
    error_code ec;
    try
    {
      socket.connect(local::endpoint(endpoint), ec);
    }
    catch (const boost::system::system_error&)
    {
      return false;
    }
    return !ec;
  }
}
