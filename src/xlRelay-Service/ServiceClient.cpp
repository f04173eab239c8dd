#include <xlrelay/ServiceClient.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/Throw.h>
#include <boost/asio.hpp>

namespace asio = boost::asio;
using local = boost::asio::local::stream_protocol;
using boost::system::error_code;
using std::string;
using nlohmann::json;

namespace xlrelay
{
  ServiceClient::ServiceClient(string endpoint, std::chrono::milliseconds timeout)
    : _endpoint(std::move(endpoint))
    , _timeout(timeout)
  {}

  Response ServiceClient::send(const Request& request) const
  {
    asio::io_context io;
    local::socket socket(io);

    error_code ec;
    try
    {
      socket.connect(local::endpoint(_endpoint), ec);
    }
    catch (const boost::system::system_error& e)
    {
      XLR_THROW_TYPE(ServiceUnavailableError, "Invalid endpoint '{}': {}", _endpoint, e.what());
    }
    if (ec)
      XLR_THROW_TYPE(ServiceUnavailableError,
        "xlRelay service is not running at '{}' ({}). Start it with 'xlrelay service start'",
        _endpoint, ec.message());

    const auto payload = serialise(request) + "\n";
    asio::streambuf buffer(XLRELAY_MAX_MESSAGE_BYTES);

    error_code writeError, readError;
    size_t length = 0;
    bool done = false;

    asio::async_write(socket, asio::buffer(payload),
      [&](const error_code& ec, size_t)
      {
        writeError = ec;
        if (ec)
        {
          done = true;
          return;
        }
        asio::async_read_until(socket, buffer, '\n',
          [&](const error_code& ec, size_t n)
          {
            readError = ec;
            length = n;
            done = true;
          });
      });

    io.run_for(_timeout);

    if (!done)
    {
      error_code ignored;
      socket.close(ignored);
      io.restart();
      io.run();
      XLR_THROW_TYPE(OperationTimeoutError,
        "No response to '{}' from the xlRelay service within {} s",
        request.command, _timeout.count() / 1000.0);
    }
    if (writeError)
      XLR_THROW_TYPE(ServiceUnavailableError,
        "Failed to send request to the xlRelay service: {}", writeError.message());
    if (readError == asio::error::eof && buffer.size() > 0)
      length = buffer.size();
    else if (readError == asio::error::eof)
      XLR_THROW_TYPE(ProtocolError, "The xlRelay service closed the connection without a response");
    else if (readError == asio::error::not_found)
      XLR_THROW_TYPE(ProtocolError, "Response exceeds the maximum size of {} bytes", XLRELAY_MAX_MESSAGE_BYTES);
    else if (readError)
      XLR_THROW_TYPE(ServiceUnavailableError,
        "Failed to read response from the xlRelay service: {}", readError.message());

    auto data = buffer.data();
    string line(asio::buffers_begin(data), asio::buffers_begin(data) + length);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.pop_back();

    return parseResponse(line);
  }

  json ServiceClient::call(const string& command, const string& sessionId, json args) const
  {
    return send(Request{ command, sessionId, std::move(args) }).value();
  }

  bool ServiceClient::ping() const noexcept
  {
    try
    {
      return send(Request{ "service.ping", string(), nullptr }).success;
    }
    catch (const std::exception& e)
    {
      XLR_DEBUG("Ping of '{}' failed: {}", _endpoint, e.what());
      return false;
    }
  }
}
