#include <xlrelay/Broker.h>
#include <xlrelay/Arguments.h>
#include <xlrelay/Log.h>
#include <xlrelay/Throw.h>
#include <xlRelayHelpers/Environment.h>
#include <fmt/chrono.h>

using std::string;
using nlohmann::json;
using std::chrono::duration_cast;
using std::chrono::seconds;

namespace xlrelay
{
  namespace
  {
    const char* stateName(BatchHandle::State state)
    {
      switch (state)
      {
      case BatchHandle::State::Idle: return "idle";
      case BatchHandle::State::Busy: return "busy";
      default: return "closed";
      }
    }

    string isoTime(std::chrono::system_clock::time_point time)
    {
      return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
        fmt::gmtime(std::chrono::system_clock::to_time_t(time)));
    }

    const string& requireSession(const Request& request)
    {
      if (request.sessionId.empty())
        XLR_THROW_TYPE(ArgumentError, "Command '{}' requires a sessionId", request.command);
      return request.sessionId;
    }
  }

  Broker::Broker(
    SessionRegistry& registry,
    const CommandDispatcher& dispatcher,
    string endpoint)
    : _registry(registry)
    , _dispatcher(dispatcher)
    , _endpoint(std::move(endpoint))
    , _startedAt(std::chrono::system_clock::now())
    , _lastRequest(Clock::now().time_since_epoch().count())
  {}

  void Broker::setShutdownHandler(std::function<void()> handler)
  {
    _shutdownHandler = std::move(handler);
  }

  Broker::Clock::time_point Broker::lastRequest() const noexcept
  {
    return Clock::time_point(Clock::duration(_lastRequest.load()));
  }

  size_t Broker::sessionCount() const
  {
    return _registry.count();
  }

  Response Broker::handle(const string& line) noexcept
  {
    try
    {
      return handle(parseRequest(line));
    }
    catch (const std::exception& e)
    {
      XLR_DEBUG("Rejected request: {}", e.what());
      return Response::failure(e);
    }
  }

  Response Broker::handle(const Request& request) noexcept
  {
    Response response;
    auto [category, action] = splitCommand(request.command);
    _lastRequest = Clock::now().time_since_epoch().count();
    try
    {
      XLR_TRACE("Request '{}' session '{}'", request.command, request.sessionId);

      if (category == "service")
        response = Response::ok(handleService(action, request));
      else if (category == "session")
        response = Response::ok(handleSession(action, request));
      else
        response = Response::ok(handleFeature(request));
    }
    catch (const std::exception& e)
    {
      XLR_DEBUG("Command '{}' failed: {}", request.command, e.what());
      response = Response::failure(e);
    }
    _lastRequest = Clock::now().time_since_epoch().count();

    if (response.success && category == "service" && action == "shutdown")
    {
      XLR_INFO("Shutdown requested");
      if (_shutdownHandler)
        _shutdownHandler();
    }
    return response;
  }

  json Broker::handleService(const string& action, const Request& request)
  {
    if (action == "ping")
      return { { "pong", true } };

    if (action == "status")
    {
      return {
        { "running", true },
        { "pid", currentProcessId() },
        { "endpoint", _endpoint },
        { "sessionCount", _registry.count() },
        { "startedAt", isoTime(_startedAt) },
        { "uptimeSeconds", duration_cast<seconds>(
            std::chrono::system_clock::now() - _startedAt).count() }
      };
    }

    if (action == "shutdown")
      return { { "shuttingDown", true } };

    XLR_THROW_TYPE(UnknownCommandError, "Unknown service action: {}", request.command);
  }

  json Broker::handleSession(const string& action, const Request& request)
  {
    auto& args = request.args;

    if (action == "open" || action == "create")
    {
      auto filePath = Args::requireString(args, "filePath");
      auto timeout = Args::optionalSeconds(args, "timeoutSeconds");
      auto sessionId = action == "open"
        ? _registry.open(filePath, timeout)
        : _registry.create(filePath, timeout);
      return {
        { "sessionId", sessionId },
        { "filePath", _registry.getBatch(sessionId)->path().string() }
      };
    }

    if (action == "close")
    {
      auto& sessionId = requireSession(request);
      auto closed = _registry.close(sessionId, Args::optionalBool(args, "save", false));
      return { { "sessionId", sessionId }, { "closed", closed } };
    }

    if (action == "save")
    {
      auto& sessionId = requireSession(request);
      auto timeout = Args::optionalSeconds(args, "timeoutSeconds");
      auto batch = _registry.getBatch(sessionId);
      try
      {
        batch->save(timeout);
      }
      catch (const HandleInvalidatedError& e)
      {
        dropInvalidated(sessionId, *batch, e);
      }
      return { { "sessionId", sessionId }, { "saved", true } };
    }

    if (action == "list")
    {
      auto sessions = json::array();
      for (auto& info : _registry.sessions())
      {
        sessions.push_back({
          { "sessionId", info.sessionId },
          { "filePath", info.filePath },
          { "state", stateName(info.state) },
          { "dirty", info.dirty },
          { "pendingOperations", info.pendingOperations },
          { "createdAt", isoTime(info.createdAt) },
          { "idleSeconds", duration_cast<seconds>(info.idleFor).count() }
        });
      }
      return { { "sessions", sessions } };
    }

    XLR_THROW_TYPE(UnknownCommandError, "Unknown session action: {}", request.command);
  }

  json Broker::handleFeature(const Request& request)
  {
    _dispatcher.verify(request.command);
    auto& sessionId = requireSession(request);
    auto batch = _registry.getBatch(sessionId);
    try
    {
      return _dispatcher.dispatch(request.command, *batch, request.args);
    }
    catch (const HandleInvalidatedError& e)
    {
      dropInvalidated(sessionId, *batch, e);
    }
  }

  void Broker::dropInvalidated(
    const string& sessionId, const BatchHandle& batch, const HandleInvalidatedError& error)
  {
    // Closed between lookup and submission, by eviction or another client
    if (batch.state() == BatchHandle::State::Closed)
      XLR_THROW_TYPE(UnknownSessionError,
        "Session '{}' was closed before the request ran; open a new session", sessionId);

    // The workbook cannot be used again: drop the session so it is reopened
    // rather than failing every later request
    try
    {
      _registry.close(sessionId, false);
    }
    catch (const std::exception& e)
    {
      XLR_WARN("Error closing invalidated session {}: {}", sessionId, e.what());
    }
    XLR_THROW_TYPE(HandleInvalidatedError, "{}. Session {} has been closed", error.what(), sessionId);
  }
}
