#include <xlrelay/Protocol.h>
#include <xlrelay/StringUtils.h>
#include <xlrelay/Throw.h>

using std::string;
using nlohmann::json;

namespace xlrelay
{
  Response Response::ok(json result)
  {
    Response response;
    response.success = true;
    response.result = std::move(result);
    return response;
  }

  Response Response::failure(ErrorKind kind, const string& message)
  {
    Response response;
    response.success = false;
    response.errorKind = kind;
    response.errorMessage = message;
    return response;
  }

  Response Response::failure(const std::exception& e)
  {
    return failure(errorKindOf(e), e.what());
  }

  const json& Response::value() const
  {
    if (!success)
      throwError(errorKind, errorMessage);
    return result;
  }

  namespace
  {
    json parseObject(const string& text, const char* what)
    {
      json parsed;
      try
      {
        parsed = json::parse(text);
      }
      catch (const json::parse_error& e)
      {
        XLR_THROW_TYPE(ProtocolError, "Malformed {}: {}", what, e.what());
      }
      if (!parsed.is_object())
        XLR_THROW_TYPE(ProtocolError, "Malformed {}: expected a JSON object", what);
      return parsed;
    }
  }

  Request parseRequest(const string& text)
  {
    auto parsed = parseObject(text, "request");

    Request request;
    auto command = parsed.find("command");
    if (command == parsed.end() || !command->is_string())
      XLR_THROW_TYPE(ProtocolError, "Malformed request: 'command' must be a string");
    request.command = trim(command->get<string>());
    if (request.command.empty())
      XLR_THROW_TYPE(ProtocolError, "Malformed request: 'command' is empty");

    auto sessionId = parsed.find("sessionId");
    if (sessionId != parsed.end() && !sessionId->is_null())
    {
      if (!sessionId->is_string())
        XLR_THROW_TYPE(ProtocolError, "Malformed request: 'sessionId' must be a string");
      request.sessionId = sessionId->get<string>();
    }

    auto args = parsed.find("args");
    if (args != parsed.end() && !args->is_null())
    {
      if (!args->is_object())
        XLR_THROW_TYPE(ProtocolError, "Malformed request: 'args' must be an object");
      request.args = std::move(*args);
    }
    return request;
  }

  Response parseResponse(const string& text)
  {
    auto parsed = parseObject(text, "response");

    auto success = parsed.find("success");
    if (success == parsed.end() || !success->is_boolean())
      XLR_THROW_TYPE(ProtocolError, "Malformed response: 'success' must be a boolean");

    Response response;
    response.success = success->get<bool>();
    if (auto result = parsed.find("result"); result != parsed.end())
      response.result = std::move(*result);
    if (!response.success)
    {
      auto message = parsed.find("errorMessage");
      response.errorMessage = message != parsed.end() && message->is_string()
        ? message->get<string>() : string("Unspecified error");
      auto kind = parsed.find("errorKind");
      response.errorKind = kind != parsed.end() && kind->is_string()
        ? errorKindFromName(kind->get<string>()) : ErrorKind::Internal;
    }
    return response;
  }

  string serialise(const Request& request)
  {
    json j = {
      { "command", request.command },
      { "sessionId", request.sessionId.empty() ? json() : json(request.sessionId) },
      { "args", request.args }
    };
    return j.dump();
  }

  string serialise(const Response& response)
  {
    json j = {
      { "success", response.success },
      { "result", response.result }
    };
    if (response.success)
    {
      j["errorMessage"] = nullptr;
      j["errorKind"] = nullptr;
    }
    else
    {
      j["errorMessage"] = response.errorMessage;
      j["errorKind"] = errorKindName(response.errorKind);
    }
    // Replace invalid UTF-8 from native error messages rather than throw
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
  }

  std::pair<string, string> splitCommand(const string& command)
  {
    auto dot = command.find('.');
    if (dot == string::npos)
      return { toLower(command), string() };
    return { toLower(command.substr(0, dot)), toLower(command.substr(dot + 1)) };
  }
}
