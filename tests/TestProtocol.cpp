#include <gtest/gtest.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Protocol.h>

using namespace xlrelay;
using nlohmann::json;
using std::string;

namespace Tests
{
  TEST(Protocol, ParseRequest)
  {
    auto request = parseRequest(
      R"({"command":"range.get-values","sessionId":"abc","args":{"sheetName":"Sheet1"}})");
    EXPECT_EQ("range.get-values", request.command);
    EXPECT_EQ("abc", request.sessionId);
    EXPECT_EQ("Sheet1", request.args["sheetName"].get<string>());

    auto noSession = parseRequest(R"({"command":"service.ping","sessionId":null})");
    EXPECT_TRUE(noSession.sessionId.empty());
    EXPECT_TRUE(noSession.args.is_null());
  }

  TEST(Protocol, MalformedRequestsAreProtocolErrors)
  {
    EXPECT_THROW(parseRequest("{not json"), ProtocolError);
    EXPECT_THROW(parseRequest("[1,2,3]"), ProtocolError);
    EXPECT_THROW(parseRequest(R"({"sessionId":"abc"})"), ProtocolError);
    EXPECT_THROW(parseRequest(R"({"command":42})"), ProtocolError);
    EXPECT_THROW(parseRequest(R"({"command":"  "})"), ProtocolError);
    EXPECT_THROW(parseRequest(R"({"command":"sheet.list","sessionId":7})"), ProtocolError);
    EXPECT_THROW(parseRequest(R"({"command":"sheet.list","args":[1]})"), ProtocolError);
  }

  TEST(Protocol, RequestSurvivesSerialisation)
  {
    Request request{ "table.append", "0123", json::parse(R"({"rows":[[1,"a"]]})") };
    auto line = serialise(request);
    EXPECT_EQ(string::npos, line.find('\n'));

    auto parsed = parseRequest(line);
    EXPECT_EQ(request.command, parsed.command);
    EXPECT_EQ(request.sessionId, parsed.sessionId);
    EXPECT_EQ(request.args, parsed.args);
  }

  TEST(Protocol, SuccessResponseHasNullErrorFields)
  {
    auto j = json::parse(serialise(Response::ok({ { "pong", true } })));
    EXPECT_TRUE(j["success"].get<bool>());
    EXPECT_TRUE(j["result"]["pong"].get<bool>());
    EXPECT_TRUE(j["errorMessage"].is_null());
    EXPECT_TRUE(j["errorKind"].is_null());
  }

  TEST(Protocol, FailureResponseCarriesKind)
  {
    auto line = serialise(Response::failure(UnknownSessionError("Session 'x' not found")));
    auto j = json::parse(line);
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_TRUE(j["result"].is_null());
    EXPECT_EQ("Session 'x' not found", j["errorMessage"].get<string>());
    EXPECT_EQ("UnknownSession", j["errorKind"].get<string>());

    auto response = parseResponse(line);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(ErrorKind::UnknownSession, response.errorKind);
    EXPECT_THROW(response.value(), UnknownSessionError);
  }

  TEST(Protocol, ForeignExceptionsAreInternal)
  {
    auto response = Response::failure(std::logic_error("oops"));
    EXPECT_EQ(ErrorKind::Internal, response.errorKind);
    EXPECT_THROW(response.value(), std::runtime_error);

    auto unknownKind = parseResponse(R"({"success":false,"errorMessage":"m","errorKind":"Martian"})");
    EXPECT_EQ(ErrorKind::Internal, unknownKind.errorKind);

    auto nullKind = parseResponse(R"({"success":false,"errorMessage":null,"errorKind":null})");
    EXPECT_EQ(ErrorKind::Internal, nullKind.errorKind);
    EXPECT_FALSE(nullKind.errorMessage.empty());
  }

  TEST(Protocol, InvalidUtf8IsReplacedNotThrown)
  {
    auto response = Response::failure(ErrorKind::Automation, string("bad \xC3\x28 text"));
    string line;
    ASSERT_NO_THROW(line = serialise(response));
    EXPECT_NO_THROW(json::parse(line));
  }

  TEST(Protocol, MalformedResponses)
  {
    EXPECT_THROW(parseResponse(""), ProtocolError);
    EXPECT_THROW(parseResponse(R"({"result":1})"), ProtocolError);
    EXPECT_THROW(parseResponse(R"({"success":"yes"})"), ProtocolError);
  }

  TEST(Protocol, ErrorKindNames)
  {
    for (auto kind : { ErrorKind::UnknownSession, ErrorKind::HandleInvalidated,
      ErrorKind::SaveConflict, ErrorKind::IO, ErrorKind::Timeout, ErrorKind::ServiceUnavailable,
      ErrorKind::Protocol, ErrorKind::FileNotFound, ErrorKind::AlreadyOpen,
      ErrorKind::InvalidArgument, ErrorKind::UnknownCommand, ErrorKind::Automation })
    {
      EXPECT_EQ(kind, errorKindFromName(errorKindName(kind)));
      try
      {
        throwError(kind, "message");
        FAIL() << "throwError returned";
      }
      catch (const RelayError& e)
      {
        EXPECT_EQ(kind, e.kind());
        EXPECT_STREQ("message", e.what());
      }
    }
  }

  TEST(Protocol, SplitCommand)
  {
    EXPECT_EQ(std::make_pair(string("range"), string("get-values")), splitCommand("Range.Get-Values"));
    EXPECT_EQ(std::make_pair(string("ping"), string()), splitCommand("ping"));
    EXPECT_EQ(std::make_pair(string("a"), string("b.c")), splitCommand("a.b.c"));
  }
}
