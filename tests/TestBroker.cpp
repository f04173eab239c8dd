#include <gtest/gtest.h>
#include "FakeWorkbook.h"
#include <xlrelay/Broker.h>
#include <xlrelay/Commands.h>

using namespace xlrelay;
using nlohmann::json;
using std::make_shared;
using std::string;

namespace Tests
{
  class BrokerTest : public ::testing::Test
  {
  protected:
    BrokerTest()
      : registry(factory, options())
      , broker(registry, dispatcher, "/tmp/test.sock")
    {
      registerBuiltinCommands(dispatcher);
    }

    static SessionOptions options()
    {
      SessionOptions result;
      result.sweepInterval = std::chrono::milliseconds(0);
      return result;
    }

    Response send(const string& command, const string& sessionId = string(), json args = nullptr)
    {
      return broker.handle(Request{ command, sessionId, std::move(args) });
    }

    string openBook(const string& name)
    {
      auto response = send("session.open", "", { { "filePath", dir.touch(name).string() } });
      EXPECT_TRUE(response.success) << response.errorMessage;
      return response.result["sessionId"].get<string>();
    }

    TempDirectory dir;
    std::shared_ptr<FakeWorkbookFactory> factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry;
    CommandDispatcher dispatcher;
    Broker broker;
  };

  TEST_F(BrokerTest, ServiceCommands)
  {
    auto ping = send("service.ping");
    ASSERT_TRUE(ping.success);
    EXPECT_TRUE(ping.result["pong"].get<bool>());

    auto status = send("Service.Status");
    ASSERT_TRUE(status.success);
    EXPECT_TRUE(status.result["running"].get<bool>());
    EXPECT_EQ("/tmp/test.sock", status.result["endpoint"].get<string>());
    EXPECT_EQ(0, status.result["sessionCount"].get<int>());
    EXPECT_EQ(20u, status.result["startedAt"].get<string>().size());

    auto unknown = send("service.reboot");
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(ErrorKind::UnknownCommand, unknown.errorKind);
  }

  TEST_F(BrokerTest, ShutdownCallsHandlerAfterResponding)
  {
    bool called = false;
    broker.setShutdownHandler([&called]() { called = true; });
    auto response = send("service.shutdown");
    EXPECT_TRUE(response.success);
    EXPECT_TRUE(response.result["shuttingDown"].get<bool>());
    EXPECT_TRUE(called);
  }

  TEST_F(BrokerTest, SessionLifecycle)
  {
    auto id = openBook("book.xlsx");
    EXPECT_EQ(1u, broker.sessionCount());

    auto list = send("session.list");
    ASSERT_TRUE(list.success);
    ASSERT_EQ(1u, list.result["sessions"].size());
    auto& info = list.result["sessions"][0];
    EXPECT_EQ(id, info["sessionId"].get<string>());
    EXPECT_EQ("idle", info["state"].get<string>());
    EXPECT_FALSE(info["dirty"].get<bool>());

    auto created = send("sheet.create", id, { { "sheetName", "Data" } });
    ASSERT_TRUE(created.success) << created.errorMessage;

    auto saved = send("session.save", id);
    EXPECT_TRUE(saved.success);
    EXPECT_TRUE(saved.result["saved"].get<bool>());

    auto closed = send("session.close", id);
    EXPECT_TRUE(closed.result["closed"].get<bool>());
    auto closedAgain = send("session.close", id);
    EXPECT_TRUE(closedAgain.success);
    EXPECT_FALSE(closedAgain.result["closed"].get<bool>());

    auto afterClose = send("sheet.list", id);
    EXPECT_FALSE(afterClose.success);
    EXPECT_EQ(ErrorKind::UnknownSession, afterClose.errorKind);
  }

  TEST_F(BrokerTest, FailuresAreReportedNotThrown)
  {
    auto missing = send("session.open", "", { { "filePath", (dir.path() / "none.xlsx").string() } });
    EXPECT_EQ(ErrorKind::FileNotFound, missing.errorKind);

    auto noPath = send("session.open");
    EXPECT_EQ(ErrorKind::InvalidArgument, noPath.errorKind);

    auto id = openBook("book.xlsx");
    auto twice = send("session.open", "", { { "filePath", (dir.path() / "book.xlsx").string() } });
    EXPECT_EQ(ErrorKind::AlreadyOpen, twice.errorKind);

    auto noSession = send("sheet.list");
    EXPECT_EQ(ErrorKind::InvalidArgument, noSession.errorKind);

    auto unknownSession = send("sheet.list", "ffffffffffffffffffffffffffffffff");
    EXPECT_EQ(ErrorKind::UnknownSession, unknownSession.errorKind);

    auto unknownFeature = send("chart.draw", id);
    EXPECT_EQ(ErrorKind::UnknownCommand, unknownFeature.errorKind);
    EXPECT_EQ("Unknown command category: chart", unknownFeature.errorMessage);

    auto badArgs = send("range.get-values", id, { { "sheetName", "Sheet1" } });
    EXPECT_EQ(ErrorKind::InvalidArgument, badArgs.errorKind);

    // The session is unaffected by failed commands
    EXPECT_TRUE(send("sheet.list", id).success);
  }

  TEST_F(BrokerTest, MalformedLinesAreProtocolErrors)
  {
    auto response = broker.handle(string("{\"command\": "));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(ErrorKind::Protocol, response.errorKind);

    auto ok = broker.handle(string(R"({"command":"service.ping"})"));
    EXPECT_TRUE(ok.success);
  }

  TEST_F(BrokerTest, InvalidatedSessionIsDropped)
  {
    auto id = openBook("book.xlsx");
    factory->kill(registry.getBatch(id)->path());

    auto response = send("calculation.calculate", id);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(ErrorKind::HandleInvalidated, response.errorKind);
    EXPECT_NE(string::npos, response.errorMessage.find("has been closed"));

    EXPECT_EQ(0u, registry.count());
    EXPECT_EQ(ErrorKind::UnknownSession, send("sheet.list", id).errorKind);

    // Reopening gives a working session
    auto reopened = openBook("book.xlsx");
    EXPECT_TRUE(send("calculation.calculate", reopened).success);
  }

  TEST_F(BrokerTest, SessionClosedAfterLookupIsReportedAsUnknown)
  {
    auto id = openBook("book.xlsx");
    // As if evicted between the broker's lookup and its submission
    registry.getBatch(id)->close();

    auto response = send("sheet.list", id);
    EXPECT_FALSE(response.success);
    EXPECT_EQ(ErrorKind::UnknownSession, response.errorKind);
    EXPECT_NE(string::npos, response.errorMessage.find(id));

    auto save = send("session.save", id);
    EXPECT_EQ(ErrorKind::UnknownSession, save.errorKind);
  }

  TEST_F(BrokerTest, LastRequestIsTracked)
  {
    const auto before = broker.lastRequest();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    send("service.ping");
    EXPECT_GT(broker.lastRequest(), before);
  }
}
