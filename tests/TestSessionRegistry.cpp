#include <gtest/gtest.h>
#include "FakeWorkbook.h"
#include <xlrelay/Errors.h>
#include <xlrelay/SessionRegistry.h>
#include <future>

using namespace xlrelay;
using namespace std::chrono_literals;
using std::make_shared;
using std::string;
using std::vector;
namespace fs = std::filesystem;

namespace Tests
{
  namespace
  {
    SessionOptions noSweeper()
    {
      SessionOptions options;
      options.sweepInterval = 0ms;
      return options;
    }
  }

  TEST(SessionRegistry, OpenReturnsAnOpaqueToken)
  {
    TempDirectory dir;
    auto book = dir.touch("book.xlsx");
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    auto id = registry.open(book.string());
    EXPECT_EQ(32u, id.size());
    EXPECT_EQ(1u, registry.count());

    auto batch = registry.getBatch(id);
    EXPECT_EQ(book.string(), batch->path().string());
    EXPECT_EQ(batch, registry.getBatch(id));
  }

  TEST(SessionRegistry, OpenValidatesThePath)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    EXPECT_THROW(registry.open((dir.path() / "missing.xlsx").string()), FileNotFoundError);
    EXPECT_THROW(registry.open(dir.touch("notes.txt").string()), ArgumentError);
    EXPECT_THROW(registry.open("  "), ArgumentError);
    EXPECT_EQ(0, factory->openCount());
  }

  TEST(SessionRegistry, FileIsBoundToOneSession)
  {
    TempDirectory dir;
    auto book = dir.touch("book.xlsx");
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    auto id = registry.open(book.string());
    EXPECT_THROW(registry.open(book.string()), AlreadyOpenConflictError);
    // The same file by another route
    EXPECT_THROW(registry.open((dir.path() / "." / "book.xlsx").string()), AlreadyOpenConflictError);

    registry.close(id);
    auto reopened = registry.open(book.string());
    EXPECT_NE(id, reopened);
  }

  TEST(SessionRegistry, FailedOpenReleasesThePath)
  {
    TempDirectory dir;
    auto book = dir.touch("book.xlsx");
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    factory->setFailOpen(true);
    EXPECT_THROW(registry.open(book.string()), AutomationError);
    EXPECT_EQ(0u, registry.count());

    factory->setFailOpen(false);
    EXPECT_NO_THROW(registry.open(book.string()));
  }

  TEST(SessionRegistry, UnknownSessionsAreRejected)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    EXPECT_THROW(registry.getBatch("0123456789abcdef0123456789abcdef"), UnknownSessionError);
    EXPECT_THROW(registry.save("nope"), UnknownSessionError);

    auto id = registry.open(dir.touch("book.xlsx").string());
    registry.close(id);
    EXPECT_THROW(registry.getBatch(id), UnknownSessionError);
  }

  TEST(SessionRegistry, CloseIsIdempotent)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    auto id = registry.open(dir.touch("book.xlsx").string());
    auto batch = registry.getBatch(id);
    EXPECT_TRUE(registry.close(id));
    EXPECT_FALSE(registry.close(id));
    EXPECT_FALSE(registry.close(id, true));
    EXPECT_EQ(1, factory->closeCount());
    EXPECT_EQ(BatchHandle::State::Closed, batch->state());
  }

  TEST(SessionRegistry, OperationsExecuteInSubmissionOrder)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());
    auto id = registry.open(dir.touch("book.xlsx").string());

    auto order = make_shared<vector<int>>();
    for (auto i = 0; i < 50; ++i)
      registry.getBatch(id)->execute([order, i](Workbook&) { order->push_back(i); });
    registry.save(id);

    ASSERT_EQ(50u, order->size());
    for (auto i = 0; i < 50; ++i)
      EXPECT_EQ(i, (*order)[i]);
  }

  TEST(SessionRegistry, ConcurrentSubmittersShareOneOrder)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());
    auto id = registry.open(dir.touch("book.xlsx").string());

    // Only touched on the session's thread
    auto record = make_shared<vector<std::pair<int, int>>>();
    auto submitter = [&](int who)
    {
      for (auto i = 0; i < 100; ++i)
        registry.getBatch(id)->execute([record, who, i](Workbook&) { record->emplace_back(who, i); });
    };
    auto a = std::async(std::launch::async, submitter, 0);
    auto b = std::async(std::launch::async, submitter, 1);
    a.get();
    b.get();
    registry.getBatch(id)->execute([](Workbook&) {});

    ASSERT_EQ(200u, record->size());
    int next[2] = { 0, 0 };
    for (auto& [who, i] : *record)
      EXPECT_EQ(next[who]++, i);
  }

  TEST(SessionRegistry, SessionsRunInParallel)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    factory->setCalculateDelay(1s);
    SessionRegistry registry(factory, noSweeper());
    auto first = registry.open(dir.touch("first.xlsx").string());
    auto second = registry.open(dir.touch("second.xlsx").string());

    auto calculate = [&](const string& id)
    {
      registry.getBatch(id)->execute([](Workbook& wb) { wb.calculate(); });
    };

    const auto start = std::chrono::steady_clock::now();
    auto a = std::async(std::launch::async, calculate, first);
    auto b = std::async(std::launch::async, calculate, second);
    a.get();
    b.get();
    const auto took = std::chrono::steady_clock::now() - start;

    EXPECT_GE(took, 950ms);
    EXPECT_LT(took, 1800ms);
  }

  TEST(SessionRegistry, AppendedRowsSurviveSaveAndReopen)
  {
    TempDirectory dir;
    auto book = dir.touch("orders.xlsx");
    auto factory = make_shared<FakeWorkbookFactory>();
    factory->addTable(book, "Orders", { string("Id"), string("Item") });
    SessionRegistry registry(factory, noSweeper());

    auto id = registry.open(book.string());
    registry.getBatch(id)->execute([](Workbook& wb)
    {
      return wb.appendTableRows("Orders", {
        { 1.0, string("apple") }, { 2.0, string("pear") }, { 3.0, string("plum") } });
    });
    registry.getBatch(id)->execute([](Workbook& wb)
    {
      return wb.appendTableRows("Orders", { { 4.0, string("fig") }, { 5.0, string("kiwi") } });
    });
    registry.save(id);
    registry.close(id);

    auto reopened = registry.open(book.string());
    auto table = registry.getBatch(reopened)->execute([](Workbook& wb) { return wb.readTable("Orders"); });
    ASSERT_EQ(6u, table.size());
    for (auto i = 1; i <= 5; ++i)
      EXPECT_EQ(CellValue(double(i)), table[i][0]);
    EXPECT_EQ(CellValue(string("kiwi")), table[5][1]);
  }

  TEST(SessionRegistry, CreateMakesANewWorkbook)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionRegistry registry(factory, noSweeper());

    const auto target = dir.path() / "reports" / "new.xlsx";
    auto id = registry.create(target.string());
    EXPECT_TRUE(fs::exists(target));

    auto sessions = registry.sessions();
    ASSERT_EQ(1u, sessions.size());
    EXPECT_EQ(id, sessions[0].sessionId);
    EXPECT_EQ("new.xlsx", fs::path(sessions[0].filePath).filename().string());
    EXPECT_EQ(BatchHandle::State::Idle, sessions[0].state);
    EXPECT_FALSE(sessions[0].dirty);

    EXPECT_THROW(registry.create(target.string()), ArgumentError);
    EXPECT_THROW(registry.create((dir.path() / "old.xls").string()), ArgumentError);
  }

  TEST(SessionRegistry, IdleSessionsAreEvicted)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    auto options = noSweeper();
    options.idleTimeout = 100ms;
    SessionRegistry registry(factory, options);

    auto idle = registry.open(dir.touch("idle.xlsx").string());
    auto active = registry.open(dir.touch("active.xlsx").string());
    std::this_thread::sleep_for(150ms);
    registry.getBatch(active);

    EXPECT_EQ(1u, registry.evictIdle());
    EXPECT_THROW(registry.getBatch(idle), UnknownSessionError);
    EXPECT_NO_THROW(registry.getBatch(active));
  }

  TEST(SessionRegistry, EvictionSkipsBusySessions)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    auto options = noSweeper();
    options.idleTimeout = 100ms;
    SessionRegistry registry(factory, options);
    auto id = registry.open(dir.touch("book.xlsx").string());

    auto batch = registry.getBatch(id);
    std::promise<void> started;
    auto running = std::async(std::launch::async, [&]()
    {
      batch->execute([&started](Workbook&)
      {
        started.set_value();
        std::this_thread::sleep_for(400ms);
      });
    });
    started.get_future().wait();
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(BatchHandle::State::Busy, batch->state());
    EXPECT_EQ(0u, registry.evictIdle());
    running.get();
    EXPECT_NO_THROW(registry.getBatch(id));
  }

  TEST(SessionRegistry, SweeperEvictsInTheBackground)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    SessionOptions options;
    options.idleTimeout = 100ms;
    options.sweepInterval = 50ms;
    SessionRegistry registry(factory, options);
    auto id = registry.open(dir.touch("book.xlsx").string());

    for (auto i = 0; i < 200 && registry.count() > 0; ++i)
      std::this_thread::sleep_for(10ms);
    EXPECT_EQ(0u, registry.count());
    EXPECT_THROW(registry.getBatch(id), UnknownSessionError);
    EXPECT_EQ(1, factory->closeCount());
  }

  TEST(SessionRegistry, EvictionDiscardsOrSavesChanges)
  {
    TempDirectory dir;
    auto discarded = dir.touch("discarded.xlsx");
    auto kept = dir.touch("kept.xlsx");
    auto factory = make_shared<FakeWorkbookFactory>();
    auto addSheet = [](Workbook& wb) { wb.addSheet("Extra"); };

    {
      auto options = noSweeper();
      options.idleTimeout = 50ms;
      SessionRegistry registry(factory, options);
      registry.getBatch(registry.open(discarded.string()))->execute(addSheet);
      std::this_thread::sleep_for(100ms);
      EXPECT_EQ(1u, registry.evictIdle());
    }
    {
      auto options = noSweeper();
      options.idleTimeout = 50ms;
      options.saveOnEvict = true;
      SessionRegistry registry(factory, options);
      registry.getBatch(registry.open(kept.string()))->execute(addSheet);
      std::this_thread::sleep_for(100ms);
      EXPECT_EQ(1u, registry.evictIdle());
    }

    EXPECT_EQ(1u, factory->saved(discarded).sheets.size());
    EXPECT_EQ(2u, factory->saved(kept).sheets.size());
  }

  TEST(SessionRegistry, DestructorClosesEverything)
  {
    TempDirectory dir;
    auto factory = make_shared<FakeWorkbookFactory>();
    {
      SessionRegistry registry(factory, noSweeper());
      registry.open(dir.touch("a.xlsx").string());
      registry.open(dir.touch("b.xlsm").string());
    }
    EXPECT_EQ(2, factory->closeCount());
  }
}
