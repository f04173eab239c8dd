#include <gtest/gtest.h>
#include "FakeWorkbook.h"
#include <xlrelay/BatchHandle.h>
#include <xlrelay/Errors.h>
#include <atomic>
#include <future>

using namespace xlrelay;
using namespace std::chrono_literals;
using std::make_shared;
using std::string;
using std::vector;

namespace Tests
{
  namespace
  {
    const std::filesystem::path theBookPath = std::filesystem::absolute("book.xlsx");

    ExecuteOptions withTimeout(std::chrono::milliseconds timeout)
    {
      ExecuteOptions options;
      options.timeout = timeout;
      return options;
    }

    template<class F>
    auto elapsed(F&& func)
    {
      auto start = std::chrono::steady_clock::now();
      func();
      return std::chrono::steady_clock::now() - start;
    }
  }

  TEST(BatchHandle, AllWorkRunsOnOneDedicatedThread)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);

    batch->execute([](Workbook& wb) { wb.addSheet("Data"); });
    batch->execute([](Workbook& wb) { return wb.sheetNames(); });
    batch->save();
    batch->close();

    auto threads = factory->threads();
    ASSERT_EQ(1u, threads.size());
    EXPECT_NE(std::this_thread::get_id(), *threads.begin());
  }

  TEST(BatchHandle, ExecuteReturnsResultsAndErrors)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);

    auto sheets = batch->execute([](Workbook& wb) { return wb.sheetNames(); });
    EXPECT_EQ(vector<string>{ "Sheet1" }, sheets);

    EXPECT_THROW(batch->execute([](Workbook& wb) { wb.deleteSheet("Missing"); }), ArgumentError);

    // A failed operation does not invalidate the batch
    EXPECT_TRUE(batch->valid());
    EXPECT_EQ(2, batch->execute([](Workbook&) { return 2; }));
  }

  TEST(BatchHandle, SavePersistsExactlyThePrecedingMutations)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);

    batch->execute([](Workbook& wb) { wb.writeRange("Sheet1", "A1", { { 1.0 } }); });
    batch->execute([](Workbook& wb) { wb.writeRange("Sheet1", "A2", { { 2.0 } }); });
    EXPECT_TRUE(batch->dirty());
    batch->save();
    EXPECT_FALSE(batch->dirty());

    batch->execute([](Workbook& wb) { wb.writeRange("Sheet1", "A3", { { 3.0 } }); });
    EXPECT_TRUE(batch->dirty());

    auto saved = factory->saved(theBookPath);
    EXPECT_EQ(1u, saved.ranges.count("Sheet1!A1"));
    EXPECT_EQ(1u, saved.ranges.count("Sheet1!A2"));
    EXPECT_EQ(0u, saved.ranges.count("Sheet1!A3"));

    // Nothing is saved implicitly
    batch->close();
    EXPECT_EQ(0u, factory->saved(theBookPath).ranges.count("Sheet1!A3"));
  }

  TEST(BatchHandle, ReadOnlyOperationsDoNotDirtyTheBatch)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);

    ExecuteOptions readOnly;
    readOnly.readOnly = true;
    batch->execute([](Workbook& wb) { return wb.sheetNames(); }, readOnly);
    EXPECT_FALSE(batch->dirty());
  }

  TEST(BatchHandle, TimeoutMarksHandleForHealthCheck)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    BatchOptions options;
    options.operationTimeout = 100ms;
    auto batch = BatchHandle::open(theBookPath, factory, options);

    auto took = elapsed([&]()
    {
      EXPECT_THROW(
        batch->execute([](Workbook&) { std::this_thread::sleep_for(400ms); }),
        OperationTimeoutError);
    });
    EXPECT_LT(took, 350ms);

    // The handle survived, so the health check passes and work continues
    EXPECT_EQ(1, batch->execute([](Workbook&) { return 1; }, withTimeout(5s)));
    EXPECT_TRUE(batch->valid());

    // This time the handle dies while the operation is running
    EXPECT_THROW(
      batch->execute([](Workbook&) { std::this_thread::sleep_for(300ms); }),
      OperationTimeoutError);
    factory->kill(theBookPath);
    EXPECT_THROW(
      batch->execute([](Workbook&) { return 1; }, withTimeout(5s)),
      HandleInvalidatedError);
    EXPECT_FALSE(batch->valid());
  }

  TEST(BatchHandle, TimedOutOperationWhichHasNotStartedIsCancelled)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);

    std::promise<void> started;
    auto first = std::async(std::launch::async, [&]()
    {
      batch->execute([&started](Workbook&)
      {
        started.set_value();
        std::this_thread::sleep_for(300ms);
      }, withTimeout(5s));
    });
    started.get_future().wait();

    auto ran = make_shared<std::atomic<bool>>(false);
    EXPECT_THROW(
      batch->execute([ran](Workbook&) { *ran = true; }, withTimeout(50ms)),
      OperationTimeoutError);

    first.get();
    batch->execute([](Workbook&) {}, withTimeout(5s));
    EXPECT_FALSE(ran->load());
  }

  TEST(BatchHandle, RequestedTimeoutIsCapped)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    BatchOptions options;
    options.maxOperationTimeout = 200ms;
    auto batch = BatchHandle::open(theBookPath, factory, options);

    auto took = elapsed([&]()
    {
      EXPECT_THROW(
        batch->execute([](Workbook&) { std::this_thread::sleep_for(800ms); }, withTimeout(60s)),
        OperationTimeoutError);
    });
    EXPECT_LT(took, 700ms);
  }

  TEST(BatchHandle, CloseQueuesBehindInFlightWork)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);

    std::promise<void> started;
    std::atomic<bool> finished(false);
    auto running = std::async(std::launch::async, [&]()
    {
      batch->execute([&](Workbook& wb)
      {
        started.set_value();
        std::this_thread::sleep_for(200ms);
        wb.calculate();
        finished = true;
      });
    });
    started.get_future().wait();

    batch->close();
    EXPECT_TRUE(finished.load());
    running.get();

    auto calls = factory->calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ("calculate", calls[calls.size() - 2]);
    EXPECT_EQ("close", calls.back());

    EXPECT_EQ(BatchHandle::State::Closed, batch->state());
    EXPECT_FALSE(batch->valid());
    EXPECT_THROW(batch->execute([](Workbook&) {}), HandleInvalidatedError);

    // Idempotent
    batch->close(true);
    EXPECT_EQ(1, factory->closeCount());
  }

  TEST(BatchHandle, CloseWithSaveCommitsTheBatch)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);
    batch->execute([](Workbook& wb) { wb.addSheet("Results"); });
    batch->close(true);

    auto saved = factory->saved(theBookPath);
    EXPECT_EQ((vector<string>{ "Sheet1", "Results" }), saved.sheets);
  }

  TEST(BatchHandle, FailingSaveStillReleasesTheHandle)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);
    batch->execute([](Workbook& wb) { wb.addSheet("Results"); });

    factory->setFailSave(true);
    EXPECT_THROW(batch->save(), SaveConflictError);
    EXPECT_TRUE(batch->valid());
    EXPECT_TRUE(batch->dirty());

    EXPECT_THROW(batch->close(true), SaveConflictError);
    EXPECT_EQ(1, factory->closeCount());
    EXPECT_EQ(BatchHandle::State::Closed, batch->state());
  }

  TEST(BatchHandle, KilledHandleFailsPromptly)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);
    batch->execute([](Workbook& wb) { wb.calculate(); });

    factory->kill(theBookPath);
    auto took = elapsed([&]()
    {
      EXPECT_THROW(batch->execute([](Workbook& wb) { wb.calculate(); }), HandleInvalidatedError);
    });
    EXPECT_LT(took, 1s);
    EXPECT_FALSE(batch->valid());

    // Known dead: fails without reaching the workbook
    const auto callsBefore = factory->calls().size();
    EXPECT_THROW(batch->execute([](Workbook& wb) { wb.calculate(); }), HandleInvalidatedError);
    EXPECT_THROW(batch->save(), HandleInvalidatedError);
    EXPECT_EQ(callsBefore, factory->calls().size());

    batch->close();
    EXPECT_EQ(1, factory->closeCount());
  }

  TEST(BatchHandle, CloseWithSaveOnDeadHandleFails)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    auto batch = BatchHandle::open(theBookPath, factory);
    batch->execute([](Workbook& wb) { wb.addSheet("Results"); });

    factory->kill(theBookPath);
    EXPECT_THROW(batch->execute([](Workbook& wb) { wb.calculate(); }), HandleInvalidatedError);
    ASSERT_FALSE(batch->valid());

    EXPECT_THROW(batch->close(true), HandleInvalidatedError);
    EXPECT_EQ(1, factory->closeCount());
    EXPECT_EQ(BatchHandle::State::Closed, batch->state());
    EXPECT_EQ(vector<string>{ "Sheet1" }, factory->saved(theBookPath).sheets);
  }

  TEST(BatchHandle, OpenFailurePropagates)
  {
    auto factory = make_shared<FakeWorkbookFactory>();
    factory->setFailOpen(true);
    EXPECT_THROW(BatchHandle::open(theBookPath, factory), AutomationError);
  }
}
