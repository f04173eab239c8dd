#include <xlrelay/BatchHandle.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/Throw.h>

using std::string;
using std::shared_ptr;
using std::make_shared;
using std::unique_ptr;
using std::chrono::milliseconds;
using std::chrono::duration_cast;
namespace fs = std::filesystem;

namespace xlrelay
{
  struct BatchHandle::Shared
  {
    string name;
    unique_ptr<Workbook> workbook;
    std::atomic<bool> dead{ false };
    std::atomic<bool> needsHealthCheck{ false };
    std::atomic<bool> dirty{ false };
    std::atomic<size_t> inFlight{ 0 };
    std::atomic<Clock::rep> lastActivity{ 0 };

    void touch() noexcept
    {
      lastActivity = Clock::now().time_since_epoch().count();
    }
  };

  namespace
  {
    double seconds(milliseconds ms)
    {
      return ms.count() / 1000.0;
    }

    /// Decrements the in-flight count when an operation leaves the thread
    struct OperationScope
    {
      BatchHandle::Shared& shared;
      OperationScope(BatchHandle::Shared& s) : shared(s) {}
      ~OperationScope()
      {
        shared.touch();
        --shared.inFlight;
      }
    };

    void markDead(BatchHandle::Shared& shared, const char* reason)
    {
      if (!shared.dead.exchange(true))
        XLR_WARN("Workbook '{}' is no longer usable: {}", shared.name, reason);
    }

    void verifyHealth(BatchHandle::Shared& shared)
    {
      if (shared.dead)
        XLR_THROW_TYPE(HandleInvalidatedError,
          "Workbook '{}' is no longer available; close and reopen the session", shared.name);
      if (!shared.workbook)
        XLR_THROW_TYPE(HandleInvalidatedError, "Workbook '{}' has been released", shared.name);

      // An earlier operation timed out, so the native handle may have been 
      // left in any state. Probe it before trusting it with more work.
      if (shared.needsHealthCheck.exchange(false) && !shared.workbook->isAlive())
      {
        markDead(shared, "health check after a timed out operation failed");
        XLR_THROW_TYPE(HandleInvalidatedError,
          "Workbook '{}' did not survive a timed out operation; close and reopen the session",
          shared.name);
      }
    }

    /// Runs on the affinity thread. Foreign exceptions are reported as IO errors.
    void saveWorkbook(BatchHandle::Shared& shared)
    {
      try
      {
        shared.workbook->save();
      }
      catch (const HandleInvalidatedError& e)
      {
        markDead(shared, e.what());
        throw;
      }
      catch (const SaveConflictError&)
      {
        throw;
      }
      catch (const WorkbookIOError&)
      {
        throw;
      }
      catch (const std::exception& e)
      {
        XLR_THROW_TYPE(WorkbookIOError, "Saving '{}' failed: {}", shared.name, e.what());
      }
      shared.dirty = false;
    }

    void releaseWorkbook(BatchHandle::Shared& shared) noexcept
    {
      if (!shared.workbook)
        return;
      try
      {
        shared.workbook->close();
      }
      catch (const std::exception& e)
      {
        XLR_WARN("Error closing workbook '{}': {}", shared.name, e.what());
      }
      shared.workbook.reset();
      XLR_DEBUG("Released workbook '{}'", shared.name);
    }
  }

  BatchHandle::BatchHandle(const fs::path& path, const BatchOptions& options)
    : _path(path)
    , _options(options)
    , _shared(make_shared<Shared>())
    , _thread(path.filename().string())
    , _closed(false)
  {
    _shared->name = path.string();
    _shared->touch();
  }

  shared_ptr<BatchHandle> BatchHandle::open(
    const fs::path& path,
    const shared_ptr<WorkbookFactory>& factory,
    const BatchOptions& options)
  {
    shared_ptr<BatchHandle> batch(new BatchHandle(path, options));
    batch->start([factory, path]() { return factory->open(path); });
    return batch;
  }

  shared_ptr<BatchHandle> BatchHandle::create(
    const fs::path& path,
    const shared_ptr<WorkbookFactory>& factory,
    bool macroEnabled,
    const BatchOptions& options)
  {
    shared_ptr<BatchHandle> batch(new BatchHandle(path, options));
    batch->start([factory, path, macroEnabled]() { return factory->create(path, macroEnabled); });
    return batch;
  }

  void BatchHandle::start(std::function<unique_ptr<Workbook>()>&& make)
  {
    // If this throws, the caller's shared_ptr destroys the batch, which queues
    // a release behind the open and stops the thread.
    auto shared = _shared;
    auto opened = _thread.run([shared, make = std::move(make)]() 
    { 
      shared->workbook = make(); 
    });

    if (opened.wait_for(_options.maxOperationTimeout) == std::future_status::timeout)
      XLR_THROW_TYPE(OperationTimeoutError, "Opening '{}' did not complete within {} s",
        _shared->name, seconds(_options.maxOperationTimeout));
    opened.get();
    XLR_DEBUG("Opened workbook '{}'", _shared->name);
  }

  BatchHandle::~BatchHandle()
  {
    try
    {
      close(false);
    }
    catch (const std::exception& e)
    {
      XLR_ERROR("Error closing workbook '{}': {}", _shared->name, e.what());
    }
  }

  milliseconds BatchHandle::effectiveTimeout(
    const std::optional<milliseconds>& requested,
    milliseconds fallback) const
  {
    auto timeout = requested && requested->count() > 0 ? *requested : fallback;
    return std::min(timeout, _options.maxOperationTimeout);
  }

  void BatchHandle::submit(
    std::function<void(Workbook&)>&& op,
    const ExecuteOptions& options,
    Kind kind)
  {
    if (_closed)
      XLR_THROW_TYPE(HandleInvalidatedError, "Workbook '{}' has been closed", _shared->name);
    if (_shared->dead)
      XLR_THROW_TYPE(HandleInvalidatedError,
        "Workbook '{}' is no longer available; close and reopen the session", _shared->name);

    const auto timeout = effectiveTimeout(options.timeout,
      kind == Kind::Save ? _options.saveTimeout : _options.operationTimeout);
    const auto description = options.description.empty()
      ? string(kind == Kind::Save ? "save" : "operation")
      : options.description;

    auto shared = _shared;
    auto abandoned = make_shared<std::atomic<bool>>(false);
    const bool marksDirty = kind == Kind::Operation && !options.readOnly;

    ++shared->inFlight;
    shared->touch();

    std::future<void> done;
    try
    {
      done = _thread.run([shared, abandoned, op = std::move(op), marksDirty, kind, description]() mutable
      {
        OperationScope scope(*shared);
        if (*abandoned)
        {
          XLR_WARN("'{}' on '{}' was cancelled: its caller timed out before it started",
            description, shared->name);
          return;
        }
        verifyHealth(*shared);
        if (marksDirty)
          shared->dirty = true;
        try
        {
          if (kind == Kind::Save)
            saveWorkbook(*shared);
          else
            op(*shared->workbook);
        }
        catch (const HandleInvalidatedError& e)
        {
          markDead(*shared, e.what());
          throw;
        }
        catch (const std::exception& e)
        {
          if (*abandoned)
            XLR_WARN("'{}' on '{}' failed after its caller timed out: {}",
              description, shared->name, e.what());
          throw;
        }
        if (*abandoned)
          XLR_WARN("'{}' on '{}' completed after its caller timed out", description, shared->name);
      });
    }
    catch (const std::exception& e)
    {
      --shared->inFlight;
      XLR_THROW_TYPE(HandleInvalidatedError, "Workbook '{}' has been closed: {}", shared->name, e.what());
    }

    if (done.wait_for(timeout) == std::future_status::timeout)
    {
      abandoned->store(true);
      shared->needsHealthCheck = true;
      XLR_THROW_TYPE(OperationTimeoutError,
        "'{}' on '{}' did not complete within {} s; it may still be running",
        description, shared->name, seconds(timeout));
    }
    done.get();
  }

  void BatchHandle::save(std::optional<milliseconds> timeout)
  {
    ExecuteOptions options;
    options.timeout = timeout;
    options.readOnly = true;
    options.description = "save";
    submit([](Workbook&) {}, options, Kind::Save);
  }

  void BatchHandle::close(bool save)
  {
    std::lock_guard<std::mutex> lock(_closeLock);
    if (_closed.exchange(true))
      return;

    XLR_DEBUG("Closing workbook '{}'{}", _shared->name, save ? " with save" : "");

    auto shared = _shared;
    std::exception_ptr error;
    try
    {
      auto released = _thread.run([shared, save]()
      {
        std::exception_ptr saveError;
        if (save && shared->workbook && !shared->dead)
        {
          try
          {
            saveWorkbook(*shared);
          }
          catch (const std::exception&)
          {
            saveError = std::current_exception();
          }
        }
        else if (save)
        {
          saveError = std::make_exception_ptr(HandleInvalidatedError(fmt::format(
            "Workbook '{}' is no longer available and could not be saved", shared->name)));
        }
        if (shared->dirty)
          XLR_WARN("Discarding unsaved changes to '{}'", shared->name);
        releaseWorkbook(*shared);
        if (saveError)
          std::rethrow_exception(saveError);
      });

      if (released.wait_for(_options.closeTimeout) == std::future_status::timeout)
        XLR_ERROR("Closing '{}' did not complete within {} s; it will be released when "
          "the running operation returns", shared->name, seconds(_options.closeTimeout));
      else
        released.get();
    }
    catch (const std::exception&)
    {
      error = std::current_exception();
    }

    _thread.stop(_options.closeTimeout);

    if (error)
      std::rethrow_exception(error);
  }

  BatchHandle::State BatchHandle::state() const noexcept
  {
    if (_closed)
      return State::Closed;
    return _shared->inFlight > 0 ? State::Busy : State::Idle;
  }

  bool BatchHandle::dirty() const noexcept
  {
    return _shared->dirty;
  }

  bool BatchHandle::valid() const noexcept
  {
    return !_closed && !_shared->dead;
  }

  size_t BatchHandle::pending() const noexcept
  {
    return _shared->inFlight;
  }

  BatchHandle::Clock::time_point BatchHandle::lastActivity() const noexcept
  {
    return Clock::time_point(Clock::duration(_shared->lastActivity.load()));
  }

  void BatchHandle::touch() noexcept
  {
    _shared->touch();
  }
}
