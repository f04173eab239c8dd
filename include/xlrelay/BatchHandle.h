#pragma once
#include <xlrelay/AffinityThread.h>
#include <xlrelay/Workbook.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

namespace xlrelay
{
  struct BatchOptions
  {
    /// Used when an operation does not specify a timeout
    std::chrono::milliseconds operationTimeout = std::chrono::minutes(2);
    /// Upper bound on any caller supplied timeout
    std::chrono::milliseconds maxOperationTimeout = std::chrono::minutes(5);
    std::chrono::milliseconds saveTimeout = std::chrono::minutes(2);
    /// How long close waits for queued work and the native release
    std::chrono::milliseconds closeTimeout = std::chrono::seconds(15);
  };

  struct ExecuteOptions
  {
    std::optional<std::chrono::milliseconds> timeout;
    /// Read only operations do not mark the batch dirty
    bool readOnly = false;
    /// Names the operation in logs and error messages
    std::string description;
  };

  /// <summary>
  /// One open workbook and the dedicated affinity thread which owns its native
  /// handle. Operations are executed strictly in submission order, so a save
  /// persists exactly the mutations submitted before it.
  /// 
  /// Mutations are never saved implicitly: call save() to commit the batch.
  /// </summary>
  class BatchHandle
  {
  public:
    enum class State { Idle, Busy, Closed };

    using Clock = std::chrono::steady_clock;

    /// <summary>
    /// Opens an existing workbook. The factory is called on the new batch's 
    /// affinity thread. Throws whatever the factory throws.
    /// </summary>
    static std::shared_ptr<BatchHandle> open(
      const std::filesystem::path& path,
      const std::shared_ptr<WorkbookFactory>& factory,
      const BatchOptions& options = BatchOptions());

    /// <summary>
    /// Creates a new workbook at `path`, see WorkbookFactory::create
    /// </summary>
    static std::shared_ptr<BatchHandle> create(
      const std::filesystem::path& path,
      const std::shared_ptr<WorkbookFactory>& factory,
      bool macroEnabled,
      const BatchOptions& options = BatchOptions());

    ~BatchHandle();

    BatchHandle(const BatchHandle&) = delete;
    BatchHandle& operator=(const BatchHandle&) = delete;

    /// <summary>
    /// Runs `op(Workbook&)` on the affinity thread and returns its result. The
    /// operation must be copyable.
    /// 
    /// Throws OperationTimeoutError if the operation does not complete within
    /// the timeout: an operation which has already started keeps running and
    /// the workbook's health is checked before the next operation. Throws 
    /// HandleInvalidatedError immediately if the native handle is known to be
    /// dead or the batch is closed.
    /// </summary>
    template<class F>
    auto execute(F&& op, const ExecuteOptions& options = ExecuteOptions())
      -> decltype(op(std::declval<Workbook&>()))
    {
      using result_t = decltype(op(std::declval<Workbook&>()));
      if constexpr (std::is_void_v<result_t>)
      {
        submit(std::function<void(Workbook&)>(std::forward<F>(op)), options, Kind::Operation);
      }
      else
      {
        auto result = std::make_shared<std::optional<result_t>>();
        submit([result, op = std::forward<F>(op)](Workbook& wb) mutable
          {
            result->emplace(op(wb));
          },
          options, Kind::Operation);
        return std::move(**result);
      }
    }

    /// <summary>
    /// Commits all preceding operations to disk. Throws SaveConflictError if 
    /// the file is locked or read-only, WorkbookIOError for other failures.
    /// </summary>
    void save(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// <summary>
    /// Optionally saves, then releases the native handle and stops the affinity
    /// thread. The close is queued behind any operations already submitted. The
    /// native handle is released even if the save fails, in which case the save 
    /// error is rethrown afterwards. Subsequent calls are no-ops.
    /// </summary>
    void close(bool save = false);

    const std::filesystem::path& path() const noexcept { return _path; }

    State state() const noexcept;

    /// <summary>
    /// True if operations have run since the last successful save
    /// </summary>
    bool dirty() const noexcept;

    /// <summary>
    /// False once closed or once the native handle is known to be dead
    /// </summary>
    bool valid() const noexcept;

    /// <summary>
    /// Operations queued or running
    /// </summary>
    size_t pending() const noexcept;

    Clock::time_point lastActivity() const noexcept;

    void touch() noexcept;

    const BatchOptions& options() const noexcept { return _options; }

    struct Shared;

  private:
    enum class Kind { Operation, Save };

    BatchHandle(const std::filesystem::path& path, const BatchOptions& options);

    void start(std::function<std::unique_ptr<Workbook>()>&& make);

    void submit(
      std::function<void(Workbook&)>&& op,
      const ExecuteOptions& options,
      Kind kind);

    std::chrono::milliseconds effectiveTimeout(
      const std::optional<std::chrono::milliseconds>& requested,
      std::chrono::milliseconds fallback) const;

    std::filesystem::path _path;
    BatchOptions _options;
    std::shared_ptr<Shared> _shared;
    AffinityThread _thread;
    std::mutex _closeLock;
    std::atomic<bool> _closed;
  };
}
