#pragma once
#include <xlrelay/BatchHandle.h>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace xlrelay
{
  struct SessionOptions
  {
    /// Sessions without activity for this long are closed. Zero disables eviction.
    std::chrono::milliseconds idleTimeout = std::chrono::minutes(30);
    /// How often the sweeper looks for idle sessions. Zero disables the sweeper
    /// thread; evictIdle can still be called directly.
    std::chrono::milliseconds sweepInterval = std::chrono::seconds(30);
    /// Save dirty workbooks before evicting them rather than discarding changes
    bool saveOnEvict = false;
    BatchOptions batch;
  };

  struct SessionInfo
  {
    std::string sessionId;
    std::string filePath;
    BatchHandle::State state;
    bool dirty;
    size_t pendingOperations;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::milliseconds idleFor;
  };

  /// <summary>
  /// Maps opaque session tokens to open workbooks. A file can be bound to at
  /// most one session at a time. The map lock is only held for lookups and 
  /// updates: opening, saving and closing workbooks happen on the batch's own
  /// thread.
  /// </summary>
  class SessionRegistry
  {
  public:
    SessionRegistry(
      std::shared_ptr<WorkbookFactory> factory,
      const SessionOptions& options = SessionOptions());

    /// <summary>
    /// Stops the sweeper then closes all sessions without saving
    /// </summary>
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// <summary>
    /// Opens an existing workbook in a new session and returns its id.
    /// Throws FileNotFoundError, ArgumentError for unsupported file types and
    /// AlreadyOpenConflictError if the file is bound to another session.
    /// </summary>
    std::string open(
      const std::string& filePath,
      std::optional<std::chrono::milliseconds> operationTimeout = std::nullopt);

    /// <summary>
    /// Creates and saves a new empty workbook then opens a session on it.
    /// Throws ArgumentError if the file exists or is not .xlsx or .xlsm.
    /// </summary>
    std::string create(
      const std::string& filePath,
      std::optional<std::chrono::milliseconds> operationTimeout = std::nullopt);

    /// <summary>
    /// Throws UnknownSessionError if the id is not registered
    /// </summary>
    std::shared_ptr<BatchHandle> getBatch(const std::string& sessionId);

    void save(
      const std::string& sessionId,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// <summary>
    /// Removes the session then closes its workbook, waiting for operations
    /// already submitted. Returns false if the session did not exist. If 
    /// the save fails the workbook is still closed and the error is rethrown.
    /// </summary>
    bool close(const std::string& sessionId, bool save = false);

    void closeAll() noexcept;

    std::vector<SessionInfo> sessions() const;

    size_t count() const;

    /// <summary>
    /// Closes sessions which have been idle for longer than the idle timeout
    /// and have no pending operations. Returns the number closed.
    /// </summary>
    size_t evictIdle();

    const SessionOptions& options() const noexcept { return _options; }

  private:
    struct Entry
    {
      std::string id;
      std::string key;
      std::filesystem::path path;
      std::chrono::system_clock::time_point created;
      std::shared_ptr<BatchHandle> batch;
    };

    std::filesystem::path resolvePath(const std::string& filePath) const;
    std::string reservePath(const std::filesystem::path& path);
    void releasePath(const std::string& key);
    std::string add(
      const std::string& key,
      const std::filesystem::path& path,
      std::shared_ptr<BatchHandle>&& batch);
    BatchOptions batchOptions(std::optional<std::chrono::milliseconds> operationTimeout) const;
    void sweepLoop();

    std::shared_ptr<WorkbookFactory> _factory;
    SessionOptions _options;

    mutable std::mutex _lock;
    std::map<std::string, Entry> _sessions;
    /// Normalised paths of open or opening workbooks
    std::set<std::string> _boundPaths;

    std::mutex _sweepLock;
    std::condition_variable _sweepSignal;
    bool _stopSweep = false;
    std::thread _sweeper;
  };
}
