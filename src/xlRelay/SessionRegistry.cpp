#include <xlrelay/SessionRegistry.h>
#include <xlrelay/Errors.h>
#include <xlrelay/Log.h>
#include <xlrelay/StringUtils.h>
#include <xlrelay/Throw.h>
#include <xlRelayHelpers/GuidUtils.h>

using std::string;
using std::vector;
using std::shared_ptr;
using std::optional;
using std::chrono::milliseconds;
using std::chrono::duration_cast;
namespace fs = std::filesystem;

namespace xlrelay
{
  namespace
  {
    bool isOneOf(const string& ext, std::initializer_list<const char*> choices)
    {
      for (auto c : choices)
        if (ext == c)
          return true;
      return false;
    }

    string pathKey(const fs::path& path)
    {
#ifdef _WIN32
      return toLower(path.string());
#else
      return path.string();
#endif
    }
  }

  SessionRegistry::SessionRegistry(
    std::shared_ptr<WorkbookFactory> factory,
    const SessionOptions& options)
    : _factory(std::move(factory))
    , _options(options)
  {
    if (!_factory)
      XLR_THROW("SessionRegistry requires a workbook factory");

    if (_options.idleTimeout.count() > 0 && _options.sweepInterval.count() > 0)
      _sweeper = std::thread([this]() { sweepLoop(); });
  }

  SessionRegistry::~SessionRegistry()
  {
    {
      std::lock_guard<std::mutex> lock(_sweepLock);
      _stopSweep = true;
    }
    _sweepSignal.notify_all();
    if (_sweeper.joinable())
      _sweeper.join();

    closeAll();
  }

  fs::path SessionRegistry::resolvePath(const string& filePath) const
  {
    if (trim(filePath).empty())
      XLR_THROW_TYPE(ArgumentError, "filePath is required");

    std::error_code err;
    auto path = fs::absolute(fs::path(filePath), err);
    if (err)
      XLR_THROW_TYPE(ArgumentError, "Invalid file path '{}': {}", filePath, err.message());
    return path.lexically_normal();
  }

  BatchOptions SessionRegistry::batchOptions(optional<milliseconds> operationTimeout) const
  {
    auto result = _options.batch;
    if (operationTimeout && operationTimeout->count() > 0)
      result.operationTimeout = std::min(*operationTimeout, result.maxOperationTimeout);
    return result;
  }

  string SessionRegistry::reservePath(const fs::path& path)
  {
    auto key = pathKey(path);
    std::lock_guard<std::mutex> lock(_lock);
    if (_boundPaths.count(key) > 0)
    {
      for (auto& [id, entry] : _sessions)
        if (entry.key == key)
          XLR_THROW_TYPE(AlreadyOpenConflictError,
            "'{}' is already open in session {}", path.string(), id);
      XLR_THROW_TYPE(AlreadyOpenConflictError,
        "'{}' is being opened or closed by another session", path.string());
    }
    _boundPaths.insert(key);
    return key;
  }

  void SessionRegistry::releasePath(const string& key)
  {
    std::lock_guard<std::mutex> lock(_lock);
    _boundPaths.erase(key);
  }

  string SessionRegistry::add(
    const string& key,
    const fs::path& path,
    shared_ptr<BatchHandle>&& batch)
  {
    Entry entry;
    entry.id = newSessionToken();
    entry.key = key;
    entry.path = path;
    entry.created = std::chrono::system_clock::now();
    entry.batch = std::move(batch);

    auto id = entry.id;
    {
      std::lock_guard<std::mutex> lock(_lock);
      _sessions.emplace(id, std::move(entry));
    }
    XLR_INFO("Session {} opened for '{}'", id, path.string());
    return id;
  }

  string SessionRegistry::open(
    const string& filePath,
    optional<milliseconds> operationTimeout)
  {
    auto path = resolvePath(filePath);

    std::error_code err;
    if (!fs::exists(path, err))
      XLR_THROW_TYPE(FileNotFoundError, "File not found: {}", path.string());

    const auto ext = toLower(path.extension().string());
    if (!isOneOf(ext, { ".xlsx", ".xlsm", ".xls", ".xlsb" }))
      XLR_THROW_TYPE(ArgumentError,
        "Unsupported file type '{}': expected .xlsx, .xlsm, .xls or .xlsb", ext);

    auto canonical = fs::canonical(path, err);
    if (!err)
      path = canonical;

    auto key = reservePath(path);
    shared_ptr<BatchHandle> batch;
    try
    {
      batch = BatchHandle::open(path, _factory, batchOptions(operationTimeout));
    }
    catch (const std::exception&)
    {
      releasePath(key);
      throw;
    }
    return add(key, path, std::move(batch));
  }

  string SessionRegistry::create(
    const string& filePath,
    optional<milliseconds> operationTimeout)
  {
    auto path = resolvePath(filePath);

    const auto ext = toLower(path.extension().string());
    if (!isOneOf(ext, { ".xlsx", ".xlsm" }))
      XLR_THROW_TYPE(ArgumentError,
        "Unsupported file type '{}' for a new workbook: expected .xlsx or .xlsm", ext);

    std::error_code err;
    if (fs::exists(path, err))
      XLR_THROW_TYPE(ArgumentError, "File already exists: {}", path.string());

    if (path.has_parent_path() && !fs::exists(path.parent_path(), err))
    {
      fs::create_directories(path.parent_path(), err);
      if (err)
        XLR_THROW_TYPE(WorkbookIOError, "Cannot create directory '{}': {}",
          path.parent_path().string(), err.message());
    }

    auto key = reservePath(path);
    shared_ptr<BatchHandle> batch;
    try
    {
      batch = BatchHandle::create(path, _factory, ext == ".xlsm", batchOptions(operationTimeout));
    }
    catch (const std::exception&)
    {
      releasePath(key);
      throw;
    }
    return add(key, path, std::move(batch));
  }

  shared_ptr<BatchHandle> SessionRegistry::getBatch(const string& sessionId)
  {
    std::lock_guard<std::mutex> lock(_lock);
    auto found = _sessions.find(sessionId);
    if (found == _sessions.end())
      XLR_THROW_TYPE(UnknownSessionError,
        "Session '{}' not found; it may have been closed or timed out", sessionId);
    found->second.batch->touch();
    return found->second.batch;
  }

  void SessionRegistry::save(const string& sessionId, optional<milliseconds> timeout)
  {
    getBatch(sessionId)->save(timeout);
  }

  bool SessionRegistry::close(const string& sessionId, bool save)
  {
    Entry entry;
    {
      std::lock_guard<std::mutex> lock(_lock);
      auto found = _sessions.find(sessionId);
      if (found == _sessions.end())
        return false;
      entry = std::move(found->second);
      _sessions.erase(found);
    }

    XLR_INFO("Closing session {} for '{}'", sessionId, entry.path.string());
    try
    {
      entry.batch->close(save);
    }
    catch (const std::exception&)
    {
      releasePath(entry.key);
      throw;
    }
    releasePath(entry.key);
    return true;
  }

  void SessionRegistry::closeAll() noexcept
  {
    vector<string> ids;
    {
      std::lock_guard<std::mutex> lock(_lock);
      for (auto& [id, entry] : _sessions)
        ids.push_back(id);
    }
    // Sequentially: each close may wait for a slow native release
    for (auto& id : ids)
    {
      try
      {
        close(id, false);
      }
      catch (const std::exception& e)
      {
        XLR_ERROR("Error closing session {}: {}", id, e.what());
      }
    }
  }

  vector<SessionInfo> SessionRegistry::sessions() const
  {
    const auto now = BatchHandle::Clock::now();
    vector<SessionInfo> result;
    std::lock_guard<std::mutex> lock(_lock);
    for (auto& [id, entry] : _sessions)
    {
      auto& batch = *entry.batch;
      result.push_back(SessionInfo{
        id,
        entry.path.string(),
        batch.state(),
        batch.dirty(),
        batch.pending(),
        entry.created,
        duration_cast<milliseconds>(now - batch.lastActivity())
      });
    }
    return result;
  }

  size_t SessionRegistry::count() const
  {
    std::lock_guard<std::mutex> lock(_lock);
    return _sessions.size();
  }

  size_t SessionRegistry::evictIdle()
  {
    if (_options.idleTimeout.count() <= 0)
      return 0;

    const auto now = BatchHandle::Clock::now();
    vector<string> expired;
    {
      std::lock_guard<std::mutex> lock(_lock);
      for (auto& [id, entry] : _sessions)
      {
        auto& batch = *entry.batch;
        if (batch.pending() == 0 && now - batch.lastActivity() > _options.idleTimeout)
          expired.push_back(id);
      }
    }

    size_t evicted = 0;
    for (auto& id : expired)
    {
      std::shared_ptr<BatchHandle> batch;
      {
        // Re-check: a request may have arrived since the scan
        std::lock_guard<std::mutex> lock(_lock);
        auto found = _sessions.find(id);
        if (found == _sessions.end())
          continue;
        batch = found->second.batch;
        if (batch->pending() > 0 || now - batch->lastActivity() <= _options.idleTimeout)
          continue;
      }

      if (batch->dirty())
        XLR_WARN("Session {} for '{}' timed out with unsaved changes{}", id,
          batch->path().string(), _options.saveOnEvict ? "; saving" : " which will be discarded");
      else
        XLR_INFO("Session {} for '{}' timed out", id, batch->path().string());

      try
      {
        if (close(id, _options.saveOnEvict && batch->dirty()))
          ++evicted;
      }
      catch (const std::exception& e)
      {
        ++evicted;
        XLR_ERROR("Error evicting session {}: {}", id, e.what());
      }
    }
    return evicted;
  }

  void SessionRegistry::sweepLoop()
  {
    std::unique_lock<std::mutex> lock(_sweepLock);
    while (!_sweepSignal.wait_for(lock, _options.sweepInterval, [this]() { return _stopSweep; }))
    {
      lock.unlock();
      try
      {
        evictIdle();
      }
      catch (const std::exception& e)
      {
        XLR_ERROR("Idle session sweep failed: {}", e.what());
      }
      lock.lock();
    }
  }
}
