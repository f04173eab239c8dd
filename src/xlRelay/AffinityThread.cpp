#include <xlrelay/AffinityThread.h>
#include <xlrelay/Log.h>
#include <xlrelay/Throw.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

using std::string;
using std::shared_ptr;
using std::make_shared;
using std::unique_lock;
using std::mutex;

namespace xlrelay
{
  struct AffinityThread::State
  {
    mutex lock;
    std::condition_variable signal;
    std::deque<std::function<void()>> queue;
    bool stopping = false;
    std::atomic<size_t> pending{ 0 };
    std::atomic<std::thread::id> threadId{ std::thread::id() };
    std::promise<void> exited;
  };

  void AffinityThread::workerLoop(const shared_ptr<State>& state, const string& name)
  {
    state->threadId = std::this_thread::get_id();
    XLR_DEBUG("Affinity thread '{}' started", name);

    while (true)
    {
      std::function<void()> item;
      {
        unique_lock<mutex> lock(state->lock);
        state->signal.wait(lock, [&]() { return state->stopping || !state->queue.empty(); });
        // Drain the queue before honouring a stop
        if (state->queue.empty())
          break;
        item = std::move(state->queue.front());
        state->queue.pop_front();
      }
      try
      {
        item();
      }
      catch (const std::exception& e)
      {
        XLR_ERROR("Affinity thread '{}': {}", name, e.what());
      }
      --state->pending;
    }

    XLR_DEBUG("Affinity thread '{}' finished", name);
    state->exited.set_value();
  }

  AffinityThread::AffinityThread(string name)
    : _name(std::move(name))
    , _state(make_shared<State>())
  {
    _thread = std::thread([state = _state, name = _name]() { workerLoop(state, name); });
  }

  AffinityThread::~AffinityThread()
  {
    if (_thread.joinable())
      stop(std::chrono::seconds(15));
  }

  void AffinityThread::post(std::function<void()>&& item)
  {
    {
      std::lock_guard<mutex> lock(_state->lock);
      if (_state->stopping)
        XLR_THROW("Affinity thread '{}' has been stopped", _name);
      ++_state->pending;
      _state->queue.emplace_back(std::move(item));
    }
    _state->signal.notify_one();
  }

  bool AffinityThread::isCurrentThread() const noexcept
  {
    return _state->threadId.load() == std::this_thread::get_id();
  }

  bool AffinityThread::stop(std::chrono::milliseconds timeout)
  {
    {
      std::lock_guard<mutex> lock(_state->lock);
      _state->stopping = true;
    }
    _state->signal.notify_one();

    if (!_thread.joinable())
      return true;

    if (isCurrentThread())
    {
      // Cannot join ourselves; the loop exits once this item returns
      _thread.detach();
      return true;
    }

    auto exited = _state->exited.get_future();
    if (exited.wait_for(timeout) == std::future_status::timeout)
    {
      XLR_ERROR("Affinity thread '{}' did not stop within {} ms, detaching it with {} item(s) pending",
        _name, timeout.count(), _state->pending.load());
      _thread.detach();
      return false;
    }
    _thread.join();
    return true;
  }

  bool AffinityThread::stopped() const noexcept
  {
    std::lock_guard<mutex> lock(_state->lock);
    return _state->stopping;
  }

  size_t AffinityThread::pending() const noexcept
  {
    return _state->pending;
  }
}
