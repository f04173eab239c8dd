#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace xlrelay
{
  namespace detail
  {
    template<typename F, class ReturnType>
    auto packagedFunction(F&& f, const std::shared_ptr<std::promise<ReturnType>>& result)
    {
      return std::function<void()>([result, f = std::forward<F>(f)]() mutable
      {
        try
        {
          result->set_value(f());
        }
        catch (...)
        {
          result->set_exception(std::current_exception());
        }
      });
    }

    template<typename F>
    auto packagedFunction(F&& f, const std::shared_ptr<std::promise<void>>& result)
    {
      return std::function<void()>([result, f = std::forward<F>(f)]() mutable
      {
        try
        {
          f();
          result->set_value();
        }
        catch (...)
        {
          result->set_exception(std::current_exception());
        }
      });
    }
  }

  /// <summary>
  /// A dedicated worker thread with a FIFO work queue. Native automation 
  /// objects live in a single-threaded apartment, so every call touching one
  /// must be made on the thread which created it: each open workbook owns one
  /// of these and all work against it is marshalled here.
  /// </summary>
  class AffinityThread
  {
  public:
    explicit AffinityThread(std::string name);
    ~AffinityThread();

    AffinityThread(const AffinityThread&) = delete;
    AffinityThread& operator=(const AffinityThread&) = delete;

    /// <summary>
    /// Schedules `func` to run on this thread after all previously scheduled
    /// items. If called from this thread, `func` is executed immediately, since
    /// queuing would deadlock a caller waiting on the result.
    /// </summary>
    /// <returns>A std::future which contains the result of the function</returns>
    template<typename F>
    auto run(F&& func) -> std::future<decltype(func())>
    {
      using returnType = decltype(func());
      auto result = std::make_shared<std::promise<returnType>>();
      auto packaged = detail::packagedFunction(std::forward<F>(func), result);
      if (isCurrentThread())
        packaged();
      else
        post(std::move(packaged));
      return result->get_future();
    }

    /// <summary>
    /// Appends an item to the queue. Throws if the thread has been stopped.
    /// Exceptions escaping `item` are logged and discarded, so prefer `run`.
    /// </summary>
    void post(std::function<void()>&& item);

    bool isCurrentThread() const noexcept;

    /// <summary>
    /// Stops accepting new work, runs any items already queued and joins the 
    /// thread. If the thread has not finished within `timeout` it is detached
    /// and false is returned: queued items will still run when the blocking item
    /// returns.
    /// </summary>
    bool stop(std::chrono::milliseconds timeout);

    bool stopped() const noexcept;

    /// <summary>
    /// Number of items queued or running
    /// </summary>
    size_t pending() const noexcept;

    const std::string& name() const noexcept { return _name; }

  private:
    struct State;
    static void workerLoop(const std::shared_ptr<State>& state, const std::string& name);

    std::string _name;
    std::shared_ptr<State> _state;
    std::thread _thread;
  };
}
