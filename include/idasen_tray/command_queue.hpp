#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace idasen_tray {

// Single worker thread draining commands in FIFO order.
class CommandQueue {
public:
  using Command = std::function<void()>;

  CommandQueue();
  ~CommandQueue();

  CommandQueue(const CommandQueue &) = delete;
  CommandQueue & operator=(const CommandQueue &) = delete;

  // Returns false once the queue is stopped; the command is dropped.
  // A command that throws is logged and the worker moves on to the next one.
  bool post(Command command);

  // Runs fn on the worker and exposes its result. A future whose command was
  // dropped by stop() reports std::future_errc::broken_promise.
  template<typename Fn>
  std::future<typename std::invoke_result<Fn>::type> submit(Fn fn)
  {
    using Result = typename std::invoke_result<Fn>::type;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    auto future = task->get_future();
    post([task]() { (*task)(); });
    return future;
  }

  // Drops pending commands and joins the worker. Safe to call twice.
  void stop();

private:
  void run();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Command> pending_;
  bool stopping_{false};
  std::thread worker_;
};

} // namespace idasen_tray
