#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread.
    It provides:
        - Consistent start/stop behavior
        - A local_stop flag for stopping the singular worker thread
        - Read-only access to a global_stop flag for stopping on entire system shutdowns
        - finished()/failed() so the owner can tell a worker that returned on its own (end of input) or died on an
          exception from one that is still running
*/

namespace pcc {

class ThreadRunner {
public:
  // Any callable that takes a global stop token and a local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws if already started
  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop. Does NOT affect other threads
  void request_stop();
  // True if either global or local stop flags are set
  bool stop_requested() const;

  void join();
  bool joinable() const;

  // Worker function has returned, normally or by exception
  bool finished() const { return finished_.load(std::memory_order_acquire); }
  // Worker function threw, error() holds the message
  bool failed() const { return failed_.load(std::memory_order_acquire); }
  std::string error() const;

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};    // Stops this thread only
  StopToken global_stop_{};               // View of the app-wide StopSource
  std::string name_{"thread"};

  std::atomic_bool finished_{false};
  std::atomic_bool failed_{false};
  mutable std::mutex error_mu_;
  std::string error_;
};

} // namespace pcc
