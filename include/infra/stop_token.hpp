#pragma once
#include <atomic>

/*
    StopSource / StopToken: cooperative shutdown for the whole counter.

    The app owns one StopSource and every stage gets a StopToken, a read-only view of it, which it checks between
    frames. A frame that is already being counted always finishes, so a stop never leaves a half-applied cycle behind.

    The first request_stop() also records why the counter is shutting down (SIGINT, end of input, a failed stage).
    Later requests don't overwrite it.

    Each stage also has its own local stop flag (see ThreadRunner) for stopping just that stage.
*/

namespace pcc {

enum class StopReason {
  None,
  Interrupted,
  EndOfInput,
  StageFailed
};

inline const char* ToString(StopReason r) {
  switch (r) {
    case StopReason::None: return "running";
    case StopReason::Interrupted: return "interrupted";
    case StopReason::EndOfInput: return "end of input";
    case StopReason::StageFailed: return "stage failed";
  }
  return "unknown";
}

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop(StopReason reason = StopReason::Interrupted) {
    StopReason expected = StopReason::None;
    reason_.compare_exchange_strong(expected, reason, std::memory_order_relaxed);
    stop_.store(true, std::memory_order_relaxed);
  }

  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

  StopReason reason() const { return reason_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool stop_{false};
  std::atomic<StopReason> reason_{StopReason::None};
};

} // namespace pcc
