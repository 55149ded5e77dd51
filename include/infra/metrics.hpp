#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

/*
  Metrics owns one StageMetrics per stage. A stage updates its own counters from its worker thread with relaxed
  atomics; anyone may read them at any time. NowNs grabs the current steady time in nanoseconds.
*/

namespace pcc {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

struct StageMetrics {
  std::string name;

  std::atomic<std::uint64_t> items{0};            // Frames handled
  std::atomic<std::uint64_t> dropped_inputs{0};   // Inputs discarded before processing (rejected/filtered detections)
  std::atomic<std::uint64_t> avg_latency_ns{0};   // Exponential moving average, 1/8 weight for the newest sample
  std::atomic<std::uint64_t> max_latency_ns{0};
  std::atomic<std::uint64_t> blocked_ns_total{0}; // Time spent waiting on a full downstream queue
  std::atomic<std::uint64_t> last_event_ns{0};

  explicit StageMetrics(std::string n) : name(std::move(n)) {
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_item(std::uint64_t latency_ns, std::uint64_t dropped = 0) {
    items.fetch_add(1, std::memory_order_relaxed);
    if (dropped) dropped_inputs.fetch_add(dropped, std::memory_order_relaxed);

    auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    auto next = (prev == 0) ? latency_ns : (prev * 7 + latency_ns) / 8;
    avg_latency_ns.store(next, std::memory_order_relaxed);

    if (latency_ns > max_latency_ns.load(std::memory_order_relaxed))
      max_latency_ns.store(latency_ns, std::memory_order_relaxed);

    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_blocked(std::uint64_t waited_ns) {
    blocked_ns_total.fetch_add(waited_ns, std::memory_order_relaxed);
  }

  // One line for the shutdown report: "counting: 40 frames, avg 0.120 ms, max 0.900 ms, 2 inputs dropped"
  std::string describe() const {
    std::ostringstream oss;
    oss << name << ": " << items.load(std::memory_order_relaxed) << " frames, avg " << std::fixed
        << std::setprecision(3) << (static_cast<double>(avg_latency_ns.load(std::memory_order_relaxed)) / 1e6)
        << " ms, max " << (static_cast<double>(max_latency_ns.load(std::memory_order_relaxed)) / 1e6) << " ms";

    const std::uint64_t dropped = dropped_inputs.load(std::memory_order_relaxed);
    if (dropped) oss << ", " << dropped << " inputs dropped";

    const std::uint64_t blocked = blocked_ns_total.load(std::memory_order_relaxed);
    if (blocked) oss << ", blocked " << (static_cast<double>(blocked) / 1e6) << " ms";
    return oss.str();
  }
};

class Metrics {
public:
  StageMetrics* make_stage(std::string name) {
    stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
    return stages_.back().get();
  }

  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

} // namespace pcc
