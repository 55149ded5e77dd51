#include "stages/replay_stage.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace pcc {

ReplayStage::ReplayStage(StageMetrics* metrics, ReplayConfig cfg, std::vector<Detections> frames,
                         std::shared_ptr<BoundedQueue<Detections>> out)
    : Stage("replay_stage", metrics), cfg_(std::move(cfg)), frames_(std::move(frames)), out_(std::move(out)) {}

// run() must not outlive this object
ReplayStage::~ReplayStage() { stop(); }

void ReplayStage::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  auto stopped = [&] { return global.stop_requested() || local.load(std::memory_order_relaxed); };

  const auto period = (cfg_.target_fps > 0) ? std::chrono::microseconds(1000000 / cfg_.target_fps)
                                            : std::chrono::microseconds(0);
  auto next_due = std::chrono::steady_clock::now();

  for (auto& frame : frames_) {
    if (stopped()) break;

    // Pace like a live detector when asked to
    if (period.count() > 0) {
      std::this_thread::sleep_until(next_due);
      next_due += period;
    }

    const std::uint64_t t0 = NowNs();

    // Every frame must arrive whole and in order, so wait for space instead of dropping
    bool pushed = false;
    int attempts = 0;
    while (!pushed && !stopped() && !out_->closed()) {
      pushed = out_->push_for(frame, 5ms);
      ++attempts;
    }
    if (!pushed) break;

    const std::uint64_t handover_ns = NowNs() - t0;
    if (StageMetrics* m = metrics()) {
      m->on_item(handover_ns);
      if (attempts > 1) m->on_blocked(handover_ns);
    }
    sent_.fetch_add(1, std::memory_order_relaxed);
  }

  // End of stream, the counter drains what's queued and finishes
  out_->close();
}

} // namespace pcc
