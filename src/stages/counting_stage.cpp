#include "stages/counting_stage.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace pcc {

CountingStage::CountingStage(StageMetrics* metrics, const AppConfig& cfg, std::shared_ptr<BoundedQueue<Detections>> in,
                             std::shared_ptr<LatestStore<WorldState>> world, std::shared_ptr<BoundedQueue<CountEvent>> events)
    : Stage("counting_stage", metrics), pipeline_(cfg), in_(std::move(in)), world_(std::move(world)),
      events_(std::move(events)) {}

// run() must not outlive the pipeline it drives
CountingStage::~CountingStage() { stop(); }

void CountingStage::run(const StopToken& global, const std::atomic_bool& local) {
  using namespace std::chrono_literals;

  auto stopped = [&] { return global.stop_requested() || local.load(std::memory_order_relaxed); };

  // Stop is only checked between frames, a popped frame is always counted to the end
  while (!stopped()) {
    Detections frame;

    // The timed pop doubles as the heartbeat that lets this loop notice stop requests
    if (!in_->try_pop_for(frame, 5ms)) {
      if (in_->drained()) break;
      continue;
    }

    const auto t0 = std::chrono::steady_clock::now();

    FrameResult result = pipeline_.process(frame);

    // Publish only once the whole cycle is done
    world_->write(pipeline_.snapshot());

    const auto work_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();

    // Count events are never dropped for space, the stage waits for the reader instead. Only a stop loses one
    const std::uint64_t wait_start = NowNs();
    bool waited = false;
    for (auto& ev : result.events) {
      bool pushed = events_->push_for(ev, 5ms);
      while (!pushed && !stopped() && !events_->closed()) {
        waited = true;
        pushed = events_->push_for(ev, 5ms);
      }
      if (!pushed) {
        std::cerr << "[counting] stopped with the event queue full, dropped log entry for track " << ev.track_id
                  << "\n";
      }
    }

    if (StageMetrics* m = metrics()) {
      m->on_item(static_cast<std::uint64_t>(work_ns),
                 static_cast<std::uint64_t>(result.rejected_detections + result.filtered_detections));
      if (waited) m->on_blocked(NowNs() - wait_start);
    }
  }

  events_->close();
}

} // namespace pcc
