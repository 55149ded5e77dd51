#pragma once

#include <cstdint>
#include <memory>

#include "core/config.hpp"
#include "core/crossing_counter.hpp"
#include "core/detections.hpp"
#include "core/pipeline.hpp"
#include "core/world_state.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace pcc {

// Owns the CountingPipeline and runs it on its own thread, one full cycle per popped frame.
// After each cycle the new count events go to 'events' and a WorldState snapshot goes to 'world'.
// Returns once the input queue is closed and drained, or on stop
class CountingStage final : public Stage {
public:
  // Throws on an invalid config, before any thread is started
  CountingStage(StageMetrics* metrics, const AppConfig& cfg, std::shared_ptr<BoundedQueue<Detections>> in,
                std::shared_ptr<LatestStore<WorldState>> world, std::shared_ptr<BoundedQueue<CountEvent>> events);
  ~CountingStage() override;

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  CountingPipeline pipeline_;
  std::shared_ptr<BoundedQueue<Detections>> in_;
  std::shared_ptr<LatestStore<WorldState>> world_;
  std::shared_ptr<BoundedQueue<CountEvent>> events_;
};

} // namespace pcc
