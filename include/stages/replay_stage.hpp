#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace pcc {

// Stands in for the detector: feeds recorded per-frame detections into the counter, one complete frame at a time.
// Waits for queue space rather than dropping, and closes the queue after the last frame
class ReplayStage final : public Stage {
public:
  ReplayStage(StageMetrics* metrics, ReplayConfig cfg, std::vector<Detections> frames,
              std::shared_ptr<BoundedQueue<Detections>> out);
  ~ReplayStage() override;

  std::uint64_t frames_sent() const { return sent_.load(std::memory_order_relaxed); }

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  ReplayConfig cfg_;
  std::vector<Detections> frames_;
  std::shared_ptr<BoundedQueue<Detections>> out_;
  std::atomic<std::uint64_t> sent_{0};
};

} // namespace pcc
