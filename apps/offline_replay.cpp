#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <memory>
#include <string>

// Utilities
#include "core/config_loader.hpp"
#include "core/crossing_counter.hpp"
#include "core/detections.hpp"
#include "core/replay_loader.hpp"
#include "core/summary_writer.hpp"
#include "core/world_state.hpp"

#include "infra/stop_token.hpp"

// Resources
#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"

// Stages
#include "stages/counting_stage.hpp"
#include "stages/replay_stage.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

static void LogEvent(const pcc::CountEvent& ev) {
  std::cout << "[count] frame " << ev.frame_id << " track " << ev.track_id << " " << pcc::ToString(ev.direction)
            << " at (" << std::fixed << std::setprecision(1) << ev.position.x << ", " << ev.position.y << ")"
            << std::endl;
}

// offline_replay.cpp runs the counter over recorded detections
// Usage: offline_replay [config.yaml] [detections.yaml]

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    pcc::AppConfig cfg = pcc::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    const std::string input_path = (argc > 2) ? argv[2] : cfg.replay.input_path;
    std::vector<pcc::Detections> frames = pcc::LoadDetectionsFromYamlFile(input_path);
    std::cout << "Loaded " << frames.size() << " frames from " << input_path << "\n";

    std::signal(SIGINT, HandleSigint);

    pcc::StopSource global_stop;
    pcc::Metrics metrics;

    // Resources shared between stages
    auto detections_queue = std::make_shared<pcc::BoundedQueue<pcc::Detections>>(cfg.buffering.detections_queue.capacity, cfg.buffering.detections_queue.drop_policy);
    auto events_queue = std::make_shared<pcc::BoundedQueue<pcc::CountEvent>>(cfg.buffering.events_queue.capacity, cfg.buffering.events_queue.drop_policy);
    auto world_latest_store = std::make_shared<pcc::LatestStore<pcc::WorldState>>();

    // Counting stage validates the config and builds the pipeline here, before any frame moves
    pcc::CountingStage counting_stage(metrics.make_stage("counting"), cfg, detections_queue, world_latest_store, events_queue);
    pcc::ReplayStage replay_stage(metrics.make_stage("replay"), cfg.replay, std::move(frames), detections_queue);

    // Consumers first
    counting_stage.start(global_stop.token());
    replay_stage.start(global_stop.token());

    std::uint64_t seen_version = 0;
    std::uint64_t last_summary_frames = 0;
    pcc::OccupancyStatus last_status = pcc::OccupancyStatus::Ok;
    pcc::WorldState latest;

    auto write_summary = [&](const pcc::WorldState& ws) {
      if (!cfg.summary.enabled) return;
      pcc::WriteSummaryFile(cfg.summary.output_path, ws, cfg.occupancy);
      last_summary_frames = ws.frames_processed;
    };

    // Main thread logs events and keeps the summary fresh until the counter has drained its input
    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        global_stop.request_stop(pcc::StopReason::Interrupted);
        break;
      }

      pcc::CountEvent ev;
      if (events_queue->try_pop_for(ev, std::chrono::milliseconds(5))) {
        LogEvent(ev);
      }

      if (auto ws = world_latest_store->read_if_newer(seen_version)) {
        latest = std::move(*ws);

        const pcc::OccupancyStatus status = pcc::ClassifyOccupancy(latest.totals, cfg.occupancy);
        if (status != last_status) {
          if (status != pcc::OccupancyStatus::Ok) {
            std::cerr << "[occupancy] " << pcc::ToString(status) << ": " << latest.totals.occupancy()
                      << " inside at frame " << latest.frame_id << std::endl;
          }
          last_status = status;
        }

        if (latest.frames_processed - last_summary_frames >= static_cast<std::uint64_t>(cfg.summary.interval_frames)) {
          write_summary(latest);
        }
      }

      if (counting_stage.failed()) {
        std::cerr << "Counting stage failed: " << counting_stage.error() << std::endl;
        global_stop.request_stop(pcc::StopReason::StageFailed);
        break;
      }

      // The counter closes its event queue once it has counted the last replayed frame
      if (events_queue->drained()) {
        global_stop.request_stop(pcc::StopReason::EndOfInput);
        break;
      }
    }

    std::cout << "\nShutting down pipeline (" << pcc::ToString(global_stop.reason()) << ")..." << std::endl;

    // Producers first
    replay_stage.stop();
    counting_stage.stop();

    // Events the loop didn't get to before shutdown
    pcc::CountEvent ev;
    while (events_queue->try_pop(ev)) LogEvent(ev);

    if (auto ws = world_latest_store->read_latest()) latest = std::move(*ws);
    write_summary(latest);

    std::cout << "Frames counted: " << latest.frames_processed << " of " << replay_stage.frames_sent() << " sent\n"
              << "Entered: " << latest.totals.entered << "\n"
              << "Exited: " << latest.totals.exited << "\n"
              << "Inside: " << latest.totals.occupancy() << "\n";

    for (const auto& m : metrics.stages()) std::cout << m->describe() << "\n";

    if (counting_stage.failed()) return 1;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
