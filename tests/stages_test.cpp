#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

#include "core/config.hpp"
#include "core/pipeline.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/counting_stage.hpp"
#include "stages/replay_stage.hpp"

using namespace std::chrono_literals;

namespace {

pcc::AppConfig Config() {
  pcc::AppConfig cfg;
  cfg.boundary.points = {{0.f, 50.f}, {100.f, 50.f}};
  cfg.buffering.detections_queue.capacity = 2;   // small, so replay has to wait on the counter
  return cfg;
}

// One person walking down through the line, another walking up through it
std::vector<pcc::Detections> Frames() {
  std::vector<pcc::Detections> frames;
  for (int k = 0; k < 20; ++k) {
    pcc::Detections f;
    f.source_frame_id = static_cast<std::uint64_t>(k);
    pcc::Detection down;
    down.bbox = pcc::BBox{10.f, 8.f * static_cast<float>(k), 20.f, 20.f};
    down.confidence = 0.9f;
    pcc::Detection up;
    up.bbox = pcc::BBox{60.f, 140.f - 8.f * static_cast<float>(k), 20.f, 20.f};
    up.confidence = 0.9f;
    f.items = {down, up};
    frames.push_back(f);
  }
  return frames;
}

std::vector<pcc::CountEvent> DrainEvents(pcc::BoundedQueue<pcc::CountEvent>& events) {
  std::vector<pcc::CountEvent> seen;
  const auto deadline = std::chrono::steady_clock::now() + 10s;
  while (!events.drained() && std::chrono::steady_clock::now() < deadline) {
    pcc::CountEvent ev;
    if (events.try_pop_for(ev, 5ms)) seen.push_back(ev);
  }
  return seen;
}

} // namespace

TEST(StagesTest, ReplayThroughCounter) {
  const pcc::AppConfig cfg = Config();

  // What the same frames produce when counted directly
  pcc::CountingPipeline direct(cfg);
  std::size_t direct_events = 0;
  for (const auto& f : Frames()) direct_events += direct.process(f).events.size();

  pcc::StopSource global_stop;
  pcc::Metrics metrics;
  auto detections = std::make_shared<pcc::BoundedQueue<pcc::Detections>>(cfg.buffering.detections_queue.capacity,
                                                                          cfg.buffering.detections_queue.drop_policy);
  auto events = std::make_shared<pcc::BoundedQueue<pcc::CountEvent>>(64, pcc::DropPolicy::DropOldest);
  auto world = std::make_shared<pcc::LatestStore<pcc::WorldState>>();

  pcc::CountingStage counting(metrics.make_stage("counting"), cfg, detections, world, events);
  pcc::ReplayStage replay(metrics.make_stage("replay"), cfg.replay, Frames(), detections);

  counting.start(global_stop.token());
  replay.start(global_stop.token());

  const std::vector<pcc::CountEvent> seen = DrainEvents(*events);

  replay.stop();
  counting.stop();

  EXPECT_TRUE(counting.finished());
  EXPECT_FALSE(counting.failed());
  EXPECT_EQ(replay.frames_sent(), 20u);

  // Nothing was dropped between the stages, so the threaded run matches the direct one
  EXPECT_EQ(seen.size(), direct_events);
  EXPECT_EQ(seen.size(), 2u);

  const auto ws = world->read_latest();
  ASSERT_TRUE(ws.has_value());
  EXPECT_EQ(ws->frames_processed, 20u);
  EXPECT_EQ(ws->frame_id, 19u);
  EXPECT_EQ(ws->totals.entered, direct.totals().entered);
  EXPECT_EQ(ws->totals.exited, direct.totals().exited);

  ASSERT_EQ(metrics.stages().size(), 2u);
  EXPECT_EQ(metrics.stages()[0]->items.load(), 20u);
  EXPECT_EQ(metrics.stages()[1]->items.load(), 20u);
  EXPECT_EQ(metrics.stages()[0]->describe().find("counting: 20 frames"), 0u);
  EXPECT_EQ(detections->drops_total(), 0u);
}

TEST(StagesTest, FullEventQueueWaitsForReader) {
  const pcc::AppConfig cfg = Config();

  pcc::StopSource global_stop;
  pcc::Metrics metrics;
  auto detections = std::make_shared<pcc::BoundedQueue<pcc::Detections>>(2, pcc::DropPolicy::DropNewest);
  // Room for one event and a policy that would evict it if the stage pushed without waiting
  auto events = std::make_shared<pcc::BoundedQueue<pcc::CountEvent>>(1, pcc::DropPolicy::DropOldest);
  auto world = std::make_shared<pcc::LatestStore<pcc::WorldState>>();

  pcc::CountingStage counting(metrics.make_stage("counting"), cfg, detections, world, events);
  pcc::ReplayStage replay(nullptr, cfg.replay, Frames(), detections);
  counting.start(global_stop.token());
  replay.start(global_stop.token());

  // Nobody reads while both crossings happen, the counter has to hold the second event
  std::this_thread::sleep_for(200ms);
  EXPECT_FALSE(counting.finished());

  const std::vector<pcc::CountEvent> seen = DrainEvents(*events);

  replay.stop();
  counting.stop();

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_TRUE(seen[0].direction != seen[1].direction);
  EXPECT_EQ(events->drops_total(), 0u);
  EXPECT_GT(metrics.stages()[0]->blocked_ns_total.load(), 0u);

  const auto ws = world->read_latest();
  ASSERT_TRUE(ws.has_value());
  EXPECT_EQ(ws->frames_processed, 20u);
}

TEST(StagesTest, StopBeforeEndOfInput) {
  pcc::AppConfig cfg = Config();
  cfg.replay.target_fps = 50;   // slow enough that the stop lands mid-stream

  pcc::StopSource global_stop;
  auto detections = std::make_shared<pcc::BoundedQueue<pcc::Detections>>(2, pcc::DropPolicy::DropNewest);
  auto events = std::make_shared<pcc::BoundedQueue<pcc::CountEvent>>(64, pcc::DropPolicy::DropOldest);
  auto world = std::make_shared<pcc::LatestStore<pcc::WorldState>>();

  pcc::CountingStage counting(nullptr, cfg, detections, world, events);
  pcc::ReplayStage replay(nullptr, cfg.replay, Frames(), detections);
  counting.start(global_stop.token());
  replay.start(global_stop.token());

  std::this_thread::sleep_for(60ms);
  global_stop.request_stop();

  replay.stop();
  counting.stop();

  EXPECT_LT(replay.frames_sent(), 20u);
  EXPECT_TRUE(detections->closed());
  EXPECT_TRUE(events->closed());

  // Whatever was published is a whole cycle
  if (const auto ws = world->read_latest()) {
    EXPECT_LE(ws->frames_processed, replay.frames_sent());
    EXPECT_EQ(ws->frame_id + 1, ws->frames_processed);
  }
}

TEST(StagesTest, InvalidConfigThrowsBeforeStart) {
  pcc::AppConfig cfg = Config();
  cfg.tracking.min_confirmed_frames = 0;

  auto detections = std::make_shared<pcc::BoundedQueue<pcc::Detections>>(2, pcc::DropPolicy::DropNewest);
  auto events = std::make_shared<pcc::BoundedQueue<pcc::CountEvent>>(2, pcc::DropPolicy::DropOldest);
  auto world = std::make_shared<pcc::LatestStore<pcc::WorldState>>();

  EXPECT_THROW(pcc::CountingStage(nullptr, cfg, detections, world, events), std::runtime_error);
}

TEST(StagesTest, StopIsIdempotent) {
  const pcc::AppConfig cfg = Config();
  auto detections = std::make_shared<pcc::BoundedQueue<pcc::Detections>>(2, pcc::DropPolicy::DropNewest);

  pcc::ReplayStage replay(nullptr, cfg.replay, Frames(), detections);
  replay.stop();   // never started
  EXPECT_FALSE(replay.finished());

  pcc::StopSource global_stop;
  replay.start(global_stop.token());
  replay.stop();
  replay.stop();
  EXPECT_TRUE(replay.finished());
  EXPECT_TRUE(detections->closed());
}
