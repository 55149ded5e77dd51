#include <stdexcept>
#include <string>

#include "gtest/gtest.h"

#include "core/config_loader.hpp"

namespace {

// The loader must reject 'yaml' and name 'key_path' in the message
void ExpectConfigError(const std::string& yaml, const std::string& key_path) {
  SCOPED_TRACE(key_path);
  try {
    pcc::LoadConfigFromYamlString(yaml);
    ADD_FAILURE() << "accepted invalid config: " << yaml;
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(key_path), std::string::npos) << "message was: " << e.what();
  }
}

} // namespace

TEST(ConfigLoaderTest, Defaults) {
  const pcc::AppConfig cfg = pcc::LoadConfigFromYamlString("{}");
  EXPECT_NEAR(cfg.detection.confidence_min, 0.5, 1e-6);
  EXPECT_NEAR(cfg.association.max_cost, 0.7, 1e-6);
  EXPECT_NEAR(cfg.association.appearance_weight, 0.0, 1e-6);
  EXPECT_TRUE(cfg.association.metric == pcc::AppearanceMetric::Cosine);
  EXPECT_EQ(cfg.tracking.min_confirmed_frames, 3);
  EXPECT_EQ(cfg.tracking.max_missed_frames, 5);
  EXPECT_EQ(cfg.tracking.lost_grace_frames, 10);
  EXPECT_TRUE(cfg.boundary.type == pcc::BoundaryType::Line);
  EXPECT_EQ(cfg.boundary.points.size(), 2u);
  EXPECT_TRUE(cfg.boundary.positive_side == pcc::PositiveSide::Right);
  EXPECT_TRUE(cfg.buffering.events_queue.drop_policy == pcc::DropPolicy::DropOldest);
  EXPECT_TRUE(cfg.summary.enabled);
  EXPECT_EQ(cfg.occupancy.capacity, 0);
  EXPECT_NEAR(cfg.occupancy.warning_threshold, 0.8, 1e-6);
  EXPECT_NEAR(cfg.occupancy.critical_threshold, 1.0, 1e-6);
}

TEST(ConfigLoaderTest, Overrides) {
  const pcc::AppConfig cfg = pcc::LoadConfigFromYamlString(R"(
detection:
  confidence_min: 0.3
  frame_width: 1280
  frame_height: 720
association:
  max_cost: 0.8
  appearance_weight: 0.25
  metric: euclidean
tracking:
  min_confirmed_frames: 2
  kalman:
    measurement_noise: 4.0
boundary:
  type: polygon
  points: [[0, 0], [100, 0], [100, 100], [0, 100]]
  dead_band: 3
buffering:
  detections_queue: {capacity: 2, drop_policy: drop_oldest}
summary:
  enabled: false
  output_path: ""
occupancy:
  capacity: 12
  warning_threshold: 0.5
  critical_threshold: 0.9
)");

  EXPECT_NEAR(cfg.detection.confidence_min, 0.3, 1e-6);
  EXPECT_EQ(cfg.detection.frame_width, 1280);
  EXPECT_NEAR(cfg.association.max_cost, 0.8, 1e-6);
  EXPECT_NEAR(cfg.association.appearance_weight, 0.25, 1e-6);
  EXPECT_TRUE(cfg.association.metric == pcc::AppearanceMetric::Euclidean);
  EXPECT_EQ(cfg.tracking.min_confirmed_frames, 2);
  EXPECT_EQ(cfg.tracking.max_missed_frames, 5);
  EXPECT_NEAR(cfg.tracking.kalman.measurement_noise, 4.0, 1e-6);
  EXPECT_NEAR(cfg.tracking.kalman.process_noise_pos, 1.0, 1e-6);

  EXPECT_TRUE(cfg.boundary.type == pcc::BoundaryType::Polygon);
  ASSERT_EQ(cfg.boundary.points.size(), 4u);
  EXPECT_NEAR(cfg.boundary.points[2].x, 100.0, 1e-6);
  // Polygons count entries into the region unless told otherwise
  EXPECT_TRUE(cfg.boundary.positive_side == pcc::PositiveSide::Inside);
  EXPECT_NEAR(cfg.boundary.dead_band, 3.0, 1e-6);

  EXPECT_EQ(cfg.buffering.detections_queue.capacity, 2u);
  EXPECT_TRUE(cfg.buffering.detections_queue.drop_policy == pcc::DropPolicy::DropOldest);
  EXPECT_FALSE(cfg.summary.enabled);
  EXPECT_EQ(cfg.occupancy.capacity, 12);
  EXPECT_NEAR(cfg.occupancy.warning_threshold, 0.5, 1e-6);
  EXPECT_NEAR(cfg.occupancy.critical_threshold, 0.9, 1e-6);
}

TEST(ConfigLoaderTest, InvalidValuesNameTheirKey) {
  ExpectConfigError("association: {max_cost: -0.1}", "association.max_cost");
  ExpectConfigError("association: {max_cost: 1.5}", "association.max_cost");
  ExpectConfigError("association: {appearance_weight: 2}", "association.appearance_weight");
  ExpectConfigError("association: {metric: manhattan}", "association.metric");
  ExpectConfigError("detection: {confidence_min: 1.2}", "detection.confidence_min");
  ExpectConfigError("detection: {embedding_dim: -1}", "detection.embedding_dim");
  ExpectConfigError("tracking: {min_confirmed_frames: 0}", "tracking.min_confirmed_frames");
  ExpectConfigError("tracking: {max_missed_frames: -1}", "tracking.max_missed_frames");
  ExpectConfigError("tracking: {lost_grace_frames: -3}", "tracking.lost_grace_frames");
  ExpectConfigError("tracking: {kalman: {measurement_noise: 0}}", "tracking.kalman.measurement_noise");
  ExpectConfigError("tracking: {min_confirmed_frames: three}", "tracking.min_confirmed_frames");
  ExpectConfigError("boundary: {points: [[0, 0], [0, 0]]}", "boundary.points");
  ExpectConfigError("boundary: {points: [[0, 0], [1, 1], [2, 2]]}", "boundary.points");
  ExpectConfigError("boundary: {points: [[0, 0], [5]]}", "boundary.points[1]");
  ExpectConfigError("boundary: {positive_side: inside}", "boundary.positive_side");
  ExpectConfigError("boundary: {type: circle}", "boundary.type");
  ExpectConfigError("boundary: {dead_band: -1}", "boundary.dead_band");
  ExpectConfigError("boundary: {type: polygon, points: [[0, 0], [10, 10], [20, 20]]}", "boundary.points");
  ExpectConfigError("buffering: {events_queue: {drop_policy: drop_all}}", "buffering.events_queue.drop_policy");
  ExpectConfigError("summary: {interval_frames: 0}", "summary.interval_frames");
  ExpectConfigError("occupancy: {capacity: -5}", "occupancy.capacity");
  ExpectConfigError("occupancy: {warning_threshold: 0}", "occupancy.warning_threshold");
  ExpectConfigError("occupancy: {warning_threshold: 0.9, critical_threshold: 0.7}", "occupancy.critical_threshold");
}

TEST(ConfigLoaderTest, MissingFile) {
  EXPECT_THROW(pcc::LoadConfigFromYamlFile("does/not/exist.yaml"), std::runtime_error);
}

TEST(ConfigLoaderTest, ShippedConfigLoads) {
  // Tests run from the source root
  const pcc::AppConfig cfg = pcc::LoadConfigFromYamlFile("configs/dev.yaml");
  EXPECT_EQ(cfg.detection.frame_width, 640);
  EXPECT_TRUE(cfg.boundary.type == pcc::BoundaryType::Line);
  EXPECT_EQ(cfg.replay.input_path, "data/sample_detections.yaml");
  EXPECT_EQ(cfg.occupancy.capacity, 50);
}
