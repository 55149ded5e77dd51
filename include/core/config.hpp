#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace pcc {

enum class DropPolicy {
  DropOldest,
  DropNewest
};

enum class AppearanceMetric {
  Cosine,
  Euclidean
};

enum class BoundaryType {
  Line,
  Polygon
};

// Which side of the boundary counts as "positive" (Entering)
// Line: relative to the directed segment A->B in image coordinates (y down)
// Polygon: inside or outside of the region
enum class PositiveSide {
  Right,
  Left,
  Inside,
  Outside
};

struct PointConfig {
  float x = 0.f;
  float y = 0.f;
};

struct QueueConfig {
  std::size_t capacity = 8;
  DropPolicy drop_policy = DropPolicy::DropNewest;
};

struct DetectionConfig {
  float confidence_min = 0.5f;

  // Frame size used to reject boxes that lie completely outside the image. 0 disables the check
  int frame_width = 0;
  int frame_height = 0;

  // Expected embedding length. 0 accepts any length
  int embedding_dim = 0;
};

struct AssociationConfig {
  float max_cost = 0.7f;             // Gating threshold, pairs above this are never matched
  float appearance_weight = 0.0f;    // 0 = geometry only, 1 = appearance only
  AppearanceMetric metric = AppearanceMetric::Cosine;
};

struct KalmanConfig {
  float process_noise_pos = 1.0f;
  float process_noise_vel = 0.1f;
  float measurement_noise = 1.0f;
  float initial_velocity_variance = 100.0f;
};

struct TrackingConfig {
  int min_confirmed_frames = 3;   // Consecutive hits before a tentative track is confirmed
  int max_missed_frames = 5;      // Misses a confirmed track tolerates before it is lost
  int lost_grace_frames = 10;     // Extra misses a lost track is kept for re-matching
  int history_length = 32;        // Centroids kept per track for crossing evaluation
  KalmanConfig kalman{};
};

struct BoundaryConfig {
  BoundaryType type = BoundaryType::Line;
  std::vector<PointConfig> points{{0.f, 240.f}, {640.f, 240.f}};
  PositiveSide positive_side = PositiveSide::Right;
  float dead_band = 0.f;          // Half-width of the no-side zone around the boundary, pixels
};

struct BufferingConfig {
  QueueConfig detections_queue{};
  QueueConfig events_queue{64, DropPolicy::DropOldest};
};

struct ReplayConfig {
  std::string input_path = "data/sample_detections.yaml";
  int target_fps = 0;             // 0 = replay as fast as the counter consumes
};

struct SummaryConfig {
  bool enabled = true;
  std::string output_path = "output/live_data.yaml";
  int interval_frames = 30;
};

// Thresholds are fractions of capacity
struct OccupancyConfig {
  int capacity = 0;               // 0 disables both alerts
  float warning_threshold = 0.8f;
  float critical_threshold = 1.0f;
};

struct AppConfig {
  DetectionConfig detection{};
  AssociationConfig association{};
  TrackingConfig tracking{};
  BoundaryConfig boundary{};
  BufferingConfig buffering{};
  ReplayConfig replay{};
  SummaryConfig summary{};
  OccupancyConfig occupancy{};
};

}
