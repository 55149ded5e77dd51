#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace pcc {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static DropPolicy ParseDropPolicyKey(const YAML::Node& parent, const char* key, const std::string& key_path, DropPolicy fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "drop_oldest") return DropPolicy::DropOldest;
  if (s == "drop_newest") return DropPolicy::DropNewest;
  throw ConfigError(key_path, "unknown drop_policy '" + s + "'. Use: drop_oldest | drop_newest");
}

static AppearanceMetric ParseMetricKey(const YAML::Node& parent, const char* key, const std::string& key_path, AppearanceMetric fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "cosine") return AppearanceMetric::Cosine;
  if (s == "euclidean") return AppearanceMetric::Euclidean;
  throw ConfigError(key_path, "unknown metric '" + s + "'. Use: cosine | euclidean");
}

static BoundaryType ParseBoundaryTypeKey(const YAML::Node& parent, const char* key, const std::string& key_path, BoundaryType fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "line") return BoundaryType::Line;
  if (s == "polygon") return BoundaryType::Polygon;
  throw ConfigError(key_path, "unknown boundary type '" + s + "'. Use: line | polygon");
}

static PositiveSide ParsePositiveSideKey(const YAML::Node& parent, const char* key, const std::string& key_path, PositiveSide fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "right") return PositiveSide::Right;
  if (s == "left") return PositiveSide::Left;
  if (s == "inside") return PositiveSide::Inside;
  if (s == "outside") return PositiveSide::Outside;
  throw ConfigError(key_path, "unknown positive_side '" + s + "'. Use: right | left | inside | outside");
}

// Points are written as [x, y] pairs
static std::vector<PointConfig> ParsePointsKey(const YAML::Node& parent, const char* key, const std::string& key_path, const std::vector<PointConfig>& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  if (!n.IsSequence()) throw ConfigError(key_path, "must be a sequence of [x, y] pairs");

  std::vector<PointConfig> out;
  for (std::size_t i = 0; i < n.size(); ++i) {
    const YAML::Node p = n[i];
    const std::string pp = key_path + "[" + std::to_string(i) + "]";
    if (!p.IsSequence() || p.size() != 2) throw ConfigError(pp, "must be an [x, y] pair");
    try {
      out.push_back(PointConfig{p[0].as<float>(), p[1].as<float>()});
    } catch (const YAML::Exception& e) {
      throw ConfigError(pp, e.what());
    }
  }
  return out;
}

static void LoadQueueConfig(const YAML::Node& qnode, const std::string& key_path, QueueConfig& out) {
  if (!qnode) return;
  out.capacity = GetOrKey<std::size_t>(qnode, "capacity", PathJoin(key_path, "capacity"), out.capacity);
  out.drop_policy = ParseDropPolicyKey(qnode, "drop_policy", PathJoin(key_path, "drop_policy"), out.drop_policy);
}

static void LoadDetection(const YAML::Node& root, DetectionConfig& cfg) {
  const YAML::Node det = root["detection"];
  if (!det) return;
  const std::string p = "detection";

  cfg.confidence_min = GetOrKey<float>(det, "confidence_min", PathJoin(p, "confidence_min"), cfg.confidence_min);
  cfg.frame_width = GetOrKey<int>(det, "frame_width", PathJoin(p, "frame_width"), cfg.frame_width);
  cfg.frame_height = GetOrKey<int>(det, "frame_height", PathJoin(p, "frame_height"), cfg.frame_height);
  cfg.embedding_dim = GetOrKey<int>(det, "embedding_dim", PathJoin(p, "embedding_dim"), cfg.embedding_dim);
}

static void LoadAssociation(const YAML::Node& root, AssociationConfig& cfg) {
  const YAML::Node as = root["association"];
  if (!as) return;
  const std::string p = "association";

  cfg.max_cost = GetOrKey<float>(as, "max_cost", PathJoin(p, "max_cost"), cfg.max_cost);
  cfg.appearance_weight = GetOrKey<float>(as, "appearance_weight", PathJoin(p, "appearance_weight"), cfg.appearance_weight);
  cfg.metric = ParseMetricKey(as, "metric", PathJoin(p, "metric"), cfg.metric);
}

static void LoadTracking(const YAML::Node& root, TrackingConfig& cfg) {
  const YAML::Node tr = root["tracking"];
  if (!tr) return;
  const std::string p = "tracking";

  cfg.min_confirmed_frames = GetOrKey<int>(tr, "min_confirmed_frames", PathJoin(p, "min_confirmed_frames"), cfg.min_confirmed_frames);
  cfg.max_missed_frames = GetOrKey<int>(tr, "max_missed_frames", PathJoin(p, "max_missed_frames"), cfg.max_missed_frames);
  cfg.lost_grace_frames = GetOrKey<int>(tr, "lost_grace_frames", PathJoin(p, "lost_grace_frames"), cfg.lost_grace_frames);
  cfg.history_length = GetOrKey<int>(tr, "history_length", PathJoin(p, "history_length"), cfg.history_length);

  const YAML::Node kf = tr["kalman"];
  const std::string kp = PathJoin(p, "kalman");
  if (kf) {
    cfg.kalman.process_noise_pos = GetOrKey<float>(kf, "process_noise_pos", PathJoin(kp, "process_noise_pos"), cfg.kalman.process_noise_pos);
    cfg.kalman.process_noise_vel = GetOrKey<float>(kf, "process_noise_vel", PathJoin(kp, "process_noise_vel"), cfg.kalman.process_noise_vel);
    cfg.kalman.measurement_noise = GetOrKey<float>(kf, "measurement_noise", PathJoin(kp, "measurement_noise"), cfg.kalman.measurement_noise);
    cfg.kalman.initial_velocity_variance = GetOrKey<float>(kf, "initial_velocity_variance", PathJoin(kp, "initial_velocity_variance"), cfg.kalman.initial_velocity_variance);
  }
}

static void LoadBoundary(const YAML::Node& root, BoundaryConfig& cfg) {
  const YAML::Node b = root["boundary"];
  if (!b) return;
  const std::string p = "boundary";

  cfg.type = ParseBoundaryTypeKey(b, "type", PathJoin(p, "type"), cfg.type);
  cfg.points = ParsePointsKey(b, "points", PathJoin(p, "points"), cfg.points);
  // Polygons default to counting entries into the region
  const PositiveSide side_fallback = (cfg.type == BoundaryType::Polygon) ? PositiveSide::Inside : cfg.positive_side;
  cfg.positive_side = ParsePositiveSideKey(b, "positive_side", PathJoin(p, "positive_side"), side_fallback);
  cfg.dead_band = GetOrKey<float>(b, "dead_band", PathJoin(p, "dead_band"), cfg.dead_band);
}

static void LoadBuffering(const YAML::Node& root, BufferingConfig& cfg) {
  const YAML::Node buf = root["buffering"];
  if (!buf) return;
  const std::string p = "buffering";

  LoadQueueConfig(buf["detections_queue"], PathJoin(p, "detections_queue"), cfg.detections_queue);
  LoadQueueConfig(buf["events_queue"], PathJoin(p, "events_queue"), cfg.events_queue);
}

static void LoadReplay(const YAML::Node& root, ReplayConfig& cfg) {
  const YAML::Node r = root["replay"];
  if (!r) return;
  const std::string p = "replay";

  cfg.input_path = GetOrKey<std::string>(r, "input_path", PathJoin(p, "input_path"), cfg.input_path);
  cfg.target_fps = GetOrKey<int>(r, "target_fps", PathJoin(p, "target_fps"), cfg.target_fps);
}

static void LoadSummary(const YAML::Node& root, SummaryConfig& cfg) {
  const YAML::Node s = root["summary"];
  if (!s) return;
  const std::string p = "summary";

  cfg.enabled = GetOrKey<bool>(s, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.output_path = GetOrKey<std::string>(s, "output_path", PathJoin(p, "output_path"), cfg.output_path);
  cfg.interval_frames = GetOrKey<int>(s, "interval_frames", PathJoin(p, "interval_frames"), cfg.interval_frames);
}

static void LoadOccupancy(const YAML::Node& root, OccupancyConfig& cfg) {
  const YAML::Node o = root["occupancy"];
  if (!o) return;

  cfg.capacity = GetOrKey<int>(o, "capacity", "occupancy.capacity", cfg.capacity);
  cfg.warning_threshold =
      GetOrKey<float>(o, "warning_threshold", "occupancy.warning_threshold", cfg.warning_threshold);
  cfg.critical_threshold =
      GetOrKey<float>(o, "critical_threshold", "occupancy.critical_threshold", cfg.critical_threshold);
}

static bool IsFinite(float v) { return std::isfinite(v); }

static void ValidateBoundary(const BoundaryConfig& b) {
  for (const auto& pt : b.points) {
    if (!IsFinite(pt.x) || !IsFinite(pt.y)) throw ConfigError("boundary.points", "coordinates must be finite");
  }
  if (!IsFinite(b.dead_band) || b.dead_band < 0.f) throw ConfigError("boundary.dead_band", "must be >= 0");

  if (b.type == BoundaryType::Line) {
    if (b.points.size() != 2) throw ConfigError("boundary.points", "a line needs exactly 2 points");
    const float dx = b.points[1].x - b.points[0].x;
    const float dy = b.points[1].y - b.points[0].y;
    if (dx == 0.f && dy == 0.f) throw ConfigError("boundary.points", "line endpoints must differ");
    if (b.positive_side != PositiveSide::Right && b.positive_side != PositiveSide::Left)
      throw ConfigError("boundary.positive_side", "a line uses right | left");
    return;
  }

  if (b.points.size() < 3) throw ConfigError("boundary.points", "a polygon needs at least 3 points");
  double twice_area = 0.0;
  for (std::size_t i = 0; i < b.points.size(); ++i) {
    const auto& p = b.points[i];
    const auto& q = b.points[(i + 1) % b.points.size()];
    twice_area += static_cast<double>(p.x) * q.y - static_cast<double>(q.x) * p.y;
  }
  if (twice_area == 0.0) throw ConfigError("boundary.points", "polygon has zero area");
  if (b.positive_side != PositiveSide::Inside && b.positive_side != PositiveSide::Outside)
    throw ConfigError("boundary.positive_side", "a polygon uses inside | outside");
}

void ValidateOrThrow(const AppConfig& cfg) {
  const auto& det = cfg.detection;
  if (!IsFinite(det.confidence_min) || det.confidence_min < 0.f || det.confidence_min > 1.f)
    throw ConfigError("detection.confidence_min", "must be in [0, 1]");
  if (det.frame_width < 0 || det.frame_height < 0) throw ConfigError("detection", "frame_width/frame_height must be >= 0");
  if (det.embedding_dim < 0) throw ConfigError("detection.embedding_dim", "must be >= 0");

  const auto& as = cfg.association;
  if (!IsFinite(as.max_cost) || as.max_cost <= 0.f || as.max_cost > 1.f)
    throw ConfigError("association.max_cost", "must be in (0, 1]");
  if (!IsFinite(as.appearance_weight) || as.appearance_weight < 0.f || as.appearance_weight > 1.f)
    throw ConfigError("association.appearance_weight", "must be in [0, 1]");

  const auto& tr = cfg.tracking;
  if (tr.min_confirmed_frames < 1) throw ConfigError("tracking.min_confirmed_frames", "must be >= 1");
  if (tr.max_missed_frames < 0) throw ConfigError("tracking.max_missed_frames", "must be >= 0");
  if (tr.lost_grace_frames < 0) throw ConfigError("tracking.lost_grace_frames", "must be >= 0");
  if (tr.history_length < 2) throw ConfigError("tracking.history_length", "must be >= 2");

  const auto& kf = tr.kalman;
  if (!(kf.process_noise_pos > 0.f) || !(kf.process_noise_vel > 0.f))
    throw ConfigError("tracking.kalman", "process noise must be > 0");
  if (!(kf.measurement_noise > 0.f)) throw ConfigError("tracking.kalman.measurement_noise", "must be > 0");
  if (!(kf.initial_velocity_variance > 0.f))
    throw ConfigError("tracking.kalman.initial_velocity_variance", "must be > 0");

  ValidateBoundary(cfg.boundary);

  if (cfg.buffering.detections_queue.capacity < 1)
    throw ConfigError("buffering.detections_queue.capacity", "must be >= 1");
  if (cfg.buffering.events_queue.capacity < 1)
    throw ConfigError("buffering.events_queue.capacity", "must be >= 1");

  if (cfg.replay.target_fps < 0) throw ConfigError("replay.target_fps", "must be >= 0");

  if (cfg.summary.enabled) {
    if (cfg.summary.output_path.empty())
      throw ConfigError("summary.output_path", "required when summary.enabled=true");
    if (cfg.summary.interval_frames <= 0)
      throw ConfigError("summary.interval_frames", "must be > 0 when summary.enabled=true");
  }

  if (cfg.occupancy.capacity < 0) throw ConfigError("occupancy.capacity", "must be >= 0");
  if (!IsFinite(cfg.occupancy.warning_threshold) || cfg.occupancy.warning_threshold <= 0.f)
    throw ConfigError("occupancy.warning_threshold", "must be > 0");
  if (!IsFinite(cfg.occupancy.critical_threshold) ||
      cfg.occupancy.critical_threshold < cfg.occupancy.warning_threshold)
    throw ConfigError("occupancy.critical_threshold", "must be >= occupancy.warning_threshold");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadDetection(root, cfg.detection);
  LoadAssociation(root, cfg.association);
  LoadTracking(root, cfg.tracking);
  LoadBoundary(root, cfg.boundary);
  LoadBuffering(root, cfg.buffering);
  LoadReplay(root, cfg.replay);
  LoadSummary(root, cfg.summary);
  LoadOccupancy(root, cfg.occupancy);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace pcc
