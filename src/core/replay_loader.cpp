#include "core/replay_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace pcc {

static std::runtime_error ReplayError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Replay error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

template <typename T>
static T Required(const YAML::Node& parent, const char* key, const std::string& key_path) {
  const YAML::Node n = parent[key];
  if (!n) throw ReplayError(key_path, "missing");
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ReplayError(key_path, e.what());
  }
}

static Detection ParseDetection(const YAML::Node& d, const std::string& p) {
  if (!d.IsMap()) throw ReplayError(p, "must be a map");

  Detection det;
  det.bbox.x = Required<float>(d, "x", p + ".x");
  det.bbox.y = Required<float>(d, "y", p + ".y");
  det.bbox.w = Required<float>(d, "width", p + ".width");
  det.bbox.h = Required<float>(d, "height", p + ".height");
  det.confidence = Required<float>(d, "confidence", p + ".confidence");

  const YAML::Node emb = d["embedding"];
  if (emb) {
    try {
      det.embedding = emb.as<std::vector<float>>();
    } catch (const YAML::Exception& e) {
      throw ReplayError(p + ".embedding", e.what());
    }
  }
  return det;
}

static std::vector<Detections> ParseFrames(const YAML::Node& root) {
  const YAML::Node frames = root["frames"];
  if (!frames) throw ReplayError("frames", "missing");
  if (!frames.IsSequence()) throw ReplayError("frames", "must be a sequence");

  // Replayed frames are stamped relative to load time
  const auto base = std::chrono::steady_clock::now();

  std::vector<Detections> out;
  out.reserve(frames.size());
  for (std::size_t i = 0; i < frames.size(); ++i) {
    const YAML::Node f = frames[i];
    const std::string fp = "frames[" + std::to_string(i) + "]";
    if (!f.IsMap()) throw ReplayError(fp, "must be a map");

    Detections ds;
    ds.source_frame_id = f["frame_id"] ? Required<std::uint64_t>(f, "frame_id", fp + ".frame_id") : i;
    const std::int64_t ts_ms = f["timestamp_ms"] ? Required<std::int64_t>(f, "timestamp_ms", fp + ".timestamp_ms") : 0;
    ds.capture_time = base + std::chrono::milliseconds(ts_ms);

    const YAML::Node dets = f["detections"];
    if (dets) {
      if (!dets.IsSequence()) throw ReplayError(fp + ".detections", "must be a sequence");
      ds.items.reserve(dets.size());
      for (std::size_t j = 0; j < dets.size(); ++j) {
        ds.items.push_back(ParseDetection(dets[j], fp + ".detections[" + std::to_string(j) + "]"));
      }
    }
    out.push_back(std::move(ds));
  }
  return out;
}

std::vector<Detections> LoadDetectionsFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return ParseFrames(root);
}

std::vector<Detections> LoadDetectionsFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return ParseFrames(root);
}

} // namespace pcc
