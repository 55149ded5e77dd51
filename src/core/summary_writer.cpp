#include "core/summary_writer.hpp"

#include <yaml-cpp/yaml.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pcc {

const char* ToString(OccupancyStatus s) {
  switch (s) {
    case OccupancyStatus::Ok: return "ok";
    case OccupancyStatus::Warning: return "warning";
    case OccupancyStatus::OverCapacity: return "over_capacity";
    case OccupancyStatus::Anomaly: return "anomaly";
  }
  return "unknown";
}

OccupancyStatus ClassifyOccupancy(const CountTotals& totals, const OccupancyConfig& cfg) {
  const std::int64_t inside = totals.occupancy();
  if (inside < 0) return OccupancyStatus::Anomaly;
  if (cfg.capacity <= 0) return OccupancyStatus::Ok;

  const double capacity = static_cast<double>(cfg.capacity);
  const double n = static_cast<double>(inside);
  if (n > cfg.critical_threshold * capacity) return OccupancyStatus::OverCapacity;
  if (n >= cfg.warning_threshold * capacity) return OccupancyStatus::Warning;
  return OccupancyStatus::Ok;
}

static std::string LocalIsoTime(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

std::string EmitSummaryYaml(const WorldState& ws, const OccupancyConfig& occupancy,
                            std::chrono::system_clock::time_point now) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "entered" << YAML::Value << ws.totals.entered;
  out << YAML::Key << "exited" << YAML::Value << ws.totals.exited;
  out << YAML::Key << "current_inside" << YAML::Value << ws.totals.occupancy();
  out << YAML::Key << "total" << YAML::Value << ws.totals.total;
  out << YAML::Key << "frame_id" << YAML::Value << ws.frame_id;
  out << YAML::Key << "frames_processed" << YAML::Value << ws.frames_processed;
  out << YAML::Key << "last_updated" << YAML::Value << LocalIsoTime(now);

  out << YAML::Key << "tracks" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "tentative" << YAML::Value << ws.track_counts.tentative;
  out << YAML::Key << "confirmed" << YAML::Value << ws.track_counts.confirmed;
  out << YAML::Key << "lost" << YAML::Value << ws.track_counts.lost;
  out << YAML::EndMap;

  out << YAML::Key << "status" << YAML::Value << ToString(ClassifyOccupancy(ws.totals, occupancy));
  out << YAML::EndMap;

  if (!out.good()) throw std::runtime_error(std::string("Failed to emit summary: ") + out.GetLastError());
  return std::string(out.c_str()) + "\n";
}

void WriteSummaryFile(const std::string& path, const WorldState& ws, const OccupancyConfig& occupancy) {
  namespace fs = std::filesystem;

  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create directory for summary '" + path + "': " + ec.message());
  }

  const std::string doc = EmitSummaryYaml(ws, occupancy, std::chrono::system_clock::now());

  const fs::path tmp = fs::path(path + ".tmp");
  {
    std::ofstream f(tmp);
    if (!f) throw std::runtime_error("Failed to open summary file '" + tmp.string() + "'");
    f << doc;
    if (!f) throw std::runtime_error("Failed to write summary file '" + tmp.string() + "'");
  }

  fs::rename(tmp, target, ec);
  if (ec) throw std::runtime_error("Failed to move summary into place at '" + path + "': " + ec.message());
}

} // namespace pcc
