#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
    LatestStore holds the most recent value a stage published, overwriting older ones.

    The counting stage is the only thing allowed to touch the live track set, and only in the middle of a cycle.
    After each cycle it writes a WorldState snapshot here; the summary writer, the console and anything else that
    wants to observe the counter reads the snapshot instead. Readers never block the counter for longer than a
    copy, and they never see a half-finished cycle.

    version() bumps on every write, so a reader can cheaply check whether anything new arrived.
*/

namespace pcc {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  void write(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = std::move(value);
    ++version_;
  }

  std::optional<T> read_latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    return latest_;
  }

  // Copy out only when something newer than 'seen_version' exists, updating 'seen_version'
  std::optional<T> read_if_newer(std::uint64_t& seen_version) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!latest_ || version_ == seen_version) return std::nullopt;
    seen_version = version_;
    return latest_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(mu_);
    return latest_.has_value();
  }

private:
  mutable std::mutex mu_;
  std::optional<T> latest_;
  std::uint64_t version_{0};
};

} // namespace pcc
