#include "stages/stage.hpp"
#include <iostream>

#include <utility>

namespace pcc {

Stage::Stage(std::string name, StageMetrics* metrics)
    : name_(std::move(name)), metrics_(metrics), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start(StopToken global_stop) {
  runner_.start(global_stop, [this](const StopToken& g, const std::atomic_bool& l) {
    run(g, l);
  });
  started_ = true;

  std::cout << name_ << " started" << std::endl;
}

void Stage::stop() {
  if (!started_) return;
  started_ = false;

  runner_.request_stop();
  runner_.join();

  if (runner_.failed()) {
    std::cout << name_ << " stopped with error: " << runner_.error() << std::endl;
  } else if (metrics_) {
    std::cout << name_ << " stopped after " << metrics_->items.load(std::memory_order_relaxed) << " frames"
              << std::endl;
  } else {
    std::cout << name_ << " stopped" << std::endl;
  }
}

} // namespace pcc
