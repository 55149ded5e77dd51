#pragma once

#include <atomic>
#include <string>

#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

namespace pcc {

/*
    A pipeline stage is a named worker loop on its own thread. Subclasses implement run() and return from it
    when either stop flag is set or their input is exhausted. The stage closes its output queue on the way out,
    so whoever is downstream can tell the stream has ended.

    metrics may be null, stages then just don't record anything.
*/
class Stage {
public:
  Stage(std::string name, StageMetrics* metrics);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  void start(StopToken global_stop);

  // Requests a local stop and joins. Safe to call more than once
  void stop();

  // run() has returned
  bool finished() const { return runner_.finished(); }
  bool failed() const { return runner_.failed(); }
  std::string error() const { return runner_.error(); }

  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& global_stop,
                   const std::atomic_bool& local_stop) = 0;

  StageMetrics* metrics() const { return metrics_; }

private:
  std::string name_;
  StageMetrics* metrics_;
  ThreadRunner runner_;
  bool started_{false};
};

} // namespace pcc
