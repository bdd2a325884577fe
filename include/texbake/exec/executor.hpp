#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/plan/planner.hpp"
#include "texbake/routing/scoped_routing.hpp"

namespace texbake {

// External rasterizer. Owns the render device; receives one target at a time
// with its routing already applied and writes the image at target.output_path.
class RenderEngine {
 public:
  virtual ~RenderEngine() = default;
  virtual tl::expected<void, Error> Render(const BakeTarget& target) = 0;
};

struct TargetFailure {
  size_t index = 0;
  std::string output_path;
  Error error;
};

struct BakeReport {
  size_t planned = 0;
  std::vector<std::string> succeeded;  // output paths
  std::vector<SkippedTargetWarning> skipped;
  std::vector<TargetFailure> failed;
  size_t not_run = 0;  // left over after cancellation
  bool cancelled = false;

  bool ok() const { return failed.empty() && !cancelled; }
};

struct Progress {
  size_t index = 0;
  size_t total = 0;
  const BakeTarget* target = nullptr;
  bool failed = false;
};

struct ExecuteOptions {
  const std::atomic<bool>* cancel = nullptr;
  std::function<void(const Progress&)> on_progress;
};

// Strictly sequential; a failed target is recorded and the batch continues.
BakeReport ExecutePlan(const Plan& plan, RenderEngine& engine, MaterialGraphHost& host,
                       const ExecuteOptions& options = {});

// One line per failed target plus a totals line.
std::string SummarizeReport(const BakeReport& report);

}  // namespace texbake
