#include "texbake/api.hpp"

#include <spdlog/spdlog.h>

namespace texbake {

tl::expected<BakeReport, Error> Bake(const BakeConfig& config, const HostScene& scene,
                                     RenderEngine& engine, MaterialGraphHost& host,
                                     const ExecuteOptions& options) {
  auto plan = PlanBake(config, scene);
  if (!plan) {
    spdlog::error("planning failed ({}): {}", ErrorCodeName(plan.error().code),
                  plan.error().message);
    return tl::unexpected(plan.error());
  }
  BakeReport report = ExecutePlan(*plan, engine, host, options);
  spdlog::info("bake finished: {} succeeded, {} skipped, {} failed", report.succeeded.size(),
               report.skipped.size(), report.failed.size());
  return report;
}

}  // namespace texbake
