#include "texbake/exec/executor.hpp"

#include <exception>
#include <sstream>

#include <spdlog/spdlog.h>

namespace texbake {
namespace {

tl::expected<void, Error> RunTarget(const BakeTarget& target, RenderEngine& engine,
                                    MaterialGraphHost& host) {
  ScopedRouting scope(host);
  for (const auto& remap : target.uv_remaps) {
    auto r = scope.Apply(remap);
    if (!r) return r;
  }
  for (const auto& instr : target.routing) {
    auto r = scope.Apply(instr);
    if (!r) return r;
  }
  try {
    return engine.Render(target);
  } catch (const std::exception& e) {
    return tl::unexpected(Error{ErrorCode::RenderFailure, e.what()});
  }
}

}  // namespace

BakeReport ExecutePlan(const Plan& plan, RenderEngine& engine, MaterialGraphHost& host,
                       const ExecuteOptions& options) {
  BakeReport report;
  report.planned = plan.targets.size();
  report.skipped = plan.warnings;

  for (size_t i = 0; i < plan.targets.size(); ++i) {
    if (options.cancel && options.cancel->load()) {
      report.cancelled = true;
      report.not_run = plan.targets.size() - i;
      spdlog::warn("bake cancelled, {} targets not run", report.not_run);
      break;
    }
    const BakeTarget& target = plan.targets[i];
    auto result = RunTarget(target, engine, host);
    if (result) {
      spdlog::info("baked {} ({}/{})", target.output_path, i + 1, plan.targets.size());
      report.succeeded.push_back(target.output_path);
    } else {
      Error err = result.error();
      if (err.code != ErrorCode::RenderFailure && err.code != ErrorCode::IoError) {
        err.code = ErrorCode::RenderFailure;
      }
      spdlog::error("baking {} failed: {}", target.Describe(), err.message);
      report.failed.push_back(TargetFailure{i, target.output_path, err});
    }
    if (options.on_progress) {
      options.on_progress(Progress{i, plan.targets.size(), &target, !result});
    }
  }
  return report;
}

std::string SummarizeReport(const BakeReport& report) {
  std::ostringstream os;
  for (const auto& f : report.failed) {
    os << "failed: " << f.output_path << ": " << f.error.message << "\n";
  }
  for (const auto& w : report.skipped) {
    os << "skipped: " << w.material_name << " " << ChannelName(w.channel) << ": " << w.reason
       << "\n";
  }
  os << report.succeeded.size() << " succeeded, " << report.skipped.size() << " skipped, "
     << report.failed.size() << " failed";
  if (report.cancelled) {
    os << ", cancelled with " << report.not_run << " not run";
  }
  return os.str();
}

}  // namespace texbake
