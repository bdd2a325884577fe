#pragma once

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/exec/executor.hpp"
#include "texbake/host/scene.hpp"
#include "texbake/plan/config.hpp"
#include "texbake/plan/planner.hpp"

namespace texbake {

// Plans the whole job, then executes it. Planning errors are returned before
// the engine sees any target; per-target failures land in the report.
tl::expected<BakeReport, Error> Bake(const BakeConfig& config, const HostScene& scene,
                                     RenderEngine& engine, MaterialGraphHost& host,
                                     const ExecuteOptions& options = {});

}  // namespace texbake
