#pragma once

#include <filesystem>
#include <string>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/plan/planner.hpp"

namespace texbake {

// Targets in plan order with their resolved paths, color spaces and routing,
// followed by the skipped-target warnings and atlas layouts.
std::string PlanToJson(const Plan& plan);

tl::expected<void, Error> WritePlanJson(const Plan& plan, const std::filesystem::path& json_path);

}  // namespace texbake
