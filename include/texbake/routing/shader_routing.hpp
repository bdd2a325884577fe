#pragma once

#include <cstdint>
#include <string>

#include <tl/expected.hpp>

#include "texbake/core/channel.hpp"
#include "texbake/host/scene.hpp"

namespace texbake {

enum class MixedShaderStrategy { FullSurface, PrincipledOnly, CustomOnly };

const char* StrategyName(MixedShaderStrategy strategy);

enum class RouteKind { SurfaceOutput, PrincipledSocket, CustomOutput };

// Opaque to the planner; the render engine rewires the graph to sample
// `node`.`socket` before a target and restores it afterwards.
struct RoutingInstruction {
  std::string material_id;
  std::uint64_t graph_handle = 0;
  RouteKind kind = RouteKind::SurfaceOutput;
  std::string node;
  std::string socket;
  MixedShaderStrategy strategy = MixedShaderStrategy::FullSurface;
};

struct SkippedTargetWarning {
  std::string object_id;
  std::string material_id;
  std::string material_name;
  ChannelKind channel = ChannelKind::BaseColor;
  MixedShaderStrategy strategy = MixedShaderStrategy::FullSurface;
  std::string reason;
};

constexpr const char* kMaterialOutputNode = "Material Output";
constexpr const char* kSurfaceSocket = "Surface";
constexpr const char* kBsdfSocket = "BSDF";

// Route for one (material, channel) pair, or the reason it has none under `strategy`.
tl::expected<RoutingInstruction, SkippedTargetWarning> PlanRoute(const MaterialSlot& slot,
                                                                 ChannelKind channel,
                                                                 MixedShaderStrategy strategy);

}  // namespace texbake
