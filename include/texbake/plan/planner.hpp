#pragma once

#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/host/scene.hpp"
#include "texbake/layout/atlas.hpp"
#include "texbake/layout/udim.hpp"
#include "texbake/plan/config.hpp"
#include "texbake/routing/shader_routing.hpp"

namespace texbake {

enum class LightingMode { Off, WithShadows, NoShadows };

const char* LightingModeName(LightingMode mode);

// One fully resolved unit of work producing exactly one image.
struct BakeTarget {
  std::string object_id;
  std::string object_name;
  std::vector<MaterialSlot> materials;  // more than one only for atlas targets
  bool is_atlas = false;
  ChannelKind channel = ChannelKind::BaseColor;
  Resolution resolution;
  std::optional<UdimTile> tile;
  std::string colorspace;
  std::string relative_path;  // naming engine output
  std::string output_path;    // relative_path under the output directory
  std::vector<RoutingInstruction> routing;
  std::vector<UvRemap> uv_remaps;  // atlas with UV update only
  LightingMode lighting = LightingMode::Off;
  BakePass pass = BakePass::Emit;
  int margin = 4;

  std::string Describe() const;
};

struct AtlasGroup {
  std::string object_id;
  AtlasLayout layout;
};

// One baked channel wired back into a Principled input of a rebuilt material.
struct RebuildInput {
  ChannelKind channel = ChannelKind::BaseColor;
  std::string socket;                    // Principled input name
  std::string colorspace;
  std::vector<std::string> image_paths;  // one per UDIM tile, otherwise exactly one
};

// Node graph the host builds for a material once its bake has finished.
struct MaterialRebuild {
  std::string object_id;
  std::string material_id;
  std::string material_name;
  Resolution resolution;             // largest planned resolution
  std::vector<RebuildInput> inputs;  // registry order
};

struct Plan {
  std::vector<BakeTarget> targets;  // object, material/group, channel, resolution, tile
  std::vector<SkippedTargetWarning> warnings;
  std::vector<Resolution> resolutions;
  std::vector<AtlasGroup> atlases;
  std::vector<UvRemap> uv_remaps;
  std::vector<MaterialRebuild> rebuilds;  // empty unless replace_nodes is set
};

// Largest area; the first listed wins a tie.
Resolution PrimaryResolution(const std::vector<Resolution>& resolutions);

// Fails with ConfigError, LayoutError or DuplicateOutput before any target is returned.
tl::expected<Plan, Error> PlanBake(const BakeConfig& config, const HostScene& scene);

}  // namespace texbake
