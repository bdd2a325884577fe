#pragma once

#include <filesystem>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/channel.hpp"
#include "texbake/core/colorspace.hpp"
#include "texbake/core/error.hpp"
#include "texbake/core/naming.hpp"
#include "texbake/core/resolution.hpp"
#include "texbake/layout/atlas.hpp"
#include "texbake/layout/udim.hpp"
#include "texbake/routing/shader_routing.hpp"

namespace texbake {

enum class ShadowMode { WithShadows, NoShadows };

constexpr int kMaxMargin = 64;

// Immutable snapshot of everything the user configured for one bake.
struct BakeConfig {
  std::filesystem::path output_directory;
  int margin = 4;
  bool replace_nodes = false;  // plan a Principled rebuild of each baked material
  ResolutionSettings resolutions;
  std::vector<ChannelKind> channels = ChannelsForPreset(ChannelPreset::Basic);
  MixedShaderStrategy mixed_shader_strategy = MixedShaderStrategy::FullSurface;
  AtlasSettings atlas;
  UdimSettings udim;
  ColorSpacePolicy colorspace;
  NamingScheme naming{NamingMode::Standard, true, true, true};
  bool include_lighting = false;
  ShadowMode shadow_mode = ShadowMode::WithShadows;  // inert without lighting
};

tl::expected<void, Error> ValidateConfig(const BakeConfig& config);

// Registered channels of `config` in registry order, duplicates removed.
std::vector<ChannelKind> NormalizedChannels(const std::vector<ChannelKind>& channels);

}  // namespace texbake
