#pragma once

#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"

namespace texbake {

// Registry order is the channel order of a plan.
enum class ChannelKind {
  BaseColor,
  Roughness,
  Metallic,
  Normal,
  Subsurface,
  Transmission,
  Emission,
  Alpha,
  Specular,
  Clearcoat,
  ClearcoatRoughness,
  Sheen,
  Displacement,
  AmbientOcclusion,
  CustomShader
};

// Which grouped color-space setting a channel falls under.
enum class ColorSpaceGroup { Color, Normal, Data, Emission };

// How the render engine samples a channel.
enum class BakePass { Emit, Roughness, Normal, AmbientOcclusion, Combined };

struct ChannelInfo {
  ChannelKind kind;
  const char* name;                // "BaseColor"
  const char* suffix;              // file token, "basecolor"
  const char* default_colorspace;
  bool requires_lighting;
  bool is_advanced;
  ColorSpaceGroup group;
  BakePass pass;
  const char* principled_socket;   // empty when the channel has no BSDF input
};

// nullptr when `kind` is not a registered channel.
const ChannelInfo* LookupChannel(ChannelKind kind);
const std::vector<ChannelInfo>& AllChannels();

std::string ChannelName(ChannelKind kind);
tl::expected<ChannelKind, Error> ParseChannel(const std::string& name);

const char* BakePassName(BakePass pass);

enum class ChannelPreset { Basic, Full, None, CustomShaderOnly };

std::vector<ChannelKind> ChannelsForPreset(ChannelPreset preset);

}  // namespace texbake
