#pragma once

#include <map>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/channel.hpp"
#include "texbake/core/error.hpp"

namespace texbake {

enum class ColorSpaceMode { Auto, Custom, ManualOverride };

struct ColorSpacePolicy {
  ColorSpaceMode mode = ColorSpaceMode::Auto;
  std::map<ChannelKind, std::string> overrides;        // Custom, per channel
  std::map<ColorSpaceGroup, std::string> group_overrides;  // Custom, per group
  std::string manual_override = "sRGB";                // ManualOverride
};

// ManualOverride > Custom channel override > Custom group override > registry default.
tl::expected<std::string, Error> ResolveColorSpace(ChannelKind kind,
                                                   const ColorSpacePolicy& policy);

const std::vector<std::string>& KnownColorSpaces();
bool IsKnownColorSpace(const std::string& name);

// Rejects color space names outside KnownColorSpaces().
tl::expected<void, Error> ValidateColorSpacePolicy(const ColorSpacePolicy& policy);

}  // namespace texbake
