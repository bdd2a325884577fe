#include "texbake/core/colorspace.hpp"

#include <algorithm>

namespace texbake {

tl::expected<std::string, Error> ResolveColorSpace(ChannelKind kind,
                                                   const ColorSpacePolicy& policy) {
  const ChannelInfo* info = LookupChannel(kind);
  if (!info) {
    return tl::unexpected(Error{ErrorCode::ConfigError,
                                "no color space registered for channel kind " +
                                    std::to_string(static_cast<int>(kind))});
  }
  if (policy.mode == ColorSpaceMode::ManualOverride) {
    return policy.manual_override;
  }
  if (policy.mode == ColorSpaceMode::Custom) {
    auto it = policy.overrides.find(kind);
    if (it != policy.overrides.end()) {
      return it->second;
    }
    auto git = policy.group_overrides.find(info->group);
    if (git != policy.group_overrides.end()) {
      return git->second;
    }
  }
  return std::string(info->default_colorspace);
}

const std::vector<std::string>& KnownColorSpaces() {
  static const std::vector<std::string> kSpaces = {
      "sRGB", "Non-Color", "Linear Rec.709", "Linear sRGB", "ACEScg", "Rec.2020", "Raw", "XYZ"};
  return kSpaces;
}

bool IsKnownColorSpace(const std::string& name) {
  const auto& spaces = KnownColorSpaces();
  return std::find(spaces.begin(), spaces.end(), name) != spaces.end();
}

tl::expected<void, Error> ValidateColorSpacePolicy(const ColorSpacePolicy& policy) {
  auto check = [](const std::string& name) -> tl::expected<void, Error> {
    if (!IsKnownColorSpace(name)) {
      return tl::unexpected(Error{ErrorCode::ConfigError, "unknown color space '" + name + "'"});
    }
    return {};
  };
  if (policy.mode == ColorSpaceMode::ManualOverride) {
    return check(policy.manual_override);
  }
  if (policy.mode == ColorSpaceMode::Custom) {
    for (const auto& entry : policy.overrides) {
      if (!LookupChannel(entry.first)) {
        return tl::unexpected(Error{ErrorCode::ConfigError, "override for unregistered channel"});
      }
      auto r = check(entry.second);
      if (!r) return r;
    }
    for (const auto& entry : policy.group_overrides) {
      auto r = check(entry.second);
      if (!r) return r;
    }
  }
  return {};
}

}  // namespace texbake
