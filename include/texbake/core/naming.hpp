#pragma once

#include <optional>
#include <string>

#include "texbake/core/channel.hpp"
#include "texbake/core/resolution.hpp"

namespace texbake {

enum class NamingMode {
  Standard,  // {material}.{tile}.{channel}.png
  Mari,      // {material}_{tile}_{channel}.png
  Mudbox     // {material}.{channel}.{tile}.png
};

struct NamingScheme {
  NamingMode mode = NamingMode::Standard;
  bool folder_by_object = false;
  bool folder_by_material = false;
  bool folder_by_resolution = false;
};

struct NameRequest {
  std::string object;
  std::string material;
  ChannelKind channel = ChannelKind::BaseColor;
  Resolution resolution;
  std::optional<int> tile;
};

// Replaces every character outside [A-Za-z0-9_.-] with '_'; empty input yields `fallback`.
std::string SanitizeName(const std::string& name, const std::string& fallback);

// Relative '/'-separated path: optional object/material/resolution folders, then the file.
std::string BuildOutputPath(const NameRequest& request, const NamingScheme& scheme);

}  // namespace texbake
