#pragma once

#include <array>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"

namespace texbake {

constexpr int kMinResolution = 16;
constexpr int kMaxResolution = 16384;
constexpr int kMaxCustomResolutions = 3;

struct Resolution {
  int width = 2048;
  int height = 2048;

  bool operator==(const Resolution& o) const { return width == o.width && height == o.height; }
  bool operator!=(const Resolution& o) const { return !(*this == o); }
};

// "2048x2048"
std::string ResolutionLabel(const Resolution& r);

struct CustomResolution {
  Resolution size;
  bool enabled = false;
};

struct ResolutionSettings {
  int base = 2048;  // used when multi-resolution export is off
  bool multi_resolution = false;
  bool res_512 = false;
  bool res_1024 = true;
  bool res_2048 = true;
  bool res_4096 = false;
  bool res_8192 = false;
  bool custom_enabled = false;
  std::array<CustomResolution, kMaxCustomResolutions> custom = {
      CustomResolution{{1536, 1536}, false},
      CustomResolution{{1920, 1080}, false},
      CustomResolution{{1280, 720}, false},
  };
};

tl::expected<void, Error> ValidateResolutions(const ResolutionSettings& settings);

// Standard sizes then custom slots, identical sizes merged, stable-sorted by area.
// Falls back to the base size when multi-resolution is on but nothing is selected.
std::vector<Resolution> ExpandResolutions(const ResolutionSettings& settings);

enum class ResolutionGroup { Game, Film, All, None };

void ApplyResolutionGroup(ResolutionGroup group, ResolutionSettings& settings);

enum class CustomQuickSet {
  Square1536,
  Square3072,
  Square6144,
  Hd1920x1080,
  Hd1280x720,
  Qhd2560x1440,
  Uhd3840x2160,
  Clear
};

// Square sizes own a fixed slot. Rectangular sizes take the first disabled slot and
// replace a fixed slot when all three are in use. Clear disables every slot and
// restores the default sizes.
void ApplyCustomQuickSet(CustomQuickSet quick, ResolutionSettings& settings);

}  // namespace texbake
