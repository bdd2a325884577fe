#pragma once

#include <vector>

#include <Eigen/Core>
#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/host/scene.hpp"

namespace texbake {

enum class AtlasLayoutMode { Auto, Manual };

// Manual grids are 1..8 cells along each axis.
constexpr int kMaxAtlasGrid = 8;

struct AtlasSettings {
  bool enabled = false;
  AtlasLayoutMode mode = AtlasLayoutMode::Auto;
  int rows = 2;  // Manual only
  int cols = 2;  // Manual only
  double padding = 0.02;
  bool update_uv = true;
};

struct AtlasPlacement {
  MaterialSlot slot;
  Eigen::Vector2d uv_offset;
  Eigen::Vector2d uv_scale;
};

struct AtlasLayout {
  std::vector<AtlasPlacement> placements;  // row-major, one per material
  int rows = 1;
  int cols = 1;
  double padding = 0.0;
};

// Maps a [0,1]^2 UV of one material into its atlas island.
struct UvRemap {
  std::string object_id;
  std::string material_id;
  Eigen::Vector2d scale;
  Eigen::Vector2d offset;

  Eigen::Vector2d Apply(const Eigen::Vector2d& uv) const {
    return offset + uv.cwiseProduct(scale);
  }
};

// Smallest near-square grid: cols = ceil(sqrt(n)), rows = ceil(n / cols).
void AutoGrid(int count, int* rows, int* cols);

tl::expected<AtlasLayout, Error> PackAtlas(const std::vector<MaterialSlot>& slots,
                                           const AtlasSettings& settings);

std::vector<UvRemap> BuildUvRemaps(const AtlasLayout& layout);

}  // namespace texbake
