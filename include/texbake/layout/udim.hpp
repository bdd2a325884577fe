#pragma once

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <tl/expected.hpp>

#include "texbake/core/error.hpp"

namespace texbake {

constexpr int kFirstUdimTile = 1001;
constexpr int kLastUdimTile = 1100;  // ten columns by ten rows
constexpr int kUdimColumns = 10;

struct UdimSettings {
  bool enabled = false;
  bool auto_detect = true;  // when set the explicit range is ignored
  int range_start = 1001;
  int range_end = 1010;
};

struct UdimTile {
  int id = kFirstUdimTile;
  int row = 0;
  int col = 0;
  // [u0,u1) x [v0,v1) in UV units
  double u0 = 0.0;
  double u1 = 1.0;
  double v0 = 0.0;
  double v1 = 1.0;
};

UdimTile TileForId(int id);

// nullopt for non-finite UVs and for UVs outside the 1001..1100 block
// (left of 0, right of the 10th column, below 0 or above the 10th row).
std::optional<int> TileIdForUv(const Eigen::Vector2d& uv);

// UV relative to the tile origin, [0,1) for UVs inside the tile.
Eigen::Vector2d NormalizeToTile(const Eigen::Vector2d& uv, const UdimTile& tile);

// Sorted, deduplicated set of tiles the UVs touch.
std::vector<int> DetectTiles(const std::vector<Eigen::Vector2d>& uvs);

// ConfigError unless kFirstUdimTile <= start <= end <= kLastUdimTile.
tl::expected<std::vector<UdimTile>, Error> ExpandTileRange(int start, int end);

// Tiles to bake for one object. Auto-detect uses `host_tiles` when non-empty,
// otherwise the UVs, and falls back to 1001 when nothing is found.
tl::expected<std::vector<UdimTile>, Error> PlanTiles(const UdimSettings& settings,
                                                     const std::vector<int>& host_tiles,
                                                     const std::vector<Eigen::Vector2d>& uvs,
                                                     const std::string& object_name);

tl::expected<void, Error> ValidateUdimSettings(const UdimSettings& settings);

}  // namespace texbake
