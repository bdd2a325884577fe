#include "texbake/layout/udim.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include <spdlog/spdlog.h>

namespace texbake {

UdimTile TileForId(int id) {
  UdimTile tile;
  tile.id = id;
  tile.row = (id - kFirstUdimTile) / kUdimColumns;
  tile.col = (id - kFirstUdimTile) % kUdimColumns;
  tile.u0 = tile.col;
  tile.u1 = tile.col + 1.0;
  tile.v0 = tile.row;
  tile.v1 = tile.row + 1.0;
  return tile;
}

std::optional<int> TileIdForUv(const Eigen::Vector2d& uv) {
  if (!std::isfinite(uv.x()) || !std::isfinite(uv.y())) {
    return std::nullopt;
  }
  // Range-checked in double so the casts below stay within int.
  const double u = std::floor(uv.x());
  const double v = std::floor(uv.y());
  constexpr int kUdimRows = (kLastUdimTile - kFirstUdimTile) / kUdimColumns + 1;
  if (u < 0.0 || u >= kUdimColumns || v < 0.0 || v >= kUdimRows) {
    return std::nullopt;
  }
  return kFirstUdimTile + static_cast<int>(u) + static_cast<int>(v) * kUdimColumns;
}

Eigen::Vector2d NormalizeToTile(const Eigen::Vector2d& uv, const UdimTile& tile) {
  return uv - Eigen::Vector2d(tile.u0, tile.v0);
}

std::vector<int> DetectTiles(const std::vector<Eigen::Vector2d>& uvs) {
  std::set<int> tiles;
  for (const auto& uv : uvs) {
    if (auto id = TileIdForUv(uv)) tiles.insert(*id);
  }
  return std::vector<int>(tiles.begin(), tiles.end());
}

tl::expected<void, Error> ValidateUdimSettings(const UdimSettings& settings) {
  if (!settings.enabled || settings.auto_detect) {
    return {};
  }
  auto in_block = [](int id) { return id >= kFirstUdimTile && id <= kLastUdimTile; };
  if (!in_block(settings.range_start) || !in_block(settings.range_end)) {
    return tl::unexpected(Error{ErrorCode::ConfigError,
                                "UDIM range " + std::to_string(settings.range_start) + "-" +
                                    std::to_string(settings.range_end) +
                                    " must lie within 1001-1100"});
  }
  if (settings.range_start > settings.range_end) {
    return tl::unexpected(Error{ErrorCode::ConfigError,
                                "UDIM range start " + std::to_string(settings.range_start) +
                                    " is after end " + std::to_string(settings.range_end)});
  }
  return {};
}

tl::expected<std::vector<UdimTile>, Error> ExpandTileRange(int start, int end) {
  UdimSettings settings;
  settings.enabled = true;
  settings.auto_detect = false;
  settings.range_start = start;
  settings.range_end = end;
  auto valid = ValidateUdimSettings(settings);
  if (!valid) return tl::unexpected(valid.error());

  std::vector<UdimTile> tiles;
  tiles.reserve(static_cast<size_t>(end - start + 1));
  for (int id = start; id <= end; ++id) tiles.push_back(TileForId(id));
  return tiles;
}

tl::expected<std::vector<UdimTile>, Error> PlanTiles(const UdimSettings& settings,
                                                     const std::vector<int>& host_tiles,
                                                     const std::vector<Eigen::Vector2d>& uvs,
                                                     const std::string& object_name) {
  if (!settings.auto_detect) {
    return ExpandTileRange(settings.range_start, settings.range_end);
  }
  std::vector<int> ids;
  if (!host_tiles.empty()) {
    std::set<int> unique;
    for (int id : host_tiles) {
      if (id < kFirstUdimTile || id > kLastUdimTile) {
        return tl::unexpected(Error{ErrorCode::ConfigError,
                                    "object '" + object_name + "' reports invalid UDIM tile " +
                                        std::to_string(id)});
      }
      unique.insert(id);
    }
    ids.assign(unique.begin(), unique.end());
  } else {
    ids = DetectTiles(uvs);
  }
  if (ids.empty()) {
    spdlog::warn("object '{}' has no UDIM tiles detected, baking tile {}", object_name,
                 kFirstUdimTile);
    ids.push_back(kFirstUdimTile);
  }
  std::vector<UdimTile> tiles;
  tiles.reserve(ids.size());
  for (int id : ids) tiles.push_back(TileForId(id));
  return tiles;
}

}  // namespace texbake
