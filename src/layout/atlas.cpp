#include "texbake/layout/atlas.hpp"

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

namespace texbake {

void AutoGrid(int count, int* rows, int* cols) {
  int c = 1;
  while (c * c < count) ++c;
  *cols = c;
  *rows = count <= 0 ? 1 : (count + c - 1) / c;
}

tl::expected<AtlasLayout, Error> PackAtlas(const std::vector<MaterialSlot>& slots,
                                           const AtlasSettings& settings) {
  const int n = static_cast<int>(slots.size());
  if (n == 0) {
    return tl::unexpected(Error{ErrorCode::LayoutError, "atlas requires at least one material"});
  }

  AtlasLayout layout;
  if (settings.mode == AtlasLayoutMode::Auto) {
    AutoGrid(n, &layout.rows, &layout.cols);
  } else {
    if (settings.rows < 1 || settings.cols < 1 || settings.rows > kMaxAtlasGrid ||
        settings.cols > kMaxAtlasGrid) {
      return tl::unexpected(Error{ErrorCode::LayoutError,
                                  "atlas layout " + std::to_string(settings.cols) + "x" +
                                      std::to_string(settings.rows) + " must be 1-" +
                                      std::to_string(kMaxAtlasGrid) + " cells per side"});
    }
    layout.rows = settings.rows;
    layout.cols = settings.cols;
    if (layout.rows * layout.cols < n) {
      return tl::unexpected(Error{ErrorCode::LayoutError,
                                  "atlas layout " + std::to_string(layout.cols) + "x" +
                                      std::to_string(layout.rows) + " cannot hold " +
                                      std::to_string(n) + " materials"});
    }
  }

  const double p = settings.padding;
  if (p < 0.0) {
    return tl::unexpected(Error{ErrorCode::LayoutError, "atlas padding must be >= 0"});
  }
  if (p >= 0.5 / std::max(layout.rows, layout.cols)) {
    return tl::unexpected(Error{ErrorCode::LayoutError, "padding exceeds cell size"});
  }
  layout.padding = p;

  const double cell_u = 1.0 / layout.cols;
  const double cell_v = 1.0 / layout.rows;
  layout.placements.reserve(slots.size());
  for (int i = 0; i < n; ++i) {
    AtlasPlacement placement;
    placement.slot = slots[i];
    placement.uv_scale = Eigen::Vector2d(cell_u - p, cell_v - p);
    placement.uv_offset =
        Eigen::Vector2d((i % layout.cols) * cell_u + p / 2.0, (i / layout.cols) * cell_v + p / 2.0);
    layout.placements.push_back(std::move(placement));
  }
  spdlog::debug("atlas {}x{} for {} materials, padding {}", layout.cols, layout.rows, n, p);
  return layout;
}

std::vector<UvRemap> BuildUvRemaps(const AtlasLayout& layout) {
  std::vector<UvRemap> remaps;
  remaps.reserve(layout.placements.size());
  for (const auto& placement : layout.placements) {
    remaps.push_back(UvRemap{placement.slot.object_id, placement.slot.material_id,
                             placement.uv_scale, placement.uv_offset});
  }
  return remaps;
}

}  // namespace texbake
