#include "texbake/core/resolution.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace texbake {
namespace {

bool InRange(int v) { return v >= kMinResolution && v <= kMaxResolution; }

tl::expected<void, Error> CheckSize(const Resolution& r, const std::string& what) {
  if (r.width <= 0 || r.height <= 0) {
    return tl::unexpected(
        Error{ErrorCode::ConfigError, what + " must be positive, got " + ResolutionLabel(r)});
  }
  if (!InRange(r.width) || !InRange(r.height)) {
    return tl::unexpected(Error{ErrorCode::ConfigError,
                                what + " " + ResolutionLabel(r) + " outside [" +
                                    std::to_string(kMinResolution) + ", " +
                                    std::to_string(kMaxResolution) + "]"});
  }
  return {};
}

}  // namespace

std::string ResolutionLabel(const Resolution& r) {
  return std::to_string(r.width) + "x" + std::to_string(r.height);
}

tl::expected<void, Error> ValidateResolutions(const ResolutionSettings& settings) {
  auto base = CheckSize({settings.base, settings.base}, "resolution");
  if (!base) return base;
  if (settings.multi_resolution && settings.custom_enabled) {
    for (size_t i = 0; i < settings.custom.size(); ++i) {
      if (!settings.custom[i].enabled) continue;
      auto r = CheckSize(settings.custom[i].size, "custom resolution " + std::to_string(i + 1));
      if (!r) return r;
    }
  }
  return {};
}

std::vector<Resolution> ExpandResolutions(const ResolutionSettings& settings) {
  if (!settings.multi_resolution) {
    return {Resolution{settings.base, settings.base}};
  }
  std::vector<Resolution> out;
  auto add = [&out](const Resolution& r) {
    if (std::find(out.begin(), out.end(), r) == out.end()) out.push_back(r);
  };
  const std::pair<bool, int> standard[] = {{settings.res_512, 512},
                                           {settings.res_1024, 1024},
                                           {settings.res_2048, 2048},
                                           {settings.res_4096, 4096},
                                           {settings.res_8192, 8192}};
  for (const auto& s : standard) {
    if (s.first) add({s.second, s.second});
  }
  if (settings.custom_enabled) {
    for (const auto& slot : settings.custom) {
      if (slot.enabled) add(slot.size);
    }
  }
  if (out.empty()) {
    spdlog::warn("multi-resolution enabled but no resolution selected, using {}x{}",
                 settings.base, settings.base);
    return {Resolution{settings.base, settings.base}};
  }
  std::stable_sort(out.begin(), out.end(), [](const Resolution& a, const Resolution& b) {
    return static_cast<long long>(a.width) * a.height <
           static_cast<long long>(b.width) * b.height;
  });
  return out;
}

void ApplyResolutionGroup(ResolutionGroup group, ResolutionSettings& settings) {
  bool game = group == ResolutionGroup::Game;
  bool film = group == ResolutionGroup::Film;
  bool all = group == ResolutionGroup::All;
  settings.res_512 = game || all;
  settings.res_1024 = game || all;
  settings.res_2048 = game || film || all;
  settings.res_4096 = film || all;
  settings.res_8192 = film || all;
}

void ApplyCustomQuickSet(CustomQuickSet quick, ResolutionSettings& settings) {
  auto& slots = settings.custom;
  auto fixed = [&slots](size_t i, int w, int h) {
    slots[i].size = {w, h};
    slots[i].enabled = true;
  };
  auto first_free = [&slots](size_t fallback, int w, int h) {
    for (auto& slot : slots) {
      if (!slot.enabled) {
        slot.size = {w, h};
        slot.enabled = true;
        return;
      }
    }
    slots[fallback].size = {w, h};
  };
  switch (quick) {
    case CustomQuickSet::Square1536:
      fixed(0, 1536, 1536);
      break;
    case CustomQuickSet::Square3072:
      fixed(1, 3072, 3072);
      break;
    case CustomQuickSet::Square6144:
      fixed(2, 6144, 6144);
      break;
    case CustomQuickSet::Hd1920x1080:
      first_free(0, 1920, 1080);
      break;
    case CustomQuickSet::Hd1280x720:
      first_free(1, 1280, 720);
      break;
    case CustomQuickSet::Qhd2560x1440:
      first_free(2, 2560, 1440);
      break;
    case CustomQuickSet::Uhd3840x2160:
      first_free(0, 3840, 2160);
      break;
    case CustomQuickSet::Clear:
      slots = ResolutionSettings{}.custom;
      break;
  }
}

}  // namespace texbake
