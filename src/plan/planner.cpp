#include "texbake/plan/planner.hpp"

#include <unordered_map>

#include <spdlog/spdlog.h>

#include "texbake/core/colorspace.hpp"
#include "texbake/core/naming.hpp"

namespace texbake {
namespace {

// One object's material slot, or all of its slots merged into an atlas.
struct Group {
  std::string material_token;
  std::vector<MaterialSlot> slots;
  bool is_atlas = false;
  std::vector<UvRemap> remaps;
};

struct ChannelRoute {
  std::vector<MaterialSlot> slots;
  std::vector<RoutingInstruction> routing;
  std::vector<UvRemap> remaps;
};

LightingMode LightingFor(const ChannelInfo& info, const BakeConfig& config) {
  if (!info.requires_lighting || !config.include_lighting) {
    return LightingMode::Off;
  }
  return config.shadow_mode == ShadowMode::NoShadows ? LightingMode::NoShadows
                                                     : LightingMode::WithShadows;
}

// Drops the materials of `group` that have no route for `channel`.
ChannelRoute RouteGroup(const Group& group, ChannelKind channel, const BakeConfig& config,
                        std::vector<SkippedTargetWarning>& warnings) {
  ChannelRoute out;
  for (size_t i = 0; i < group.slots.size(); ++i) {
    const MaterialSlot& slot = group.slots[i];
    auto route = PlanRoute(slot, channel, config.mixed_shader_strategy);
    if (!route) {
      spdlog::warn("skipping {} for material '{}' on '{}': {} ({})", ChannelName(channel),
                   slot.material_name, slot.object_id, route.error().reason,
                   StrategyName(route.error().strategy));
      warnings.push_back(route.error());
      continue;
    }
    out.slots.push_back(slot);
    out.routing.push_back(*route);
    if (!group.remaps.empty()) out.remaps.push_back(group.remaps[i]);
  }
  return out;
}

tl::expected<std::vector<Group>, Error> GroupsFor(const SceneObject& object,
                                                  const BakeConfig& config, Plan& plan) {
  std::vector<Group> groups;
  if (!config.atlas.enabled) {
    for (const auto& slot : object.slots) {
      groups.push_back(Group{slot.material_name, {slot}, false, {}});
    }
    return groups;
  }
  auto layout = PackAtlas(object.slots, config.atlas);
  if (!layout) {
    return tl::unexpected(Error{layout.error().code,
                                "object '" + object.name + "': " + layout.error().message});
  }
  Group group;
  group.material_token = object.name + "_Atlas";
  group.slots = object.slots;
  group.is_atlas = true;
  if (config.atlas.update_uv) {
    group.remaps = BuildUvRemaps(*layout);
    plan.uv_remaps.insert(plan.uv_remaps.end(), group.remaps.begin(), group.remaps.end());
  }
  plan.atlases.push_back(AtlasGroup{object.id, *layout});
  groups.push_back(std::move(group));
  return groups;
}

MaterialRebuild& RebuildFor(const MaterialSlot& slot, const Resolution& primary, Plan& plan) {
  for (auto& rebuild : plan.rebuilds) {
    if (rebuild.object_id == slot.object_id && rebuild.material_id == slot.material_id) {
      return rebuild;
    }
  }
  plan.rebuilds.push_back(
      MaterialRebuild{slot.object_id, slot.material_id, slot.material_name, primary, {}});
  return plan.rebuilds.back();
}

// Wires the primary-resolution images of one channel into every routed material.
// Channels without a Principled input are left out of the rebuilt graph.
void AddRebuildInputs(const ChannelRoute& route, const ChannelInfo& info,
                      const std::string& colorspace, const Resolution& primary,
                      const std::vector<BakeTarget>& targets, size_t first_target, Plan& plan) {
  if (info.principled_socket[0] == '\0') return;
  RebuildInput input;
  input.channel = info.kind;
  input.socket = info.principled_socket;
  input.colorspace = colorspace;
  for (size_t i = first_target; i < targets.size(); ++i) {
    if (targets[i].resolution == primary) input.image_paths.push_back(targets[i].output_path);
  }
  for (const auto& slot : route.slots) {
    RebuildFor(slot, primary, plan).inputs.push_back(input);
  }
}

tl::expected<void, Error> CheckDuplicates(const std::vector<BakeTarget>& targets) {
  std::unordered_map<std::string, size_t> seen;
  for (size_t i = 0; i < targets.size(); ++i) {
    auto inserted = seen.emplace(targets[i].output_path, i);
    if (!inserted.second) {
      const BakeTarget& first = targets[inserted.first->second];
      return tl::unexpected(Error{ErrorCode::DuplicateOutput,
                                  "output path '" + targets[i].output_path +
                                      "' produced by both [" + first.Describe() + "] and [" +
                                      targets[i].Describe() + "]"});
    }
  }
  return {};
}

}  // namespace

const char* LightingModeName(LightingMode mode) {
  switch (mode) {
    case LightingMode::Off:
      return "OFF";
    case LightingMode::WithShadows:
      return "WITH_SHADOWS";
    case LightingMode::NoShadows:
      return "NO_SHADOWS";
  }
  return "OFF";
}

Resolution PrimaryResolution(const std::vector<Resolution>& resolutions) {
  Resolution primary;
  long long best = -1;
  for (const auto& r : resolutions) {
    const long long area = static_cast<long long>(r.width) * r.height;
    if (area > best) {
      best = area;
      primary = r;
    }
  }
  return primary;
}

std::string BakeTarget::Describe() const {
  std::string material = is_atlas ? std::string("atlas") : std::string();
  if (!is_atlas && !materials.empty()) material = materials.front().material_name;
  std::string s = object_name + "/" + material + " " + ChannelName(channel) + " " +
                  ResolutionLabel(resolution);
  if (tile) s += " " + std::to_string(tile->id);
  return s;
}

tl::expected<Plan, Error> PlanBake(const BakeConfig& config, const HostScene& scene) {
  auto valid = ValidateConfig(config);
  if (!valid) return tl::unexpected(valid.error());

  Plan plan;
  plan.resolutions = ExpandResolutions(config.resolutions);
  const std::vector<ChannelKind> channels = NormalizedChannels(config.channels);
  const Resolution primary = PrimaryResolution(plan.resolutions);

  for (const auto& object : scene.objects) {
    if (object.slots.empty()) {
      spdlog::info("object '{}' has no usable materials, skipping", object.name);
      continue;
    }

    std::vector<std::optional<UdimTile>> tiles;
    if (config.udim.enabled) {
      auto planned = PlanTiles(config.udim, object.udim_tiles, object.uvs, object.name);
      if (!planned) return tl::unexpected(planned.error());
      for (const auto& t : *planned) tiles.emplace_back(t);
    } else {
      tiles.emplace_back(std::nullopt);
    }

    auto groups = GroupsFor(object, config, plan);
    if (!groups) return tl::unexpected(groups.error());

    for (const auto& group : *groups) {
      for (ChannelKind channel : channels) {
        const ChannelInfo* info = LookupChannel(channel);
        auto colorspace = ResolveColorSpace(channel, config.colorspace);
        if (!colorspace) return tl::unexpected(colorspace.error());

        ChannelRoute route = RouteGroup(group, channel, config, plan.warnings);
        if (route.slots.empty()) continue;

        const LightingMode lighting = LightingFor(*info, config);
        const size_t first_target = plan.targets.size();
        for (const auto& resolution : plan.resolutions) {
          for (const auto& tile : tiles) {
            BakeTarget target;
            target.object_id = object.id;
            target.object_name = object.name;
            target.materials = route.slots;
            target.is_atlas = group.is_atlas;
            target.channel = channel;
            target.resolution = resolution;
            target.tile = tile;
            target.colorspace = *colorspace;
            target.relative_path = BuildOutputPath(
                NameRequest{object.name, group.material_token, channel, resolution,
                            tile ? std::optional<int>(tile->id) : std::nullopt},
                config.naming);
            target.output_path = (config.output_directory / target.relative_path).generic_string();
            target.routing = route.routing;
            target.uv_remaps = route.remaps;
            target.lighting = lighting;
            target.pass = lighting == LightingMode::Off ? info->pass : BakePass::Combined;
            target.margin = config.margin;
            plan.targets.push_back(std::move(target));
          }
        }
        if (config.replace_nodes) {
          AddRebuildInputs(route, *info, *colorspace, primary, plan.targets, first_target, plan);
        }
      }
    }
  }

  auto unique = CheckDuplicates(plan.targets);
  if (!unique) return tl::unexpected(unique.error());

  spdlog::info("planned {} bake targets over {} resolutions, {} skipped", plan.targets.size(),
               plan.resolutions.size(), plan.warnings.size());
  if (config.replace_nodes) {
    spdlog::info("{} materials will be rebuilt at {}", plan.rebuilds.size(),
                 ResolutionLabel(primary));
  }
  return plan;
}

}  // namespace texbake
