#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "texbake/host/scene.hpp"
#include "texbake/plan/config.hpp"

namespace texbake::test {

inline MaterialSlot Slot(const std::string& object, const std::string& material, int index = 0,
                         ShaderClass cls = ShaderClass::PrincipledOnly) {
  MaterialSlot slot;
  slot.object_id = object;
  slot.slot_index = index;
  slot.material_id = material;
  slot.material_name = material;
  slot.graph_handle = static_cast<std::uint64_t>(index + 1);
  slot.shader_class = cls;
  return slot;
}

inline SceneObject Object(const std::string& name, std::vector<MaterialSlot> slots) {
  SceneObject object;
  object.id = name;
  object.name = name;
  object.slots = std::move(slots);
  return object;
}

// Flat output layout without folders, single 2048 resolution, one channel.
inline BakeConfig FlatConfig(ChannelKind channel = ChannelKind::BaseColor) {
  BakeConfig config;
  config.output_directory = "out";
  config.channels = {channel};
  config.naming = NamingScheme{NamingMode::Standard, false, false, false};
  return config;
}

}  // namespace texbake::test
