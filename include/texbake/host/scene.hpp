#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Core>
#include <tl/expected.hpp>

#include "texbake/core/error.hpp"

namespace texbake {

// Which networks feed the material output Surface socket, as reported by the host.
enum class ShaderClass { PrincipledOnly, CustomOnly, Mixed };

const char* ShaderClassName(ShaderClass c);
tl::expected<ShaderClass, Error> ParseShaderClass(const std::string& name);

struct MaterialSlot {
  std::string object_id;
  int slot_index = 0;
  std::string material_id;
  std::string material_name;
  std::uint64_t graph_handle = 0;  // opaque reference into host data
  std::string uv_set = "UVMap";
  ShaderClass shader_class = ShaderClass::PrincipledOnly;
  std::string principled_node = "Principled BSDF";
  std::string custom_output;       // "<node>.<socket>" of the custom network
};

struct SceneObject {
  std::string id;
  std::string name;
  std::vector<MaterialSlot> slots;
  std::vector<int> udim_tiles;       // host-reported tiles in use, may be empty
  std::vector<Eigen::Vector2d> uvs;  // raw UV coordinates for tile detection
};

// Selection snapshot handed to the planner for one run.
struct HostScene {
  std::vector<SceneObject> objects;
};

}  // namespace texbake
