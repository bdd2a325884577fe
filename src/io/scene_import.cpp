#include "texbake/io/scene_import.hpp"

#include <fstream>
#include <sstream>

#include <assimp/Importer.hpp>
#include <assimp/postprocess.h>
#include <assimp/scene.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "texbake/layout/udim.hpp"

namespace texbake {
namespace {

using nlohmann::json;

Error SceneError(const std::string& what) {
  return Error{ErrorCode::ConfigError, "scene description: " + what};
}

template <typename T>
void Read(const json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end()) out = it->template get<T>();
}

tl::expected<MaterialSlot, Error> ParseSlot(const json& js, const SceneObject& object,
                                            int index) {
  if (!js.is_object()) {
    return tl::unexpected(SceneError("slot " + std::to_string(index) + " of '" + object.name +
                                     "' is not an object"));
  }
  MaterialSlot slot;
  slot.object_id = object.id;
  slot.slot_index = index;
  Read(js, "material_name", slot.material_name);
  slot.material_id = slot.material_name;
  Read(js, "material_id", slot.material_id);
  Read(js, "graph_handle", slot.graph_handle);
  Read(js, "uv_set", slot.uv_set);
  Read(js, "principled_node", slot.principled_node);
  Read(js, "custom_output", slot.custom_output);
  std::string shader_class = ShaderClassName(slot.shader_class);
  Read(js, "shader_class", shader_class);
  auto cls = ParseShaderClass(shader_class);
  if (!cls) return tl::unexpected(SceneError(cls.error().message));
  slot.shader_class = *cls;
  if (slot.material_id.empty()) {
    return tl::unexpected(SceneError("slot " + std::to_string(index) + " of '" + object.name +
                                     "' has no material"));
  }
  return slot;
}

tl::expected<SceneObject, Error> ParseObject(const json& jo, size_t index) {
  if (!jo.is_object()) {
    return tl::unexpected(SceneError("object " + std::to_string(index) + " is not an object"));
  }
  SceneObject object;
  Read(jo, "name", object.name);
  object.id = object.name;
  Read(jo, "id", object.id);
  if (object.id.empty()) {
    return tl::unexpected(SceneError("object " + std::to_string(index) + " has no id or name"));
  }
  if (object.name.empty()) object.name = object.id;
  Read(jo, "udim_tiles", object.udim_tiles);
  auto uvs = jo.find("uvs");
  if (uvs != jo.end()) {
    for (const auto& uv : *uvs) {
      if (!uv.is_array() || uv.size() != 2) {
        return tl::unexpected(SceneError("uvs of '" + object.name + "' must be [u, v] pairs"));
      }
      object.uvs.emplace_back(uv[0].get<double>(), uv[1].get<double>());
    }
  }
  auto slots = jo.find("slots");
  if (slots != jo.end()) {
    int slot_index = 0;
    for (const auto& js : *slots) {
      auto slot = ParseSlot(js, object, slot_index++);
      if (!slot) return tl::unexpected(slot.error());
      object.slots.push_back(std::move(*slot));
    }
  }
  return object;
}

}  // namespace

tl::expected<HostScene, Error> ImportMesh(const std::filesystem::path& mesh_path) {
  Assimp::Importer importer;
  const aiScene* ai = importer.ReadFile(mesh_path.string(),
                                        aiProcess_Triangulate | aiProcess_JoinIdenticalVertices);
  if (!ai) {
    return tl::unexpected(Error{ErrorCode::MeshParseError, importer.GetErrorString()});
  }

  SceneObject object;
  object.name = mesh_path.stem().string();
  object.id = object.name;
  for (unsigned m = 0; m < ai->mNumMaterials; ++m) {
    bool used = false;
    for (unsigned mesh_idx = 0; mesh_idx < ai->mNumMeshes; ++mesh_idx) {
      const aiMesh* mesh = ai->mMeshes[mesh_idx];
      if (mesh->mMaterialIndex != m) continue;
      used = true;
      if (!mesh->HasTextureCoords(0)) continue;
      for (unsigned v = 0; v < mesh->mNumVertices; ++v) {
        const aiVector3D& uv = mesh->mTextureCoords[0][v];
        object.uvs.emplace_back(uv.x, uv.y);
      }
    }
    if (!used) continue;

    MaterialSlot slot;
    slot.object_id = object.id;
    slot.slot_index = static_cast<int>(object.slots.size());
    aiString name;
    if (ai->mMaterials[m]->Get(AI_MATKEY_NAME, name) == AI_SUCCESS) {
      slot.material_name = name.C_Str();
    }
    if (slot.material_name.empty()) slot.material_name = "Material" + std::to_string(m);
    slot.material_id = slot.material_name;
    slot.graph_handle = m;
    object.slots.push_back(std::move(slot));
  }
  object.udim_tiles = DetectTiles(object.uvs);
  spdlog::info("imported {}: {} material slots, {} UDIM tiles", mesh_path.string(),
               object.slots.size(), object.udim_tiles.size());

  HostScene scene;
  scene.objects.push_back(std::move(object));
  return scene;
}

tl::expected<HostScene, Error> ParseSceneJson(const std::string& text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return tl::unexpected(SceneError("not a JSON object"));
  }
  HostScene scene;
  try {
    auto objects = j.find("objects");
    if (objects == j.end() || !objects->is_array()) {
      return tl::unexpected(SceneError("missing 'objects' array"));
    }
    for (size_t i = 0; i < objects->size(); ++i) {
      auto object = ParseObject((*objects)[i], i);
      if (!object) return tl::unexpected(object.error());
      scene.objects.push_back(std::move(*object));
    }
  } catch (const json::exception& e) {
    return tl::unexpected(SceneError(e.what()));
  }
  return scene;
}

tl::expected<HostScene, Error> LoadSceneJson(const std::filesystem::path& json_path) {
  std::ifstream is(json_path);
  if (!is) {
    return tl::unexpected(
        Error{ErrorCode::IoError, "failed to read scene " + json_path.string()});
  }
  std::ostringstream ss;
  ss << is.rdbuf();
  return ParseSceneJson(ss.str());
}

}  // namespace texbake
