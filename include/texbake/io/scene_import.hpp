#pragma once

#include <filesystem>
#include <string>

#include <tl/expected.hpp>

#include "texbake/core/error.hpp"
#include "texbake/host/scene.hpp"

namespace texbake {

// One object named after the file stem, one slot per material that has
// geometry. UVs come from channel 0 and the tiles they touch become the
// host-reported UDIM tiles.
tl::expected<HostScene, Error> ImportMesh(const std::filesystem::path& mesh_path);

// Scene snapshot as written by a host exporter:
// {"objects": [{"id", "name", "udim_tiles", "uvs": [[u, v]...], "slots": [...]}]}
tl::expected<HostScene, Error> ParseSceneJson(const std::string& text);
tl::expected<HostScene, Error> LoadSceneJson(const std::filesystem::path& json_path);

}  // namespace texbake
