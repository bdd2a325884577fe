#include "texbake/preset/preset.hpp"

#include <algorithm>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace texbake {
namespace {

using nlohmann::json;

template <typename E>
using EnumNames = std::vector<std::pair<E, const char*>>;

const EnumNames<ColorSpaceMode> kColorSpaceModes = {{ColorSpaceMode::Auto, "AUTO"},
                                                    {ColorSpaceMode::Custom, "CUSTOM"},
                                                    {ColorSpaceMode::ManualOverride, "MANUAL"}};

const EnumNames<MixedShaderStrategy> kStrategies = {
    {MixedShaderStrategy::FullSurface, "SURFACE_OUTPUT"},
    {MixedShaderStrategy::PrincipledOnly, "PRINCIPLED_ONLY"},
    {MixedShaderStrategy::CustomOnly, "CUSTOM_ONLY"}};

const EnumNames<ShadowMode> kShadowModes = {{ShadowMode::WithShadows, "WITH_SHADOWS"},
                                            {ShadowMode::NoShadows, "NO_SHADOWS"}};

const EnumNames<NamingMode> kNamingModes = {{NamingMode::Standard, "STANDARD"},
                                            {NamingMode::Mari, "MARI"},
                                            {NamingMode::Mudbox, "MUDBOX"}};

const EnumNames<AtlasLayoutMode> kAtlasModes = {{AtlasLayoutMode::Auto, "AUTO"},
                                                {AtlasLayoutMode::Manual, "MANUAL"}};

const std::vector<std::pair<ChannelKind, const char*>> kIncludeKeys = {
    {ChannelKind::BaseColor, "include_basecolor"},
    {ChannelKind::Roughness, "include_roughness"},
    {ChannelKind::Metallic, "include_metallic"},
    {ChannelKind::Normal, "include_normal"},
    {ChannelKind::Subsurface, "include_subsurface"},
    {ChannelKind::Transmission, "include_transmission"},
    {ChannelKind::Emission, "include_emission"},
    {ChannelKind::Alpha, "include_alpha"},
    {ChannelKind::Specular, "include_specular"},
    {ChannelKind::Clearcoat, "include_clearcoat"},
    {ChannelKind::ClearcoatRoughness, "include_clearcoat_roughness"},
    {ChannelKind::Sheen, "include_sheen"},
    {ChannelKind::Displacement, "include_displacement"},
    {ChannelKind::AmbientOcclusion, "include_ambient_occlusion"},
    {ChannelKind::CustomShader, "include_custom_shader"}};

const std::vector<std::pair<ColorSpaceGroup, const char*>> kGroupKeys = {
    {ColorSpaceGroup::Color, "colorspace_basecolor"},
    {ColorSpaceGroup::Normal, "colorspace_normal"},
    {ColorSpaceGroup::Data, "colorspace_roughness"},
    {ColorSpaceGroup::Emission, "colorspace_emission"}};

template <typename E>
const char* NameOf(const EnumNames<E>& names, E value) {
  for (const auto& entry : names) {
    if (entry.first == value) return entry.second;
  }
  return names.front().second;
}

Error FormatError(std::string message) {
  return Error{ErrorCode::PresetFormatError, std::move(message)};
}

template <typename E>
tl::expected<void, Error> ReadEnum(const json& j, const char* key, const EnumNames<E>& names,
                                   E& out) {
  if (!j.contains(key)) return {};
  const json& v = j.at(key);
  if (!v.is_string()) {
    return tl::unexpected(FormatError(std::string(key) + " must be a string"));
  }
  const std::string s = v.get<std::string>();
  for (const auto& entry : names) {
    if (s == entry.second) {
      out = entry.first;
      return {};
    }
  }
  return tl::unexpected(FormatError("unrecognized " + std::string(key) + " '" + s + "'"));
}

// Leaves `out` untouched when the key is absent; get<T> throws type_error on a
// mismatched JSON type.
template <typename T>
void Read(const json& j, const char* key, T& out) {
  if (j.contains(key)) out = j.at(key).get<T>();
}

json EncodeConfig(const BakeConfig& c) {
  json j;
  const ResolutionSettings& r = c.resolutions;
  j["resolution"] = r.base;
  j["margin"] = c.margin;
  j["replace_nodes"] = c.replace_nodes;
  j["include_lighting"] = c.include_lighting;
  j["lighting_shadow_mode"] = NameOf(kShadowModes, c.shadow_mode);
  j["output_directory"] = c.output_directory.generic_string();

  j["enable_multi_resolution"] = r.multi_resolution;
  j["res_512"] = r.res_512;
  j["res_1024"] = r.res_1024;
  j["res_2048"] = r.res_2048;
  j["res_4096"] = r.res_4096;
  j["res_8192"] = r.res_8192;
  j["enable_custom_resolution"] = r.custom_enabled;
  for (size_t i = 0; i < r.custom.size(); ++i) {
    const std::string n = std::to_string(i + 1);
    j["custom_width_" + n] = r.custom[i].size.width;
    j["custom_height_" + n] = r.custom[i].size.height;
    j["use_custom_" + n] = r.custom[i].enabled;
  }

  const std::vector<ChannelKind> channels = NormalizedChannels(c.channels);
  for (const auto& entry : kIncludeKeys) {
    j[entry.second] =
        std::find(channels.begin(), channels.end(), entry.first) != channels.end();
  }
  j["mixed_shader_strategy"] = NameOf(kStrategies, c.mixed_shader_strategy);

  j["colorspace_mode"] = NameOf(kColorSpaceModes, c.colorspace.mode);
  j["colorspace_manual_override"] = c.colorspace.manual_override;
  for (const auto& entry : kGroupKeys) {
    auto it = c.colorspace.group_overrides.find(entry.first);
    if (it != c.colorspace.group_overrides.end()) j[entry.second] = it->second;
  }
  json overrides = json::object();
  for (const auto& entry : c.colorspace.overrides) {
    overrides[ChannelName(entry.first)] = entry.second;
  }
  j["colorspace_overrides"] = overrides;

  j["enable_material_atlas"] = c.atlas.enabled;
  j["atlas_layout_mode"] = NameOf(kAtlasModes, c.atlas.mode);
  j["atlas_rows"] = c.atlas.rows;
  j["atlas_cols"] = c.atlas.cols;
  j["atlas_padding"] = c.atlas.padding;
  j["atlas_update_uv"] = c.atlas.update_uv;

  j["enable_udim"] = c.udim.enabled;
  j["udim_auto_detect"] = c.udim.auto_detect;
  j["udim_range_start"] = c.udim.range_start;
  j["udim_range_end"] = c.udim.range_end;
  j["udim_naming_mode"] = NameOf(kNamingModes, c.naming.mode);
  j["folder_by_object"] = c.naming.folder_by_object;
  j["folder_by_material"] = c.naming.folder_by_material;
  j["folder_by_resolution"] = c.naming.folder_by_resolution;
  return j;
}

tl::expected<void, Error> DecodeDiscriminants(const json& j, BakeConfig& c) {
  auto r = ReadEnum(j, "lighting_shadow_mode", kShadowModes, c.shadow_mode);
  if (!r) return r;
  r = ReadEnum(j, "mixed_shader_strategy", kStrategies, c.mixed_shader_strategy);
  if (!r) return r;
  r = ReadEnum(j, "colorspace_mode", kColorSpaceModes, c.colorspace.mode);
  if (!r) return r;
  r = ReadEnum(j, "atlas_layout_mode", kAtlasModes, c.atlas.mode);
  if (!r) return r;
  return ReadEnum(j, "udim_naming_mode", kNamingModes, c.naming.mode);
}

void DecodeFields(const json& j, BakeConfig& c) {
  ResolutionSettings& r = c.resolutions;
  Read(j, "resolution", r.base);
  Read(j, "margin", c.margin);
  Read(j, "replace_nodes", c.replace_nodes);
  Read(j, "include_lighting", c.include_lighting);

  if (j.contains("output_directory")) {
    c.output_directory = j.at("output_directory").get<std::string>();
  } else {
    bool use_custom = false;
    std::string custom;
    Read(j, "use_custom_directory", use_custom);
    Read(j, "custom_directory", custom);
    if (use_custom && !custom.empty()) c.output_directory = custom;
  }

  Read(j, "enable_multi_resolution", r.multi_resolution);
  Read(j, "res_512", r.res_512);
  Read(j, "res_1024", r.res_1024);
  Read(j, "res_2048", r.res_2048);
  Read(j, "res_4096", r.res_4096);
  Read(j, "res_8192", r.res_8192);
  Read(j, "enable_custom_resolution", r.custom_enabled);
  for (size_t i = 0; i < r.custom.size(); ++i) {
    const std::string n = std::to_string(i + 1);
    Read(j, ("custom_width_" + n).c_str(), r.custom[i].size.width);
    Read(j, ("custom_height_" + n).c_str(), r.custom[i].size.height);
    Read(j, ("use_custom_" + n).c_str(), r.custom[i].enabled);
  }

  std::vector<ChannelKind> channels = NormalizedChannels(c.channels);
  std::vector<ChannelKind> selected;
  for (const auto& entry : kIncludeKeys) {
    bool on = std::find(channels.begin(), channels.end(), entry.first) != channels.end();
    Read(j, entry.second, on);
    if (on) selected.push_back(entry.first);
  }
  c.channels = selected;

  Read(j, "colorspace_manual_override", c.colorspace.manual_override);
  for (const auto& entry : kGroupKeys) {
    if (j.contains(entry.second)) {
      c.colorspace.group_overrides[entry.first] = j.at(entry.second).get<std::string>();
    }
  }

  Read(j, "enable_material_atlas", c.atlas.enabled);
  Read(j, "atlas_rows", c.atlas.rows);
  Read(j, "atlas_cols", c.atlas.cols);
  Read(j, "atlas_padding", c.atlas.padding);
  Read(j, "atlas_update_uv", c.atlas.update_uv);

  Read(j, "enable_udim", c.udim.enabled);
  Read(j, "udim_auto_detect", c.udim.auto_detect);
  Read(j, "udim_range_start", c.udim.range_start);
  Read(j, "udim_range_end", c.udim.range_end);

  if (j.contains("folder_by_object") || j.contains("folder_by_material") ||
      j.contains("folder_by_resolution")) {
    Read(j, "folder_by_object", c.naming.folder_by_object);
    Read(j, "folder_by_material", c.naming.folder_by_material);
    Read(j, "folder_by_resolution", c.naming.folder_by_resolution);
  } else if (j.contains("organize_folders")) {
    bool organize = true;
    Read(j, "organize_folders", organize);
    c.naming.folder_by_object = organize;
    c.naming.folder_by_material = organize;
    c.naming.folder_by_resolution = organize;
  }
}

tl::expected<void, Error> DecodeOverrides(const json& j, BakeConfig& c) {
  if (!j.contains("colorspace_overrides")) return {};
  const json& o = j.at("colorspace_overrides");
  if (!o.is_object()) {
    return tl::unexpected(FormatError("colorspace_overrides must be an object"));
  }
  for (auto it = o.begin(); it != o.end(); ++it) {
    auto kind = ParseChannel(it.key());
    if (!kind) {
      return tl::unexpected(FormatError("colorspace_overrides: " + kind.error().message));
    }
    if (!it.value().is_string()) {
      return tl::unexpected(FormatError("colorspace_overrides values must be strings"));
    }
    c.colorspace.overrides[*kind] = it.value().get<std::string>();
  }
  return {};
}

}  // namespace

std::string EncodePreset(const Preset& preset) {
  json j = EncodeConfig(preset.config);
  j["schema_version"] = kPresetSchemaVersion;
  j["name"] = preset.name;
  return j.dump(2);
}

tl::expected<Preset, Error> DecodePreset(const std::string& text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return tl::unexpected(FormatError("preset is not valid JSON"));
  }
  if (!j.is_object()) {
    return tl::unexpected(FormatError("preset must be a JSON object"));
  }

  Preset preset;
  preset.schema_version = 1;
  try {
    if (j.contains("schema_version")) {
      if (!j.at("schema_version").is_number_integer()) {
        return tl::unexpected(FormatError("schema_version must be an integer"));
      }
      preset.schema_version = j.at("schema_version").get<int>();
    }
    if (preset.schema_version < 1) {
      return tl::unexpected(
          FormatError("invalid schema_version " + std::to_string(preset.schema_version)));
    }
    if (preset.schema_version > kPresetSchemaVersion) {
      spdlog::warn("preset schema version {} is newer than {}, unknown fields are ignored",
                   preset.schema_version, kPresetSchemaVersion);
    }
    Read(j, "name", preset.name);

    auto d = DecodeDiscriminants(j, preset.config);
    if (!d) return tl::unexpected(d.error());
    DecodeFields(j, preset.config);
    auto o = DecodeOverrides(j, preset.config);
    if (!o) return tl::unexpected(o.error());
  } catch (const json::exception& e) {
    return tl::unexpected(FormatError(e.what()));
  }
  return preset;
}

}  // namespace texbake
