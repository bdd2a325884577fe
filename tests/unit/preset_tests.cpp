#include <string>

#include <gtest/gtest.h>

#include "texbake/preset/preset.hpp"

using namespace texbake;

namespace {

Preset Configured() {
  Preset preset;
  preset.name = "Hero Asset";
  BakeConfig& c = preset.config;
  c.output_directory = "/tmp/bakes/hero";
  c.margin = 16;
  c.channels = {ChannelKind::Normal, ChannelKind::BaseColor, ChannelKind::AmbientOcclusion};
  c.resolutions.multi_resolution = true;
  c.resolutions.res_4096 = true;
  c.resolutions.custom_enabled = true;
  c.resolutions.custom[1] = CustomResolution{{1920, 1080}, true};
  c.mixed_shader_strategy = MixedShaderStrategy::PrincipledOnly;
  c.atlas.enabled = true;
  c.atlas.mode = AtlasLayoutMode::Manual;
  c.atlas.rows = 3;
  c.atlas.cols = 2;
  c.atlas.padding = 0.015;
  c.udim.enabled = true;
  c.udim.auto_detect = false;
  c.udim.range_start = 1001;
  c.udim.range_end = 1024;
  c.colorspace.mode = ColorSpaceMode::Custom;
  c.colorspace.overrides[ChannelKind::Normal] = "Raw";
  c.colorspace.group_overrides[ColorSpaceGroup::Color] = "ACEScg";
  c.naming = NamingScheme{NamingMode::Mudbox, true, false, true};
  c.include_lighting = true;
  c.shadow_mode = ShadowMode::NoShadows;
  return preset;
}

}  // namespace

TEST(Preset, round_trip_is_byte_identical_ok) {
  const std::string text = EncodePreset(Configured());
  auto decoded = DecodePreset(text);
  ASSERT_TRUE(decoded) << decoded.error().message;
  EXPECT_EQ(EncodePreset(*decoded), text);

  const std::string defaults = EncodePreset(Preset{});
  auto decoded_defaults = DecodePreset(defaults);
  ASSERT_TRUE(decoded_defaults);
  EXPECT_EQ(EncodePreset(*decoded_defaults), defaults);
}

TEST(Preset, decoded_fields_match_ok) {
  auto decoded = DecodePreset(EncodePreset(Configured()));
  ASSERT_TRUE(decoded);
  const BakeConfig& c = decoded->config;
  EXPECT_EQ(decoded->name, "Hero Asset");
  EXPECT_EQ(decoded->schema_version, kPresetSchemaVersion);
  EXPECT_EQ(c.output_directory.generic_string(), "/tmp/bakes/hero");
  EXPECT_EQ(c.margin, 16);
  EXPECT_EQ(c.channels, (std::vector<ChannelKind>{ChannelKind::BaseColor, ChannelKind::Normal,
                                                  ChannelKind::AmbientOcclusion}));
  EXPECT_TRUE(c.resolutions.res_4096);
  EXPECT_EQ(c.resolutions.custom[1].size, (Resolution{1920, 1080}));
  EXPECT_EQ(c.mixed_shader_strategy, MixedShaderStrategy::PrincipledOnly);
  EXPECT_EQ(c.atlas.mode, AtlasLayoutMode::Manual);
  EXPECT_EQ(c.atlas.rows, 3);
  EXPECT_DOUBLE_EQ(c.atlas.padding, 0.015);
  EXPECT_EQ(c.udim.range_end, 1024);
  EXPECT_EQ(c.colorspace.overrides.at(ChannelKind::Normal), "Raw");
  EXPECT_EQ(c.colorspace.group_overrides.at(ColorSpaceGroup::Color), "ACEScg");
  EXPECT_EQ(c.naming.mode, NamingMode::Mudbox);
  EXPECT_FALSE(c.naming.folder_by_material);
  EXPECT_EQ(c.shadow_mode, ShadowMode::NoShadows);
}

TEST(Preset, version_one_fields_take_defaults_ok) {
  const std::string v1 = R"({
    "resolution": 4096,
    "include_basecolor": true,
    "include_roughness": false,
    "include_metallic": false,
    "include_normal": true,
    "use_custom_directory": true,
    "custom_directory": "/renders/out",
    "organize_folders": false,
    "colorspace_mode": "MANUAL",
    "colorspace_manual_override": "Linear Rec.709"
  })";
  auto decoded = DecodePreset(v1);
  ASSERT_TRUE(decoded) << decoded.error().message;
  EXPECT_EQ(decoded->schema_version, 1);
  const BakeConfig& c = decoded->config;
  EXPECT_EQ(c.resolutions.base, 4096);
  EXPECT_EQ(c.margin, 4);
  EXPECT_EQ(c.channels, (std::vector<ChannelKind>{ChannelKind::BaseColor, ChannelKind::Normal}));
  EXPECT_EQ(c.output_directory.generic_string(), "/renders/out");
  EXPECT_FALSE(c.naming.folder_by_object);
  EXPECT_FALSE(c.naming.folder_by_resolution);
  EXPECT_EQ(c.colorspace.mode, ColorSpaceMode::ManualOverride);
  EXPECT_EQ(c.colorspace.manual_override, "Linear Rec.709");
  // Not present in version 1.
  EXPECT_FALSE(c.atlas.enabled);
  EXPECT_FALSE(c.udim.enabled);
  EXPECT_EQ(c.mixed_shader_strategy, MixedShaderStrategy::FullSurface);
}

TEST(Preset, malformed_json_is_format_error) {
  auto r = DecodePreset("{\"margin\": ");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::PresetFormatError);
  EXPECT_FALSE(DecodePreset("[1, 2, 3]"));
}

TEST(Preset, wrong_value_type_is_format_error) {
  auto r = DecodePreset(R"({"schema_version": 2, "resolution": "2048"})");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::PresetFormatError);

  auto version = DecodePreset(R"({"schema_version": "two"})");
  ASSERT_FALSE(version);
  EXPECT_EQ(version.error().code, ErrorCode::PresetFormatError);
}

TEST(Preset, unknown_discriminant_is_format_error) {
  auto r = DecodePreset(R"({"schema_version": 2, "mixed_shader_strategy": "BEST_GUESS"})");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::PresetFormatError);
  EXPECT_NE(r.error().message.find("BEST_GUESS"), std::string::npos);

  auto channel = DecodePreset(R"({"colorspace_overrides": {"Glossiness": "Raw"}})");
  ASSERT_FALSE(channel);
  EXPECT_EQ(channel.error().code, ErrorCode::PresetFormatError);
}

TEST(Preset, newer_schema_version_is_accepted_ok) {
  auto r = DecodePreset(R"({"schema_version": 7, "margin": 2, "future_field": [1]})");
  ASSERT_TRUE(r);
  EXPECT_EQ(r->schema_version, 7);
  EXPECT_EQ(r->config.margin, 2);
}
