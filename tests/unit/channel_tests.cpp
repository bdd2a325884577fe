#include <algorithm>

#include <gtest/gtest.h>

#include "texbake/core/channel.hpp"

using namespace texbake;

TEST(Channel, every_kind_is_registered_ok) {
  EXPECT_EQ(AllChannels().size(), 15u);
  for (const auto& info : AllChannels()) {
    const ChannelInfo* found = LookupChannel(info.kind);
    ASSERT_NE(found, nullptr);
    EXPECT_STREQ(found->name, info.name);
  }
}

TEST(Channel, unregistered_kind_returns_null) {
  EXPECT_EQ(LookupChannel(static_cast<ChannelKind>(99)), nullptr);
  EXPECT_EQ(ChannelName(static_cast<ChannelKind>(99)), "Unknown");
}

TEST(Channel, default_colorspaces_ok) {
  EXPECT_STREQ(LookupChannel(ChannelKind::BaseColor)->default_colorspace, "sRGB");
  EXPECT_STREQ(LookupChannel(ChannelKind::Emission)->default_colorspace, "sRGB");
  EXPECT_STREQ(LookupChannel(ChannelKind::Normal)->default_colorspace, "Non-Color");
  EXPECT_STREQ(LookupChannel(ChannelKind::Roughness)->default_colorspace, "Non-Color");
  EXPECT_STREQ(LookupChannel(ChannelKind::AmbientOcclusion)->default_colorspace, "Non-Color");
}

TEST(Channel, only_basecolor_requires_lighting) {
  for (const auto& info : AllChannels()) {
    EXPECT_EQ(info.requires_lighting, info.kind == ChannelKind::BaseColor) << info.name;
  }
}

TEST(Channel, parse_accepts_name_and_suffix_ok) {
  auto by_name = ParseChannel("ClearcoatRoughness");
  ASSERT_TRUE(by_name);
  EXPECT_EQ(*by_name, ChannelKind::ClearcoatRoughness);
  auto by_suffix = ParseChannel("ao");
  ASSERT_TRUE(by_suffix);
  EXPECT_EQ(*by_suffix, ChannelKind::AmbientOcclusion);
  auto mixed_case = ParseChannel("basecolor");
  ASSERT_TRUE(mixed_case);
  EXPECT_EQ(*mixed_case, ChannelKind::BaseColor);
}

TEST(Channel, parse_unknown_is_config_error) {
  auto r = ParseChannel("Glossiness");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
}

TEST(Channel, presets_ok) {
  EXPECT_EQ(ChannelsForPreset(ChannelPreset::Basic).size(), 4u);
  EXPECT_TRUE(ChannelsForPreset(ChannelPreset::None).empty());
  auto full = ChannelsForPreset(ChannelPreset::Full);
  EXPECT_EQ(full.size(), 14u);
  EXPECT_EQ(std::count(full.begin(), full.end(), ChannelKind::CustomShader), 0);
  auto custom = ChannelsForPreset(ChannelPreset::CustomShaderOnly);
  ASSERT_EQ(custom.size(), 1u);
  EXPECT_EQ(custom[0], ChannelKind::CustomShader);
}
