#include <gtest/gtest.h>

#include "texbake/core/colorspace.hpp"

using namespace texbake;

TEST(ColorSpace, auto_uses_registry_defaults_ok) {
  ColorSpacePolicy policy;
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::Normal, policy), "Non-Color");
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::BaseColor, policy), "sRGB");
}

TEST(ColorSpace, auto_ignores_overrides_ok) {
  ColorSpacePolicy policy;
  policy.overrides[ChannelKind::Normal] = "Raw";
  policy.group_overrides[ColorSpaceGroup::Color] = "ACEScg";
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::Normal, policy), "Non-Color");
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::BaseColor, policy), "sRGB");
}

TEST(ColorSpace, manual_override_applies_to_every_channel_ok) {
  ColorSpacePolicy policy;
  policy.mode = ColorSpaceMode::ManualOverride;
  policy.manual_override = "Raw";
  policy.overrides[ChannelKind::Normal] = "sRGB";
  for (const auto& info : AllChannels()) {
    EXPECT_EQ(*ResolveColorSpace(info.kind, policy), "Raw") << info.name;
  }
}

TEST(ColorSpace, custom_channel_beats_group_ok) {
  ColorSpacePolicy policy;
  policy.mode = ColorSpaceMode::Custom;
  policy.group_overrides[ColorSpaceGroup::Data] = "Raw";
  policy.overrides[ChannelKind::Metallic] = "Linear Rec.709";
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::Metallic, policy), "Linear Rec.709");
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::Roughness, policy), "Raw");
  EXPECT_EQ(*ResolveColorSpace(ChannelKind::Normal, policy), "Non-Color");
}

TEST(ColorSpace, unregistered_kind_is_config_error) {
  ColorSpacePolicy policy;
  auto r = ResolveColorSpace(static_cast<ChannelKind>(42), policy);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::ConfigError);
}

TEST(ColorSpace, validate_rejects_unknown_names) {
  ColorSpacePolicy policy;
  policy.mode = ColorSpaceMode::Custom;
  policy.overrides[ChannelKind::BaseColor] = "NotAColorSpace";
  EXPECT_FALSE(ValidateColorSpacePolicy(policy));
  policy.overrides[ChannelKind::BaseColor] = "ACEScg";
  EXPECT_TRUE(ValidateColorSpacePolicy(policy));
}
