#include <gtest/gtest.h>

#include "texbake/core/resolution.hpp"

using namespace texbake;

TEST(Resolution, single_resolution_uses_base_ok) {
  ResolutionSettings s;
  s.base = 4096;
  auto out = ExpandResolutions(s);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], (Resolution{4096, 4096}));
}

TEST(Resolution, multi_merges_duplicates_and_sorts_by_area_ok) {
  ResolutionSettings s;
  s.multi_resolution = true;
  s.res_512 = true;
  s.res_1024 = true;
  s.res_2048 = true;
  s.custom_enabled = true;
  s.custom[0] = CustomResolution{{2048, 2048}, true};
  s.custom[1] = CustomResolution{{1920, 1080}, true};
  auto out = ExpandResolutions(s);
  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(out[0], (Resolution{512, 512}));
  EXPECT_EQ(out[1], (Resolution{1024, 1024}));
  EXPECT_EQ(out[2], (Resolution{1920, 1080}));
  EXPECT_EQ(out[3], (Resolution{2048, 2048}));
}

TEST(Resolution, custom_slots_ignored_without_multi_ok) {
  ResolutionSettings s;
  s.custom_enabled = true;
  s.custom[0] = CustomResolution{{0, 0}, true};
  EXPECT_TRUE(ValidateResolutions(s));
  EXPECT_EQ(ExpandResolutions(s).size(), 1u);
}

TEST(Resolution, nothing_selected_falls_back_to_base_ok) {
  ResolutionSettings s;
  s.multi_resolution = true;
  ApplyResolutionGroup(ResolutionGroup::None, s);
  auto out = ExpandResolutions(s);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], (Resolution{2048, 2048}));
}

TEST(Resolution, out_of_range_is_config_error) {
  ResolutionSettings s;
  s.base = 8;
  auto r = ValidateResolutions(s);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::ConfigError);

  s.base = 2048;
  s.multi_resolution = true;
  s.custom_enabled = true;
  s.custom[2] = CustomResolution{{32768, 512}, true};
  EXPECT_FALSE(ValidateResolutions(s));
  s.custom[2].size = {-1, 512};
  EXPECT_FALSE(ValidateResolutions(s));
}

TEST(Resolution, groups_select_standard_sizes_ok) {
  ResolutionSettings s;
  ApplyResolutionGroup(ResolutionGroup::Game, s);
  EXPECT_TRUE(s.res_512 && s.res_1024 && s.res_2048);
  EXPECT_FALSE(s.res_4096 || s.res_8192);
  ApplyResolutionGroup(ResolutionGroup::Film, s);
  EXPECT_FALSE(s.res_512 || s.res_1024);
  EXPECT_TRUE(s.res_2048 && s.res_4096 && s.res_8192);
}

TEST(Resolution, custom_quick_sets_fill_slots_ok) {
  ResolutionSettings s;
  ApplyCustomQuickSet(CustomQuickSet::Square3072, s);
  EXPECT_TRUE(s.custom[1].enabled);
  EXPECT_EQ(s.custom[1].size, (Resolution{3072, 3072}));

  ApplyCustomQuickSet(CustomQuickSet::Hd1920x1080, s);
  EXPECT_TRUE(s.custom[0].enabled);
  EXPECT_EQ(s.custom[0].size, (Resolution{1920, 1080}));

  ApplyCustomQuickSet(CustomQuickSet::Qhd2560x1440, s);
  EXPECT_EQ(s.custom[2].size, (Resolution{2560, 1440}));

  // All slots in use: 4K replaces slot 0.
  ApplyCustomQuickSet(CustomQuickSet::Uhd3840x2160, s);
  EXPECT_EQ(s.custom[0].size, (Resolution{3840, 2160}));

  ApplyCustomQuickSet(CustomQuickSet::Clear, s);
  for (const auto& slot : s.custom) EXPECT_FALSE(slot.enabled);
  EXPECT_EQ(s.custom[0].size, (Resolution{1536, 1536}));
}
