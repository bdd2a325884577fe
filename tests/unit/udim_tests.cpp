#include <climits>
#include <limits>
#include <vector>

#include <gtest/gtest.h>

#include "texbake/layout/udim.hpp"

using namespace texbake;

TEST(Udim, explicit_range_size_and_mapping_ok) {
  auto tiles = ExpandTileRange(1001, 1012);
  ASSERT_TRUE(tiles);
  ASSERT_EQ(tiles->size(), 12u);
  const UdimTile& t1011 = (*tiles)[10];
  EXPECT_EQ(t1011.id, 1011);
  EXPECT_EQ(t1011.row, 1);
  EXPECT_EQ(t1011.col, 0);
  EXPECT_DOUBLE_EQ(t1011.u0, 0.0);
  EXPECT_DOUBLE_EQ(t1011.u1, 1.0);
  EXPECT_DOUBLE_EQ(t1011.v0, 1.0);
  EXPECT_DOUBLE_EQ(t1011.v1, 2.0);
  EXPECT_EQ((*tiles)[9].id, 1010);
  EXPECT_EQ((*tiles)[9].col, 9);
}

TEST(Udim, inverted_or_low_range_is_config_error) {
  auto inverted = ExpandTileRange(1010, 1001);
  ASSERT_FALSE(inverted);
  EXPECT_EQ(inverted.error().code, ErrorCode::ConfigError);
  EXPECT_FALSE(ExpandTileRange(1000, 1005));
}

TEST(Udim, explicit_range_upper_edge_ok) {
  auto last_row = ExpandTileRange(1091, 1100);
  ASSERT_TRUE(last_row);
  ASSERT_EQ(last_row->size(), 10u);
  EXPECT_EQ(last_row->back().id, 1100);
  EXPECT_EQ(last_row->back().row, 9);
  EXPECT_EQ(last_row->back().col, 9);

  auto full = ExpandTileRange(kFirstUdimTile, kLastUdimTile);
  ASSERT_TRUE(full);
  EXPECT_EQ(full->size(), 100u);
}

TEST(Udim, range_beyond_1100_is_config_error) {
  auto past_end = ExpandTileRange(1001, 1101);
  ASSERT_FALSE(past_end);
  EXPECT_EQ(past_end.error().code, ErrorCode::ConfigError);

  auto huge = ExpandTileRange(1001, INT_MAX);
  ASSERT_FALSE(huge);
  EXPECT_EQ(huge.error().code, ErrorCode::ConfigError);

  EXPECT_FALSE(ExpandTileRange(1101, 1105));
  EXPECT_FALSE(ExpandTileRange(INT_MAX, INT_MAX));
}

TEST(Udim, uv_to_tile_ok) {
  EXPECT_EQ(*TileIdForUv({0.5, 0.5}), 1001);
  EXPECT_EQ(*TileIdForUv({1.25, 0.1}), 1002);
  EXPECT_EQ(*TileIdForUv({0.5, 1.5}), 1011);
  EXPECT_EQ(*TileIdForUv({9.99, 2.0}), 1030);
  EXPECT_FALSE(TileIdForUv({-0.1, 0.5}));
  EXPECT_FALSE(TileIdForUv({10.0, 0.5}));
  EXPECT_FALSE(TileIdForUv({0.5, -0.5}));
}

TEST(Udim, uv_on_last_row_maps_to_1091_block_ok) {
  EXPECT_EQ(*TileIdForUv({0.5, 9.5}), 1091);
  EXPECT_EQ(*TileIdForUv({9.5, 9.999}), 1100);
  EXPECT_FALSE(TileIdForUv({0.5, 10.0}));
}

TEST(Udim, far_or_non_finite_uv_has_no_tile) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_FALSE(TileIdForUv({nan, 0.5}));
  EXPECT_FALSE(TileIdForUv({0.5, nan}));
  EXPECT_FALSE(TileIdForUv({0.5, inf}));
  EXPECT_FALSE(TileIdForUv({-inf, 0.5}));
  EXPECT_FALSE(TileIdForUv({0.5, 3e8}));
  EXPECT_FALSE(TileIdForUv({0.5, 1e12}));
  EXPECT_FALSE(TileIdForUv({1e12, 0.5}));

  std::vector<Eigen::Vector2d> uvs = {{0.5, 3e8}, {0.5, nan}, {1.5, 0.5}, {0.5, 1e12}};
  EXPECT_EQ(DetectTiles(uvs), (std::vector<int>{1002}));
}

TEST(Udim, normalize_to_tile_ok) {
  Eigen::Vector2d local = NormalizeToTile({3.25, 1.75}, TileForId(1014));
  EXPECT_DOUBLE_EQ(local.x(), 0.25);
  EXPECT_DOUBLE_EQ(local.y(), 0.75);
}

TEST(Udim, detect_tiles_sorted_unique_ok) {
  std::vector<Eigen::Vector2d> uvs = {{1.5, 0.5}, {0.2, 0.2}, {1.1, 0.9}, {0.5, 1.5}};
  EXPECT_EQ(DetectTiles(uvs), (std::vector<int>{1001, 1002, 1011}));
}

TEST(Udim, auto_detect_prefers_host_tiles_ok) {
  UdimSettings settings;
  settings.enabled = true;
  settings.auto_detect = true;
  std::vector<Eigen::Vector2d> uvs = {{0.5, 0.5}};
  auto tiles = PlanTiles(settings, {1003, 1002, 1003}, uvs, "Crate");
  ASSERT_TRUE(tiles);
  ASSERT_EQ(tiles->size(), 2u);
  EXPECT_EQ((*tiles)[0].id, 1002);
  EXPECT_EQ((*tiles)[1].id, 1003);

  auto bad = PlanTiles(settings, {999}, uvs, "Crate");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code, ErrorCode::ConfigError);

  auto past_end = PlanTiles(settings, {1002, 1101}, uvs, "Crate");
  ASSERT_FALSE(past_end);
  EXPECT_EQ(past_end.error().code, ErrorCode::ConfigError);
}

TEST(Udim, auto_detect_without_tiles_falls_back_to_1001_ok) {
  UdimSettings settings;
  settings.enabled = true;
  auto tiles = PlanTiles(settings, {}, {}, "Empty");
  ASSERT_TRUE(tiles);
  ASSERT_EQ(tiles->size(), 1u);
  EXPECT_EQ((*tiles)[0].id, 1001);
}

TEST(Udim, auto_detect_overrides_explicit_range_ok) {
  UdimSettings settings;
  settings.enabled = true;
  settings.auto_detect = true;
  settings.range_start = 1010;
  settings.range_end = 1001;
  EXPECT_TRUE(ValidateUdimSettings(settings));
  auto tiles = PlanTiles(settings, {}, {{2.5, 0.5}}, "Crate");
  ASSERT_TRUE(tiles);
  ASSERT_EQ(tiles->size(), 1u);
  EXPECT_EQ((*tiles)[0].id, 1003);
}
