#include <gtest/gtest.h>

#include <badge_model/settings.hpp>
#include <badge_model/units.hpp>
#include <cmath>
#include <limits>

using namespace badge_model;

TEST(UnitsTest, MillimetresTruncateToPrintPixels) {
    EXPECT_EQ(mm_to_pixels(210), 2480);
    EXPECT_EQ(mm_to_pixels(297), 3507);
    EXPECT_EQ(mm_to_pixels(68), 803);
    EXPECT_EQ(mm_to_pixels(5), 59);
    EXPECT_EQ(mm_to_pixels(1), 11);
    EXPECT_EQ(mm_to_pixels(210, 150), 1240);
    EXPECT_NEAR(pixels_to_mm(300), 25.4, 1e-12);
}

TEST(SettingsTest, DefaultsDescribeStandardBadgeOnA4) {
    const LayoutSettings s;
    EXPECT_DOUBLE_EQ(s.badge_diameter_mm(), 68.0);
    EXPECT_EQ(s.mode, LayoutMode::Compact);

    const GeometryConfig g = make_geometry(s);
    EXPECT_EQ(g.item_diameter_px, 803);
    EXPECT_EQ(g.sheet_width_px, 2480);
    EXPECT_EQ(g.sheet_height_px, 3507);
    EXPECT_EQ(g.dpi, 300);
    EXPECT_DOUBLE_EQ(g.item_radius_px(), 401.5);
}

TEST(SettingsTest, ClampKeepsValuesInRange) {
    LayoutSettings s;
    s.badge_size_mm = 250;
    s.bleed_mm = -2;
    s.spacing_mm = -3;
    s.margin_mm = 80;
    s.dpi = 10;
    s.item_count = -4;
    s.paper = PaperSize{"Broken", 0, 297};

    const LayoutSettings c = clamp_settings(s);
    EXPECT_DOUBLE_EQ(c.badge_size_mm, limits::max_badge_size_mm);
    EXPECT_DOUBLE_EQ(c.bleed_mm, 0.0);
    EXPECT_DOUBLE_EQ(c.spacing_mm, 0.0);
    EXPECT_DOUBLE_EQ(c.margin_mm, limits::max_margin_mm);
    EXPECT_EQ(c.dpi, limits::min_dpi);
    EXPECT_EQ(c.item_count, 0);
    EXPECT_EQ(c.paper.name, "A4");

    s.badge_size_mm = 2;
    EXPECT_DOUBLE_EQ(clamp_settings(s).badge_size_mm, limits::min_badge_size_mm);
}

TEST(SettingsTest, NonFiniteValuesFallBackToDefaults) {
    LayoutSettings s;
    s.badge_size_mm = std::numeric_limits<double>::quiet_NaN();
    s.margin_mm = std::numeric_limits<double>::infinity();
    const LayoutSettings c = clamp_settings(s);
    EXPECT_DOUBLE_EQ(c.badge_size_mm, 58.0);
    EXPECT_DOUBLE_EQ(c.margin_mm, 6.0);
}

TEST(SettingsTest, PaperLookupIgnoresCase) {
    ASSERT_TRUE(find_paper_size("a4").has_value());
    EXPECT_DOUBLE_EQ(find_paper_size("a4")->height_mm, 297.0);
    ASSERT_TRUE(find_paper_size("LETTER").has_value());
    EXPECT_DOUBLE_EQ(find_paper_size("LETTER")->width_mm, 215.9);
    EXPECT_FALSE(find_paper_size("B5").has_value());
}

TEST(SettingsTest, PresetsReplaceSizeAndBleed) {
    const auto& presets = badge_presets();
    ASSERT_EQ(presets.size(), 3u);
    LayoutSettings s;
    s.spacing_mm = 2;
    const LayoutSettings small = apply_preset(s, presets.front());
    EXPECT_DOUBLE_EQ(small.badge_size_mm, 32.0);
    EXPECT_DOUBLE_EQ(small.badge_diameter_mm(), 42.0);
    EXPECT_DOUBLE_EQ(small.spacing_mm, 2.0);
}

TEST(SettingsTest, LayoutModeNames) {
    EXPECT_EQ(parse_layout_mode("Grid"), LayoutMode::Grid);
    EXPECT_EQ(parse_layout_mode("compact"), LayoutMode::Compact);
    EXPECT_FALSE(parse_layout_mode("hex").has_value());
    EXPECT_STREQ(layout_mode_name(LayoutMode::Grid), "grid");
}

TEST(SettingsTest, ItemCountHasUpperBound) {
    LayoutSettings s;
    s.item_count = std::numeric_limits<int>::max();
    EXPECT_EQ(clamp_settings(s).item_count, limits::max_item_count);
}

TEST(SettingsTest, HugePaperIsClampedBeforePixelConversion) {
    LayoutSettings s;
    s.paper = PaperSize{"Banner", 1e12, 297};
    s.dpi = limits::max_dpi;
    const LayoutSettings c = clamp_settings(s);
    EXPECT_DOUBLE_EQ(c.paper.width_mm, limits::max_paper_mm);
    EXPECT_DOUBLE_EQ(c.paper.height_mm, 297.0);

    const GeometryConfig g = make_geometry(c);
    EXPECT_EQ(g.sheet_width_px, mm_to_pixels(limits::max_paper_mm, limits::max_dpi));
    EXPECT_GT(g.sheet_width_px, 0);
}
