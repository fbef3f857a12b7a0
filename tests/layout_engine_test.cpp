#include <gtest/gtest.h>

#include <badge_layout/layout_checks.hpp>
#include <badge_layout/layout_engine.hpp>
#include "test_geometry.h"

using namespace badge_layout;

TEST(LayoutEngineTest, CompactModeSplitsTwentyFiveBadges) {
    const LayoutEngine engine;
    const auto geometry = test_geometry::a4_geometry(68);
    const auto result = engine.layout(25, LayoutMode::Compact, 1.0, 5.0, geometry);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->mode, LayoutMode::Compact);
    EXPECT_EQ(result->capacity_per_sheet, 11);
    EXPECT_EQ(result->total_pages, 3);
    EXPECT_EQ(result->pages.back().items_on_page, 3);
    EXPECT_EQ(result->sheet.margin_px, 59.0);
    EXPECT_EQ(result->sheet.spacing_px, 11.0);
    EXPECT_TRUE(is_contained(result->sheet, geometry));
}

TEST(LayoutEngineTest, GridModeUsesGridCalculator) {
    const LayoutEngine engine;
    const auto result = engine.layout(25, LayoutMode::Grid, 1.0, 5.0, test_geometry::a4_geometry(68));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->mode, LayoutMode::Grid);
    EXPECT_EQ(result->sheet.strategy, PackingStrategy::Grid);
    EXPECT_EQ(result->capacity_per_sheet, 8);
    EXPECT_EQ(result->total_pages, 4);
    EXPECT_EQ(result->pages.back().items_on_page, 1);
}

TEST(LayoutEngineTest, CalculatorPerMode) {
    const LayoutEngine engine;
    EXPECT_EQ(engine.calculator(LayoutMode::Grid).mode(), LayoutMode::Grid);
    EXPECT_EQ(engine.calculator(LayoutMode::Compact).mode(), LayoutMode::Compact);
    EXPECT_EQ(make_calculator(LayoutMode::Grid)->mode(), LayoutMode::Grid);
    EXPECT_EQ(make_calculator(LayoutMode::Compact)->mode(), LayoutMode::Compact);
}

TEST(LayoutEngineTest, RepeatedCallsLeaveNoState) {
    const LayoutEngine engine;
    const auto small = test_geometry::a4_geometry(42);
    const auto large = test_geometry::a4_geometry(68);

    const auto first = engine.single_sheet(LayoutMode::Compact, 1.0, 5.0, large);
    (void)engine.single_sheet(LayoutMode::Grid, 3.0, 10.0, small);
    const auto again = engine.single_sheet(LayoutMode::Compact, 1.0, 5.0, large);

    ASSERT_EQ(first.positions.size(), again.positions.size());
    for (std::size_t i = 0; i < first.positions.size(); ++i) {
        EXPECT_EQ(first.positions[i].x, again.positions[i].x);
        EXPECT_EQ(first.positions[i].y, again.positions[i].y);
    }
}

TEST(LayoutEngineTest, OversizedBadgeCannotBePartitioned) {
    const LayoutEngine engine;
    const auto geometry = test_geometry::a4_geometry(250);

    EXPECT_EQ(engine.single_sheet(LayoutMode::Compact, 1.0, 5.0, geometry).capacity(), 0u);
    EXPECT_FALSE(engine.layout(3, LayoutMode::Compact, 1.0, 5.0, geometry).has_value());
    EXPECT_FALSE(engine.layout(3, LayoutMode::Grid, 1.0, 5.0, geometry).has_value());

    const auto preview = engine.layout(0, LayoutMode::Compact, 1.0, 5.0, geometry);
    ASSERT_TRUE(preview.has_value());
    EXPECT_EQ(preview->total_pages, 1);
}

TEST(LayoutEngineTest, CompactOptionsReachTheCalculator) {
    CompactLayoutOptions options;
    options.fall_back_to_grid = false;
    const LayoutEngine engine(options);
    const auto& compact = dynamic_cast<const CompactLayoutCalculator&>(engine.calculator(LayoutMode::Compact));
    EXPECT_FALSE(compact.options().fall_back_to_grid);
}

TEST(LayoutEngineTest, DescribeLayout) {
    const LayoutEngine engine;
    const auto sheet = engine.single_sheet(LayoutMode::Compact, 1.0, 5.0, test_geometry::a4_geometry(68));
    const std::string text = describe_layout(sheet);
    EXPECT_NE(text.find("compact/hexagonal"), std::string::npos);
    EXPECT_NE(text.find("11 per sheet"), std::string::npos);
    EXPECT_STREQ(packing_strategy_name(PackingStrategy::Uniform), "uniform");
}
