#include <gtest/gtest.h>

#include <badge_layout/page_planner.hpp>
#include <limits>
#include <numeric>

using namespace badge_layout;

namespace {

SingleSheetLayout sheet_with_slots(int count) {
    SingleSheetLayout sheet;
    sheet.mode = LayoutMode::Compact;
    for (int i = 0; i < count; ++i)
        sheet.positions.push_back({100.0 + i, 200.0 + 2 * i});
    return sheet;
}

} // namespace

TEST(PagePlannerTest, TwentyFiveItemsOnElevenSlotPages) {
    const auto sheet = sheet_with_slots(11);
    const auto result = partition_pages(25, sheet);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->total_items, 25);
    EXPECT_EQ(result->capacity_per_sheet, 11);
    EXPECT_EQ(result->total_pages, 3);
    ASSERT_EQ(result->pages.size(), 3u);
    EXPECT_EQ(result->pages[0].items_on_page, 11);
    EXPECT_EQ(result->pages[1].items_on_page, 11);
    EXPECT_EQ(result->pages[2].items_on_page, 3);
    EXPECT_EQ(result->mode, LayoutMode::Compact);

    // Every page reuses the same slots, truncated to its item count.
    for (const auto& page : result->pages) {
        ASSERT_EQ(page.positions.size(), static_cast<std::size_t>(page.items_on_page));
        for (std::size_t i = 0; i < page.positions.size(); ++i) {
            EXPECT_EQ(page.positions[i].x, sheet.positions[i].x);
            EXPECT_EQ(page.positions[i].y, sheet.positions[i].y);
        }
    }
    EXPECT_EQ(result->pages[2].page_index, 2);
}

TEST(PagePlannerTest, ZeroItemsGiveOneEmptyPage) {
    const auto result = partition_pages(0, sheet_with_slots(11));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->total_pages, 1);
    ASSERT_EQ(result->pages.size(), 1u);
    EXPECT_EQ(result->pages[0].items_on_page, 0);
    EXPECT_TRUE(result->pages[0].positions.empty());
}

TEST(PagePlannerTest, ConservationForAnyCapacity) {
    for (int capacity = 1; capacity <= 15; ++capacity) {
        const auto sheet = sheet_with_slots(capacity);
        for (int items = 0; items <= 60; ++items) {
            SCOPED_TRACE(testing::Message() << items << " items, capacity " << capacity);
            const auto result = partition_pages(items, sheet);
            ASSERT_TRUE(result.has_value());

            const int expected_pages = items == 0 ? 1 : (items + capacity - 1) / capacity;
            EXPECT_EQ(result->total_pages, expected_pages);
            ASSERT_EQ(static_cast<int>(result->pages.size()), expected_pages);

            const int placed = std::accumulate(result->pages.begin(), result->pages.end(), 0,
                [](int acc, const PageAssignment& p) { return acc + p.items_on_page; });
            EXPECT_EQ(placed, items);
            for (std::size_t p = 0; p + 1 < result->pages.size(); ++p)
                EXPECT_EQ(result->pages[p].items_on_page, capacity);
            EXPECT_LE(result->pages.back().items_on_page, capacity);
        }
    }
}

TEST(PagePlannerTest, ItemsWithoutCapacityAreRejected) {
    EXPECT_FALSE(partition_pages(1, sheet_with_slots(0)).has_value());
    EXPECT_FALSE(partition_pages(25, sheet_with_slots(0)).has_value());
}

TEST(PagePlannerTest, EmptySheetWithNoItemsStillPreviews) {
    const auto result = partition_pages(0, sheet_with_slots(0));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->capacity_per_sheet, 0);
    EXPECT_EQ(result->total_pages, 1);
}

TEST(PagePlannerTest, NegativeItemCountIsTreatedAsZero) {
    const auto result = partition_pages(-3, sheet_with_slots(4));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->total_items, 0);
    EXPECT_EQ(result->total_pages, 1);
}

TEST(PagePlannerTest, PagesNeeded) {
    EXPECT_EQ(pages_needed(25, 11), 3);
    EXPECT_EQ(pages_needed(22, 11), 2);
    EXPECT_EQ(pages_needed(0, 11), 1);
    EXPECT_EQ(pages_needed(0, 0), 1);
    EXPECT_EQ(pages_needed(5, 0), 0);
}

TEST(PagePlannerTest, PagesNeededDoesNotOverflow) {
    EXPECT_EQ(pages_needed(std::numeric_limits<int>::max(), 11), 195225787);
    EXPECT_EQ(pages_needed(std::numeric_limits<int>::max(), 1), std::numeric_limits<int>::max());
    EXPECT_EQ(pages_needed(std::numeric_limits<int>::max(), std::numeric_limits<int>::max()), 1);
}
