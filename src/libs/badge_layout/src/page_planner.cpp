#include <badge_layout/page_planner.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace badge_layout {

int pages_needed(int total_items, int capacity) {
    if (total_items <= 0) return 1;
    if (capacity <= 0) return 0;
    return 1 + (total_items - 1) / capacity;
}

std::optional<MultiPageLayoutResult> partition_pages(int total_items, const SingleSheetLayout& sheet) {
    const int items = std::max(0, total_items);
    const int capacity = static_cast<int>(sheet.capacity());
    if (capacity == 0 && items > 0) {
        spdlog::warn("partition_pages: {} items requested but no item fits on a sheet", items);
        return std::nullopt;
    }

    MultiPageLayoutResult out;
    out.mode = sheet.mode;
    out.total_items = items;
    out.capacity_per_sheet = capacity;
    out.total_pages = pages_needed(items, capacity);
    out.sheet = sheet;
    out.pages.reserve(static_cast<std::size_t>(out.total_pages));

    int remaining = items;
    for (int page = 0; page < out.total_pages; ++page) {
        PageAssignment pa;
        pa.page_index = page;
        pa.items_on_page = std::min(capacity, remaining);
        pa.positions.assign(sheet.positions.begin(), sheet.positions.begin() + pa.items_on_page);
        remaining -= pa.items_on_page;
        out.pages.push_back(std::move(pa));
    }
    return out;
}

} // namespace badge_layout
