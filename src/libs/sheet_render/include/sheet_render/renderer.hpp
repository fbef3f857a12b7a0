#pragma once

#include <badge_layout/types.hpp>
#include <badge_model/types.hpp>

struct ImDrawList;

namespace sheet_render {

// Draws one page in world coordinates (device pixels): the sheet, its margin frame,
// occupied slots as filled numbered circles, free slots as placeholder outlines.
// first_item_index numbers the occupied slots across pages.
void render_sheet_page(ImDrawList* draw_list,
    const badge_model::GeometryConfig& geometry,
    const badge_layout::SingleSheetLayout& sheet,
    const badge_layout::PageAssignment& page,
    int first_item_index,
    float offset_x, float offset_y, float zoom);

} // namespace sheet_render
