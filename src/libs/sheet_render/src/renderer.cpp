#include <sheet_render/renderer.hpp>
#include "imgui.h"
#include <algorithm>
#include <cstdio>

namespace sheet_render {

namespace {

ImVec2 world_to_screen(double wx, double wy, float offset_x, float offset_y, float zoom) {
    return ImVec2(static_cast<float>(wx) * zoom + offset_x, static_cast<float>(wy) * zoom + offset_y);
}

} // namespace

void render_sheet_page(ImDrawList* draw_list,
    const badge_model::GeometryConfig& geometry,
    const badge_layout::SingleSheetLayout& sheet,
    const badge_layout::PageAssignment& page,
    int first_item_index,
    float offset_x, float offset_y, float zoom)
{
    if (!draw_list) return;

    const unsigned int shadow_color = IM_COL32(0, 0, 0, 90);
    const unsigned int paper_color = IM_COL32(255, 255, 255, 255);
    const unsigned int margin_color = IM_COL32(200, 200, 200, 255);
    const unsigned int badge_fill = IM_COL32(90, 140, 210, 255);
    const unsigned int badge_border = IM_COL32(40, 80, 150, 255);
    const unsigned int placeholder_color = IM_COL32(220, 220, 220, 255);
    const unsigned int text_color = IM_COL32(255, 255, 255, 255);

    const double w = geometry.sheet_width_px;
    const double h = geometry.sheet_height_px;
    const double m = sheet.margin_px;

    const ImVec2 sheet_min = world_to_screen(0, 0, offset_x, offset_y, zoom);
    const ImVec2 sheet_max = world_to_screen(w, h, offset_x, offset_y, zoom);
    draw_list->AddRectFilled(ImVec2(sheet_min.x + 6, sheet_min.y + 6), ImVec2(sheet_max.x + 6, sheet_max.y + 6), shadow_color);
    draw_list->AddRectFilled(sheet_min, sheet_max, paper_color);
    if (m > 0) {
        draw_list->AddRect(world_to_screen(m, m, offset_x, offset_y, zoom),
            world_to_screen(w - m, h - m, offset_x, offset_y, zoom), margin_color, 0.0f, 0, 1.0f);
    }

    const float radius = static_cast<float>(geometry.item_radius_px()) * zoom;
    const float border = std::max(1.0f, 6.0f * zoom);
    for (std::size_t i = 0; i < sheet.positions.size(); ++i) {
        const auto& p = sheet.positions[i];
        const ImVec2 center = world_to_screen(p.x, p.y, offset_x, offset_y, zoom);
        if (static_cast<int>(i) >= page.items_on_page) {
            draw_list->AddCircle(center, radius, placeholder_color, 0, 1.0f);
            continue;
        }
        draw_list->AddCircleFilled(center, radius, badge_fill);
        draw_list->AddCircle(center, radius, badge_border, 0, border);

        char label[16];
        std::snprintf(label, sizeof(label), "%d", first_item_index + static_cast<int>(i) + 1);
        const ImVec2 text_size = ImGui::CalcTextSize(label);
        draw_list->AddText(ImVec2(center.x - text_size.x * 0.5f, center.y - text_size.y * 0.5f), text_color, label);
    }
}

} // namespace sheet_render
