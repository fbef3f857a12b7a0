#include <canvas/canvas.hpp>
#include <badge_layout/layout_checks.hpp>
#include <badge_layout/page_planner.hpp>
#include <sheet_render/renderer.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>

namespace {

const float fit_padding = 24.0f;
const float min_zoom = 0.02f;
const float max_zoom = 4.0f;
const float grid_step = 40.0f;
const float key_pan_step = 40.0f;

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> layout_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "badge_layout_latest.log";
        logger = spdlog::basic_logger_mt("badge_layout_logger", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Layout logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace

namespace canvas {

SheetCanvas::SheetCanvas() {
    recompute();
}

SheetCanvas::~SheetCanvas() = default;

bool SheetCanvas::set_settings(const badge_model::LayoutSettings& settings) {
    const badge_model::LayoutSettings clamped = badge_model::clamp_settings(settings);
    if (clamped == settings_) return false;
    if (!(clamped.paper == settings_.paper)) needs_fit_ = true;
    settings_ = clamped;
    recompute();
    return true;
}

int SheetCanvas::page_count() const {
    return layout_ ? layout_->total_pages : 1;
}

void SheetCanvas::set_current_page(int page) {
    current_page_ = std::clamp(page, 0, page_count() - 1);
}

void SheetCanvas::recompute() {
    geometry_ = badge_model::make_geometry(settings_);
    sheet_ = engine_.single_sheet(settings_.mode, settings_.spacing_mm, settings_.margin_mm, geometry_);
    layout_ = badge_layout::partition_pages(settings_.item_count, sheet_);
    summary_ = badge_layout::describe_layout(sheet_);
    set_current_page(current_page_);

    auto logger = layout_logger();
    if (layout_) {
        logger->info("layout_recomputed {} items={} pages={} diameter={}px sheet={}x{}px",
            summary_, layout_->total_items, layout_->total_pages,
            geometry_.item_diameter_px, geometry_.sheet_width_px, geometry_.sheet_height_px);
    } else {
        logger->warn("layout_unplaceable items={} diameter={}px margin={}mm sheet={}x{}px",
            settings_.item_count, geometry_.item_diameter_px, settings_.margin_mm,
            geometry_.sheet_width_px, geometry_.sheet_height_px);
    }
    verify_layout();
}

void SheetCanvas::verify_layout() {
    auto logger = layout_logger();
    violation_count_ = 0;

    if (!badge_layout::is_contained(sheet_, geometry_)) {
        ++violation_count_;
        logger->error("layout_violation kind=containment {}", summary_);
    }

    const auto pairs = badge_layout::find_close_pairs(sheet_.positions, geometry_.item_diameter_px);
    violation_count_ += pairs.size();
    for (const auto& [a, b] : pairs) {
        const auto& pa = sheet_.positions[a];
        const auto& pb = sheet_.positions[b];
        logger->error("layout_violation kind=overlap a={} b={} a_pos=({}, {}) b_pos=({}, {})",
            a, b, pa.x, pa.y, pb.x, pb.y);
    }
}

void SheetCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void SheetCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = std::clamp(zoom_ * zoom_delta, min_zoom, max_zoom);
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
}

void SheetCanvas::zoom_at_center(float zoom_delta) {
    zoom_at(region_center_x_, region_center_y_, zoom_delta);
}

void SheetCanvas::fit_to_region(ImVec2 region_min, float region_width, float region_height) {
    const float w = static_cast<float>(geometry_.sheet_width_px);
    const float h = static_cast<float>(geometry_.sheet_height_px);
    if (w <= 0 || h <= 0) return;
    const float zx = (region_width - 2.0f * fit_padding) / w;
    const float zy = (region_height - 2.0f * fit_padding) / h;
    zoom_ = std::clamp(std::min(zx, zy), min_zoom, max_zoom);
    offset_x_ = region_min.x + (region_width - w * zoom_) * 0.5f;
    offset_y_ = region_min.y + (region_height - h * zoom_) * 0.5f;
    needs_fit_ = false;
}

void SheetCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const float grid_thickness = 1.0f;

    // Screen-space grid; the sheet itself is the only thing in world units.
    for (float x = region_min.x; x <= region_max.x; x += grid_step)
        dl->AddLine(ImVec2(x, region_min.y), ImVec2(x, region_max.y), grid_color, grid_thickness);
    for (float y = region_min.y; y <= region_max.y; y += grid_step)
        dl->AddLine(ImVec2(region_min.x, y), ImVec2(region_max.x, y), grid_color, grid_thickness);
}

void SheetCanvas::handle_input(float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y;

    if (ImGui::IsMouseClicked(0) && in_region) {
        dragging_ = true;
        drag_start_x_ = mouse.x;
        drag_start_y_ = mouse.y;
        drag_start_offset_x_ = offset_x_;
        drag_start_offset_y_ = offset_y_;
    }
    if (ImGui::IsMouseReleased(0))
        dragging_ = false;
    if (ImGui::IsMouseDoubleClicked(0) && in_region)
        needs_fit_ = true;

    if (dragging_) {
        offset_x_ = drag_start_offset_x_ + (mouse.x - drag_start_x_);
        offset_y_ = drag_start_offset_y_ + (mouse.y - drag_start_y_);
    }

    if (in_region && io.MouseWheel != 0.0f) {
        float factor = io.MouseWheel > 0 ? 1.2f : 1.0f / 1.2f;
        zoom_at(mouse.x, mouse.y, factor);
    }

    if (in_region && ImGui::IsWindowFocused()) {
        if (ImGui::IsKeyPressed(ImGuiKey_LeftArrow)) pan(key_pan_step, 0);
        if (ImGui::IsKeyPressed(ImGuiKey_RightArrow)) pan(-key_pan_step, 0);
        if (ImGui::IsKeyPressed(ImGuiKey_UpArrow)) pan(0, key_pan_step);
        if (ImGui::IsKeyPressed(ImGuiKey_DownArrow)) pan(0, -key_pan_step);
    }

    if (in_region && ImGui::IsKeyPressed(ImGuiKey_PageDown))
        set_current_page(current_page_ + 1);
    if (in_region && ImGui::IsKeyPressed(ImGuiKey_PageUp))
        set_current_page(current_page_ - 1);
}

bool SheetCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);
    region_center_x_ = region_min.x + region_width * 0.5f;
    region_center_y_ = region_min.y + region_height * 0.5f;
    if (needs_fit_) fit_to_region(region_min, region_width, region_height);

    handle_input(region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);

    badge_layout::PageAssignment empty_page;
    const badge_layout::PageAssignment* page = &empty_page;
    int first_item_index = 0;
    if (layout_ && current_page_ < static_cast<int>(layout_->pages.size())) {
        page = &layout_->pages[static_cast<std::size_t>(current_page_)];
        first_item_index = current_page_ * layout_->capacity_per_sheet;
    }
    sheet_render::render_sheet_page(draw_list, geometry_, sheet_, *page, first_item_index,
        offset_x_, offset_y_, zoom_);

    if (!layout_) {
        const char* msg = "Nothing fits on the sheet: reduce badge size or margin";
        const ImVec2 size = ImGui::CalcTextSize(msg);
        draw_list->AddText(ImVec2(region_min.x + (region_width - size.x) * 0.5f, region_min.y + fit_padding),
            IM_COL32(230, 90, 80, 255), msg);
    }
    return true;
}

} // namespace canvas
