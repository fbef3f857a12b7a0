#pragma once

#include <badge_layout/layout_engine.hpp>
#include <badge_layout/types.hpp>
#include <badge_model/settings.hpp>
#include <badge_model/types.hpp>
#include <cstddef>
#include <optional>
#include <string>

struct ImVec2;

namespace canvas {

// Preview of one sheet at a time. Holds the current settings and re-runs the layout
// engine whenever they change.
class SheetCanvas {
public:
    SheetCanvas();
    ~SheetCanvas();

    // Returns true when the layout was recomputed.
    bool set_settings(const badge_model::LayoutSettings& settings);
    const badge_model::LayoutSettings& settings() const { return settings_; }

    const badge_model::GeometryConfig& geometry() const { return geometry_; }
    const badge_layout::SingleSheetLayout& sheet() const { return sheet_; }
    // nullopt when items are requested but nothing fits on a sheet.
    const std::optional<badge_layout::MultiPageLayoutResult>& layout() const { return layout_; }
    const std::string& summary() const { return summary_; }

    int page_count() const;
    int current_page() const { return current_page_; }
    void set_current_page(int page);

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);
    // Zooms around the middle of the region drawn last frame.
    void zoom_at_center(float zoom_delta);
    void request_fit() { needs_fit_ = true; }
    float zoom() const { return zoom_; }
    std::size_t violation_count() const { return violation_count_; }

    bool update_and_draw(float region_width, float region_height);

private:
    badge_layout::LayoutEngine engine_;
    badge_model::LayoutSettings settings_;
    badge_model::GeometryConfig geometry_;
    badge_layout::SingleSheetLayout sheet_;
    std::optional<badge_layout::MultiPageLayoutResult> layout_;
    std::string summary_;
    int current_page_ = 0;
    std::size_t violation_count_ = 0;
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 0.2f;
    float region_center_x_ = 0;
    float region_center_y_ = 0;
    bool needs_fit_ = true;
    bool dragging_ = false;
    float drag_start_x_ = 0;
    float drag_start_y_ = 0;
    float drag_start_offset_x_ = 0;
    float drag_start_offset_y_ = 0;

    void recompute();
    void verify_layout();
    void fit_to_region(ImVec2 region_min, float region_width, float region_height);
    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void handle_input(float region_width, float region_height);
};

} // namespace canvas
