#include <badge_layout/grid_layout.hpp>
#include <algorithm>
#include <cmath>

namespace badge_layout {

namespace {

// Extent of `count` items at `pitch`. A single column forced into a printable area narrower
// than one pitch only needs its own diameter.
double block_extent(int count, double pitch, double spacing, double available) {
    const double extent = count * pitch;
    return extent <= available ? extent : extent - spacing;
}

} // namespace

SingleSheetLayout compute_grid_layout(int diameter_px, double spacing_px, double margin_px,
    int sheet_width_px, int sheet_height_px)
{
    const double spacing = std::max(0.0, spacing_px);
    const double margin = std::max(0.0, margin_px);

    SingleSheetLayout out;
    out.mode = LayoutMode::Grid;
    out.strategy = PackingStrategy::Grid;
    out.margin_px = margin;
    out.spacing_px = spacing;
    out.item_diameter_px = diameter_px;
    if (diameter_px <= 0) return out;

    const double diameter = diameter_px;
    const double radius = diameter * 0.5;
    const double available_w = sheet_width_px - 2.0 * margin;
    const double available_h = sheet_height_px - 2.0 * margin;
    if (available_w < diameter || available_h < diameter) return out;

    const double pitch = diameter + spacing;
    const int cols = std::max(1, static_cast<int>(std::floor(available_w / pitch)));
    const int rows = std::max(1, static_cast<int>(std::floor(available_h / pitch)));

    const double start_x = margin + (available_w - block_extent(cols, pitch, spacing, available_w)) * 0.5;
    const double start_y = margin + (available_h - block_extent(rows, pitch, spacing, available_h)) * 0.5;

    out.columns = cols;
    out.rows = rows;
    out.horizontal_pitch_px = pitch;
    out.vertical_pitch_px = pitch;
    out.positions.reserve(static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows));
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            out.positions.push_back({start_x + col * pitch + radius, start_y + row * pitch + radius});
        }
    }
    return out;
}

SingleSheetLayout GridLayoutCalculator::compute(const badge_model::GeometryConfig& geometry,
    double spacing_px, double margin_px) const
{
    return compute_grid_layout(geometry.item_diameter_px, spacing_px, margin_px,
        geometry.sheet_width_px, geometry.sheet_height_px);
}

} // namespace badge_layout
