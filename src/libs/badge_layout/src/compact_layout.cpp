#include <badge_layout/compact_layout.hpp>
#include <badge_layout/grid_layout.hpp>
#include <badge_layout/layout_constants.hpp>
#include <algorithm>
#include <cmath>

namespace badge_layout {

namespace {

using namespace layout;

struct ColumnFit {
    int columns = 0;
    double pitch = 0;  // center-to-center distance between adjacent columns
    double width = 0;  // outer width of the whole block
};

// Largest column count whose evenly spread gaps still honour the relaxed spacing.
ColumnFit search_uniform_columns(double diameter, double spacing, double available_w,
    const CompactLayoutOptions& options)
{
    ColumnFit best;
    const int limit = options.max_search_columns > 0
        ? options.max_search_columns
        : static_cast<int>(std::floor(available_w / diameter));

    for (int n = 1; n <= limit; ++n) {
        double gap = 0;
        double width = diameter;
        if (n > 1) {
            const double free_w = available_w - n * diameter;
            if (free_w < 0) break;
            gap = free_w / (n - 1);
            if (gap < options.spacing_relaxation * spacing) break;
            width = n * diameter + (n - 1) * gap;
        }
        if (width > available_w + distance_epsilon) break;
        best = ColumnFit{n, diameter + gap, width};
    }
    return best;
}

} // namespace

SingleSheetLayout compute_compact_layout(int diameter_px, double spacing_px, double margin_px,
    int sheet_width_px, int sheet_height_px, const CompactLayoutOptions& options)
{
    const double spacing = std::max(0.0, spacing_px);
    const double margin = std::max(0.0, margin_px);

    SingleSheetLayout out;
    out.mode = LayoutMode::Compact;
    out.strategy = PackingStrategy::Uniform;
    out.margin_px = margin;
    out.spacing_px = spacing;
    out.item_diameter_px = diameter_px;
    if (diameter_px <= 0) return out;

    const double diameter = diameter_px;
    const double radius = diameter * 0.5;
    const double available_w = sheet_width_px - 2.0 * margin;
    const double available_h = sheet_height_px - 2.0 * margin;
    if (available_w <= 0 || available_h <= 0) return out;

    const ColumnFit uniform = search_uniform_columns(diameter, spacing, available_w, options);
    if (uniform.columns == 0) return out;

    const double hex_pitch = diameter * hex_factor + spacing;
    const int hex_columns = std::max(1, static_cast<int>(std::floor((available_w + hex_pitch) / hex_pitch)));
    const bool use_hex = hex_columns > uniform.columns
        || (options.prefer_hex_on_tie && hex_columns == uniform.columns);

    int columns = 0;
    double pitch_x = 0;
    double start_x = 0;
    if (use_hex) {
        columns = hex_columns;
        pitch_x = hex_pitch;
        start_x = margin + radius;
        out.strategy = PackingStrategy::Hexagonal;
    } else {
        columns = uniform.columns;
        pitch_x = uniform.pitch;
        start_x = margin + (available_w - uniform.width) * 0.5 + radius;
        out.strategy = PackingStrategy::Uniform;
    }

    // Pure hex spacing under-separates rows when pitch_x came from the uniform search.
    const double pitch_y = std::max(pitch_x * hex_factor, diameter + spacing);
    const double right_limit = sheet_width_px - margin;
    const double bottom_limit = sheet_height_px - margin;

    int emitted_columns = 0;
    int max_rows = 0;
    for (int col = 0; col < columns; ++col) {
        const double x = columns == 1 ? start_x : start_x + col * pitch_x;
        if (x - radius < margin - distance_epsilon || x + radius > right_limit + distance_epsilon)
            continue;

        const double y_start = margin + radius + (col % 2 == 0 ? 0.0 : pitch_y * 0.5);
        int rows = 0;
        for (int k = 0;; ++k) {
            const double y = y_start + k * pitch_y;
            if (y + radius > bottom_limit + distance_epsilon) break;
            out.positions.push_back({x, y});
            ++rows;
        }
        ++emitted_columns;
        max_rows = std::max(max_rows, rows);
    }

    out.columns = emitted_columns;
    out.rows = max_rows;
    out.horizontal_pitch_px = pitch_x;
    out.vertical_pitch_px = pitch_y;

    if (options.fall_back_to_grid) {
        SingleSheetLayout grid = compute_grid_layout(diameter_px, spacing, margin,
            sheet_width_px, sheet_height_px);
        if (grid.capacity() > out.capacity()) {
            grid.mode = LayoutMode::Compact;
            return grid;
        }
    }
    return out;
}

SingleSheetLayout CompactLayoutCalculator::compute(const badge_model::GeometryConfig& geometry,
    double spacing_px, double margin_px) const
{
    return compute_compact_layout(geometry.item_diameter_px, spacing_px, margin_px,
        geometry.sheet_width_px, geometry.sheet_height_px, options_);
}

} // namespace badge_layout
