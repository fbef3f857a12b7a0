#pragma once

#include <badge_layout/sheet_calculator.hpp>

namespace badge_layout {

// Row-major grid at pitch = diameter + spacing, block centered in the printable area.
// Returns an empty layout when the printable area is smaller than one item.
SingleSheetLayout compute_grid_layout(int diameter_px, double spacing_px, double margin_px,
    int sheet_width_px, int sheet_height_px);

class GridLayoutCalculator final : public SheetLayoutCalculator {
public:
    LayoutMode mode() const override { return LayoutMode::Grid; }
    SingleSheetLayout compute(const badge_model::GeometryConfig& geometry,
        double spacing_px, double margin_px) const override;
};

} // namespace badge_layout
