#pragma once

#include <badge_layout/layout_constants.hpp>
#include <badge_layout/sheet_calculator.hpp>

namespace badge_layout {

struct CompactLayoutOptions {
    double spacing_relaxation = layout::spacing_relaxation;
    int max_search_columns = layout::max_uniform_search_columns;
    bool prefer_hex_on_tie = layout::prefer_hex_on_tie;
    // Use the plain grid when the staggered arrangement would hold fewer items than it.
    bool fall_back_to_grid = true;
};

// Column-major honeycomb: columns at either the hexagonal pitch (packed against the left
// margin) or an evenly spread pitch (centered), odd columns shifted down by half a row.
// Columns that would leave the printable area are dropped, never clamped.
SingleSheetLayout compute_compact_layout(int diameter_px, double spacing_px, double margin_px,
    int sheet_width_px, int sheet_height_px, const CompactLayoutOptions& options = {});

class CompactLayoutCalculator final : public SheetLayoutCalculator {
public:
    CompactLayoutCalculator() = default;
    explicit CompactLayoutCalculator(const CompactLayoutOptions& options) : options_(options) {}

    LayoutMode mode() const override { return LayoutMode::Compact; }
    SingleSheetLayout compute(const badge_model::GeometryConfig& geometry,
        double spacing_px, double margin_px) const override;

    const CompactLayoutOptions& options() const { return options_; }

private:
    CompactLayoutOptions options_;
};

} // namespace badge_layout
