#pragma once

#include <string>

namespace badge_model {

constexpr int default_dpi = 300;

enum class LayoutMode { Grid, Compact };

struct PaperSize {
    std::string name;
    double width_mm = 0;
    double height_mm = 0;

    bool operator==(const PaperSize&) const = default;
};

// Everything the layout calculators need to know about the item and the sheet,
// already resolved to device pixels. Built once per query by the caller.
struct GeometryConfig {
    int item_diameter_px = 0;
    int sheet_width_px = 0;
    int sheet_height_px = 0;
    int dpi = default_dpi;

    double item_radius_px() const { return item_diameter_px * 0.5; }
};

} // namespace badge_model
