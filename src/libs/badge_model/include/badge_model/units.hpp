#pragma once

#include <badge_model/types.hpp>

namespace badge_model {

constexpr double mm_per_inch = 25.4;

// Truncates toward zero, the same rounding the print pipeline uses (A4 @ 300 dpi = 2480x3507).
inline int mm_to_pixels(double mm, int dpi = default_dpi) {
    return static_cast<int>(mm * static_cast<double>(dpi) / mm_per_inch);
}

inline double pixels_to_mm(double pixels, int dpi = default_dpi) {
    return pixels * mm_per_inch / static_cast<double>(dpi);
}

inline GeometryConfig make_geometry_config(double item_diameter_mm, const PaperSize& paper,
    int dpi = default_dpi)
{
    GeometryConfig g;
    g.item_diameter_px = mm_to_pixels(item_diameter_mm, dpi);
    g.sheet_width_px = mm_to_pixels(paper.width_mm, dpi);
    g.sheet_height_px = mm_to_pixels(paper.height_mm, dpi);
    g.dpi = dpi;
    return g;
}

} // namespace badge_model
