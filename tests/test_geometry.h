#pragma once

#include <badge_layout/types.hpp>
#include <badge_model/types.hpp>
#include <badge_model/units.hpp>
#include <map>
#include <vector>

namespace test_geometry {

inline const badge_model::PaperSize a4{"A4", 210.0, 297.0};

inline int px(double mm) {
    return badge_model::mm_to_pixels(mm, badge_model::default_dpi);
}

inline badge_model::GeometryConfig a4_geometry(double diameter_mm) {
    return badge_model::make_geometry_config(diameter_mm, a4, badge_model::default_dpi);
}

// Item count per distinct x, left to right.
inline std::vector<int> column_sizes(const badge_layout::SingleSheetLayout& layout) {
    std::map<double, int> by_x;
    for (const auto& p : layout.positions) ++by_x[p.x];
    std::vector<int> out;
    for (const auto& kv : by_x) out.push_back(kv.second);
    return out;
}

} // namespace test_geometry
