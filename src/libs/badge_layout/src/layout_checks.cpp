#include <badge_layout/layout_checks.hpp>
#include <badge_layout/layout_constants.hpp>
#include <cmath>
#include <limits>

namespace badge_layout {

bool is_contained(const SingleSheetLayout& layout, const badge_model::GeometryConfig& geometry) {
    const double r = geometry.item_radius_px();
    const double m = layout.margin_px;
    const double eps = layout::distance_epsilon;
    for (const auto& p : layout.positions) {
        if (p.x - r < m - eps || p.x + r > geometry.sheet_width_px - m + eps) return false;
        if (p.y - r < m - eps || p.y + r > geometry.sheet_height_px - m + eps) return false;
    }
    return true;
}

double min_center_distance(const std::vector<Position>& positions) {
    double best = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < positions.size(); ++i) {
        for (std::size_t j = i + 1; j < positions.size(); ++j) {
            const double d = std::hypot(positions[i].x - positions[j].x, positions[i].y - positions[j].y);
            if (d < best) best = d;
        }
    }
    return best;
}

std::vector<std::pair<std::size_t, std::size_t>> find_close_pairs(
    const std::vector<Position>& positions, double min_distance)
{
    std::vector<std::pair<std::size_t, std::size_t>> out;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        for (std::size_t j = i + 1; j < positions.size(); ++j) {
            const double d = std::hypot(positions[i].x - positions[j].x, positions[i].y - positions[j].y);
            if (d < min_distance - layout::distance_epsilon) out.emplace_back(i, j);
        }
    }
    return out;
}

} // namespace badge_layout
