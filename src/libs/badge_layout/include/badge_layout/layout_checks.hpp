#pragma once

#include <badge_layout/types.hpp>
#include <badge_model/types.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace badge_layout {

// Every item lies fully inside the sheet minus its margin.
bool is_contained(const SingleSheetLayout& layout, const badge_model::GeometryConfig& geometry);

// Smallest center-to-center distance; +inf for fewer than two positions.
double min_center_distance(const std::vector<Position>& positions);

// Index pairs (i < j) whose centers are closer than min_distance.
std::vector<std::pair<std::size_t, std::size_t>> find_close_pairs(
    const std::vector<Position>& positions, double min_distance);

} // namespace badge_layout
