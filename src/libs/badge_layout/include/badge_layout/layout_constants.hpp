#pragma once

namespace badge_layout {

// Tunables of the compact packer. All pixel values are device pixels.

namespace layout {

// sin(60 deg): row-to-row (or column-to-column) factor of a hexagonal close pack.
constexpr double hex_factor = 0.86602540378443864676;

// The uniform column search accepts an extra column while the realized gap is at least this
// fraction of the requested spacing.
constexpr double spacing_relaxation = 0.5;

// Upper bound of the uniform column search; 0 derives it from available width / diameter.
constexpr int max_uniform_search_columns = 0;

// When the hexagonal and the uniform search find the same column count the uniform
// (centered) arrangement wins unless this is set.
constexpr bool prefer_hex_on_tie = false;

// Tolerance for floating point comparisons in the verification helpers.
constexpr double distance_epsilon = 1e-6;

} // namespace layout
} // namespace badge_layout
