#pragma once

#include <badge_model/types.hpp>
#include <cstddef>
#include <vector>

namespace badge_layout {

using badge_model::LayoutMode;

// Center of one placed item, in device pixels.
struct Position {
    double x = 0;
    double y = 0;
};

enum class PackingStrategy {
    Grid,       // row/column grid at pitch = diameter + spacing
    Uniform,    // columns spread evenly over the available width, block centered
    Hexagonal   // columns at the hexagonal pitch, packed against the left margin
};

struct SingleSheetLayout {
    LayoutMode mode = LayoutMode::Grid;
    PackingStrategy strategy = PackingStrategy::Grid;
    std::vector<Position> positions; // grid: row-major, compact: column-major
    int columns = 0;
    int rows = 0;                    // grid: row count, compact: rows of the tallest column
    double horizontal_pitch_px = 0;
    double vertical_pitch_px = 0;
    double margin_px = 0;
    double spacing_px = 0;
    int item_diameter_px = 0;

    // How many items fit on one sheet; the only capacity used downstream.
    std::size_t capacity() const { return positions.size(); }
};

struct PageAssignment {
    int page_index = 0;
    int items_on_page = 0;
    // First items_on_page slots of the single sheet layout.
    std::vector<Position> positions;
};

struct MultiPageLayoutResult {
    LayoutMode mode = LayoutMode::Grid;
    int total_items = 0;
    int capacity_per_sheet = 0;
    int total_pages = 0;
    std::vector<PageAssignment> pages;
    SingleSheetLayout sheet;
};

} // namespace badge_layout
