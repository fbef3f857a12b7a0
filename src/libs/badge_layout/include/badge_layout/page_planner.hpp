#pragma once

#include <badge_layout/types.hpp>
#include <optional>

namespace badge_layout {

// Splits total_items over as many sheets as needed, every page reusing the slots of `sheet`.
// All pages but the last are full. Zero items yields one empty page (placeholder preview).
// Returns nullopt when items are requested but the sheet holds none.
std::optional<MultiPageLayoutResult> partition_pages(int total_items, const SingleSheetLayout& sheet);

// max(1, ceil(total_items / capacity)); 0 when capacity is 0 and items are requested.
int pages_needed(int total_items, int capacity);

} // namespace badge_layout
