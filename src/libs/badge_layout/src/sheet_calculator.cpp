#include <badge_layout/sheet_calculator.hpp>
#include <badge_layout/compact_layout.hpp>
#include <badge_layout/grid_layout.hpp>

namespace badge_layout {

std::unique_ptr<SheetLayoutCalculator> make_calculator(LayoutMode mode) {
    return make_calculator(mode, CompactLayoutOptions{});
}

std::unique_ptr<SheetLayoutCalculator> make_calculator(LayoutMode mode,
    const CompactLayoutOptions& compact_options)
{
    switch (mode) {
    case LayoutMode::Grid:
        return std::make_unique<GridLayoutCalculator>();
    case LayoutMode::Compact:
        return std::make_unique<CompactLayoutCalculator>(compact_options);
    }
    return std::make_unique<CompactLayoutCalculator>(compact_options);
}

} // namespace badge_layout
