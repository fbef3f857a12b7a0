#pragma once

#include <badge_layout/types.hpp>
#include <badge_model/types.hpp>
#include <memory>

namespace badge_layout {

struct CompactLayoutOptions;

// One implementation per LayoutMode. Implementations hold no mutable state, so a single
// instance can serve concurrent callers.
class SheetLayoutCalculator {
public:
    virtual ~SheetLayoutCalculator() = default;

    virtual LayoutMode mode() const = 0;

    // spacing_px / margin_px below zero are treated as zero.
    virtual SingleSheetLayout compute(const badge_model::GeometryConfig& geometry,
        double spacing_px, double margin_px) const = 0;
};

std::unique_ptr<SheetLayoutCalculator> make_calculator(LayoutMode mode);
std::unique_ptr<SheetLayoutCalculator> make_calculator(LayoutMode mode,
    const CompactLayoutOptions& compact_options);

} // namespace badge_layout
