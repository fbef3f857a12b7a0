#pragma once

#include <badge_layout/compact_layout.hpp>
#include <badge_layout/sheet_calculator.hpp>
#include <badge_layout/types.hpp>
#include <badge_model/types.hpp>
#include <memory>
#include <optional>
#include <string>

namespace badge_layout {

// Single entry point for callers: mm parameters in, pages of slot positions out.
// Const and stateless between calls; safe to share across threads.
class LayoutEngine {
public:
    LayoutEngine();
    explicit LayoutEngine(const CompactLayoutOptions& compact_options);
    ~LayoutEngine();

    LayoutEngine(LayoutEngine&&) noexcept;
    LayoutEngine& operator=(LayoutEngine&&) noexcept;

    SingleSheetLayout single_sheet(LayoutMode mode, double spacing_mm, double margin_mm,
        const badge_model::GeometryConfig& config) const;

    // nullopt when total_items > 0 and nothing fits on a sheet.
    std::optional<MultiPageLayoutResult> layout(int total_items, LayoutMode mode,
        double spacing_mm, double margin_mm, const badge_model::GeometryConfig& config) const;

    const SheetLayoutCalculator& calculator(LayoutMode mode) const;

private:
    std::unique_ptr<SheetLayoutCalculator> grid_;
    std::unique_ptr<SheetLayoutCalculator> compact_;
};

const char* packing_strategy_name(PackingStrategy strategy);

// e.g. "compact/hexagonal 3 cols x 4 rows, 11 per sheet, pitch 706.4 x 814.0 px"
std::string describe_layout(const SingleSheetLayout& layout);

} // namespace badge_layout
