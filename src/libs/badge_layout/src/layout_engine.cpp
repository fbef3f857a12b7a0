#include <badge_layout/layout_engine.hpp>
#include <badge_layout/page_planner.hpp>
#include <badge_model/settings.hpp>
#include <badge_model/units.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace badge_layout {

LayoutEngine::LayoutEngine()
    : LayoutEngine(CompactLayoutOptions{})
{
}

LayoutEngine::LayoutEngine(const CompactLayoutOptions& compact_options)
    : grid_(make_calculator(LayoutMode::Grid))
    , compact_(make_calculator(LayoutMode::Compact, compact_options))
{
}

LayoutEngine::~LayoutEngine() = default;
LayoutEngine::LayoutEngine(LayoutEngine&&) noexcept = default;
LayoutEngine& LayoutEngine::operator=(LayoutEngine&&) noexcept = default;

const SheetLayoutCalculator& LayoutEngine::calculator(LayoutMode mode) const {
    return mode == LayoutMode::Grid ? *grid_ : *compact_;
}

SingleSheetLayout LayoutEngine::single_sheet(LayoutMode mode, double spacing_mm, double margin_mm,
    const badge_model::GeometryConfig& config) const
{
    const int spacing_px = badge_model::mm_to_pixels(spacing_mm, config.dpi);
    const int margin_px = badge_model::mm_to_pixels(margin_mm, config.dpi);
    SingleSheetLayout sheet = calculator(mode).compute(config, spacing_px, margin_px);
    if (sheet.capacity() == 0) {
        spdlog::debug("single_sheet: nothing fits (mode={} diameter={}px spacing={}px margin={}px sheet={}x{}px)",
            badge_model::layout_mode_name(mode), config.item_diameter_px, spacing_px, margin_px,
            config.sheet_width_px, config.sheet_height_px);
    }
    return sheet;
}

std::optional<MultiPageLayoutResult> LayoutEngine::layout(int total_items, LayoutMode mode,
    double spacing_mm, double margin_mm, const badge_model::GeometryConfig& config) const
{
    return partition_pages(total_items, single_sheet(mode, spacing_mm, margin_mm, config));
}

const char* packing_strategy_name(PackingStrategy strategy) {
    switch (strategy) {
    case PackingStrategy::Grid: return "grid";
    case PackingStrategy::Uniform: return "uniform";
    case PackingStrategy::Hexagonal: return "hexagonal";
    }
    return "grid";
}

std::string describe_layout(const SingleSheetLayout& layout) {
    return fmt::format("{}/{} {} cols x {} rows, {} per sheet, pitch {:.1f} x {:.1f} px",
        badge_model::layout_mode_name(layout.mode), packing_strategy_name(layout.strategy),
        layout.columns, layout.rows, layout.capacity(),
        layout.horizontal_pitch_px, layout.vertical_pitch_px);
}

} // namespace badge_layout
