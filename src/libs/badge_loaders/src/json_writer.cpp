#include <badge_loaders/json_writer.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace badge_loaders {

nlohmann::json layout_to_json(const badge_layout::MultiPageLayoutResult& result,
    const badge_model::GeometryConfig& geometry)
{
    nlohmann::json pages = nlohmann::json::array();
    for (const auto& page : result.pages) {
        nlohmann::json positions = nlohmann::json::array();
        for (const auto& p : page.positions)
            positions.push_back({ p.x, p.y });
        pages.push_back({
            { "index", page.page_index },
            { "items", page.items_on_page },
            { "positions", std::move(positions) },
        });
    }

    return {
        { "mode", badge_model::layout_mode_name(result.mode) },
        { "dpi", geometry.dpi },
        { "sheet_width_px", geometry.sheet_width_px },
        { "sheet_height_px", geometry.sheet_height_px },
        { "item_diameter_px", geometry.item_diameter_px },
        { "margin_px", result.sheet.margin_px },
        { "capacity_per_sheet", result.capacity_per_sheet },
        { "total_items", result.total_items },
        { "total_pages", result.total_pages },
        { "pages", std::move(pages) },
    };
}

nlohmann::json settings_to_json(const badge_model::LayoutSettings& settings) {
    return {
        { "badge_size_mm", settings.badge_size_mm },
        { "bleed_mm", settings.bleed_mm },
        { "spacing_mm", settings.spacing_mm },
        { "margin_mm", settings.margin_mm },
        { "layout", badge_model::layout_mode_name(settings.mode) },
        { "dpi", settings.dpi },
        { "paper", {
            { "name", settings.paper.name },
            { "width_mm", settings.paper.width_mm },
            { "height_mm", settings.paper.height_mm },
        } },
        { "item_count", settings.item_count },
    };
}

bool write_layout_json(std::ostream& out, const badge_layout::MultiPageLayoutResult& result,
    const badge_model::GeometryConfig& geometry)
{
    out << layout_to_json(result, geometry).dump(2) << '\n';
    return static_cast<bool>(out);
}

bool write_layout_json_file(const std::string& path, const badge_layout::MultiPageLayoutResult& result,
    const badge_model::GeometryConfig& geometry)
{
    std::ofstream f(path);
    if (!f) {
        spdlog::error("layout export: cannot open {}", path);
        return false;
    }
    if (!write_layout_json(f, result, geometry)) {
        spdlog::error("layout export: write failed for {}", path);
        return false;
    }
    return true;
}

} // namespace badge_loaders
