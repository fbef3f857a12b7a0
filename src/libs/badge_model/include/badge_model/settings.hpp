#pragma once

#include <badge_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace badge_model {

namespace limits {

constexpr double min_badge_size_mm = 10.0;
constexpr double max_badge_size_mm = 100.0;
constexpr double max_bleed_mm = 10.0;
constexpr double max_margin_mm = 30.0;
// Lowest margin the editor proposes; the engine itself accepts zero.
constexpr double recommended_min_margin_mm = 5.0;
constexpr double max_spacing_mm = 20.0;
constexpr int min_dpi = 72;
constexpr int max_dpi = 1200;
constexpr int max_item_count = 100000;
// Largest paper edge accepted from custom sizes; keeps pixel sizes well inside int at max_dpi.
constexpr double max_paper_mm = 2000.0;

} // namespace limits

struct BadgePreset {
    std::string name;
    double badge_size_mm = 0;
    double bleed_mm = 0;
};

// User-facing layout parameters. Owned by the caller and passed by value;
// anything that depends on them re-runs the layout when they change.
struct LayoutSettings {
    double badge_size_mm = 58.0;
    double bleed_mm = 5.0;
    double spacing_mm = 3.0;
    double margin_mm = 6.0;
    LayoutMode mode = LayoutMode::Compact;
    int dpi = default_dpi;
    PaperSize paper{"A4", 210.0, 297.0};
    int item_count = 0;

    // The bleed ring is printed, so it is part of the laid out diameter.
    double badge_diameter_mm() const { return badge_size_mm + 2.0 * bleed_mm; }

    bool operator==(const LayoutSettings&) const = default;
};

LayoutSettings clamp_settings(const LayoutSettings& settings);
GeometryConfig make_geometry(const LayoutSettings& settings);

const std::vector<PaperSize>& paper_sizes();
std::optional<PaperSize> find_paper_size(const std::string& name);

const std::vector<BadgePreset>& badge_presets();
LayoutSettings apply_preset(const LayoutSettings& settings, const BadgePreset& preset);

const char* layout_mode_name(LayoutMode mode);
std::optional<LayoutMode> parse_layout_mode(const std::string& s);

} // namespace badge_model
