#include <badge_model/settings.hpp>
#include <badge_model/units.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace badge_model {

namespace {

double clamp_finite(double value, double lo, double hi, double fallback) {
    if (!std::isfinite(value)) return fallback;
    return std::clamp(value, lo, hi);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

LayoutSettings clamp_settings(const LayoutSettings& settings) {
    const LayoutSettings defaults;
    LayoutSettings out = settings;
    out.badge_size_mm = clamp_finite(settings.badge_size_mm,
        limits::min_badge_size_mm, limits::max_badge_size_mm, defaults.badge_size_mm);
    out.bleed_mm = clamp_finite(settings.bleed_mm, 0.0, limits::max_bleed_mm, defaults.bleed_mm);
    out.spacing_mm = clamp_finite(settings.spacing_mm, 0.0, limits::max_spacing_mm, defaults.spacing_mm);
    out.margin_mm = clamp_finite(settings.margin_mm, 0.0, limits::max_margin_mm, defaults.margin_mm);
    out.dpi = std::clamp(settings.dpi, limits::min_dpi, limits::max_dpi);
    out.item_count = std::clamp(settings.item_count, 0, limits::max_item_count);
    if (!std::isfinite(out.paper.width_mm) || !std::isfinite(out.paper.height_mm)
        || out.paper.width_mm <= 0 || out.paper.height_mm <= 0)
        out.paper = defaults.paper;
    out.paper.width_mm = std::min(out.paper.width_mm, limits::max_paper_mm);
    out.paper.height_mm = std::min(out.paper.height_mm, limits::max_paper_mm);
    return out;
}

GeometryConfig make_geometry(const LayoutSettings& settings) {
    return make_geometry_config(settings.badge_diameter_mm(), settings.paper, settings.dpi);
}

const std::vector<PaperSize>& paper_sizes() {
    static const std::vector<PaperSize> sizes = {
        {"A4", 210.0, 297.0},
        {"A3", 297.0, 420.0},
        {"A5", 148.0, 210.0},
        {"Letter", 215.9, 279.4},
    };
    return sizes;
}

std::optional<PaperSize> find_paper_size(const std::string& name) {
    const std::string key = to_lower(name);
    for (const auto& p : paper_sizes()) {
        if (to_lower(p.name) == key) return p;
    }
    return std::nullopt;
}

const std::vector<BadgePreset>& badge_presets() {
    static const std::vector<BadgePreset> presets = {
        {"Small", 32.0, 5.0},
        {"Standard", 58.0, 5.0},
        {"Large", 75.0, 5.0},
    };
    return presets;
}

LayoutSettings apply_preset(const LayoutSettings& settings, const BadgePreset& preset) {
    LayoutSettings out = settings;
    out.badge_size_mm = preset.badge_size_mm;
    out.bleed_mm = preset.bleed_mm;
    return clamp_settings(out);
}

const char* layout_mode_name(LayoutMode mode) {
    switch (mode) {
    case LayoutMode::Grid: return "grid";
    case LayoutMode::Compact: return "compact";
    }
    return "compact";
}

std::optional<LayoutMode> parse_layout_mode(const std::string& s) {
    const std::string key = to_lower(s);
    if (key == "grid") return LayoutMode::Grid;
    if (key == "compact") return LayoutMode::Compact;
    return std::nullopt;
}

} // namespace badge_model
