#include <badge_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>

namespace badge_loaders {

namespace {

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

// Integers outside int range saturate; clamp_settings narrows them further.
int int_or(const nlohmann::json& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    constexpr auto lo = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    constexpr auto hi = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(hi) ? static_cast<int>(hi) : static_cast<int>(u);
    }
    if (v.is_number_integer())
        return static_cast<int>(std::clamp(v.get<std::int64_t>(), lo, hi));
    return fallback;
}

std::optional<badge_model::LayoutSettings> parse_settings_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    badge_model::LayoutSettings s;
    s.badge_size_mm = number_or(j, "badge_size_mm", s.badge_size_mm);
    s.bleed_mm = number_or(j, "bleed_mm", s.bleed_mm);
    s.spacing_mm = number_or(j, "spacing_mm", s.spacing_mm);
    s.margin_mm = number_or(j, "margin_mm", s.margin_mm);
    s.dpi = int_or(j, "dpi", s.dpi);
    s.item_count = int_or(j, "item_count", s.item_count);

    if (j.contains("layout") && j["layout"].is_string()) {
        const auto name = j["layout"].get<std::string>();
        if (auto mode = badge_model::parse_layout_mode(name))
            s.mode = *mode;
        else
            spdlog::warn("settings: unknown layout '{}', keeping {}", name, badge_model::layout_mode_name(s.mode));
    }

    // "paper" is either a preset name or {"width_mm": .., "height_mm": ..}.
    if (j.contains("paper")) {
        const auto& p = j["paper"];
        if (p.is_string()) {
            const auto name = p.get<std::string>();
            if (auto paper = badge_model::find_paper_size(name))
                s.paper = *paper;
            else
                spdlog::warn("settings: unknown paper '{}', keeping {}", name, s.paper.name);
        } else if (p.is_object()) {
            badge_model::PaperSize custom;
            custom.name = p.contains("name") && p["name"].is_string() ? p["name"].get<std::string>() : "Custom";
            custom.width_mm = number_or(p, "width_mm", 0);
            custom.height_mm = number_or(p, "height_mm", 0);
            s.paper = custom;
        }
    }

    return badge_model::clamp_settings(s);
}

} // namespace

std::optional<badge_model::LayoutSettings> load_layout_settings_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_settings_json(j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("settings: invalid JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<badge_model::LayoutSettings> load_layout_settings_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        spdlog::warn("settings: cannot open {}", path);
        return std::nullopt;
    }
    return load_layout_settings_from_json(f);
}

} // namespace badge_loaders
