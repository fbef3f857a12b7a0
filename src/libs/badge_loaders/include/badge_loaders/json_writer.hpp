#pragma once

#include <badge_layout/types.hpp>
#include <badge_model/settings.hpp>
#include <badge_model/types.hpp>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace badge_loaders {

nlohmann::json layout_to_json(const badge_layout::MultiPageLayoutResult& result,
    const badge_model::GeometryConfig& geometry);
nlohmann::json settings_to_json(const badge_model::LayoutSettings& settings);

bool write_layout_json(std::ostream& out, const badge_layout::MultiPageLayoutResult& result,
    const badge_model::GeometryConfig& geometry);
bool write_layout_json_file(const std::string& path, const badge_layout::MultiPageLayoutResult& result,
    const badge_model::GeometryConfig& geometry);

} // namespace badge_loaders
