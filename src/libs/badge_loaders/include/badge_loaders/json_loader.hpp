#pragma once

#include <badge_model/settings.hpp>
#include <istream>
#include <optional>
#include <string>

namespace badge_loaders {

// Missing or mistyped fields keep their defaults; the result is clamped.
std::optional<badge_model::LayoutSettings> load_layout_settings_from_json(std::istream& in);
std::optional<badge_model::LayoutSettings> load_layout_settings_from_json_file(const std::string& path);

} // namespace badge_loaders
