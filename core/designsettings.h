/*
 * This file is part of QRStudio.
 * Copyright (C) 2025 Luisma Peramato
 *
 * QRStudio is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * QRStudio is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with QRStudio. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include "design.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace DesignSettings {
// Version written into every settings object. Bump it whenever the encoding
// of an existing field changes.
inline constexpr int kSettingsVersion = 1;

// Snaps a Design to the values the settings format can hold: colours to 8 bits
// per channel, shape parameters into their ranges, the logo rectangle into
// the unit square. A logo without an image or area is removed.
Design Normalize(const Design &design);

// Writes the normalized design, so Create(ToSettings(d)) == Normalize(d).
nlohmann::json ToSettings(const Design &design);

// Builds a Design from a settings object. Missing, unknown or mistyped fields
// keep their default value and numeric parameters are clamped. Returns
// std::nullopt only when the value is not a JSON object.
std::optional<Design> Create(const nlohmann::json &settings);

// "#RRGGBBAA", upper case.
std::string ColorToHex(const CanvasColor &color);
// Accepts "#RRGGBBAA" and "#RRGGBB" (opaque).
std::optional<CanvasColor> ColorFromHex(const std::string &hex);

std::string EyeShapeName(const EyeShape &shape);
std::string PixelShapeName(const PixelShape &shape);
std::optional<EyeShape> EyeShapeFromName(const std::string &name);
std::optional<PixelShape> PixelShapeFromName(const std::string &name);
} // namespace DesignSettings
