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
#include "designsettings.h"

#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace DesignSettings {
namespace {
int ToByte(float channel) {
  const float c = std::clamp(channel, 0.0f, 1.0f);
  return static_cast<int>(std::lround(c * 255.0f));
}

int HexPair(const std::string &text, size_t pos) {
  return std::stoi(text.substr(pos, 2), nullptr, 16);
}

void Warn(const std::string &msg) {
  Logger::Instance().Warn("Design settings: " + msg);
}

// Reads a numeric member and clamps it. Returns the fallback when the member
// is missing, not a number or not finite. The value is range checked as a
// double before it is narrowed.
float ReadClamped(const nlohmann::json &obj, const char *key, float fallback,
                  float lo, float hi) {
  auto it = obj.find(key);
  if (it == obj.end())
    return fallback;
  if (!it->is_number()) {
    Warn(std::string("'") + key + "' is not a number, using default");
    return fallback;
  }
  const double v = it->get<double>();
  if (!std::isfinite(v)) {
    Warn(std::string("'") + key + "' is not finite, using default");
    return fallback;
  }
  return static_cast<float>(
      std::clamp(v, static_cast<double>(lo), static_cast<double>(hi)));
}

float ClampParameter(float v, float fallback, float lo, float hi) {
  return std::isfinite(v) ? std::clamp(v, lo, hi) : fallback;
}

CanvasColor Quantize(const CanvasColor &color) {
  return {ToByte(color.r) / 255.0f, ToByte(color.g) / 255.0f,
          ToByte(color.b) / 255.0f, ToByte(color.a) / 255.0f};
}

// Clamps the rectangle into the unit square. A logo without an image or with
// an empty or non-finite rectangle is dropped.
std::optional<LogoTemplate> ClampLogo(double x, double y, double w, double h,
                                      const std::string &imagePath) {
  if (imagePath.empty() || !std::isfinite(x) || !std::isfinite(y) ||
      !std::isfinite(w) || !std::isfinite(h))
    return std::nullopt;
  LogoTemplate logo;
  logo.x = static_cast<float>(std::clamp(x, 0.0, 1.0));
  logo.y = static_cast<float>(std::clamp(y, 0.0, 1.0));
  logo.w = std::clamp(static_cast<float>(std::clamp(w, 0.0, 1.0)), 0.0f,
                      1.0f - logo.x);
  logo.h = std::clamp(static_cast<float>(std::clamp(h, 0.0, 1.0)), 0.0f,
                      1.0f - logo.y);
  if (!(logo.w > 0.0f) || !(logo.h > 0.0f))
    return std::nullopt;
  logo.imagePath = imagePath;
  return logo;
}

void ReadColor(const nlohmann::json &settings, const char *key,
               CanvasColor &out) {
  auto it = settings.find(key);
  if (it == settings.end())
    return;
  if (!it->is_string()) {
    Warn(std::string("'") + key + "' is not a string, using default");
    return;
  }
  if (auto color = ColorFromHex(it->get<std::string>()))
    out = *color;
  else
    Warn(std::string("'") + key + "' has malformed colour '" +
         it->get<std::string>() + "'");
}

void ReadEye(const nlohmann::json &settings, Design &design) {
  auto it = settings.find("eye");
  if (it == settings.end())
    return;
  if (!it->is_object()) {
    Warn("'eye' is not an object, using default");
    return;
  }
  auto type = it->find("type");
  if (type == it->end() || !type->is_string()) {
    Warn("'eye.type' missing, using default");
    return;
  }
  auto shape = EyeShapeFromName(type->get<std::string>());
  if (!shape) {
    Warn("unknown eye type '" + type->get<std::string>() + "'");
    return;
  }
  if (auto *rounded = std::get_if<RoundedRectEye>(&*shape))
    rounded->cornerRadius =
        ReadClamped(*it, "cornerRadius", rounded->cornerRadius, 0.0f, 0.5f);
  design.eyeShape = *shape;
}

void ReadPixel(const nlohmann::json &settings, Design &design) {
  auto it = settings.find("pixel");
  if (it == settings.end())
    return;
  if (!it->is_object()) {
    Warn("'pixel' is not an object, using default");
    return;
  }
  auto type = it->find("type");
  if (type == it->end() || !type->is_string()) {
    Warn("'pixel.type' missing, using default");
    return;
  }
  auto shape = PixelShapeFromName(type->get<std::string>());
  if (!shape) {
    Warn("unknown pixel type '" + type->get<std::string>() + "'");
    return;
  }
  if (auto *circle = std::get_if<CirclePixel>(&*shape)) {
    circle->inset = ReadClamped(*it, "inset", circle->inset, 0.0f, 0.4f);
  } else if (auto *rounded = std::get_if<RoundedPixel>(&*shape)) {
    rounded->cornerRadius =
        ReadClamped(*it, "cornerRadius", rounded->cornerRadius, 0.0f, 0.5f);
  } else if (auto *connected = std::get_if<ConnectedPixel>(&*shape)) {
    connected->cornerRadius =
        ReadClamped(*it, "cornerRadius", connected->cornerRadius, 0.0f, 0.5f);
  }
  design.pixelShape = *shape;
}

void ReadLogo(const nlohmann::json &settings, Design &design) {
  auto it = settings.find("logo");
  if (it == settings.end() || it->is_null())
    return;
  if (!it->is_object()) {
    Warn("'logo' is not an object, ignoring it");
    return;
  }
  auto rect = it->find("rect");
  if (rect == it->end() || !rect->is_array() || rect->size() != 4 ||
      !std::all_of(rect->begin(), rect->end(),
                   [](const nlohmann::json &v) { return v.is_number(); })) {
    Warn("'logo.rect' must hold four numbers, ignoring logo");
    return;
  }
  auto image = it->find("image");
  std::string imagePath;
  if (image != it->end() && image->is_string())
    imagePath = image->get<std::string>();
  auto logo = ClampLogo((*rect)[0].get<double>(), (*rect)[1].get<double>(),
                        (*rect)[2].get<double>(), (*rect)[3].get<double>(),
                        imagePath);
  if (!logo) {
    Warn("'logo' needs an image and a non-empty rect, ignoring logo");
    return;
  }
  design.logo = *logo;
}
} // namespace

std::string ColorToHex(const CanvasColor &color) {
  std::ostringstream os;
  os << '#' << std::uppercase << std::hex << std::setfill('0') << std::setw(2)
     << ToByte(color.r) << std::setw(2) << ToByte(color.g) << std::setw(2)
     << ToByte(color.b) << std::setw(2) << ToByte(color.a);
  return os.str();
}

std::optional<CanvasColor> ColorFromHex(const std::string &hex) {
  if ((hex.size() != 7 && hex.size() != 9) || hex[0] != '#')
    return std::nullopt;
  if (!std::all_of(hex.begin() + 1, hex.end(),
                   [](unsigned char c) { return std::isxdigit(c) != 0; }))
    return std::nullopt;
  CanvasColor color;
  color.r = HexPair(hex, 1) / 255.0f;
  color.g = HexPair(hex, 3) / 255.0f;
  color.b = HexPair(hex, 5) / 255.0f;
  color.a = hex.size() == 9 ? HexPair(hex, 7) / 255.0f : 1.0f;
  return color;
}

std::string EyeShapeName(const EyeShape &shape) {
  return std::visit(
      [](const auto &s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, RoundedRectEye>)
          return "roundedRect";
        else if constexpr (std::is_same_v<T, CircleEye>)
          return "circle";
        else
          return "square";
      },
      shape);
}

std::string PixelShapeName(const PixelShape &shape) {
  return std::visit(
      [](const auto &s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, CirclePixel>)
          return "circle";
        else if constexpr (std::is_same_v<T, RoundedPixel>)
          return "roundedSquare";
        else if constexpr (std::is_same_v<T, ConnectedPixel>)
          return "connected";
        else
          return "square";
      },
      shape);
}

std::optional<EyeShape> EyeShapeFromName(const std::string &name) {
  if (name == "square")
    return EyeShape{SquareEye{}};
  if (name == "roundedRect")
    return EyeShape{RoundedRectEye{}};
  if (name == "circle")
    return EyeShape{CircleEye{}};
  return std::nullopt;
}

std::optional<PixelShape> PixelShapeFromName(const std::string &name) {
  if (name == "square")
    return PixelShape{SquarePixel{}};
  if (name == "circle")
    return PixelShape{CirclePixel{}};
  if (name == "roundedSquare")
    return PixelShape{RoundedPixel{}};
  if (name == "connected")
    return PixelShape{ConnectedPixel{}};
  return std::nullopt;
}

Design Normalize(const Design &design) {
  Design out = design;
  out.foreground = Quantize(design.foreground);
  out.background = Quantize(design.background);

  if (auto *rounded = std::get_if<RoundedRectEye>(&out.eyeShape))
    rounded->cornerRadius = ClampParameter(
        rounded->cornerRadius, RoundedRectEye{}.cornerRadius, 0.0f, 0.5f);

  if (auto *circle = std::get_if<CirclePixel>(&out.pixelShape))
    circle->inset =
        ClampParameter(circle->inset, CirclePixel{}.inset, 0.0f, 0.4f);
  else if (auto *rounded = std::get_if<RoundedPixel>(&out.pixelShape))
    rounded->cornerRadius = ClampParameter(
        rounded->cornerRadius, RoundedPixel{}.cornerRadius, 0.0f, 0.5f);
  else if (auto *connected = std::get_if<ConnectedPixel>(&out.pixelShape))
    connected->cornerRadius = ClampParameter(
        connected->cornerRadius, ConnectedPixel{}.cornerRadius, 0.0f, 0.5f);

  if (out.logo)
    out.logo = ClampLogo(out.logo->x, out.logo->y, out.logo->w, out.logo->h,
                         out.logo->imagePath);
  return out;
}

nlohmann::json ToSettings(const Design &source) {
  const Design design = Normalize(source);
  nlohmann::json j;
  j["version"] = kSettingsVersion;
  j["foreground"] = ColorToHex(design.foreground);
  j["background"] = ColorToHex(design.background);

  nlohmann::json eye;
  eye["type"] = EyeShapeName(design.eyeShape);
  if (const auto *rounded = std::get_if<RoundedRectEye>(&design.eyeShape))
    eye["cornerRadius"] = rounded->cornerRadius;
  j["eye"] = eye;

  nlohmann::json pixel;
  pixel["type"] = PixelShapeName(design.pixelShape);
  if (const auto *circle = std::get_if<CirclePixel>(&design.pixelShape))
    pixel["inset"] = circle->inset;
  else if (const auto *rounded = std::get_if<RoundedPixel>(&design.pixelShape))
    pixel["cornerRadius"] = rounded->cornerRadius;
  else if (const auto *connected =
               std::get_if<ConnectedPixel>(&design.pixelShape))
    pixel["cornerRadius"] = connected->cornerRadius;
  j["pixel"] = pixel;

  if (design.logo) {
    const LogoTemplate &logo = *design.logo;
    j["logo"] = {{"rect", {logo.x, logo.y, logo.w, logo.h}},
                 {"image", logo.imagePath}};
  }
  return j;
}

std::optional<Design> Create(const nlohmann::json &settings) {
  if (!settings.is_object())
    return std::nullopt;

  Design design;
  auto version = settings.find("version");
  if (version != settings.end() &&
      (!version->is_number_integer() ||
       version->get<int>() != kSettingsVersion))
    Warn("unsupported version " + version->dump() +
         ", reading known fields only");

  ReadColor(settings, "foreground", design.foreground);
  ReadColor(settings, "background", design.background);
  ReadEye(settings, design);
  ReadPixel(settings, design);
  ReadLogo(settings, design);
  return design;
}
} // namespace DesignSettings
