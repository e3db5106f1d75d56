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

#include "canvas2d.h"
#include "modulepath.h"

#include <optional>
#include <string>
#include <variant>

// Eye shapes. Emit receives the top-left corner of the 7x7 locator block and
// the module edge length, and appends the ring and the 3x3 pupil.
struct SquareEye {
  void Emit(float x, float y, float cell, ModulePath &path) const;
  bool operator==(const SquareEye &) const { return true; }
};

struct RoundedRectEye {
  // Corner radius as a fraction of each square's edge, in [0, 0.5].
  float cornerRadius = 0.25f;
  void Emit(float x, float y, float cell, ModulePath &path) const;
  bool operator==(const RoundedRectEye &other) const {
    return cornerRadius == other.cornerRadius;
  }
};

struct CircleEye {
  void Emit(float x, float y, float cell, ModulePath &path) const;
  bool operator==(const CircleEye &) const { return true; }
};

using EyeShape = std::variant<SquareEye, RoundedRectEye, CircleEye>;

// Data pixel shapes. Emit receives a horizontal run of dark modules starting
// at (x, y) with width w and height cell. Shapes with kMergesRuns == false are
// always handed single modules (w == cell).
struct SquarePixel {
  static constexpr bool kMergesRuns = true;
  void Emit(float x, float y, float w, float cell, ModulePath &path) const;
  bool operator==(const SquarePixel &) const { return true; }
};

struct CirclePixel {
  static constexpr bool kMergesRuns = false;
  // Gap between the circle and the module edge as a fraction of the module,
  // in [0, 0.4].
  float inset = 0.0f;
  void Emit(float x, float y, float w, float cell, ModulePath &path) const;
  bool operator==(const CirclePixel &other) const {
    return inset == other.inset;
  }
};

struct RoundedPixel {
  static constexpr bool kMergesRuns = false;
  // Corner radius as a fraction of the module, in [0, 0.5].
  float cornerRadius = 0.35f;
  void Emit(float x, float y, float w, float cell, ModulePath &path) const;
  bool operator==(const RoundedPixel &other) const {
    return cornerRadius == other.cornerRadius;
  }
};

// Neighbouring modules in a row are joined into one bar with rounded ends.
struct ConnectedPixel {
  static constexpr bool kMergesRuns = true;
  float cornerRadius = 0.5f;
  void Emit(float x, float y, float w, float cell, ModulePath &path) const;
  bool operator==(const ConnectedPixel &other) const {
    return cornerRadius == other.cornerRadius;
  }
};

using PixelShape =
    std::variant<SquarePixel, CirclePixel, RoundedPixel, ConnectedPixel>;

// Image placed over the symbol. The rectangle is normalized to the symbol
// edge; data modules under it are left out of the path.
struct LogoTemplate {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
  std::string imagePath;

  // True when the normalized point lies inside the rectangle.
  bool Covers(float nx, float ny) const {
    return nx >= x && nx < x + w && ny >= y && ny < y + h;
  }
  bool operator==(const LogoTemplate &other) const {
    return x == other.x && y == other.y && w == other.w && h == other.h &&
           imagePath == other.imagePath;
  }
};

// Presentational settings applied on top of the module matrix. A default
// constructed Design renders black square modules on white.
struct Design {
  CanvasColor foreground{0.0f, 0.0f, 0.0f, 1.0f};
  CanvasColor background{1.0f, 1.0f, 1.0f, 1.0f};
  EyeShape eyeShape = SquareEye{};
  PixelShape pixelShape = SquarePixel{};
  std::optional<LogoTemplate> logo;

  bool operator==(const Design &other) const {
    return foreground == other.foreground && background == other.background &&
           eyeShape == other.eyeShape && pixelShape == other.pixelShape &&
           logo == other.logo;
  }
  bool operator!=(const Design &other) const { return !(*this == other); }
};
