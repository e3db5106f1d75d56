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

#include <variant>
#include <vector>

// Axis aligned rectangle, optionally with rounded corners. A radius of zero
// produces sharp corners.
struct PathRect {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
  float radius = 0.0f;
};

// Ellipse inscribed in the given bounding box.
struct PathEllipse {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
};

using PathElement = std::variant<PathRect, PathEllipse>;

struct PathBounds {
  float minX = 0.0f;
  float minY = 0.0f;
  float maxX = 0.0f;
  float maxY = 0.0f;
  bool valid = false;
};

// Collection of closed sub-shapes filled with the even-odd rule. Shapes that
// do not overlap simply add up; a shape fully inside another one punches a
// hole, which is how eye rings are described.
struct ModulePath {
  std::vector<PathElement> elements;

  bool Empty() const { return elements.empty(); }
  void Clear() { elements.clear(); }
  void AddRect(float x, float y, float w, float h, float radius = 0.0f) {
    elements.push_back(PathRect{x, y, w, h, radius});
  }
  void AddEllipse(float x, float y, float w, float h) {
    elements.push_back(PathEllipse{x, y, w, h});
  }

  PathBounds Bounds() const;

  // Even-odd hit test in path coordinates.
  bool Contains(float px, float py) const;
};

bool ElementContains(const PathElement &element, float px, float py);
