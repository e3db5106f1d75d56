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
#include "modulepath.h"

#include <algorithm>
#include <type_traits>

namespace {
bool RectContains(const PathRect &r, float px, float py) {
  // Half open so that rectangles sharing an edge never both claim a point.
  if (px < r.x || py < r.y || px >= r.x + r.w || py >= r.y + r.h)
    return false;
  const float radius = std::min({r.radius, r.w * 0.5f, r.h * 0.5f});
  if (radius <= 0.0f)
    return true;
  // Only the four corner squares need the circle test.
  const float cx = std::clamp(px, r.x + radius, r.x + r.w - radius);
  const float cy = std::clamp(py, r.y + radius, r.y + r.h - radius);
  const float dx = px - cx;
  const float dy = py - cy;
  return dx * dx + dy * dy <= radius * radius;
}

bool EllipseContains(const PathEllipse &e, float px, float py) {
  if (e.w <= 0.0f || e.h <= 0.0f)
    return false;
  const float rx = e.w * 0.5f;
  const float ry = e.h * 0.5f;
  const float nx = (px - (e.x + rx)) / rx;
  const float ny = (py - (e.y + ry)) / ry;
  return nx * nx + ny * ny <= 1.0f;
}
} // namespace

bool ElementContains(const PathElement &element, float px, float py) {
  return std::visit(
      [&](const auto &shape) {
        using T = std::decay_t<decltype(shape)>;
        if constexpr (std::is_same_v<T, PathRect>)
          return RectContains(shape, px, py);
        else
          return EllipseContains(shape, px, py);
      },
      element);
}

PathBounds ModulePath::Bounds() const {
  PathBounds bounds;
  for (const auto &element : elements) {
    std::visit(
        [&](const auto &shape) {
          if (!bounds.valid) {
            bounds.minX = shape.x;
            bounds.minY = shape.y;
            bounds.maxX = shape.x + shape.w;
            bounds.maxY = shape.y + shape.h;
            bounds.valid = true;
            return;
          }
          bounds.minX = std::min(bounds.minX, shape.x);
          bounds.minY = std::min(bounds.minY, shape.y);
          bounds.maxX = std::max(bounds.maxX, shape.x + shape.w);
          bounds.maxY = std::max(bounds.maxY, shape.y + shape.h);
        },
        element);
  }
  return bounds;
}

bool ModulePath::Contains(float px, float py) const {
  size_t hits = 0;
  for (const auto &element : elements) {
    if (ElementContains(element, px, py))
      ++hits;
  }
  return (hits % 2) == 1;
}
