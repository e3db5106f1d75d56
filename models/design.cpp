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
#include "design.h"
#include "modulematrix.h"

#include <algorithm>

namespace {
constexpr float kEye = static_cast<float>(kEyeModules);
} // namespace

void SquareEye::Emit(float x, float y, float cell, ModulePath &path) const {
  // Ring as four non-overlapping bars, then the pupil.
  path.AddRect(x, y, kEye * cell, cell);
  path.AddRect(x, y + (kEye - 1.0f) * cell, kEye * cell, cell);
  path.AddRect(x, y + cell, cell, (kEye - 2.0f) * cell);
  path.AddRect(x + (kEye - 1.0f) * cell, y + cell, cell, (kEye - 2.0f) * cell);
  path.AddRect(x + 2.0f * cell, y + 2.0f * cell, 3.0f * cell, 3.0f * cell);
}

void RoundedRectEye::Emit(float x, float y, float cell,
                          ModulePath &path) const {
  const float r = std::clamp(cornerRadius, 0.0f, 0.5f);
  const float outer = kEye * cell;
  const float inner = (kEye - 2.0f) * cell;
  const float pupil = 3.0f * cell;
  path.AddRect(x, y, outer, outer, r * outer);
  path.AddRect(x + cell, y + cell, inner, inner, r * inner);
  path.AddRect(x + 2.0f * cell, y + 2.0f * cell, pupil, pupil, r * pupil);
}

void CircleEye::Emit(float x, float y, float cell, ModulePath &path) const {
  const float outer = kEye * cell;
  const float inner = (kEye - 2.0f) * cell;
  const float pupil = 3.0f * cell;
  path.AddEllipse(x, y, outer, outer);
  path.AddEllipse(x + cell, y + cell, inner, inner);
  path.AddEllipse(x + 2.0f * cell, y + 2.0f * cell, pupil, pupil);
}

void SquarePixel::Emit(float x, float y, float w, float cell,
                       ModulePath &path) const {
  path.AddRect(x, y, w, cell);
}

void CirclePixel::Emit(float x, float y, float /*w*/, float cell,
                       ModulePath &path) const {
  const float gap = std::clamp(inset, 0.0f, 0.4f) * cell;
  const float d = cell - 2.0f * gap;
  path.AddEllipse(x + gap, y + gap, d, d);
}

void RoundedPixel::Emit(float x, float y, float /*w*/, float cell,
                        ModulePath &path) const {
  path.AddRect(x, y, cell, cell, std::clamp(cornerRadius, 0.0f, 0.5f) * cell);
}

void ConnectedPixel::Emit(float x, float y, float w, float cell,
                          ModulePath &path) const {
  path.AddRect(x, y, w, cell, std::clamp(cornerRadius, 0.0f, 0.5f) * cell);
}
