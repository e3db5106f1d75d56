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
#include "pathbuilder.h"

#include <type_traits>

namespace PathBuilder {
namespace {
bool IsDataModule(const ModuleMatrix &matrix, const Design &design, int row,
                  int col) {
  return matrix.Get(row, col) && !IsEyeModule(matrix.size, row, col) &&
         !IsMaskedByLogo(design, matrix.size, row, col);
}

void EmitEyes(int size, float cell, const EyeShape &eye, ModulePath &path) {
  const float far = static_cast<float>(size - kEyeModules) * cell;
  std::visit(
      [&](const auto &shape) {
        shape.Emit(0.0f, 0.0f, cell, path);
        shape.Emit(far, 0.0f, cell, path);
        shape.Emit(0.0f, far, cell, path);
      },
      eye);
}

template <typename Shape>
void EmitData(const ModuleMatrix &matrix, const Design &design, float cell,
              const Shape &shape, ModulePath &path) {
  const int n = matrix.size;
  for (int row = 0; row < n; ++row) {
    const float y = static_cast<float>(row) * cell;
    int col = 0;
    while (col < n) {
      if (!IsDataModule(matrix, design, row, col)) {
        ++col;
        continue;
      }
      int end = col + 1;
      if constexpr (Shape::kMergesRuns) {
        while (end < n && IsDataModule(matrix, design, row, end))
          ++end;
      }
      const float x = static_cast<float>(col) * cell;
      shape.Emit(x, y, static_cast<float>(end - col) * cell, cell, path);
      col = end;
    }
  }
}
} // namespace

bool IsMaskedByLogo(const Design &design, int size, int row, int col) {
  // Without an image nothing would cover the gap.
  if (!design.logo || design.logo->imagePath.empty() || size <= 0)
    return false;
  const float n = static_cast<float>(size);
  const float cx = (static_cast<float>(col) + 0.5f) / n;
  const float cy = (static_cast<float>(row) + 0.5f) / n;
  return design.logo->Covers(cx, cy);
}

ModulePath BuildPath(const ModuleMatrix &matrix, float targetSize,
                     const Design &design) {
  ModulePath path;
  if (matrix.Empty() || !(targetSize > 0.0f))
    return path;

  const float cell = targetSize / static_cast<float>(matrix.size);
  EmitEyes(matrix.size, cell, design.eyeShape, path);
  std::visit(
      [&](const auto &shape) { EmitData(matrix, design, cell, shape, path); },
      design.pixelShape);
  return path;
}
} // namespace PathBuilder
