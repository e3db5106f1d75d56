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
#include "modulematrix.h"

#include <algorithm>
#include <sstream>

size_t ModuleMatrix::OnCount() const {
  return static_cast<size_t>(
      std::count(modules.begin(), modules.end(), true));
}

bool IsEyeModule(int size, int row, int col) {
  if (size < kEyeModules)
    return false;
  const bool top = row < kEyeModules;
  const bool left = col < kEyeModules;
  const bool bottom = row >= size - kEyeModules;
  const bool right = col >= size - kEyeModules;
  return (top && left) || (top && right) || (bottom && left);
}

namespace MatrixText {

std::string ToAscii(const ModuleMatrix &matrix) {
  std::string result;
  result.reserve(static_cast<size_t>(matrix.size) * (matrix.size * 6 + 1));
  for (int row = 0; row < matrix.size; ++row) {
    for (int col = 0; col < matrix.size; ++col)
      result += matrix.Get(row, col) ? "██" : "  ";
    result += '\n';
  }
  return result;
}

std::string ToCompactAscii(const ModuleMatrix &matrix) {
  std::ostringstream result;
  for (int row = 0; row < matrix.size; row += 2) {
    for (int col = 0; col < matrix.size; ++col) {
      const bool top = matrix.Get(row, col);
      const bool bottom = row + 1 < matrix.size && matrix.Get(row + 1, col);
      if (top && bottom)
        result << "█";
      else if (top)
        result << "▀";
      else if (bottom)
        result << "▄";
      else
        result << ' ';
    }
    result << '\n';
  }
  return result.str();
}

} // namespace MatrixText
