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

#include <cstddef>
#include <string>
#include <vector>

// Edge length of a locator eye in modules.
inline constexpr int kEyeModules = 7;

// Square grid of dark/light modules produced by the encoder. Storage is row
// major; an empty matrix has size 0.
struct ModuleMatrix {
  int size = 0;
  std::vector<bool> modules;

  bool Empty() const { return size == 0; }
  bool Get(int row, int col) const {
    return modules[static_cast<size_t>(row) * size + col];
  }
  void Set(int row, int col, bool on) {
    modules[static_cast<size_t>(row) * size + col] = on;
  }
  size_t OnCount() const;

  bool operator==(const ModuleMatrix &other) const {
    return size == other.size && modules == other.modules;
  }
  bool operator!=(const ModuleMatrix &other) const { return !(*this == other); }
};

// True when (row, col) lies inside one of the three 7x7 locator blocks at the
// top-left, top-right and bottom-left corners.
bool IsEyeModule(int size, int row, int col);

namespace MatrixText {
// Two characters per module, one line per row.
std::string ToAscii(const ModuleMatrix &matrix);
// Half-block characters, two rows per line.
std::string ToCompactAscii(const ModuleMatrix &matrix);
} // namespace MatrixText
