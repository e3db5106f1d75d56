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
#include "modulematrix.h"
#include "modulepath.h"

namespace PathBuilder {
// Builds the fill path for a matrix scaled to a square of targetSize units
// with its top-left corner at the origin. Locator eyes go through the eye
// shape once each; remaining dark modules go through the pixel shape unless
// the logo rectangle covers their centre. An empty matrix or a non-positive
// size produces an empty path.
ModulePath BuildPath(const ModuleMatrix &matrix, float targetSize,
                     const Design &design);

// True when the data module at (row, col) is hidden by the logo.
bool IsMaskedByLogo(const Design &design, int size, int row, int col);
} // namespace PathBuilder
