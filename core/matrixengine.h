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

#include "errorcorrection.h"
#include "modulematrix.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

// Raised when a payload cannot be encoded at the requested level, which in
// practice means it exceeds the version 40 capacity.
class EncodingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Thin wrapper around the qrcodegen encoder producing ModuleMatrix values.
class MatrixEngine {
public:
  // Encodes the payload as a single byte mode segment. Versions 1 to 40 are
  // searched, the mask is chosen automatically and the level is never
  // boosted. An empty payload produces an empty matrix.
  static ModuleMatrix Generate(const std::vector<uint8_t> &payload,
                               ErrorCorrection level);

  // Largest byte mode payload that fits a version 40 symbol at the level.
  static size_t MaxPayloadSize(ErrorCorrection level);

  // Replaces the held matrix. On EncodingError the held matrix is untouched.
  void Regenerate(const std::vector<uint8_t> &payload, ErrorCorrection level);

  const ModuleMatrix &Matrix() const { return matrix_; }

  // Side length in modules; also the smallest render size in pixels that
  // gives every module at least one pixel.
  int PixelSize() const { return matrix_.size; }

private:
  ModuleMatrix matrix_;
};
