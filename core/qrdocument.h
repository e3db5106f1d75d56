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
#include "design.h"
#include "errorcorrection.h"
#include "matrixengine.h"
#include "messageformatter.h"
#include "modulematrix.h"
#include "modulepath.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <wx/image.h>

// A QR code: payload bytes, error correction level and Design, together with
// the module matrix derived from the first two. Every mutator that touches
// the payload or level re-encodes before returning; when encoding fails the
// document is left exactly as it was.
class QRDocument {
public:
  QRDocument() = default;

  void Update(const std::vector<uint8_t> &payload, ErrorCorrection level);
  // Encodes the UTF-8 bytes of the text.
  void Update(const std::string &text,
              ErrorCorrection level = kDefaultErrorCorrection);
  void Update(const MessageFormatter &message,
              ErrorCorrection level = kDefaultErrorCorrection);
  void SetPayload(const std::vector<uint8_t> &payload);
  void SetErrorCorrection(ErrorCorrection level);
  // Presentation only; the matrix is not regenerated. The stored Design is
  // normalized to what Settings() can represent, so a settings round trip
  // returns an equal document.
  void SetDesign(const Design &design);

  const std::vector<uint8_t> &Payload() const { return payload_; }
  ErrorCorrection GetErrorCorrection() const { return level_; }
  const Design &GetDesign() const { return design_; }
  const ModuleMatrix &Matrix() const { return engine_.Matrix(); }
  // Smallest render size, in pixels, giving each module a full pixel.
  int PixelSize() const { return engine_.PixelSize(); }

  std::string AsciiRepresentation() const;
  std::string SmallAsciiRepresentation() const;

  ModulePath Path(float size) const { return Path(size, design_); }
  ModulePath Path(float size, const Design &design) const;

  // Fills rect with the background colour, then draws the symbol in the
  // largest square centred in rect and finally the logo image.
  void Draw(ICanvas2D &canvas, const CanvasRect &rect) const {
    Draw(canvas, rect, design_);
  }
  void Draw(ICanvas2D &canvas, const CanvasRect &rect,
            const Design &design) const;

  std::optional<wxImage> Rasterize(int size, double scale = 1.0) const {
    return Rasterize(size, scale, design_);
  }
  std::optional<wxImage> Rasterize(int size, double scale,
                                   const Design &design) const;

  // Single page PDF; the page edge is size * 72 / resolution points.
  std::optional<std::string> Pdf(int size, double resolution = 72.0) const {
    return Pdf(size, resolution, design_);
  }
  std::optional<std::string> Pdf(int size, double resolution,
                                 const Design &design) const;

  // Encodes text at the default level with the default Design.
  static std::optional<wxImage> Image(const std::string &text, int size);

  // {"data": base64, "correction": "L|M|Q|H", "design": {...}}
  nlohmann::json Settings() const;
  // Never fails for an object; unusable fields fall back to their defaults.
  static std::optional<QRDocument> Create(const nlohmann::json &settings);

  std::string JsonData() const;
  std::string JsonStringFormatted() const;
  static std::optional<QRDocument> Create(std::string_view jsonBytes);
  static std::optional<QRDocument> Create(const std::string &jsonBytes) {
    return Create(std::string_view(jsonBytes));
  }
  static std::optional<QRDocument> Create(const char *jsonBytes) {
    return Create(std::string_view(jsonBytes));
  }

  bool operator==(const QRDocument &other) const {
    return payload_ == other.payload_ && level_ == other.level_ &&
           design_ == other.design_;
  }
  bool operator!=(const QRDocument &other) const { return !(*this == other); }

private:
  std::vector<uint8_t> payload_;
  ErrorCorrection level_ = kDefaultErrorCorrection;
  Design design_;
  MatrixEngine engine_;
};

namespace PayloadEncoding {
std::string ToBase64(const std::vector<uint8_t> &bytes);
// Strict decoding; std::nullopt on malformed input.
std::optional<std::vector<uint8_t>> FromBase64(const std::string &text);
} // namespace PayloadEncoding
