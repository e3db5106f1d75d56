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
#include "qrdocument.h"

#include "designsettings.h"
#include "logger.h"
#include "pathbuilder.h"
#include "qrpdfexporter.h"
#include "rasterexporter.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <wx/base64.h>

namespace PayloadEncoding {
std::string ToBase64(const std::vector<uint8_t> &bytes) {
  if (bytes.empty())
    return std::string();
  return wxBase64Encode(bytes.data(), bytes.size()).ToStdString();
}

std::optional<std::vector<uint8_t>> FromBase64(const std::string &text) {
  if (text.empty())
    return std::vector<uint8_t>();
  std::vector<uint8_t> out(wxBase64DecodedSize(text.size()));
  const size_t len = wxBase64Decode(out.data(), out.size(), text.data(),
                                    text.size(), wxBase64DecodeMode_Strict);
  if (len == wxCONV_FAILED)
    return std::nullopt;
  out.resize(len);
  return out;
}
} // namespace PayloadEncoding

void QRDocument::Update(const std::vector<uint8_t> &payload,
                        ErrorCorrection level) {
  std::vector<uint8_t> next(payload);
  engine_.Regenerate(next, level);
  payload_ = std::move(next);
  level_ = level;
}

void QRDocument::Update(const std::string &text, ErrorCorrection level) {
  Update(std::vector<uint8_t>(text.begin(), text.end()), level);
}

void QRDocument::Update(const MessageFormatter &message,
                        ErrorCorrection level) {
  Update(message.ToPayloadBytes(), level);
}

void QRDocument::SetPayload(const std::vector<uint8_t> &payload) {
  Update(payload, level_);
}

void QRDocument::SetErrorCorrection(ErrorCorrection level) {
  Update(payload_, level);
}

void QRDocument::SetDesign(const Design &design) {
  design_ = DesignSettings::Normalize(design);
}

std::string QRDocument::AsciiRepresentation() const {
  return MatrixText::ToAscii(Matrix());
}

std::string QRDocument::SmallAsciiRepresentation() const {
  return MatrixText::ToCompactAscii(Matrix());
}

ModulePath QRDocument::Path(float size, const Design &design) const {
  return PathBuilder::BuildPath(Matrix(), size, design);
}

void QRDocument::Draw(ICanvas2D &canvas, const CanvasRect &rect,
                      const Design &design) const {
  if (rect.w <= 0.0f || rect.h <= 0.0f)
    return;
  canvas.DrawRectangle(rect.x, rect.y, rect.w, rect.h,
                       CanvasFill{design.background});

  const float side = std::min(rect.w, rect.h);
  ModulePath path = PathBuilder::BuildPath(Matrix(), side, design);
  const bool hasLogo = design.logo && !design.logo->imagePath.empty() &&
                       !Matrix().Empty();
  if (path.Empty() && !hasLogo)
    return;

  CanvasTransform placement;
  placement.offsetX = rect.x + (rect.w - side) * 0.5f;
  placement.offsetY = rect.y + (rect.h - side) * 0.5f;
  canvas.Save();
  canvas.SetTransform(placement);
  canvas.FillPath(path, CanvasFill{design.foreground});
  if (hasLogo) {
    const LogoTemplate &logo = *design.logo;
    canvas.DrawImage(logo.imagePath, logo.x * side, logo.y * side,
                     logo.w * side, logo.h * side);
  }
  canvas.Restore();
}

std::optional<wxImage> QRDocument::Rasterize(int size, double scale,
                                             const Design &design) const {
  if (size <= 0 || !(scale > 0.0))
    return std::nullopt;
  CommandBuffer buffer;
  auto canvas = CreateRecordingCanvas(buffer);
  canvas->BeginFrame();
  Draw(*canvas, CanvasRect{0.0f, 0.0f, static_cast<float>(size),
                           static_cast<float>(size)},
       design);
  canvas->EndFrame();
  return RasterizeCommandBuffer(buffer, size, size, scale);
}

std::optional<std::string> QRDocument::Pdf(int size, double resolution,
                                           const Design &design) const {
  if (size <= 0 || !(resolution > 0.0) || !std::isfinite(resolution))
    return std::nullopt;
  CommandBuffer buffer;
  auto canvas = CreateRecordingCanvas(buffer);
  canvas->BeginFrame();
  Draw(*canvas, CanvasRect{0.0f, 0.0f, static_cast<float>(size),
                           static_cast<float>(size)},
       design);
  canvas->EndFrame();

  QRPdfOptions options;
  options.scale = 72.0 / resolution;
  options.pageWidthPt = size * options.scale;
  options.pageHeightPt = size * options.scale;
  QRPdfExportResult result = ExportCommandBufferToPdf(buffer, options);
  if (!result.success) {
    Logger::Instance().Error("PDF rendering failed: " + result.message);
    return std::nullopt;
  }
  return std::move(result.bytes);
}

std::optional<wxImage> QRDocument::Image(const std::string &text, int size) {
  QRDocument document;
  try {
    document.Update(text);
  } catch (const EncodingError &e) {
    Logger::Instance().Warn(std::string("Unable to encode image content: ") +
                            e.what());
    return std::nullopt;
  }
  return document.Rasterize(size);
}

nlohmann::json QRDocument::Settings() const {
  nlohmann::json j;
  j["data"] = PayloadEncoding::ToBase64(payload_);
  j["correction"] = std::string(1, ErrorCorrectionCode(level_));
  j["design"] = DesignSettings::ToSettings(design_);
  return j;
}

std::optional<QRDocument> QRDocument::Create(const nlohmann::json &settings) {
  if (!settings.is_object())
    return std::nullopt;

  Logger &log = Logger::Instance();
  std::vector<uint8_t> payload;
  auto data = settings.find("data");
  if (data != settings.end()) {
    std::optional<std::vector<uint8_t>> decoded;
    if (data->is_string())
      decoded = PayloadEncoding::FromBase64(data->get<std::string>());
    if (decoded)
      payload = std::move(*decoded);
    else
      log.Warn("Settings: 'data' is not valid base64, using an empty payload");
  }

  ErrorCorrection level = kDefaultErrorCorrection;
  auto correction = settings.find("correction");
  if (correction != settings.end()) {
    std::optional<ErrorCorrection> parsed;
    if (correction->is_string())
      parsed = ErrorCorrectionFromString(correction->get<std::string>());
    if (parsed)
      level = *parsed;
    else
      log.Warn("Settings: unknown 'correction', using " +
               std::string(1, ErrorCorrectionCode(kDefaultErrorCorrection)));
  }

  QRDocument document;
  auto design = settings.find("design");
  if (design != settings.end()) {
    if (auto parsed = DesignSettings::Create(*design))
      document.design_ = *parsed;
    else
      log.Warn("Settings: 'design' is not an object, using the default");
  }

  try {
    document.Update(payload, level);
  } catch (const EncodingError &e) {
    log.Warn(std::string("Settings: payload no longer encodes (") + e.what() +
             "), using an empty payload");
    document.Update(std::vector<uint8_t>(), level);
  }
  return document;
}

std::string QRDocument::JsonData() const { return Settings().dump(); }

std::string QRDocument::JsonStringFormatted() const {
  return Settings().dump(4);
}

std::optional<QRDocument> QRDocument::Create(std::string_view jsonBytes) {
  nlohmann::json j =
      nlohmann::json::parse(jsonBytes.begin(), jsonBytes.end(), nullptr,
                            false);
  if (j.is_discarded()) {
    Logger::Instance().Warn("Settings: input is not valid JSON");
    return std::nullopt;
  }
  return Create(j);
}
