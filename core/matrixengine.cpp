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
#include "matrixengine.h"

#include "logger.h"

#include <qrcodegen.hpp>

#include <utility>

namespace {
qrcodegen::QrCode::Ecc ToEcc(ErrorCorrection level) {
  switch (level) {
  case ErrorCorrection::Low:
    return qrcodegen::QrCode::Ecc::LOW;
  case ErrorCorrection::Medium:
    return qrcodegen::QrCode::Ecc::MEDIUM;
  case ErrorCorrection::High:
    return qrcodegen::QrCode::Ecc::HIGH;
  case ErrorCorrection::Quantize:
  default:
    return qrcodegen::QrCode::Ecc::QUARTILE;
  }
}
} // namespace

ModuleMatrix MatrixEngine::Generate(const std::vector<uint8_t> &payload,
                                    ErrorCorrection level) {
  ModuleMatrix matrix;
  if (payload.empty())
    return matrix;

  try {
    const std::vector<qrcodegen::QrSegment> segments{
        qrcodegen::QrSegment::makeBytes(payload)};
    const qrcodegen::QrCode code = qrcodegen::QrCode::encodeSegments(
        segments, ToEcc(level), qrcodegen::QrCode::MIN_VERSION,
        qrcodegen::QrCode::MAX_VERSION, -1, false);

    const int size = code.getSize();
    matrix.size = size;
    matrix.modules.assign(static_cast<size_t>(size) * size, false);
    for (int row = 0; row < size; ++row) {
      for (int col = 0; col < size; ++col)
        matrix.Set(row, col, code.getModule(col, row));
    }
  } catch (const qrcodegen::data_too_long &e) {
    Logger::Instance().Warn("Payload of " + std::to_string(payload.size()) +
                            " bytes does not fit level " +
                            std::string(1, ErrorCorrectionCode(level)) +
                            ": " + e.what());
    throw EncodingError(e.what());
  }
  return matrix;
}

size_t MatrixEngine::MaxPayloadSize(ErrorCorrection level) {
  switch (level) {
  case ErrorCorrection::Low:
    return 2953;
  case ErrorCorrection::Medium:
    return 2331;
  case ErrorCorrection::Quantize:
    return 1663;
  case ErrorCorrection::High:
  default:
    return 1273;
  }
}

void MatrixEngine::Regenerate(const std::vector<uint8_t> &payload,
                              ErrorCorrection level) {
  ModuleMatrix next = Generate(payload, level);
  matrix_ = std::move(next);
}
