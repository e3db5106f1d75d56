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
#include "errorcorrection.h"

#include <cctype>

char ErrorCorrectionCode(ErrorCorrection level) {
  switch (level) {
  case ErrorCorrection::Low:
    return 'L';
  case ErrorCorrection::Medium:
    return 'M';
  case ErrorCorrection::Quantize:
    return 'Q';
  case ErrorCorrection::High:
    return 'H';
  }
  return 'Q';
}

std::optional<ErrorCorrection> ErrorCorrectionFromCode(char code) {
  switch (std::toupper(static_cast<unsigned char>(code))) {
  case 'L':
    return ErrorCorrection::Low;
  case 'M':
    return ErrorCorrection::Medium;
  case 'Q':
    return ErrorCorrection::Quantize;
  case 'H':
    return ErrorCorrection::High;
  default:
    return std::nullopt;
  }
}

std::optional<ErrorCorrection>
ErrorCorrectionFromString(const std::string &value) {
  if (value.empty())
    return std::nullopt;
  return ErrorCorrectionFromCode(value.front());
}

std::string ErrorCorrectionDisplayName(ErrorCorrection level) {
  switch (level) {
  case ErrorCorrection::Low:
    return "Low (7%)";
  case ErrorCorrection::Medium:
    return "Medium (15%)";
  case ErrorCorrection::Quantize:
    return "Quantize (25%)";
  case ErrorCorrection::High:
    return "High (30%)";
  }
  return "Quantize (25%)";
}
