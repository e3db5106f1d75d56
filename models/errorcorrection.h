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

#include <array>
#include <optional>
#include <string>

// Redundancy level used when encoding the symbol. Higher levels tolerate more
// damage but need a larger matrix for the same payload.
enum class ErrorCorrection { Low, Medium, Quantize, High };

// Level used for new documents, text updates without an explicit level and
// as the fallback when a settings document carries no usable code.
inline constexpr ErrorCorrection kDefaultErrorCorrection =
    ErrorCorrection::Quantize;

inline constexpr std::array<ErrorCorrection, 4> kAllErrorCorrections = {
    ErrorCorrection::Low, ErrorCorrection::Medium, ErrorCorrection::Quantize,
    ErrorCorrection::High};

// Canonical single character code ('L', 'M', 'Q', 'H') used in settings.
char ErrorCorrectionCode(ErrorCorrection level);

// Inverse of ErrorCorrectionCode. Lower case codes are accepted.
std::optional<ErrorCorrection> ErrorCorrectionFromCode(char code);

// Parses the first character of a settings value. Empty strings and unknown
// codes yield std::nullopt.
std::optional<ErrorCorrection>
ErrorCorrectionFromString(const std::string &value);

// Human readable label such as "Quantize (25%)".
std::string ErrorCorrectionDisplayName(ErrorCorrection level);
