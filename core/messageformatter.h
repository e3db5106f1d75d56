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

#include <cstdint>
#include <vector>

// Produces the raw payload for structured content (links, contact cards,
// network credentials). QRDocument only consumes the resulting bytes.
class MessageFormatter {
public:
  virtual ~MessageFormatter() = default;

  virtual std::vector<uint8_t> ToPayloadBytes() const = 0;
};
