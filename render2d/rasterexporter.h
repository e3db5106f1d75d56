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

#include <optional>

#include <wx/image.h>

// Replays a recorded buffer into an offscreen bitmap of width*scale by
// height*scale device pixels. Command coordinates are in logical units; the
// scale factor is applied before replay. Returns std::nullopt when the size
// is not positive or the drawing surface could not be created.
std::optional<wxImage> RasterizeCommandBuffer(const CommandBuffer &buffer,
                                              int width, int height,
                                              double scale = 1.0);
