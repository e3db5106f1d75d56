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
#include "rasterexporter.h"

#include "logger.h"
#include "wxgraphicscanvas.h"

#include <cmath>
#include <memory>

#include <wx/bitmap.h>
#include <wx/brush.h>
#include <wx/dcmemory.h>
#include <wx/graphics.h>

std::optional<wxImage> RasterizeCommandBuffer(const CommandBuffer &buffer,
                                              int width, int height,
                                              double scale) {
  if (width <= 0 || height <= 0 || !(scale > 0.0))
    return std::nullopt;

  const int pixelWidth = static_cast<int>(std::lround(width * scale));
  const int pixelHeight = static_cast<int>(std::lround(height * scale));
  if (pixelWidth <= 0 || pixelHeight <= 0)
    return std::nullopt;

  wxBitmap bitmap(pixelWidth, pixelHeight, 32);
  if (!bitmap.IsOk()) {
    Logger::Instance().Error("Raster export: unable to allocate a " +
                             std::to_string(pixelWidth) + "x" +
                             std::to_string(pixelHeight) + " bitmap");
    return std::nullopt;
  }

  {
    wxMemoryDC memDC(bitmap);
    memDC.SetBackground(wxBrush(wxColour(255, 255, 255)));
    memDC.Clear();
    std::unique_ptr<wxGraphicsContext> gc(wxGraphicsContext::Create(memDC));
    if (!gc) {
      memDC.SelectObject(wxNullBitmap);
      Logger::Instance().Error("Raster export: no graphics context available");
      return std::nullopt;
    }
    gc->SetAntialiasMode(wxANTIALIAS_DEFAULT);
    gc->Scale(scale, scale);

    WxGraphicsCanvas canvas(*gc);
    canvas.BeginFrame();
    ReplayCommandBuffer(buffer, canvas);
    canvas.EndFrame();
    gc.reset();
    memDC.SelectObject(wxNullBitmap);
  }

  wxImage image = bitmap.ConvertToImage();
  if (!image.IsOk()) {
    Logger::Instance().Error("Raster export: bitmap conversion failed");
    return std::nullopt;
  }
  return image;
}
