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

#include <map>
#include <string>
#include <vector>

#include <wx/bitmap.h>
#include <wx/colour.h>
#include <wx/graphics.h>

wxColour ToWxColor(const CanvasColor &color);

// ICanvas2D backend drawing onto a wxGraphicsContext. Transforms set on the
// canvas are applied on top of whatever matrix the context had when
// BeginFrame was called.
class WxGraphicsCanvas : public ICanvas2D {
public:
  explicit WxGraphicsCanvas(wxGraphicsContext &gc);

  void BeginFrame() override;
  void EndFrame() override;

  void Save() override;
  void Restore() override;
  void SetTransform(const CanvasTransform &transform) override;

  void DrawRectangle(float x, float y, float w, float h,
                     const CanvasFill &fill) override;
  void FillPath(const ModulePath &path, const CanvasFill &fill) override;
  void DrawImage(const std::string &imagePath, float x, float y, float w,
                 float h) override;

private:
  const wxBitmap *CachedBitmap(const std::string &imagePath);

  wxGraphicsContext &gc_;
  wxGraphicsMatrix base_;
  int depth_ = 0;
  // Bitmaps loaded during this canvas' lifetime; invalid entries mark files
  // that failed to load so they are reported once.
  std::map<std::string, wxBitmap> bitmaps_;
};
