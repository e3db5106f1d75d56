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
#include "wxgraphicscanvas.h"

#include "logger.h"

#include <algorithm>

#include <wx/brush.h>
#include <wx/image.h>
#include <wx/pen.h>

wxColour ToWxColor(const CanvasColor &color) {
  auto clamp = [](float v) {
    return static_cast<unsigned char>(std::clamp(v, 0.0f, 1.0f) * 255.0f +
                                      0.5f);
  };
  return wxColour(clamp(color.r), clamp(color.g), clamp(color.b),
                  clamp(color.a));
}

WxGraphicsCanvas::WxGraphicsCanvas(wxGraphicsContext &gc)
    : gc_(gc), base_(gc.GetTransform()) {}

void WxGraphicsCanvas::BeginFrame() {
  base_ = gc_.GetTransform();
  depth_ = 0;
  gc_.SetPen(*wxTRANSPARENT_PEN);
}

void WxGraphicsCanvas::EndFrame() {
  while (depth_ > 0) {
    gc_.PopState();
    --depth_;
  }
  gc_.SetTransform(base_);
}

void WxGraphicsCanvas::Save() {
  gc_.PushState();
  ++depth_;
}

void WxGraphicsCanvas::Restore() {
  if (depth_ == 0)
    return;
  gc_.PopState();
  --depth_;
}

void WxGraphicsCanvas::SetTransform(const CanvasTransform &transform) {
  gc_.SetTransform(base_);
  gc_.Translate(transform.offsetX, transform.offsetY);
  gc_.Scale(transform.scale, transform.scale);
}

void WxGraphicsCanvas::DrawRectangle(float x, float y, float w, float h,
                                     const CanvasFill &fill) {
  if (w <= 0.0f || h <= 0.0f)
    return;
  gc_.SetPen(*wxTRANSPARENT_PEN);
  gc_.SetBrush(wxBrush(ToWxColor(fill.color)));
  gc_.DrawRectangle(x, y, w, h);
}

void WxGraphicsCanvas::FillPath(const ModulePath &path,
                                const CanvasFill &fill) {
  if (path.Empty())
    return;
  wxGraphicsPath gpath = gc_.CreatePath();
  for (const auto &element : path.elements) {
    if (const auto *rect = std::get_if<PathRect>(&element)) {
      const double radius =
          std::min({rect->radius, rect->w * 0.5f, rect->h * 0.5f});
      if (radius > 0.0)
        gpath.AddRoundedRectangle(rect->x, rect->y, rect->w, rect->h, radius);
      else
        gpath.AddRectangle(rect->x, rect->y, rect->w, rect->h);
    } else if (const auto *ellipse = std::get_if<PathEllipse>(&element)) {
      gpath.AddEllipse(ellipse->x, ellipse->y, ellipse->w, ellipse->h);
    }
  }
  gc_.SetPen(*wxTRANSPARENT_PEN);
  gc_.SetBrush(wxBrush(ToWxColor(fill.color)));
  gc_.FillPath(gpath, wxODDEVEN_RULE);
}

const wxBitmap *WxGraphicsCanvas::CachedBitmap(const std::string &imagePath) {
  auto it = bitmaps_.find(imagePath);
  if (it == bitmaps_.end()) {
    wxImage image;
    wxBitmap bitmap;
    if (image.LoadFile(wxString::FromUTF8(imagePath)) && image.IsOk())
      bitmap = wxBitmap(image);
    else
      Logger::Instance().Warn("Unable to load logo image " + imagePath);
    it = bitmaps_.emplace(imagePath, bitmap).first;
  }
  return it->second.IsOk() ? &it->second : nullptr;
}

void WxGraphicsCanvas::DrawImage(const std::string &imagePath, float x,
                                 float y, float w, float h) {
  if (imagePath.empty() || w <= 0.0f || h <= 0.0f)
    return;
  if (const wxBitmap *bitmap = CachedBitmap(imagePath))
    gc_.DrawBitmap(*bitmap, x, y, w, h);
}
