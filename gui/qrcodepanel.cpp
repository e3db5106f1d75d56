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
#include "qrcodepanel.h"

#include "logger.h"
#include "wxgraphicscanvas.h"

#include <memory>

#include <wx/dcbuffer.h>
#include <wx/graphics.h>

wxBEGIN_EVENT_TABLE(QRCodePanel, wxPanel)
    EVT_PAINT(QRCodePanel::OnPaint)
    EVT_SIZE(QRCodePanel::OnSize)
wxEND_EVENT_TABLE()

QRCodePanel::QRCodePanel(wxWindow *parent)
    : wxPanel(parent, wxID_ANY, wxDefaultPosition, wxSize(240, 240)) {
  SetBackgroundStyle(wxBG_STYLE_PAINT);
  SetMinSize(wxSize(120, 120));
}

bool QRCodePanel::SetTextContent(const std::string &text) {
  try {
    document.Update(text, document.GetErrorCorrection());
  } catch (const EncodingError &e) {
    Logger::Instance().Warn(std::string("Preview not updated: ") + e.what());
    return false;
  }
  Refresh();
  return true;
}

bool QRCodePanel::SetErrorCorrection(ErrorCorrection level) {
  try {
    document.SetErrorCorrection(level);
  } catch (const EncodingError &e) {
    Logger::Instance().Warn(std::string("Level not applied: ") + e.what());
    return false;
  }
  Refresh();
  return true;
}

void QRCodePanel::SetDesign(const Design &design) {
  document.SetDesign(design);
  Refresh();
}

void QRCodePanel::SetDocument(const QRDocument &doc) {
  document = doc;
  Refresh();
}

std::optional<wxImage> QRCodePanel::Image(const std::string &content,
                                          int size) {
  return QRDocument::Image(content, size);
}

void QRCodePanel::OnSize(wxSizeEvent &event) {
  Refresh();
  event.Skip();
}

void QRCodePanel::OnPaint(wxPaintEvent &) {
  wxAutoBufferedPaintDC dc(this);
  dc.SetBackground(wxBrush(GetBackgroundColour()));
  dc.Clear();

  const wxSize size = GetClientSize();
  if (size.GetWidth() <= 0 || size.GetHeight() <= 0)
    return;

  std::unique_ptr<wxGraphicsContext> gc(wxGraphicsContext::Create(dc));
  if (!gc)
    return;

  constexpr float kMargin = 8.0f;
  CanvasRect rect{kMargin, kMargin, size.GetWidth() - 2.0f * kMargin,
                  size.GetHeight() - 2.0f * kMargin};
  WxGraphicsCanvas canvas(*gc);
  canvas.BeginFrame();
  document.Draw(canvas, rect);
  canvas.EndFrame();
}
