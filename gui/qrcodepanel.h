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

#include "qrdocument.h"

#include <optional>
#include <string>

#include <wx/image.h>
#include <wx/panel.h>

// Live preview of a QRDocument. The symbol is drawn in the largest square
// that fits the client area.
class QRCodePanel : public wxPanel {
public:
  explicit QRCodePanel(wxWindow *parent);

  // Re-encodes the document; returns false (and keeps the previous content)
  // when the text does not fit the current level.
  bool SetTextContent(const std::string &text);
  bool SetErrorCorrection(ErrorCorrection level);
  void SetDesign(const Design &design);
  void SetDocument(const QRDocument &document);

  const QRDocument &GetDocument() const { return document; }

  // Snapshot of text encoded with the default settings.
  static std::optional<wxImage> Image(const std::string &content, int size);

private:
  void OnPaint(wxPaintEvent &event);
  void OnSize(wxSizeEvent &event);

  QRDocument document;

  wxDECLARE_EVENT_TABLE();
};
