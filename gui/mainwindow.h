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

#include "configservices.h"
#include "qrdocument.h"

#include <string>

#include <wx/wx.h>

class QRCodePanel;
class wxColourPickerCtrl;
class wxColourPickerEvent;

class MainWindow : public wxFrame {
public:
  explicit MainWindow(const wxString &title);
  ~MainWindow();

  bool LoadSettingsFromPath(const std::string &path); // Load settings JSON
  bool SaveSettingsToPath(const std::string &path);   // Write settings JSON

private:
  void SetupLayout();   // Build controls and preview
  void CreateMenuBar(); // Create menus
  void SyncControls();  // Reflect the preview document in the controls
  void UpdateStatus();
  Design DesignFromControls() const;

  UserPreferencesStore preferences;
  std::string currentSettingsPath;

  wxTextCtrl *contentCtrl = nullptr;
  wxChoice *correctionChoice = nullptr;
  wxChoice *eyeChoice = nullptr;
  wxChoice *pixelChoice = nullptr;
  wxColourPickerCtrl *foregroundPicker = nullptr;
  wxColourPickerCtrl *backgroundPicker = nullptr;
  wxStaticText *statusText = nullptr;
  QRCodePanel *preview = nullptr;

  void OnContentChanged(wxCommandEvent &event);
  void OnCorrectionChanged(wxCommandEvent &event);
  void OnShapeChanged(wxCommandEvent &event);
  void OnColourChanged(wxColourPickerEvent &event);

  void OnOpenSettings(wxCommandEvent &event);
  void OnSaveSettings(wxCommandEvent &event);
  void OnExportPng(wxCommandEvent &event);
  void OnExportPdf(wxCommandEvent &event);
  void OnSetLogo(wxCommandEvent &event);
  void OnClearLogo(wxCommandEvent &event);
  void OnLogAscii(wxCommandEvent &event);
  void OnShowAbout(wxCommandEvent &event);
  void OnQuit(wxCommandEvent &event);
  void OnCloseWindow(wxCloseEvent &event);

  wxDECLARE_EVENT_TABLE();
};

// Menu and control identifiers
enum {
  ID_File_OpenSettings = wxID_HIGHEST + 1,
  ID_File_SaveSettings,
  ID_File_ExportPng,
  ID_File_ExportPdf,
  ID_Tools_SetLogo,
  ID_Tools_ClearLogo,
  ID_Tools_LogAscii,
  ID_Content,
  ID_Correction,
  ID_EyeShape,
  ID_PixelShape,
  ID_Foreground,
  ID_Background
};
