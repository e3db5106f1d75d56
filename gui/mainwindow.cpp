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
#include "mainwindow.h"

#include "designsettings.h"
#include "logger.h"
#include "qrcodepanel.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <wx/clrpicker.h>
#include <wx/filedlg.h>
#include <wx/filename.h>

namespace {
constexpr float kDefaultLogoOrigin = 0.375f;
constexpr float kDefaultLogoSize = 0.25f;

const char *const kEyeLabels[] = {"Square", "Rounded", "Circle"};
const char *const kPixelLabels[] = {"Square", "Circle", "Rounded",
                                    "Connected"};

wxColour ToWxColour(const CanvasColor &c) {
  auto byte = [](float v) {
    return static_cast<unsigned char>(std::clamp(v, 0.0f, 1.0f) * 255.0f +
                                      0.5f);
  };
  return wxColour(byte(c.r), byte(c.g), byte(c.b), byte(c.a));
}

CanvasColor FromWxColour(const wxColour &c) {
  return {c.Red() / 255.0f, c.Green() / 255.0f, c.Blue() / 255.0f,
          c.Alpha() / 255.0f};
}

EyeShape EyeFromSelection(int sel) {
  switch (sel) {
  case 1:
    return RoundedRectEye{};
  case 2:
    return CircleEye{};
  default:
    return SquareEye{};
  }
}

PixelShape PixelFromSelection(int sel) {
  switch (sel) {
  case 1:
    return CirclePixel{};
  case 2:
    return RoundedPixel{};
  case 3:
    return ConnectedPixel{};
  default:
    return SquarePixel{};
  }
}

std::string DirectoryOf(const wxString &path) {
  return wxFileName(path).GetPath().ToStdString();
}
} // namespace

wxBEGIN_EVENT_TABLE(MainWindow, wxFrame)
    EVT_MENU(ID_File_OpenSettings, MainWindow::OnOpenSettings)
    EVT_MENU(ID_File_SaveSettings, MainWindow::OnSaveSettings)
    EVT_MENU(ID_File_ExportPng, MainWindow::OnExportPng)
    EVT_MENU(ID_File_ExportPdf, MainWindow::OnExportPdf)
    EVT_MENU(ID_Tools_SetLogo, MainWindow::OnSetLogo)
    EVT_MENU(ID_Tools_ClearLogo, MainWindow::OnClearLogo)
    EVT_MENU(ID_Tools_LogAscii, MainWindow::OnLogAscii)
    EVT_MENU(wxID_ABOUT, MainWindow::OnShowAbout)
    EVT_MENU(wxID_EXIT, MainWindow::OnQuit)
    EVT_TEXT(ID_Content, MainWindow::OnContentChanged)
    EVT_CHOICE(ID_Correction, MainWindow::OnCorrectionChanged)
    EVT_CHOICE(ID_EyeShape, MainWindow::OnShapeChanged)
    EVT_CHOICE(ID_PixelShape, MainWindow::OnShapeChanged)
    EVT_COLOURPICKER_CHANGED(ID_Foreground, MainWindow::OnColourChanged)
    EVT_COLOURPICKER_CHANGED(ID_Background, MainWindow::OnColourChanged)
    EVT_CLOSE(MainWindow::OnCloseWindow)
wxEND_EVENT_TABLE()

MainWindow::MainWindow(const wxString &title)
    : wxFrame(nullptr, wxID_ANY, title, wxDefaultPosition, wxSize(760, 520)) {
  if (!preferences.LoadUserConfig())
    Logger::Instance().Log("No user preferences found, using defaults");
  preferences.RegisterApplicationVariables();

  CreateMenuBar();
  SetupLayout();

  preview->SetErrorCorrection(preferences.DefaultCorrection());
  SyncControls();
}

MainWindow::~MainWindow() = default;

void MainWindow::CreateMenuBar() {
  wxMenuBar *menuBar = new wxMenuBar();

  wxMenu *fileMenu = new wxMenu();
  fileMenu->Append(ID_File_OpenSettings, "&Open Settings...\tCtrl+O");
  fileMenu->Append(ID_File_SaveSettings, "&Save Settings...\tCtrl+S");
  fileMenu->AppendSeparator();
  fileMenu->Append(ID_File_ExportPng, "Export &PNG...\tCtrl+E");
  fileMenu->Append(ID_File_ExportPdf, "Export P&DF...");
  fileMenu->AppendSeparator();
  fileMenu->Append(wxID_EXIT, "E&xit");
  menuBar->Append(fileMenu, "&File");

  wxMenu *toolsMenu = new wxMenu();
  toolsMenu->Append(ID_Tools_SetLogo, "Set &Logo Image...");
  toolsMenu->Append(ID_Tools_ClearLogo, "&Clear Logo");
  toolsMenu->AppendSeparator();
  toolsMenu->Append(ID_Tools_LogAscii, "Log &ASCII Rendering");
  menuBar->Append(toolsMenu, "&Tools");

  wxMenu *helpMenu = new wxMenu();
  helpMenu->Append(wxID_ABOUT, "&About");
  menuBar->Append(helpMenu, "&Help");

  SetMenuBar(menuBar);
}

void MainWindow::SetupLayout() {
  wxPanel *root = new wxPanel(this);
  wxBoxSizer *mainSizer = new wxBoxSizer(wxHORIZONTAL);

  wxFlexGridSizer *form = new wxFlexGridSizer(2, wxSize(8, 8));
  form->AddGrowableCol(1, 1);
  form->AddGrowableRow(0, 1);

  contentCtrl = new wxTextCtrl(root, ID_Content, wxEmptyString,
                               wxDefaultPosition, wxSize(260, 120),
                               wxTE_MULTILINE);
  form->Add(new wxStaticText(root, wxID_ANY, "Content"), 0,
            wxALIGN_TOP | wxTOP, 4);
  form->Add(contentCtrl, 1, wxEXPAND);

  wxArrayString levels;
  for (ErrorCorrection level : kAllErrorCorrections)
    levels.Add(ErrorCorrectionDisplayName(level));
  correctionChoice = new wxChoice(root, ID_Correction, wxDefaultPosition,
                                  wxDefaultSize, levels);
  form->Add(new wxStaticText(root, wxID_ANY, "Error correction"), 0,
            wxALIGN_CENTER_VERTICAL);
  form->Add(correctionChoice, 1, wxEXPAND);

  eyeChoice = new wxChoice(root, ID_EyeShape);
  for (const char *label : kEyeLabels)
    eyeChoice->Append(label);
  form->Add(new wxStaticText(root, wxID_ANY, "Eyes"), 0,
            wxALIGN_CENTER_VERTICAL);
  form->Add(eyeChoice, 1, wxEXPAND);

  pixelChoice = new wxChoice(root, ID_PixelShape);
  for (const char *label : kPixelLabels)
    pixelChoice->Append(label);
  form->Add(new wxStaticText(root, wxID_ANY, "Pixels"), 0,
            wxALIGN_CENTER_VERTICAL);
  form->Add(pixelChoice, 1, wxEXPAND);

  foregroundPicker = new wxColourPickerCtrl(root, ID_Foreground, *wxBLACK);
  form->Add(new wxStaticText(root, wxID_ANY, "Foreground"), 0,
            wxALIGN_CENTER_VERTICAL);
  form->Add(foregroundPicker, 0);

  backgroundPicker = new wxColourPickerCtrl(root, ID_Background, *wxWHITE);
  form->Add(new wxStaticText(root, wxID_ANY, "Background"), 0,
            wxALIGN_CENTER_VERTICAL);
  form->Add(backgroundPicker, 0);

  statusText = new wxStaticText(root, wxID_ANY, wxEmptyString);

  wxBoxSizer *left = new wxBoxSizer(wxVERTICAL);
  left->Add(form, 1, wxEXPAND | wxALL, 10);
  left->Add(statusText, 0, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 10);

  preview = new QRCodePanel(root);
  mainSizer->Add(left, 0, wxEXPAND);
  mainSizer->Add(preview, 1, wxEXPAND | wxALL, 10);
  root->SetSizer(mainSizer);
}

// Eye and pixel parameters are kept when the selected type does not change.
Design MainWindow::DesignFromControls() const {
  Design design = preview->GetDocument().GetDesign();
  design.foreground = FromWxColour(foregroundPicker->GetColour());
  design.background = FromWxColour(backgroundPicker->GetColour());

  EyeShape eye = EyeFromSelection(eyeChoice->GetSelection());
  if (eye.index() != design.eyeShape.index())
    design.eyeShape = eye;
  PixelShape pixel = PixelFromSelection(pixelChoice->GetSelection());
  if (pixel.index() != design.pixelShape.index())
    design.pixelShape = pixel;
  return design;
}

void MainWindow::SyncControls() {
  const QRDocument &doc = preview->GetDocument();
  const std::vector<uint8_t> &payload = doc.Payload();
  if (payload.empty())
    contentCtrl->ChangeValue(wxEmptyString);
  else
    contentCtrl->ChangeValue(
        wxString::FromUTF8(reinterpret_cast<const char *>(payload.data()),
                           payload.size()));

  const auto &levels = kAllErrorCorrections;
  auto it = std::find(levels.begin(), levels.end(), doc.GetErrorCorrection());
  correctionChoice->SetSelection(static_cast<int>(it - levels.begin()));

  const Design &design = doc.GetDesign();
  eyeChoice->SetSelection(static_cast<int>(design.eyeShape.index()));
  pixelChoice->SetSelection(static_cast<int>(design.pixelShape.index()));
  foregroundPicker->SetColour(ToWxColour(design.foreground));
  backgroundPicker->SetColour(ToWxColour(design.background));
  UpdateStatus();
}

void MainWindow::UpdateStatus() {
  const QRDocument &doc = preview->GetDocument();
  if (doc.Matrix().Empty()) {
    statusText->SetLabel("Empty");
    return;
  }
  statusText->SetLabel(wxString::Format(
      "%d x %d modules, %lu of %lu bytes", doc.PixelSize(), doc.PixelSize(),
      static_cast<unsigned long>(doc.Payload().size()),
      static_cast<unsigned long>(
          MatrixEngine::MaxPayloadSize(doc.GetErrorCorrection()))));
}

void MainWindow::OnContentChanged(wxCommandEvent &) {
  const wxScopedCharBuffer utf8 = contentCtrl->GetValue().ToUTF8();
  std::string text(utf8.data(), utf8.length());
  if (!preview->SetTextContent(text)) {
    statusText->SetLabel("Content too long for the selected level");
    return;
  }
  UpdateStatus();
}

void MainWindow::OnCorrectionChanged(wxCommandEvent &) {
  const int sel = correctionChoice->GetSelection();
  if (sel < 0 || sel >= static_cast<int>(kAllErrorCorrections.size()))
    return;
  const ErrorCorrection level = kAllErrorCorrections[sel];
  if (!preview->SetErrorCorrection(level)) {
    wxMessageBox("The content does not fit at this level.", "Error",
                 wxICON_ERROR);
    SyncControls();
    return;
  }
  preferences.SetDefaultCorrection(level);
  UpdateStatus();
}

void MainWindow::OnShapeChanged(wxCommandEvent &) {
  preview->SetDesign(DesignFromControls());
}

void MainWindow::OnColourChanged(wxColourPickerEvent &) {
  preview->SetDesign(DesignFromControls());
}

bool MainWindow::LoadSettingsFromPath(const std::string &path) {
  std::ifstream file(std::filesystem::u8path(path), std::ios::binary);
  if (!file.is_open()) {
    Logger::Instance().Error("Unable to open settings " + path);
    return false;
  }
  std::string bytes((std::istreambuf_iterator<char>(file)),
                    std::istreambuf_iterator<char>());
  auto document = QRDocument::Create(bytes);
  if (!document) {
    Logger::Instance().Error("Settings file " + path + " is not a JSON object");
    return false;
  }
  preview->SetDocument(*document);
  currentSettingsPath = path;
  SyncControls();
  Logger::Instance().Log("Loaded settings " + path);
  return true;
}

bool MainWindow::SaveSettingsToPath(const std::string &path) {
  std::ofstream file(std::filesystem::u8path(path), std::ios::binary);
  if (!file.is_open()) {
    Logger::Instance().Error("Unable to write settings " + path);
    return false;
  }
  file << preview->GetDocument().JsonStringFormatted();
  if (!file) {
    Logger::Instance().Error("Failed to write settings " + path);
    return false;
  }
  currentSettingsPath = path;
  Logger::Instance().Log("Saved settings " + path);
  return true;
}

void MainWindow::OnOpenSettings(wxCommandEvent &) {
  wxString dir = preferences.GetString(PREF_LAST_SETTINGS_DIR);
  wxFileDialog dlg(this, "Open Settings", dir, "",
                   "QR settings (*.json)|*.json",
                   wxFD_OPEN | wxFD_FILE_MUST_EXIST);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;

  preferences.SetValue(PREF_LAST_SETTINGS_DIR, DirectoryOf(dlg.GetPath()));
  if (!LoadSettingsFromPath(dlg.GetPath().ToStdString(wxConvUTF8)))
    wxMessageBox("Failed to load settings.", "Error", wxICON_ERROR);
}

void MainWindow::OnSaveSettings(wxCommandEvent &) {
  wxString dir = preferences.GetString(PREF_LAST_SETTINGS_DIR);
  wxFileDialog dlg(this, "Save Settings", dir, "qrcode.json",
                   "QR settings (*.json)|*.json",
                   wxFD_SAVE | wxFD_OVERWRITE_PROMPT);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;

  preferences.SetValue(PREF_LAST_SETTINGS_DIR, DirectoryOf(dlg.GetPath()));
  if (!SaveSettingsToPath(dlg.GetPath().ToStdString(wxConvUTF8)))
    wxMessageBox("Failed to save settings.", "Error", wxICON_ERROR);
}

void MainWindow::OnExportPng(wxCommandEvent &) {
  wxString dir = preferences.GetString(PREF_LAST_EXPORT_DIR);
  wxFileDialog dlg(this, "Export PNG", dir, "qrcode.png",
                   "PNG images (*.png)|*.png",
                   wxFD_SAVE | wxFD_OVERWRITE_PROMPT);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;
  preferences.SetValue(PREF_LAST_EXPORT_DIR, DirectoryOf(dlg.GetPath()));

  const int size =
      static_cast<int>(preferences.GetFloat(PREF_EXPORT_SIZE) + 0.5f);
  const double scale = preferences.GetFloat(PREF_EXPORT_SCALE);
  auto image = preview->GetDocument().Rasterize(size, scale);
  if (!image || !image->SaveFile(dlg.GetPath(), wxBITMAP_TYPE_PNG)) {
    Logger::Instance().Error("PNG export failed for " +
                             dlg.GetPath().ToStdString());
    wxMessageBox("Failed to export PNG.", "Error", wxICON_ERROR);
    return;
  }
  Logger::Instance().Log("Exported " + dlg.GetPath().ToStdString());
}

void MainWindow::OnExportPdf(wxCommandEvent &) {
  wxString dir = preferences.GetString(PREF_LAST_EXPORT_DIR);
  wxFileDialog dlg(this, "Export PDF", dir, "qrcode.pdf",
                   "PDF files (*.pdf)|*.pdf",
                   wxFD_SAVE | wxFD_OVERWRITE_PROMPT);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;
  preferences.SetValue(PREF_LAST_EXPORT_DIR, DirectoryOf(dlg.GetPath()));

  const int size =
      static_cast<int>(preferences.GetFloat(PREF_EXPORT_SIZE) + 0.5f);
  const double resolution = preferences.GetFloat(PREF_PDF_RESOLUTION);
  auto bytes = preview->GetDocument().Pdf(size, resolution);
  const std::string path = dlg.GetPath().ToStdString(wxConvUTF8);
  bool written = false;
  if (bytes) {
    std::ofstream file(std::filesystem::u8path(path), std::ios::binary);
    file.write(bytes->data(), static_cast<std::streamsize>(bytes->size()));
    written = static_cast<bool>(file);
  }
  if (!written) {
    Logger::Instance().Error("PDF export failed for " + path);
    wxMessageBox("Failed to export PDF.", "Error", wxICON_ERROR);
    return;
  }
  Logger::Instance().Log("Exported " + path);
}

void MainWindow::OnSetLogo(wxCommandEvent &) {
  wxFileDialog dlg(this, "Select Logo Image", "", "",
                   "Images (*.png;*.jpg;*.jpeg;*.bmp)|*.png;*.jpg;*.jpeg;*.bmp",
                   wxFD_OPEN | wxFD_FILE_MUST_EXIST);
  if (dlg.ShowModal() == wxID_CANCEL)
    return;

  Design design = preview->GetDocument().GetDesign();
  LogoTemplate logo = design.logo.value_or(
      LogoTemplate{kDefaultLogoOrigin, kDefaultLogoOrigin, kDefaultLogoSize,
                   kDefaultLogoSize, std::string()});
  logo.imagePath = dlg.GetPath().ToStdString(wxConvUTF8);
  design.logo = logo;
  preview->SetDesign(design);
}

void MainWindow::OnClearLogo(wxCommandEvent &) {
  Design design = preview->GetDocument().GetDesign();
  design.logo.reset();
  preview->SetDesign(design);
}

void MainWindow::OnLogAscii(wxCommandEvent &) {
  const QRDocument &doc = preview->GetDocument();
  if (doc.Matrix().Empty()) {
    Logger::Instance().Log("Nothing to render");
    return;
  }
  Logger::Instance().Log("\n" + doc.SmallAsciiRepresentation());
}

void MainWindow::OnShowAbout(wxCommandEvent &) {
  wxMessageBox("QRStudio\nStyled QR code renderer.", "About QRStudio",
               wxOK | wxICON_INFORMATION);
}

void MainWindow::OnQuit(wxCommandEvent &) { Close(true); }

void MainWindow::OnCloseWindow(wxCloseEvent &event) {
  if (!preferences.SaveUserConfig())
    Logger::Instance().Warn("Unable to save user preferences");
  event.Skip();
}
