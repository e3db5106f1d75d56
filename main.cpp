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
#include "logger.h"
#include "mainwindow.h"
#include <wx/wx.h>

class QRStudioApp : public wxApp {
public:
  virtual bool OnInit() override;
  virtual int OnExit() override;
};

wxIMPLEMENT_APP(QRStudioApp);

bool QRStudioApp::OnInit() {
  // Logo images and PNG export need the image handlers
  wxInitAllImageHandlers();

  // Initialize logging system (overwrites log file each launch)
  Logger::Instance();

  SetAppName("QRStudio");

  MainWindow *mainWindow = new MainWindow("QRStudio");
  mainWindow->Show(true);

  if (argc > 1) {
    const std::string path = argv[1].ToStdString(wxConvUTF8);
    if (!mainWindow->LoadSettingsFromPath(path))
      Logger::Instance().Warn("Could not open " + path);
  }
  return true;
}

int QRStudioApp::OnExit() {
  // Preferences are saved on close; make sure their log lines reach the file
  Logger::Instance().Flush();
  return wxApp::OnExit();
}
