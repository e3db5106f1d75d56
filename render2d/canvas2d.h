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

#include "modulepath.h"

#include <memory>
#include <string>
#include <variant>
#include <vector>

// Simple RGBA color container expressed in floating point values.
struct CanvasColor {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 1.0f;

  bool operator==(const CanvasColor &other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
  bool operator!=(const CanvasColor &other) const { return !(*this == other); }
};

// Fill style used by rectangles and module paths.
struct CanvasFill {
  CanvasColor color{};
};

// Uniform scale followed by a translation. Renderers use it to place the
// square symbol inside the requested rectangle.
struct CanvasTransform {
  float scale = 1.0f;
  float offsetX = 0.0f;
  float offsetY = 0.0f;
};

// Destination rectangle in canvas units.
struct CanvasRect {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
};

// Abstract interface representing a 2D drawing surface with a top-left origin
// and y growing downwards. Implementations may draw on screen, into an
// offscreen bitmap, or record commands for later export.
class ICanvas2D {
public:
  virtual ~ICanvas2D() = default;

  virtual void BeginFrame() = 0;
  virtual void EndFrame() = 0;

  virtual void Save() = 0;
  virtual void Restore() = 0;
  // Replaces the current transform; it is not composed with the previous one.
  virtual void SetTransform(const CanvasTransform &transform) = 0;

  virtual void DrawRectangle(float x, float y, float w, float h,
                             const CanvasFill &fill) = 0;
  // Fills every sub-shape of the path with the even-odd rule.
  virtual void FillPath(const ModulePath &path, const CanvasFill &fill) = 0;
  // Draws an image file stretched into the rectangle. Backends that cannot
  // load the file skip the call.
  virtual void DrawImage(const std::string &imagePath, float x, float y,
                         float w, float h) = 0;
};

// Command types used by the RecordingCanvas. Each command stores all required
// data to reproduce the drawing so exporters can rebuild the scene on a vector
// or raster backend.
struct RectangleCommand {
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
  CanvasFill fill{};
};

struct PathCommand {
  ModulePath path;
  CanvasFill fill{};
};

struct ImageCommand {
  std::string imagePath;
  float x = 0.0f;
  float y = 0.0f;
  float w = 0.0f;
  float h = 0.0f;
};

struct SaveCommand {};
struct RestoreCommand {};
struct TransformCommand { CanvasTransform transform; };

using CanvasCommand =
    std::variant<RectangleCommand, PathCommand, ImageCommand, SaveCommand,
                 RestoreCommand, TransformCommand>;

// Container preserving the order of issued drawing commands. Raster and PDF
// exporters consume it without knowing where the drawing came from.
struct CommandBuffer {
  std::vector<CanvasCommand> commands;

  void Clear() { commands.clear(); }
  bool Empty() const { return commands.empty(); }
};

// Factory helpers implemented in canvas2d.cpp so callers do not need to know
// the concrete canvas classes.
std::unique_ptr<ICanvas2D> CreateRecordingCanvas(CommandBuffer &buffer);

void ReplayCommandBuffer(const CommandBuffer &buffer, ICanvas2D &canvas);
