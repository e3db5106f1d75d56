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

#include "canvas2d.h"

#include <utility>

class RecordingCanvas : public ICanvas2D {
public:
  explicit RecordingCanvas(CommandBuffer &buffer) : m_buffer(buffer) {}

  void BeginFrame() override {
    m_buffer.Clear();
    m_transformStack.clear();
    m_currentTransform = {};
  }
  void EndFrame() override {}

  void Save() override {
    m_buffer.commands.emplace_back(SaveCommand{});
    m_transformStack.push_back(m_currentTransform);
  }
  void Restore() override {
    m_buffer.commands.emplace_back(RestoreCommand{});
    if (!m_transformStack.empty()) {
      m_currentTransform = m_transformStack.back();
      m_transformStack.pop_back();
    }
  }
  void SetTransform(const CanvasTransform &transform) override {
    m_buffer.commands.emplace_back(TransformCommand{transform});
    m_currentTransform = transform;
  }

  void DrawRectangle(float x, float y, float w, float h,
                     const CanvasFill &fill) override {
    if (w <= 0.0f || h <= 0.0f)
      return;
    m_buffer.commands.emplace_back(RectangleCommand{x, y, w, h, fill});
  }

  void FillPath(const ModulePath &path, const CanvasFill &fill) override {
    if (path.Empty())
      return;
    m_buffer.commands.emplace_back(PathCommand{path, fill});
  }

  void DrawImage(const std::string &imagePath, float x, float y, float w,
                 float h) override {
    if (imagePath.empty() || w <= 0.0f || h <= 0.0f)
      return;
    m_buffer.commands.emplace_back(ImageCommand{imagePath, x, y, w, h});
  }

private:
  CommandBuffer &m_buffer;
  std::vector<CanvasTransform> m_transformStack;
  CanvasTransform m_currentTransform{};
};

std::unique_ptr<ICanvas2D> CreateRecordingCanvas(CommandBuffer &buffer) {
  return std::make_unique<RecordingCanvas>(buffer);
}

void ReplayCommandBuffer(const CommandBuffer &buffer, ICanvas2D &canvas) {
  for (const auto &cmd : buffer.commands) {
    if (const auto *rect = std::get_if<RectangleCommand>(&cmd)) {
      canvas.DrawRectangle(rect->x, rect->y, rect->w, rect->h, rect->fill);
    } else if (const auto *path = std::get_if<PathCommand>(&cmd)) {
      canvas.FillPath(path->path, path->fill);
    } else if (const auto *image = std::get_if<ImageCommand>(&cmd)) {
      canvas.DrawImage(image->imagePath, image->x, image->y, image->w,
                       image->h);
    } else if (std::holds_alternative<SaveCommand>(cmd)) {
      canvas.Save();
    } else if (std::holds_alternative<RestoreCommand>(cmd)) {
      canvas.Restore();
    } else if (const auto *tf = std::get_if<TransformCommand>(&cmd)) {
      canvas.SetTransform(tf->transform);
    }
  }
}
