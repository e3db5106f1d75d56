#include "canvas2d.h"
#include "qrdocument.h"

#include <cassert>
#include <iostream>

namespace {
// Counts calls made while replaying a buffer.
class CountingCanvas : public ICanvas2D {
public:
  void BeginFrame() override {}
  void EndFrame() override {}
  void Save() override { ++saves; }
  void Restore() override { ++restores; }
  void SetTransform(const CanvasTransform &t) override { last = t; }
  void DrawRectangle(float, float, float, float, const CanvasFill &) override {
    ++rects;
  }
  void FillPath(const ModulePath &, const CanvasFill &) override { ++paths; }
  void DrawImage(const std::string &, float, float, float, float) override {
    ++images;
  }

  int saves = 0;
  int restores = 0;
  int rects = 0;
  int paths = 0;
  int images = 0;
  CanvasTransform last{};
};
} // namespace

int main() {
  QRDocument doc;
  doc.Update(std::string("HELLO"), ErrorCorrection::Low);

  // Background first, then the path inside a saved transform.
  {
    CommandBuffer buffer;
    auto canvas = CreateRecordingCanvas(buffer);
    canvas->BeginFrame();
    doc.Draw(*canvas, CanvasRect{0.0f, 0.0f, 300.0f, 200.0f});
    canvas->EndFrame();

    const auto &cmds = buffer.commands;
    if (cmds.size() != 5) {
      std::cerr << "Expected 5 commands, got " << cmds.size() << "\n";
      return 1;
    }
    const auto *bg = std::get_if<RectangleCommand>(&cmds[0]);
    assert(bg && bg->w == 300.0f && bg->h == 200.0f);
    assert(bg->fill.color == Design{}.background);
    assert(std::holds_alternative<SaveCommand>(cmds[1]));
    const auto *tf = std::get_if<TransformCommand>(&cmds[2]);
    assert(tf && tf->transform.offsetX == 50.0f &&
           tf->transform.offsetY == 0.0f && tf->transform.scale == 1.0f);
    const auto *path = std::get_if<PathCommand>(&cmds[3]);
    assert(path && path->fill.color == Design{}.foreground);
    PathBounds b = path->path.Bounds();
    assert(b.valid && b.maxX <= 200.001f && b.maxY <= 200.001f);
    assert(std::holds_alternative<RestoreCommand>(cmds[4]));

    CountingCanvas counter;
    ReplayCommandBuffer(buffer, counter);
    assert(counter.rects == 1 && counter.paths == 1 && counter.saves == 1 &&
           counter.restores == 1 && counter.images == 0);
    assert(counter.last.offsetX == 50.0f);

    // Recording starts over on every frame.
    canvas->BeginFrame();
    assert(buffer.Empty());
  }

  // A design passed to Draw applies to that call only.
  {
    Design red;
    red.foreground = {1.0f, 0.0f, 0.0f, 1.0f};
    red.background = {0.0f, 0.0f, 0.0f, 0.0f};
    red.logo = LogoTemplate{0.4f, 0.4f, 0.2f, 0.2f, "logo.png"};

    CommandBuffer buffer;
    auto canvas = CreateRecordingCanvas(buffer);
    canvas->BeginFrame();
    doc.Draw(*canvas, CanvasRect{10.0f, 10.0f, 100.0f, 100.0f}, red);
    canvas->EndFrame();

    const auto *bg = std::get_if<RectangleCommand>(&buffer.commands[0]);
    assert(bg && bg->fill.color == red.background && bg->x == 10.0f);
    bool sawPath = false;
    bool sawImage = false;
    for (const auto &cmd : buffer.commands) {
      if (const auto *p = std::get_if<PathCommand>(&cmd)) {
        sawPath = true;
        assert(p->fill.color == red.foreground);
      } else if (const auto *img = std::get_if<ImageCommand>(&cmd)) {
        sawImage = true;
        assert(img->imagePath == "logo.png");
        assert(img->x > 39.9f && img->x < 40.1f && img->w > 19.9f &&
               img->w < 20.1f);
      }
    }
    assert(sawPath && sawImage);
    assert(doc.GetDesign() == Design{});
  }

  // Empty documents only paint the background; empty rects paint nothing.
  {
    CommandBuffer buffer;
    auto canvas = CreateRecordingCanvas(buffer);
    canvas->BeginFrame();
    QRDocument().Draw(*canvas, CanvasRect{0.0f, 0.0f, 50.0f, 50.0f});
    assert(buffer.commands.size() == 1);
    doc.Draw(*canvas, CanvasRect{0.0f, 0.0f, 0.0f, 50.0f});
    assert(buffer.commands.size() == 1);
  }
  return 0;
}
