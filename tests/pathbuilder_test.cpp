#include "matrixengine.h"
#include "pathbuilder.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {
bool Near(double a, double b, double eps = 1e-3) { return std::fabs(a - b) <= eps; }

ModuleMatrix Encode(const std::string &text, ErrorCorrection level) {
  return MatrixEngine::Generate(std::vector<uint8_t>(text.begin(), text.end()),
                                level);
}

double RectArea(const ModulePath &path) {
  double area = 0.0;
  for (const auto &element : path.elements) {
    const auto *rect = std::get_if<PathRect>(&element);
    assert(rect && rect->radius == 0.0f);
    area += static_cast<double>(rect->w) * rect->h;
  }
  return area;
}

bool SameElements(const ModulePath &a, const ModulePath &b) {
  if (a.elements.size() != b.elements.size())
    return false;
  for (size_t i = 0; i < a.elements.size(); ++i) {
    if (a.elements[i].index() != b.elements[i].index())
      return false;
    if (const auto *ra = std::get_if<PathRect>(&a.elements[i])) {
      const auto &rb = std::get<PathRect>(b.elements[i]);
      if (ra->x != rb.x || ra->y != rb.y || ra->w != rb.w || ra->h != rb.h ||
          ra->radius != rb.radius)
        return false;
    } else {
      const auto &ea = std::get<PathEllipse>(a.elements[i]);
      const auto &eb = std::get<PathEllipse>(b.elements[i]);
      if (ea.x != eb.x || ea.y != eb.y || ea.w != eb.w || ea.h != eb.h)
        return false;
    }
  }
  return true;
}

// Compares path coverage at every module centre with the matrix. Locator
// blocks are included only when includeEyes is set.
bool CentresMatch(const ModuleMatrix &m, const ModulePath &path, float size,
                  bool includeEyes, const Design &design) {
  const float cell = size / m.size;
  for (int row = 0; row < m.size; ++row) {
    for (int col = 0; col < m.size; ++col) {
      if (!includeEyes && IsEyeModule(m.size, row, col))
        continue;
      bool expected = m.Get(row, col);
      if (!IsEyeModule(m.size, row, col) &&
          PathBuilder::IsMaskedByLogo(design, m.size, row, col))
        expected = false;
      const bool covered =
          path.Contains((col + 0.5f) * cell, (row + 0.5f) * cell);
      if (covered != expected) {
        std::cerr << "Module (" << row << ", " << col << ") expected "
                  << expected << " got " << covered << "\n";
        return false;
      }
    }
  }
  return true;
}
} // namespace

int main() {
  const ModuleMatrix hello = Encode("HELLO", ErrorCorrection::Low);
  assert(hello.size == 21);

  // Default design: bounds and exact area.
  {
    ModulePath path = PathBuilder::BuildPath(hello, 210.0f, Design{});
    PathBounds b = path.Bounds();
    if (!b.valid || !Near(b.minX, 0) || !Near(b.minY, 0) ||
        !Near(b.maxX, 210) || !Near(b.maxY, 210)) {
      std::cerr << "Unexpected bounds for the default path\n";
      return 1;
    }
    const double expected = static_cast<double>(hello.OnCount()) * 100.0;
    if (!Near(RectArea(path), expected, 1e-2)) {
      std::cerr << "Area " << RectArea(path) << " != " << expected << "\n";
      return 1;
    }
    if (!CentresMatch(hello, path, 210.0f, true, Design{}))
      return 1;
  }

  // Every pixel shape covers exactly the dark data modules.
  {
    const ModuleMatrix m = Encode("Shape invariance sample payload 0123456789",
                                  ErrorCorrection::Medium);
    const std::vector<PixelShape> shapes = {
        SquarePixel{}, CirclePixel{}, CirclePixel{0.4f}, RoundedPixel{},
        RoundedPixel{0.5f}, ConnectedPixel{}, ConnectedPixel{0.0f}};
    for (const auto &shape : shapes) {
      Design design;
      design.pixelShape = shape;
      ModulePath path = PathBuilder::BuildPath(m, 300.0f, design);
      if (!CentresMatch(m, path, 300.0f, true, design)) {
        std::cerr << "Pixel shape " << shape.index() << " changed coverage\n";
        return 1;
      }
    }
  }

  // Other eye shapes leave the data region alone and emit three eyes.
  {
    const std::vector<EyeShape> eyes = {RoundedRectEye{}, CircleEye{}};
    for (const auto &eye : eyes) {
      Design design;
      design.eyeShape = eye;
      ModulePath path = PathBuilder::BuildPath(hello, 210.0f, design);
      if (!CentresMatch(hello, path, 210.0f, false, design))
        return 1;
      // Ring and pupil centres are inside, the gap between them is not.
      assert(path.Contains(35.0f, 35.0f));
      assert(path.Contains(35.0f, 5.0f));
      assert(!path.Contains(35.0f, 15.0f));
      assert(path.Contains(210.0f - 35.0f, 35.0f));
      assert(path.Contains(35.0f, 210.0f - 35.0f));
    }
    Design rounded;
    rounded.eyeShape = RoundedRectEye{};
    rounded.pixelShape = CirclePixel{};
    ModulePath path = PathBuilder::BuildPath(hello, 210.0f, rounded);
    size_t dataModules = 0;
    for (int r = 0; r < hello.size; ++r)
      for (int c = 0; c < hello.size; ++c)
        dataModules += hello.Get(r, c) && !IsEyeModule(hello.size, r, c);
    assert(path.elements.size() == 9 + dataModules);
  }

  // Logo hides the data modules under it but never the eyes.
  {
    const ModuleMatrix m = Encode("logo masking sample", ErrorCorrection::High);
    Design design;
    design.logo = LogoTemplate{0.35f, 0.35f, 0.3f, 0.3f, "logo.png"};
    ModulePath path = PathBuilder::BuildPath(m, 250.0f, design);
    if (!CentresMatch(m, path, 250.0f, true, design))
      return 1;
    const float cell = 250.0f / m.size;
    const int mid = m.size / 2;
    assert(!path.Contains((mid + 0.5f) * cell, (mid + 0.5f) * cell));
    assert(!PathBuilder::IsMaskedByLogo(Design{}, m.size, mid, mid));

    // A logo without an image leaves the modules in place.
    Design blank;
    blank.logo = LogoTemplate{0.35f, 0.35f, 0.3f, 0.3f, ""};
    assert(!PathBuilder::IsMaskedByLogo(blank, m.size, mid, mid));
    assert(SameElements(PathBuilder::BuildPath(m, 250.0f, blank),
                        PathBuilder::BuildPath(m, 250.0f, Design{})));
  }

  // Deterministic, degenerate inputs, sub-pixel sizes.
  {
    Design design;
    design.pixelShape = ConnectedPixel{};
    assert(SameElements(PathBuilder::BuildPath(hello, 123.0f, design),
                        PathBuilder::BuildPath(hello, 123.0f, design)));
    assert(PathBuilder::BuildPath(ModuleMatrix{}, 100.0f, design).Empty());
    assert(PathBuilder::BuildPath(hello, 0.0f, design).Empty());
    assert(PathBuilder::BuildPath(hello, -5.0f, design).Empty());

    ModulePath tiny = PathBuilder::BuildPath(hello, 10.0f, Design{});
    PathBounds b = tiny.Bounds();
    assert(!tiny.Empty() && b.valid && Near(b.maxX, 10.0) && Near(b.maxY, 10.0));
  }
  return 0;
}
