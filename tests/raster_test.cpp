#include "qrdocument.h"
#include "rasterexporter.h"

#include <iostream>

#include <wx/app.h>
#include <wx/init.h>

namespace {
// Offscreen drawing needs an initialized toolkit; without a display the test
// is reported as skipped.
constexpr int kSkipped = 77;

bool IsDark(const wxImage &img, int x, int y) {
  return img.GetRed(x, y) < 64 && img.GetGreen(x, y) < 64 &&
         img.GetBlue(x, y) < 64;
}

bool IsLight(const wxImage &img, int x, int y) {
  return img.GetRed(x, y) > 192 && img.GetGreen(x, y) > 192 &&
         img.GetBlue(x, y) > 192;
}

int RunChecks() {
  QRDocument doc;
  doc.Update(std::string("HELLO"), ErrorCorrection::Low);

  auto image = doc.Rasterize(210);
  if (!image || image->GetWidth() != 210 || image->GetHeight() != 210) {
    std::cerr << "Unexpected raster size" << std::endl;
    return 1;
  }
  // Module (0, 0) belongs to the locator ring, module (7, 7) to its separator.
  if (!IsDark(*image, 5, 5) || !IsLight(*image, 75, 75)) {
    std::cerr << "Locator pattern is not where expected" << std::endl;
    return 1;
  }

  auto doubled = doc.Rasterize(210, 2.0);
  if (!doubled || doubled->GetWidth() != 420 || doubled->GetHeight() != 420 ||
      !IsDark(*doubled, 10, 10)) {
    std::cerr << "Scaled raster is wrong" << std::endl;
    return 1;
  }

  if (doc.Rasterize(0) || doc.Rasterize(100, 0.0)) {
    std::cerr << "Invalid sizes should not rasterize" << std::endl;
    return 1;
  }

  Design red;
  red.foreground = {1.0f, 0.0f, 0.0f, 1.0f};
  auto colored = doc.Rasterize(210, 1.0, red);
  if (!colored || colored->GetRed(5, 5) < 192 || colored->GetGreen(5, 5) > 64 ||
      colored->GetBlue(5, 5) > 64) {
    std::cerr << "Foreground colour was not applied" << std::endl;
    return 1;
  }

  auto quick = QRDocument::Image("HELLO", 100);
  if (!quick || quick->GetWidth() != 100 || quick->GetHeight() != 100) {
    std::cerr << "Image helper returned the wrong size" << std::endl;
    return 1;
  }
  if (QRDocument::Image(std::string(4000, 'x'), 100)) {
    std::cerr << "Oversized content should not produce an image" << std::endl;
    return 1;
  }

  CommandBuffer empty;
  if (RasterizeCommandBuffer(empty, 0, 10) ||
      RasterizeCommandBuffer(empty, 10, -1)) {
    std::cerr << "Invalid buffer size accepted" << std::endl;
    return 1;
  }
  auto blank = RasterizeCommandBuffer(empty, 8, 8);
  if (!blank || !IsLight(*blank, 4, 4)) {
    std::cerr << "Empty buffer should produce a white image" << std::endl;
    return 1;
  }
  return 0;
}
} // namespace

int main(int argc, char **argv) {
  wxApp::SetInstance(new wxApp());
  if (!wxEntryStart(argc, argv))
    return kSkipped;
  int result = RunChecks();
  wxEntryCleanup();
  return result;
}
