#pragma once

#include "canvas2d.h"
#include "modulepath.h"
#include "pdf_objects.h"

#include <map>
#include <sstream>
#include <string>

namespace qr_pdf_internal {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

// Canvas units to page points. With flipY the canvas top edge is placed at
// offsetY + drawHeight, since PDF user space grows upwards.
struct Mapping {
  double scale = 1.0;
  double offsetX = 0.0;
  double offsetY = 0.0;
  double drawHeight = 0.0;
  bool flipY = true;
};

Point Apply(const CanvasTransform &t, double x, double y);
Point MapWithMapping(double x, double y, const Mapping &mapping);
Point MapPointWithTransform(double x, double y, const CanvasTransform &current,
                            const Mapping &mapping);

// Axis aligned rectangle in page space after mapping a canvas rectangle.
struct PageRect {
  double x = 0.0;
  double y = 0.0;
  double w = 0.0;
  double h = 0.0;
};
PageRect MapRect(double x, double y, double w, double h,
                 const CanvasTransform &current, const Mapping &mapping);

// Tracks the current non-stroking colour and opacity so repeated fills do
// not re-emit operators. Opacity values are looked up in alphaStates, which
// maps an alpha to the ExtGState resource name declared on the page.
class GraphicsStateCache {
public:
  explicit GraphicsStateCache(
      const std::map<float, std::string> *alphaStates = nullptr)
      : alphaStates_(alphaStates) {}

  void SetFill(std::ostringstream &out, const CanvasFill &fill,
               const FloatFormatter &fmt);

private:
  static bool SameColor(const CanvasColor &a, const CanvasColor &b);
  const std::map<float, std::string> *alphaStates_;
  CanvasColor fillColor_{};
  float alpha_ = 1.0f;
  bool hasFillColor_ = false;
};

void AppendRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                     const FloatFormatter &fmt, const PageRect &rect,
                     const CanvasFill &fill);

// Sub-path helpers; they emit construction operators only.
void AppendRectanglePath(std::ostringstream &out, const FloatFormatter &fmt,
                         const PageRect &rect);
void AppendRoundedRectanglePath(std::ostringstream &out,
                                const FloatFormatter &fmt,
                                const PageRect &rect, double radius);
void AppendEllipsePath(std::ostringstream &out, const FloatFormatter &fmt,
                       const PageRect &bounds);

// Emits every element of the path as a sub-path and fills the result with the
// even-odd rule.
void AppendModulePath(std::ostringstream &out, GraphicsStateCache &cache,
                      const FloatFormatter &fmt, const ModulePath &path,
                      const CanvasTransform &current, const Mapping &mapping,
                      const CanvasFill &fill);

// Places an image XObject stretched over the rectangle.
void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const std::string &name, const PageRect &rect);

} // namespace qr_pdf_internal
