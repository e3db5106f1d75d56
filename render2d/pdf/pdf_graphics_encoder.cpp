#include "pdf_graphics_encoder.h"

#include <algorithm>
#include <cmath>

namespace qr_pdf_internal {

namespace {
// 4*(sqrt(2)-1)/3
constexpr double kKappa = 0.552284749831;
} // namespace

Point Apply(const CanvasTransform &t, double x, double y) {
  return {x * t.scale + t.offsetX, y * t.scale + t.offsetY};
}

Point MapWithMapping(double x, double y, const Mapping &mapping) {
  double px = mapping.offsetX + x * mapping.scale;
  double py = mapping.offsetY + y * mapping.scale;
  if (mapping.flipY)
    py = mapping.offsetY + mapping.drawHeight - y * mapping.scale;
  return {px, py};
}

Point MapPointWithTransform(double x, double y, const CanvasTransform &current,
                            const Mapping &mapping) {
  auto applied = Apply(current, x, y);
  return MapWithMapping(applied.x, applied.y, mapping);
}

PageRect MapRect(double x, double y, double w, double h,
                 const CanvasTransform &current, const Mapping &mapping) {
  Point a = MapPointWithTransform(x, y, current, mapping);
  Point b = MapPointWithTransform(x + w, y + h, current, mapping);
  return {std::min(a.x, b.x), std::min(a.y, b.y), std::abs(b.x - a.x),
          std::abs(b.y - a.y)};
}

bool GraphicsStateCache::SameColor(const CanvasColor &a, const CanvasColor &b) {
  return std::abs(a.r - b.r) < 1e-6 && std::abs(a.g - b.g) < 1e-6 &&
         std::abs(a.b - b.b) < 1e-6;
}

void GraphicsStateCache::SetFill(std::ostringstream &out,
                                 const CanvasFill &fill,
                                 const FloatFormatter &fmt) {
  if (alphaStates_) {
    const float alpha = std::clamp(fill.color.a, 0.0f, 1.0f);
    if (alpha != alpha_) {
      auto it = alphaStates_->find(alpha);
      if (it != alphaStates_->end()) {
        out << '/' << it->second << " gs\n";
        alpha_ = alpha;
      }
    }
  }
  if (!hasFillColor_ || !SameColor(fill.color, fillColor_)) {
    out << fmt.Format(fill.color.r) << ' ' << fmt.Format(fill.color.g) << ' '
        << fmt.Format(fill.color.b) << " rg\n";
    fillColor_ = fill.color;
    hasFillColor_ = true;
  }
}

void AppendRectanglePath(std::ostringstream &out, const FloatFormatter &fmt,
                         const PageRect &rect) {
  out << fmt.Format(rect.x) << ' ' << fmt.Format(rect.y) << ' '
      << fmt.Format(rect.w) << ' ' << fmt.Format(rect.h) << " re\n";
}

void AppendRectangle(std::ostringstream &out, GraphicsStateCache &cache,
                     const FloatFormatter &fmt, const PageRect &rect,
                     const CanvasFill &fill) {
  if (rect.w <= 0.0 || rect.h <= 0.0)
    return;
  cache.SetFill(out, fill, fmt);
  AppendRectanglePath(out, fmt, rect);
  out << "f\n";
}

void AppendRoundedRectanglePath(std::ostringstream &out,
                                const FloatFormatter &fmt,
                                const PageRect &rect, double radius) {
  const double r = std::min({radius, rect.w * 0.5, rect.h * 0.5});
  if (r <= 0.0) {
    AppendRectanglePath(out, fmt, rect);
    return;
  }
  const double k = r * kKappa;
  const double x0 = rect.x;
  const double y0 = rect.y;
  const double x1 = rect.x + rect.w;
  const double y1 = rect.y + rect.h;
  auto pt = [&](double x, double y) {
    out << fmt.Format(x) << ' ' << fmt.Format(y);
  };
  auto curve = [&](double ax, double ay, double bx, double by, double cx,
                   double cy) {
    pt(ax, ay);
    out << ' ';
    pt(bx, by);
    out << ' ';
    pt(cx, cy);
    out << " c\n";
  };
  auto line = [&](double x, double y) {
    pt(x, y);
    out << " l\n";
  };

  pt(x0 + r, y0);
  out << " m\n";
  line(x1 - r, y0);
  curve(x1 - r + k, y0, x1, y0 + r - k, x1, y0 + r);
  line(x1, y1 - r);
  curve(x1, y1 - r + k, x1 - r + k, y1, x1 - r, y1);
  line(x0 + r, y1);
  curve(x0 + r - k, y1, x0, y1 - r + k, x0, y1 - r);
  line(x0, y0 + r);
  curve(x0, y0 + r - k, x0 + r - k, y0, x0 + r, y0);
  out << "h\n";
}

void AppendEllipsePath(std::ostringstream &out, const FloatFormatter &fmt,
                       const PageRect &bounds) {
  if (bounds.w <= 0.0 || bounds.h <= 0.0)
    return;
  // Four cubic Beziers, one per quadrant.
  const double rx = bounds.w * 0.5;
  const double ry = bounds.h * 0.5;
  const double cx = bounds.x + rx;
  const double cy = bounds.y + ry;
  const double kx = rx * kKappa;
  const double ky = ry * kKappa;
  const Point p[13] = {{cx + rx, cy},      {cx + rx, cy + ky}, {cx + kx, cy + ry},
                       {cx, cy + ry},      {cx - kx, cy + ry}, {cx - rx, cy + ky},
                       {cx - rx, cy},      {cx - rx, cy - ky}, {cx - kx, cy - ry},
                       {cx, cy - ry},      {cx + kx, cy - ry}, {cx + rx, cy - ky},
                       {cx + rx, cy}};
  out << fmt.Format(p[0].x) << ' ' << fmt.Format(p[0].y) << " m\n";
  for (int i = 1; i < 13; i += 3) {
    out << fmt.Format(p[i].x) << ' ' << fmt.Format(p[i].y) << ' '
        << fmt.Format(p[i + 1].x) << ' ' << fmt.Format(p[i + 1].y) << ' '
        << fmt.Format(p[i + 2].x) << ' ' << fmt.Format(p[i + 2].y) << " c\n";
  }
  out << "h\n";
}

void AppendModulePath(std::ostringstream &out, GraphicsStateCache &cache,
                      const FloatFormatter &fmt, const ModulePath &path,
                      const CanvasTransform &current, const Mapping &mapping,
                      const CanvasFill &fill) {
  if (path.Empty())
    return;
  cache.SetFill(out, fill, fmt);
  const double linearScale = current.scale * mapping.scale;
  for (const auto &element : path.elements) {
    if (const auto *rect = std::get_if<PathRect>(&element)) {
      PageRect mapped = MapRect(rect->x, rect->y, rect->w, rect->h, current,
                                mapping);
      AppendRoundedRectanglePath(out, fmt, mapped,
                                 std::abs(rect->radius * linearScale));
    } else if (const auto *ellipse = std::get_if<PathEllipse>(&element)) {
      PageRect mapped = MapRect(ellipse->x, ellipse->y, ellipse->w,
                                ellipse->h, current, mapping);
      AppendEllipsePath(out, fmt, mapped);
    }
  }
  out << "f*\n";
}

void AppendImage(std::ostringstream &out, const FloatFormatter &fmt,
                 const std::string &name, const PageRect &rect) {
  if (rect.w <= 0.0 || rect.h <= 0.0)
    return;
  out << "q\n"
      << fmt.Format(rect.w) << " 0 0 " << fmt.Format(rect.h) << ' '
      << fmt.Format(rect.x) << ' ' << fmt.Format(rect.y) << " cm\n/" << name
      << " Do\nQ\n";
}

} // namespace qr_pdf_internal
