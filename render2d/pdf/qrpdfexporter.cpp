#include "qrpdfexporter.h"

#include "logger.h"
#include "pdf_graphics_encoder.h"
#include "pdf_objects.h"
#include "pdf_writer.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <vector>

#include <wx/image.h>

using namespace qr_pdf_internal;

namespace {

float ClampAlpha(const CanvasFill &fill) {
  return std::clamp(fill.color.a, 0.0f, 1.0f);
}

// Collects the opacity values and image files a buffer needs as page
// resources.
void ScanResources(const CommandBuffer &buffer, std::map<float, std::string> &alphas,
                   std::vector<std::string> &images) {
  auto addAlpha = [&](const CanvasFill &fill) {
    const float alpha = ClampAlpha(fill);
    if (alpha < 1.0f && alphas.find(alpha) == alphas.end())
      alphas.emplace(alpha, "GA" + std::to_string(alphas.size()));
  };
  for (const auto &cmd : buffer.commands) {
    if (const auto *rect = std::get_if<RectangleCommand>(&cmd)) {
      addAlpha(rect->fill);
    } else if (const auto *path = std::get_if<PathCommand>(&cmd)) {
      addAlpha(path->fill);
    } else if (const auto *image = std::get_if<ImageCommand>(&cmd)) {
      if (std::find(images.begin(), images.end(), image->imagePath) ==
          images.end())
        images.push_back(image->imagePath);
    }
  }
  if (!alphas.empty() && alphas.find(1.0f) == alphas.end())
    alphas.emplace(1.0f, "GA" + std::to_string(alphas.size()));
}

bool LoadImageData(const std::string &imagePath, PdfImageData &data) {
  wxImage image;
  if (!image.LoadFile(wxString::FromUTF8(imagePath)) || !image.IsOk())
    return false;
  if (image.HasMask() && !image.HasAlpha())
    image.InitAlpha();

  data.width = image.GetWidth();
  data.height = image.GetHeight();
  const size_t pixels = static_cast<size_t>(data.width) * data.height;
  data.rgb.assign(reinterpret_cast<const char *>(image.GetData()), pixels * 3);
  data.alpha.clear();
  if (image.HasAlpha())
    data.alpha.assign(reinterpret_cast<const char *>(image.GetAlpha()), pixels);
  return data.Valid();
}

std::string RenderCommandsToStream(
    const CommandBuffer &buffer, const Mapping &mapping,
    const FloatFormatter &formatter,
    const std::map<float, std::string> &alphas,
    const std::map<std::string, std::string> &imageNames) {
  std::ostringstream content;
  GraphicsStateCache cache(&alphas);
  std::vector<CanvasTransform> stack;
  CanvasTransform current{};

  for (const auto &cmd : buffer.commands) {
    if (const auto *rect = std::get_if<RectangleCommand>(&cmd)) {
      AppendRectangle(content, cache, formatter,
                      MapRect(rect->x, rect->y, rect->w, rect->h, current,
                              mapping),
                      rect->fill);
    } else if (const auto *path = std::get_if<PathCommand>(&cmd)) {
      AppendModulePath(content, cache, formatter, path->path, current,
                       mapping, path->fill);
    } else if (const auto *image = std::get_if<ImageCommand>(&cmd)) {
      auto it = imageNames.find(image->imagePath);
      if (it == imageNames.end())
        continue;
      AppendImage(content, formatter, it->second,
                  MapRect(image->x, image->y, image->w, image->h, current,
                          mapping));
    } else if (std::holds_alternative<SaveCommand>(cmd)) {
      stack.push_back(current);
    } else if (std::holds_alternative<RestoreCommand>(cmd)) {
      if (!stack.empty()) {
        current = stack.back();
        stack.pop_back();
      }
    } else if (const auto *tf = std::get_if<TransformCommand>(&cmd)) {
      current = tf->transform;
    }
  }
  return content.str();
}

} // namespace

QRPdfExportResult ExportCommandBufferToPdf(const CommandBuffer &buffer,
                                           const QRPdfOptions &options) {
  QRPdfExportResult result;
  if (!(options.pageWidthPt > 0.0) || !(options.pageHeightPt > 0.0) ||
      !(options.scale > 0.0) || !std::isfinite(options.pageWidthPt) ||
      !std::isfinite(options.pageHeightPt)) {
    result.message = "Invalid page size.";
    return result;
  }

  FloatFormatter formatter(options.floatPrecision);
  Mapping mapping;
  mapping.scale = options.scale;
  mapping.flipY = true;
  mapping.drawHeight = options.pageHeightPt;

  std::map<float, std::string> alphas;
  std::vector<std::string> imagePaths;
  ScanResources(buffer, alphas, imagePaths);

  std::vector<PdfObject> objects;
  std::map<std::string, std::string> imageNames;
  std::map<std::string, size_t> imageIds;
  for (const auto &path : imagePaths) {
    PdfImageData data;
    if (!LoadImageData(path, data)) {
      Logger::Instance().Warn("PDF export: skipping unreadable image " + path);
      continue;
    }
    const size_t id = AppendImageXObject(objects, data, options.compressStreams);
    if (id == 0)
      continue;
    const std::string name = "Im" + std::to_string(imageIds.size() + 1);
    imageNames[path] = name;
    imageIds[name] = id;
  }

  const std::string contentStr =
      RenderCommandsToStream(buffer, mapping, formatter, alphas, imageNames);
  objects.push_back(
      {MakeStreamObject(std::string(), contentStr, options.compressStreams)});

  std::ostringstream resources;
  resources << "<<";
  if (!alphas.empty()) {
    resources << " /ExtGState <<";
    for (const auto &[alpha, name] : alphas)
      resources << " /" << name << " << /ca " << formatter.Format(alpha)
                << " >>";
    resources << " >>";
  }
  if (!imageIds.empty()) {
    resources << " /XObject <<";
    for (const auto &[name, id] : imageIds)
      resources << " /" << name << ' ' << id << " 0 R";
    resources << " >>";
  }
  resources << " >>";

  std::ostringstream pageObj;
  size_t contentIndex = objects.size();
  size_t pageIndex = contentIndex + 1;
  size_t pagesIndex = pageIndex + 1;
  size_t catalogIndex = pagesIndex + 1;

  pageObj << "<< /Type /Page /Parent " << pagesIndex << " 0 R /MediaBox [0 0 "
          << formatter.Format(options.pageWidthPt) << ' '
          << formatter.Format(options.pageHeightPt) << "] /Contents "
          << contentIndex << " 0 R /Resources " << resources.str() << " >>";
  objects.push_back({pageObj.str()});
  objects.push_back({"<< /Type /Pages /Kids [" + std::to_string(pageIndex) +
                     " 0 R] /Count 1 >>"});
  objects.push_back({"<< /Type /Catalog /Pages " + std::to_string(pagesIndex) +
                     " 0 R >>"});

  std::ostringstream out;
  std::string error;
  if (!WritePdfDocument(out, objects, catalogIndex, error)) {
    result.message = error;
    Logger::Instance().Error("PDF export failed: " + error);
    return result;
  }
  result.bytes = out.str();
  result.success = true;
  return result;
}
