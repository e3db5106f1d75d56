#pragma once

#include "canvas2d.h"

#include <string>

// Page geometry and encoding switches for a single page export. Canvas units
// are multiplied by scale to obtain points.
struct QRPdfOptions {
  double pageWidthPt = 595.0;
  double pageHeightPt = 595.0;
  double scale = 1.0;
  bool compressStreams = true;
  int floatPrecision = 3;
};

struct QRPdfExportResult {
  bool success = false;
  std::string message;
  std::string bytes;
};

// Converts a recorded buffer into a one page PDF held in memory. Image
// commands are embedded as image XObjects when the file can be decoded and
// skipped otherwise.
QRPdfExportResult ExportCommandBufferToPdf(const CommandBuffer &buffer,
                                           const QRPdfOptions &options);
