#pragma once

#include "pdf_writer.h"

#include <string>
#include <vector>

namespace qr_pdf_internal {

class FloatFormatter {
public:
  explicit FloatFormatter(int precision);
  std::string Format(double value) const;

private:
  int precision_;
};

class PdfDeflater {
public:
  static bool Compress(const std::string &input, std::string &output,
                       std::string &error);
};

// Raw 8 bit samples for an image XObject. rgb holds width*height*3 bytes;
// alpha is either empty or width*height bytes.
struct PdfImageData {
  int width = 0;
  int height = 0;
  std::string rgb;
  std::string alpha;

  bool Valid() const;
};

// Builds a stream object body, compressing the data when requested and
// possible.
std::string MakeStreamObject(const std::string &dictionaryEntries,
                             const std::string &data, bool compress);

// Appends the image (and its soft mask when alpha is present) and returns the
// object number of the image XObject, or 0 when the data is invalid.
size_t AppendImageXObject(std::vector<PdfObject> &objects,
                          const PdfImageData &image, bool compress);

} // namespace qr_pdf_internal
