#include "pdf_objects.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <zlib.h>

namespace qr_pdf_internal {

FloatFormatter::FloatFormatter(int precision)
    : precision_(std::clamp(precision, 0, 6)) {}

std::string FloatFormatter::Format(double value) const {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision_) << value;
  std::string text = ss.str();
  // Avoid "-0.000", which some viewers reject in path operators.
  if (text.find_first_not_of("-0.") == std::string::npos && text[0] == '-')
    text.erase(0, 1);
  return text;
}

bool PdfDeflater::Compress(const std::string &input, std::string &output,
                           std::string &error) {
  if (input.empty()) {
    output.clear();
    return true;
  }
  uLongf bound = compressBound(input.size());
  std::string compressed;
  compressed.resize(bound);

  int zres = compress2(reinterpret_cast<Bytef *>(compressed.data()), &bound,
                       reinterpret_cast<const Bytef *>(input.data()),
                       input.size(), Z_BEST_SPEED);
  if (zres != Z_OK) {
    error = "compress2 failed";
    return false;
  }

  compressed.resize(bound);
  output.swap(compressed);
  return true;
}

bool PdfImageData::Valid() const {
  if (width <= 0 || height <= 0)
    return false;
  const size_t pixels = static_cast<size_t>(width) * height;
  return rgb.size() == pixels * 3 && (alpha.empty() || alpha.size() == pixels);
}

std::string MakeStreamObject(const std::string &dictionaryEntries,
                             const std::string &data, bool compress) {
  std::string compressed;
  bool useCompression = false;
  if (compress) {
    std::string error;
    useCompression = PdfDeflater::Compress(data, compressed, error);
  }
  const std::string &streamData = useCompression ? compressed : data;
  std::ostringstream obj;
  obj << "<< " << dictionaryEntries;
  if (!dictionaryEntries.empty())
    obj << ' ';
  obj << "/Length " << streamData.size();
  if (useCompression)
    obj << " /Filter /FlateDecode";
  obj << " >>\nstream\n" << streamData << "\nendstream";
  return obj.str();
}

size_t AppendImageXObject(std::vector<PdfObject> &objects,
                          const PdfImageData &image, bool compress) {
  if (!image.Valid())
    return 0;

  std::ostringstream size;
  size << "/Width " << image.width << " /Height " << image.height
       << " /BitsPerComponent 8";

  size_t maskIndex = 0;
  if (!image.alpha.empty()) {
    objects.push_back({MakeStreamObject(
        "/Type /XObject /Subtype /Image " + size.str() +
            " /ColorSpace /DeviceGray",
        image.alpha, compress)});
    maskIndex = objects.size();
  }

  std::string entries = "/Type /XObject /Subtype /Image " + size.str() +
                        " /ColorSpace /DeviceRGB";
  if (maskIndex != 0)
    entries += " /SMask " + std::to_string(maskIndex) + " 0 R";
  objects.push_back({MakeStreamObject(entries, image.rgb, compress)});
  return objects.size();
}

} // namespace qr_pdf_internal
