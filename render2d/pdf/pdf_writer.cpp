#include "pdf_writer.h"

#include <fstream>
#include <iomanip>

bool WritePdfDocument(std::ostream &out, const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, std::string &error) {
  if (catalogObjectIndex == 0 || catalogObjectIndex > objects.size()) {
    error = "Catalog object index is out of range.";
    return false;
  }
  try {
    const std::streamoff start = out.tellp();
    auto position = [&]() {
      return static_cast<long>(out.tellp() - start);
    };

    out << "%PDF-1.4\n";
    std::vector<long> offsets;
    offsets.reserve(objects.size());
    for (size_t i = 0; i < objects.size(); ++i) {
      offsets.push_back(position());
      out << (i + 1) << " 0 obj\n" << objects[i].body << "\nendobj\n";
    }

    long xrefPos = position();
    out << "xref\n0 " << (objects.size() + 1) << "\n0000000000 65535 f \n";
    for (long off : offsets)
      out << std::setw(10) << std::setfill('0') << off << " 00000 n \n";

    out << "trailer\n<< /Size " << (objects.size() + 1) << " /Root "
        << catalogObjectIndex << " 0 R >>\nstartxref\n"
        << xrefPos << "\n%%EOF";
    if (!out) {
      error = "Failed to write PDF content.";
      return false;
    }
    return true;
  } catch (const std::exception &ex) {
    error = std::string("Failed to generate PDF content: ") + ex.what();
    return false;
  }
}

bool WritePdfDocument(const std::filesystem::path &outputPath,
                      const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, std::string &error) {
  std::ofstream file(outputPath, std::ios::binary);
  if (!file.is_open()) {
    error = "Unable to open the destination file for writing.";
    return false;
  }
  return WritePdfDocument(file, objects, catalogObjectIndex, error);
}
