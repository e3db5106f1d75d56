#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

// Body of one indirect object. Objects are numbered from 1 in vector order.
struct PdfObject {
  std::string body;
};

// Serializes the objects followed by the xref table and trailer. Offsets are
// measured from the stream position at entry.
bool WritePdfDocument(std::ostream &out, const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, std::string &error);

bool WritePdfDocument(const std::filesystem::path &outputPath,
                      const std::vector<PdfObject> &objects,
                      size_t catalogObjectIndex, std::string &error);
