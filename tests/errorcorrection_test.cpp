#include "errorcorrection.h"

#include <cassert>
#include <iostream>

int main() {
  for (ErrorCorrection level : kAllErrorCorrections) {
    const char code = ErrorCorrectionCode(level);
    auto parsed = ErrorCorrectionFromCode(code);
    if (!parsed || *parsed != level) {
      std::cerr << "Code " << code << " does not map back to its level\n";
      return 1;
    }
  }

  assert(ErrorCorrectionCode(ErrorCorrection::Low) == 'L');
  assert(ErrorCorrectionCode(ErrorCorrection::Medium) == 'M');
  assert(ErrorCorrectionCode(ErrorCorrection::Quantize) == 'Q');
  assert(ErrorCorrectionCode(ErrorCorrection::High) == 'H');

  assert(ErrorCorrectionFromCode('h') == ErrorCorrection::High);
  assert(!ErrorCorrectionFromCode('X'));
  assert(ErrorCorrectionFromString("Medium") == ErrorCorrection::Medium);
  assert(ErrorCorrectionFromString("q") == ErrorCorrection::Quantize);
  assert(!ErrorCorrectionFromString(""));
  assert(!ErrorCorrectionFromString("Z"));

  assert(kDefaultErrorCorrection == ErrorCorrection::Quantize);
  assert(ErrorCorrectionDisplayName(ErrorCorrection::High) == "High (30%)");
  return 0;
}
