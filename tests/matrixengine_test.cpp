#include "matrixengine.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {
std::vector<uint8_t> Bytes(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}
} // namespace

int main() {
  // Version 1 at level L.
  {
    ModuleMatrix m = MatrixEngine::Generate(Bytes("HELLO"), ErrorCorrection::Low);
    if (m.size != 21 || m.modules.size() != 21u * 21u) {
      std::cerr << "HELLO at L should produce a 21x21 matrix, got " << m.size
                << "\n";
      return 1;
    }
    // Finder pattern corners and the separator next to them.
    assert(m.Get(0, 0) && m.Get(6, 6) && m.Get(3, 3));
    assert(!m.Get(1, 1) && !m.Get(7, 7));
    assert(m.Get(0, 20) && m.Get(20, 0));
    assert(IsEyeModule(m.size, 0, 0) && IsEyeModule(m.size, 6, 20) &&
           IsEyeModule(m.size, 20, 6));
    assert(!IsEyeModule(m.size, 20, 20) && !IsEyeModule(m.size, 10, 10));
  }

  // Deterministic.
  {
    const auto payload = Bytes("https://example.org/some/path?q=1");
    for (ErrorCorrection level : kAllErrorCorrections) {
      assert(MatrixEngine::Generate(payload, level) ==
             MatrixEngine::Generate(payload, level));
    }
  }

  // Higher levels never give a smaller symbol.
  {
    const auto payload = Bytes(std::string(120, 'x'));
    int previous = 0;
    for (ErrorCorrection level : kAllErrorCorrections) {
      const int size = MatrixEngine::Generate(payload, level).size;
      assert(size >= previous);
      assert(size % 2 == 1 && size >= 21 && size <= 177);
      previous = size;
    }
  }

  // Capacity boundary at every level.
  for (ErrorCorrection level : kAllErrorCorrections) {
    const size_t max = MatrixEngine::MaxPayloadSize(level);
    ModuleMatrix full =
        MatrixEngine::Generate(std::vector<uint8_t>(max, 0x41), level);
    if (full.size != 177) {
      std::cerr << "Largest payload should need version 40\n";
      return 1;
    }
    bool threw = false;
    try {
      MatrixEngine::Generate(std::vector<uint8_t>(max + 1, 0x41), level);
    } catch (const EncodingError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "Payload of " << (max + 1) << " bytes should not encode at "
                << ErrorCorrectionCode(level) << "\n";
      return 1;
    }
  }
  assert(MatrixEngine::MaxPayloadSize(ErrorCorrection::Low) == 2953);
  assert(MatrixEngine::MaxPayloadSize(ErrorCorrection::High) == 1273);

  // Empty payload and the strong guarantee of Regenerate.
  {
    assert(MatrixEngine::Generate({}, ErrorCorrection::Medium).Empty());

    MatrixEngine engine;
    assert(engine.Matrix().Empty() && engine.PixelSize() == 0);
    engine.Regenerate(Bytes("HELLO"), ErrorCorrection::Low);
    const ModuleMatrix before = engine.Matrix();
    assert(engine.PixelSize() == 21);
    try {
      engine.Regenerate(std::vector<uint8_t>(3000, 1), ErrorCorrection::High);
      assert(false && "expected EncodingError");
    } catch (const EncodingError &) {
    }
    assert(engine.Matrix() == before);
  }

  // Text renderings.
  {
    ModuleMatrix m = MatrixEngine::Generate(Bytes("HELLO"), ErrorCorrection::Low);
    const std::string ascii = MatrixText::ToAscii(m);
    size_t lines = 0;
    for (char c : ascii)
      lines += c == '\n';
    assert(lines == 21);
    const std::string compact = MatrixText::ToCompactAscii(m);
    lines = 0;
    for (char c : compact)
      lines += c == '\n';
    assert(lines == 11);
    assert(MatrixText::ToAscii(ModuleMatrix{}).empty());
  }
  return 0;
}
