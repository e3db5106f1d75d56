#include "designsettings.h"
#include "qrdocument.h"

#include <cassert>
#include <iostream>
#include <string>

namespace {
std::vector<uint8_t> Bytes(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

class WifiMessage : public MessageFormatter {
public:
  std::vector<uint8_t> ToPayloadBytes() const override {
    return Bytes("WIFI:S:studio;T:WPA;P:secret;;");
  }
};
} // namespace

int main() {
  // Fresh document.
  {
    QRDocument doc;
    assert(doc.Payload().empty());
    assert(doc.GetErrorCorrection() == kDefaultErrorCorrection);
    assert(doc.GetDesign() == Design{});
    assert(doc.Matrix().Empty() && doc.PixelSize() == 0);
    assert(doc.AsciiRepresentation().empty());
    assert(doc.Path(100.0f).Empty());
  }

  // Loading an empty object gives the defaults.
  {
    auto doc = QRDocument::Create(nlohmann::json::object());
    assert(doc && *doc == QRDocument());
  }

  // Known settings document.
  {
    nlohmann::json settings = {{"correction", "Q"}, {"data", "VEVTVA=="}};
    auto doc = QRDocument::Create(settings);
    assert(doc);
    assert(doc->GetErrorCorrection() == ErrorCorrection::Quantize);
    assert(doc->Payload() == Bytes("TEST"));
    assert(!doc->Matrix().Empty());
    assert(PayloadEncoding::ToBase64(Bytes("TEST")) == "VEVTVA==");
  }

  // Designs with values outside the settings format still round trip.
  {
    QRDocument doc;
    doc.Update(std::string("round trip"), ErrorCorrection::Medium);
    Design design;
    design.foreground = {0.5f, 0.3f, 0.7f, 0.5f};
    design.eyeShape = RoundedRectEye{0.75f};
    design.pixelShape = ConnectedPixel{0.8f};
    design.logo = LogoTemplate{0.4f, 0.4f, 0.9f, 0.2f, "logo.png"};
    doc.SetDesign(design);
    assert(doc.GetDesign() == DesignSettings::Normalize(design));

    auto restored = QRDocument::Create(doc.Settings());
    if (!restored || *restored != doc) {
      std::cerr << "Settings round trip changed an unquantized design\n";
      return 1;
    }
    auto fromJson = QRDocument::Create(doc.JsonData());
    assert(fromJson && *fromJson == doc);
  }

  // Settings and JSON round trips.
  {
    QRDocument doc;
    doc.Update(std::string("https://example.org/qr"), ErrorCorrection::High);
    Design design;
    design.foreground = {0.0f, 0.0f, 1.0f, 1.0f};
    design.eyeShape = CircleEye{};
    design.pixelShape = ConnectedPixel{0.25f};
    doc.SetDesign(design);

    auto restored = QRDocument::Create(doc.Settings());
    if (!restored || *restored != doc) {
      std::cerr << "Settings round trip changed the document\n";
      return 1;
    }
    assert(restored->Matrix() == doc.Matrix());

    auto fromCompact = QRDocument::Create(doc.JsonData());
    auto fromPretty = QRDocument::Create(doc.JsonStringFormatted());
    assert(fromCompact && *fromCompact == doc);
    assert(fromPretty && *fromPretty == doc);
    assert(doc.JsonStringFormatted().find('\n') != std::string::npos);
    // Keys come out sorted.
    const std::string json = doc.JsonData();
    assert(json.find("\"correction\"") < json.find("\"data\"") &&
           json.find("\"data\"") < json.find("\"design\""));
  }

  // Malformed input.
  {
    assert(!QRDocument::Create(std::string("{not json")));
    assert(!QRDocument::Create(std::string("[1, 2, 3]")));
    assert(!QRDocument::Create(nlohmann::json::array()));

    nlohmann::json settings = {{"correction", "Z"},
                               {"data", "***"},
                               {"design", "square"}};
    auto doc = QRDocument::Create(settings);
    assert(doc && *doc == QRDocument());

    auto lower = QRDocument::Create(nlohmann::json{{"correction", "low"}});
    assert(lower && lower->GetErrorCorrection() == ErrorCorrection::Low);
  }

  // A payload that does not fit its stored level falls back to empty.
  {
    const std::vector<uint8_t> big(1500, 'a');
    nlohmann::json settings = {{"correction", "H"},
                               {"data", PayloadEncoding::ToBase64(big)}};
    auto doc = QRDocument::Create(settings);
    assert(doc && doc->Payload().empty() &&
           doc->GetErrorCorrection() == ErrorCorrection::High);
  }

  // Failed updates leave the document untouched.
  {
    QRDocument doc;
    doc.Update(std::vector<uint8_t>(1500, 'a'), ErrorCorrection::Low);
    const ModuleMatrix before = doc.Matrix();
    bool threw = false;
    try {
      doc.SetErrorCorrection(ErrorCorrection::High);
    } catch (const EncodingError &) {
      threw = true;
    }
    assert(threw);
    assert(doc.GetErrorCorrection() == ErrorCorrection::Low);
    assert(doc.Matrix() == before && doc.Payload().size() == 1500);

    threw = false;
    try {
      doc.SetPayload(std::vector<uint8_t>(4000, 'b'));
    } catch (const EncodingError &) {
      threw = true;
    }
    assert(threw && doc.Payload().size() == 1500 && doc.Matrix() == before);
  }

  // Text and message updates use the default level.
  {
    QRDocument doc;
    doc.Update(std::string("HELLO"));
    assert(doc.GetErrorCorrection() == kDefaultErrorCorrection);
    doc.Update(std::string("HELLO"), ErrorCorrection::Low);
    assert(doc.PixelSize() == 21);

    doc.Update(WifiMessage());
    assert(doc.Payload() == WifiMessage().ToPayloadBytes());
    assert(doc.GetErrorCorrection() == kDefaultErrorCorrection);

    // Design changes do not re-encode.
    const ModuleMatrix before = doc.Matrix();
    Design design;
    design.pixelShape = CirclePixel{};
    doc.SetDesign(design);
    assert(doc.Matrix() == before);
    assert(doc.GetDesign() == design);

    doc.Update(std::vector<uint8_t>(), ErrorCorrection::Medium);
    assert(doc.Matrix().Empty());
  }

  // Paths follow the stored design unless one is passed in.
  {
    QRDocument doc;
    doc.Update(std::string("HELLO"), ErrorCorrection::Low);
    Design circles;
    circles.pixelShape = CirclePixel{};
    const size_t squares = doc.Path(210.0f).elements.size();
    const size_t dots = doc.Path(210.0f, circles).elements.size();
    assert(dots >= squares);
  }
  return 0;
}
