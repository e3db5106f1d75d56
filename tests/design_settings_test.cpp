#include "designsettings.h"

#include <cassert>
#include <iostream>

int main() {
  // Colour encoding.
  {
    assert(DesignSettings::ColorToHex(CanvasColor{}) == "#000000FF");
    assert(DesignSettings::ColorToHex(CanvasColor{1.0f, 1.0f, 1.0f, 1.0f}) ==
           "#FFFFFFFF");
    auto c = DesignSettings::ColorFromHex("#ff000080");
    assert(c && c->r == 1.0f && c->g == 0.0f && c->b == 0.0f);
    assert(DesignSettings::ColorToHex(*c) == "#FF000080");
    auto opaque = DesignSettings::ColorFromHex("#336699");
    assert(opaque && opaque->a == 1.0f);
    assert(!DesignSettings::ColorFromHex("336699"));
    assert(!DesignSettings::ColorFromHex("#33669"));
    assert(!DesignSettings::ColorFromHex("#GG0000FF"));
  }

  // Round trip of a fully customised design.
  {
    Design design;
    design.foreground = {51 / 255.0f, 102 / 255.0f, 153 / 255.0f, 1.0f};
    design.background = {1.0f, 1.0f, 204 / 255.0f, 128 / 255.0f};
    design.eyeShape = RoundedRectEye{0.375f};
    design.pixelShape = CirclePixel{0.125f};
    design.logo = LogoTemplate{0.375f, 0.375f, 0.25f, 0.25f, "logo.png"};

    nlohmann::json settings = DesignSettings::ToSettings(design);
    assert(settings["version"] == DesignSettings::kSettingsVersion);
    assert(settings["foreground"] == "#336699FF");
    assert(settings["eye"]["type"] == "roundedRect");
    assert(settings["pixel"]["type"] == "circle");

    auto loaded = DesignSettings::Create(settings);
    if (!loaded || *loaded != design) {
      std::cerr << "Design did not survive a settings round trip\n";
      return 1;
    }

    // Through text as well.
    auto reparsed =
        DesignSettings::Create(nlohmann::json::parse(settings.dump()));
    assert(reparsed && *reparsed == design);
  }

  // Each pixel shape name round trips.
  for (const PixelShape &shape :
       {PixelShape{SquarePixel{}}, PixelShape{CirclePixel{}},
        PixelShape{RoundedPixel{0.25f}}, PixelShape{ConnectedPixel{0.5f}}}) {
    Design design;
    design.pixelShape = shape;
    auto loaded = DesignSettings::Create(DesignSettings::ToSettings(design));
    assert(loaded && loaded->pixelShape == shape);
  }

  // Missing and broken fields keep their defaults.
  {
    auto empty = DesignSettings::Create(nlohmann::json::object());
    assert(empty && *empty == Design{});

    nlohmann::json broken = {
        {"foreground", "not a colour"},
        {"background", 42},
        {"eye", {{"type", "hexagon"}}},
        {"pixel", {{"type", "roundedSquare"}, {"cornerRadius", 3.0}}},
        {"logo", {{"rect", {0.5, 0.5}}}},
        {"version", 7}};
    auto loaded = DesignSettings::Create(broken);
    assert(loaded);
    assert(loaded->foreground == Design{}.foreground);
    assert(loaded->background == Design{}.background);
    assert(std::holds_alternative<SquareEye>(loaded->eyeShape));
    const auto *rounded = std::get_if<RoundedPixel>(&loaded->pixelShape);
    assert(rounded && rounded->cornerRadius == 0.5f);
    assert(!loaded->logo);
  }

  // Logo rectangles are clamped into the unit square.
  {
    nlohmann::json settings = {
        {"logo", {{"rect", {0.75, -1.0, 0.5, 0.25}}, {"image", "x.png"}}}};
    auto loaded = DesignSettings::Create(settings);
    assert(loaded && loaded->logo);
    assert(loaded->logo->x == 0.75f && loaded->logo->y == 0.0f);
    assert(loaded->logo->w == 0.25f && loaded->logo->h == 0.25f);
  }

  // Values the format cannot hold are snapped before they are written, so
  // reading the settings back gives the same design.
  {
    Design design;
    design.foreground = {0.5f, 0.3f, 0.7f, 0.5f};
    design.background = {0.1f, 0.9f, 0.33f, 1.0f};
    design.eyeShape = RoundedRectEye{2.0f};
    design.pixelShape = RoundedPixel{0.9f};
    design.logo = LogoTemplate{0.9f, -0.2f, 0.5f, 0.4f, "logo.png"};

    const Design normalized = DesignSettings::Normalize(design);
    assert(DesignSettings::Normalize(normalized) == normalized);
    assert(normalized.foreground.r == 128 / 255.0f);
    assert(std::get<RoundedRectEye>(normalized.eyeShape).cornerRadius == 0.5f);
    assert(std::get<RoundedPixel>(normalized.pixelShape).cornerRadius == 0.5f);
    assert(normalized.logo && normalized.logo->x == 0.9f &&
           normalized.logo->y == 0.0f);
    assert(normalized.logo->w == 1.0f - 0.9f && normalized.logo->h == 0.4f);

    auto loaded = DesignSettings::Create(DesignSettings::ToSettings(design));
    if (!loaded || *loaded != normalized) {
      std::cerr << "Unrepresentable values changed in a round trip\n";
      return 1;
    }
    auto again = DesignSettings::Create(DesignSettings::ToSettings(*loaded));
    assert(again && *again == *loaded);

    Design connected;
    connected.pixelShape = ConnectedPixel{0.8f};
    auto reloaded =
        DesignSettings::Create(DesignSettings::ToSettings(connected));
    assert(reloaded && *reloaded == DesignSettings::Normalize(connected));
  }

  // A logo needs an image and some area; otherwise it is not kept.
  {
    Design design;
    design.logo = LogoTemplate{0.25f, 0.25f, 0.5f, 0.5f, ""};
    assert(!DesignSettings::Normalize(design).logo);
    assert(!DesignSettings::ToSettings(design).contains("logo"));
    design.logo = LogoTemplate{0.25f, 0.25f, 0.0f, 0.5f, "logo.png"};
    assert(!DesignSettings::Normalize(design).logo);

    nlohmann::json noImage = {{"logo", {{"rect", {0.25, 0.25, 0.5, 0.5}}}}};
    auto loaded = DesignSettings::Create(noImage);
    assert(loaded && !loaded->logo);
  }

  // Numbers beyond float range are clamped, not narrowed first.
  {
    nlohmann::json huge = {
        {"eye", {{"type", "roundedRect"}, {"cornerRadius", -1e300}}},
        {"pixel", {{"type", "circle"}, {"inset", 1e300}}},
        {"logo", {{"rect", {0.25, 0.25, 1e300, 1e300}}, {"image", "x.png"}}}};
    auto loaded = DesignSettings::Create(huge);
    assert(loaded);
    assert(std::get<RoundedRectEye>(loaded->eyeShape).cornerRadius == 0.0f);
    assert(std::get<CirclePixel>(loaded->pixelShape).inset == 0.4f);
    assert(loaded->logo && loaded->logo->w == 0.75f &&
           loaded->logo->h == 0.75f);

    nlohmann::json offPage = {
        {"logo", {{"rect", {1e300, 0.0, 0.5, 0.5}}, {"image", "x.png"}}}};
    auto dropped = DesignSettings::Create(offPage);
    assert(dropped && !dropped->logo);
  }

  assert(!DesignSettings::Create(nlohmann::json::array()));
  assert(!DesignSettings::Create(nlohmann::json("square")));
  return 0;
}
