#include "configservices.h"

#include "logger.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string_view>

#include <wx/stdpaths.h>

namespace {
bool TryParseFloat(std::string_view text, float &out) {
  constexpr std::string_view kSpace = " \t\r\n";
  const size_t first = text.find_first_not_of(kSpace);
  if (first == std::string_view::npos)
    return false;
  text = text.substr(first, text.find_last_not_of(kSpace) - first + 1);
  auto result = std::from_chars(text.data(), text.data() + text.size(), out);
  return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

// Numbers are taken as they are, strings only when they hold a number.
bool ReadNumber(const nlohmann::json &value, float &out) {
  if (value.is_number()) {
    const double v = value.get<double>();
    if (!std::isfinite(v) || std::abs(v) > std::numeric_limits<float>::max())
      return false;
    out = static_cast<float>(v);
    return true;
  }
  return value.is_string() && TryParseFloat(value.get<std::string>(), out);
}

float ClampTo(const NumericPreference &pref, float v) {
  return std::clamp(v, pref.minValue, pref.maxValue);
}
} // namespace

void UserPreferencesStore::SetValue(const std::string &key,
                                    const std::string &value) {
  auto pref = numeric.find(key);
  float parsed = 0.0f;
  if (pref != numeric.end() && TryParseFloat(value, parsed)) {
    values[key] = ClampTo(pref->second, parsed);
    return;
  }
  values[key] = value;
}

std::optional<std::string>
UserPreferencesStore::GetValue(const std::string &key) const {
  auto it = values.find(key);
  if (it == values.end())
    return std::nullopt;
  if (it->is_string())
    return it->get<std::string>();
  return it->dump();
}

std::string UserPreferencesStore::GetString(const std::string &key,
                                            const std::string &fallback) const {
  auto it = values.find(key);
  if (it != values.end() && it->is_string())
    return it->get<std::string>();
  return fallback;
}

bool UserPreferencesStore::HasKey(const std::string &key) const {
  return values.contains(key);
}

void UserPreferencesStore::RegisterNumeric(const std::string &name,
                                           NumericPreference pref) {
  numeric[name] = std::move(pref);
}

float UserPreferencesStore::GetFloat(const std::string &name) const {
  auto pref = numeric.find(name);
  auto it = values.find(name);
  float value = 0.0f;
  if (it != values.end() && ReadNumber(*it, value))
    return pref != numeric.end() ? ClampTo(pref->second, value) : value;
  return pref != numeric.end() ? pref->second.defaultValue : 0.0f;
}

void UserPreferencesStore::SetFloat(const std::string &name, float v) {
  auto pref = numeric.find(name);
  values[name] = pref != numeric.end() ? ClampTo(pref->second, v) : v;
}

ErrorCorrection UserPreferencesStore::DefaultCorrection() const {
  return ErrorCorrectionFromString(GetString(PREF_DEFAULT_CORRECTION))
      .value_or(kDefaultErrorCorrection);
}

void UserPreferencesStore::SetDefaultCorrection(ErrorCorrection level) {
  values[PREF_DEFAULT_CORRECTION] = std::string(1, ErrorCorrectionCode(level));
}

void UserPreferencesStore::RegisterApplicationVariables() {
  RegisterNumeric(PREF_EXPORT_SIZE, {512.0f, 21.0f, 8192.0f, {"png_size"}});
  RegisterNumeric(PREF_EXPORT_SCALE, {1.0f, 1.0f, 8.0f, {}});
  RegisterNumeric(PREF_PDF_RESOLUTION, {72.0f, 36.0f, 1200.0f, {}});
  if (!HasKey(PREF_DEFAULT_CORRECTION))
    SetDefaultCorrection(kDefaultErrorCorrection);
  Normalize();
}

// Resolves every registered numeric entry to a clamped number, migrating
// legacy keys on the way.
void UserPreferencesStore::Normalize() {
  for (const auto &[name, pref] : numeric) {
    float value = pref.defaultValue;
    auto it = values.find(name);
    if (it == values.end() || !ReadNumber(*it, value)) {
      value = pref.defaultValue;
      for (const auto &legacy : pref.legacyNames) {
        auto old = values.find(legacy);
        if (old != values.end() && ReadNumber(*old, value))
          break;
        value = pref.defaultValue;
      }
    }
    values[name] = ClampTo(pref, value);
    for (const auto &legacy : pref.legacyNames)
      values.erase(legacy);
  }
}

bool UserPreferencesStore::LoadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
    return false;

  nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    Logger::Instance().Warn("Preferences file " + path +
                            " is not a JSON object");
    return false;
  }

  nlohmann::json loaded = nlohmann::json::object();
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (it->is_string() || it->is_number())
      loaded[it.key()] = *it;
    else
      Logger::Instance().Warn("Ignoring preference '" + it.key() +
                              "' of type " + it->type_name());
  }
  values = std::move(loaded);
  Normalize();
  return true;
}

bool UserPreferencesStore::SaveToFile(const std::string &path) const {
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    Logger::Instance().Error("Unable to write preferences to " + path);
    return false;
  }
  file << values.dump(4);
  return static_cast<bool>(file);
}

std::string UserPreferencesStore::GetUserConfigFile() {
  std::filesystem::path dir(
      wxStandardPaths::Get().GetUserDataDir().ToStdString());
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec)
    Logger::Instance().Warn("Unable to create " + dir.string() + ": " +
                            ec.message());
  return (dir / "user_config.json").string();
}

bool UserPreferencesStore::LoadUserConfig() {
  return LoadFromFile(GetUserConfigFile());
}

bool UserPreferencesStore::SaveUserConfig() const {
  return SaveToFile(GetUserConfigFile());
}
