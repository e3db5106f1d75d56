#pragma once

#include "errorcorrection.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

// Preference keys used by the application.
inline constexpr const char *PREF_EXPORT_SIZE = "export_size";
inline constexpr const char *PREF_EXPORT_SCALE = "export_scale";
inline constexpr const char *PREF_PDF_RESOLUTION = "pdf_resolution";
inline constexpr const char *PREF_DEFAULT_CORRECTION = "default_correction";
inline constexpr const char *PREF_LAST_SETTINGS_DIR = "last_settings_dir";
inline constexpr const char *PREF_LAST_EXPORT_DIR = "last_export_dir";

// Numeric preference with a default and an inclusive valid range. Values
// found under one of the legacy names are migrated to the current key.
struct NumericPreference {
  float defaultValue = 0.0f;
  float minValue = 0.0f;
  float maxValue = 0.0f;
  std::vector<std::string> legacyNames;
};

// JSON backed preference file. Entries are strings or numbers; registered
// numeric entries are always present and kept inside their range.
class UserPreferencesStore {
public:
  void SetValue(const std::string &key, const std::string &value);
  // Numbers are returned in their JSON spelling.
  std::optional<std::string> GetValue(const std::string &key) const;
  std::string GetString(const std::string &key,
                        const std::string &fallback = std::string()) const;
  bool HasKey(const std::string &key) const;

  void RegisterNumeric(const std::string &name, NumericPreference pref);
  float GetFloat(const std::string &name) const;
  void SetFloat(const std::string &name, float v);

  // Falls back to kDefaultErrorCorrection when unset or unreadable.
  ErrorCorrection DefaultCorrection() const;
  void SetDefaultCorrection(ErrorCorrection level);

  // Registers export size, scale and PDF resolution and seeds the default
  // error correction code when it is missing.
  void RegisterApplicationVariables();

  bool LoadFromFile(const std::string &path);
  bool SaveToFile(const std::string &path) const;
  static std::string GetUserConfigFile();
  bool LoadUserConfig();
  bool SaveUserConfig() const;

private:
  void Normalize();

  nlohmann::json values = nlohmann::json::object();
  std::map<std::string, NumericPreference> numeric;
};
