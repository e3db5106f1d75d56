#include "configservices.h"

#include <cassert>
#include <filesystem>
#include <fstream>

int main() {
  UserPreferencesStore store;
  store.RegisterApplicationVariables();
  assert(store.GetFloat(PREF_EXPORT_SIZE) == 512.0f);
  assert(store.GetFloat(PREF_PDF_RESOLUTION) == 72.0f);
  assert(store.GetValue(PREF_DEFAULT_CORRECTION).value() == "Q");

  store.SetValue(PREF_EXPORT_SCALE, "20");
  assert(store.GetFloat(PREF_EXPORT_SCALE) == 8.0f);
  store.SetFloat(PREF_EXPORT_SIZE, 4.0f);
  assert(store.GetFloat(PREF_EXPORT_SIZE) == 21.0f);
  store.SetValue(PREF_DEFAULT_CORRECTION, "H");

  const std::filesystem::path out = std::filesystem::temp_directory_path() /
                                    "qrstudio_user_preferences_store_test.json";
  assert(store.SaveToFile(out.string()));

  UserPreferencesStore loaded;
  assert(loaded.LoadFromFile(out.string()));
  loaded.RegisterApplicationVariables();
  assert(loaded.GetFloat(PREF_EXPORT_SCALE) == 8.0f);
  assert(loaded.GetFloat(PREF_EXPORT_SIZE) == 21.0f);
  assert(loaded.GetValue(PREF_DEFAULT_CORRECTION).value() == "H");

  // Older files stored the export size under another key.
  {
    std::ofstream legacy(out, std::ios::binary | std::ios::trunc);
    legacy << "{ \"png_size\": 1024, \"flags\": [1, 2] }";
  }
  UserPreferencesStore migrated;
  assert(migrated.LoadFromFile(out.string()));
  assert(!migrated.HasKey("flags"));
  migrated.RegisterApplicationVariables();
  assert(migrated.GetFloat(PREF_EXPORT_SIZE) == 1024.0f);

  {
    std::ofstream broken(out, std::ios::binary | std::ios::trunc);
    broken << "{ not json";
  }
  UserPreferencesStore rejected;
  assert(!rejected.LoadFromFile(out.string()));

  std::error_code ec;
  std::filesystem::remove(out, ec);
  assert(!rejected.LoadFromFile(out.string()));
  return 0;
}
