#include "SharingSettings.hpp"

namespace ts {
SettingsStore::SettingsStore(const string& _path) : path(_path) { load(); }

SharingSettings SettingsStore::get() {
  lock_guard<mutex> guard(settingsMutex);
  return settings;
}

SharingSettings SettingsStore::update(const SharingSettingsUpdate& changes) {
  lock_guard<mutex> guard(settingsMutex);
  if (changes.displayName) {
    settings.displayName = *changes.displayName;
  }
  if (changes.clearAutoExpire) {
    settings.autoExpireMs.reset();
  } else if (changes.autoExpireMs) {
    settings.autoExpireMs = changes.autoExpireMs;
  }
  save();
  return settings;
}

void SettingsStore::load() {
  if (!fs::exists(path)) {
    VLOG(1) << "No sharing settings at " << path << ", using defaults";
    return;
  }
  ifstream input(path);
  if (!input.is_open()) {
    LOG(WARNING) << "Failed to read sharing settings from " << path;
    return;
  }
  stringstream contents;
  contents << input.rdbuf();
  json saved;
  if (!parseJsonObject(contents.str(), &saved)) {
    LOG(WARNING) << "Ignoring corrupt sharing settings in " << path;
    return;
  }

  auto displayName = saved.find("displayName");
  if (displayName != saved.end() && displayName->is_string()) {
    settings.displayName = displayName->get<string>();
  }
  auto autoExpire = saved.find("autoExpireMs");
  if (autoExpire != saved.end() && autoExpire->is_number()) {
    settings.autoExpireMs = autoExpire->get<int64_t>();
  }
}

bool SettingsStore::save() {
  json serialized;
  serialized["displayName"] = settings.displayName;
  if (settings.autoExpireMs) {
    serialized["autoExpireMs"] = *settings.autoExpireMs;
  }

  string tmpPath = path + ".tmp";
  try {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
      fs::create_directories(parent);
    }
    {
      ofstream output(tmpPath, ios::out | ios::trunc);
      output << serialized.dump(2);
      output.close();
      if (output.fail()) {
        LOG(ERROR) << "Failed to write sharing settings to " << tmpPath;
        return false;
      }
    }
    fs::rename(tmpPath, path);
  } catch (const fs::filesystem_error& fse) {
    LOG(ERROR) << "Failed to save sharing settings: " << fse.what();
    return false;
  }
  return true;
}
}  // namespace ts
