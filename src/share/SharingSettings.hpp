#ifndef __TS_SHARING_SETTINGS__
#define __TS_SHARING_SETTINGS__

#include "Headers.hpp"

namespace ts {
const char* const DEFAULT_DISPLAY_NAME = "TermShare User";

/** @brief User preferences for sharing. */
struct SharingSettings {
  string displayName = DEFAULT_DISPLAY_NAME;
  /** @brief Default lifetime of new shares; unset means no expiry. */
  optional<int64_t> autoExpireMs;
};

/** @brief Partial update; unset members keep their current value. */
struct SharingSettingsUpdate {
  optional<string> displayName;
  optional<int64_t> autoExpireMs;
  /** @brief Removes the default expiry. Takes precedence over autoExpireMs. */
  bool clearAutoExpire = false;
};

/**
 * @brief Persists SharingSettings as a JSON object
 * {"displayName": ..., "autoExpireMs": ...}.
 *
 * The file is read once on construction and rewritten after every update via
 * a temporary file and a rename, so a crash never leaves a partial file.
 * I/O failures are logged and the in-memory settings stay authoritative.
 */
class SettingsStore {
 public:
  explicit SettingsStore(const string& _path);

  SharingSettings get();
  SharingSettings update(const SharingSettingsUpdate& changes);

  const string& getPath() const { return path; }

 protected:
  void load();
  bool save();

  string path;
  mutex settingsMutex;
  SharingSettings settings;
};
}  // namespace ts

#endif  // __TS_SHARING_SETTINGS__
