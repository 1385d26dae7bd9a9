#include "ShareConfig.hpp"

#include "SimpleIni.h"

namespace ts {
string getConfigDirectory() {
  return (fs::path(sago::getConfigHome()) / "termshare").string();
}

string getDefaultConfigPath() {
  return (fs::path(getConfigDirectory()) / "termshare.ini").string();
}

bool loadShareConfig(const string& path, bool required, ShareConfig* config) {
  if (!fs::exists(path)) {
    if (required) {
      LOG(ERROR) << "Config file does not exist: " << path;
      return false;
    }
    VLOG(1) << "No config file at " << path << ", using defaults";
    return true;
  }

  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Invalid config file: " << path << " (" << rc << ")";
    return false;
  }

  const char* apiBaseUrl = ini.GetValue("Relay", "api_base_url", NULL);
  if (apiBaseUrl && *apiBaseUrl) {
    config->relay.apiBaseUrl = string(apiBaseUrl);
  }
  const char* apiKey = ini.GetValue("Relay", "api_key", NULL);
  if (apiKey) {
    config->relay.apiKey = string(apiKey);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = atoi(vlevel);
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = atoi(silent) != 0;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->maxLogSize = string(logsize);
  }
  return true;
}
}  // namespace ts
