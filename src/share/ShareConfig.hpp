#ifndef __TS_SHARE_CONFIG__
#define __TS_SHARE_CONFIG__

#include "Headers.hpp"

namespace ts {
const char* const DEFAULT_API_BASE_URL = "https://api.launchtunnel.dev/api";

/** @brief Where the relay lives and how to authenticate with it. */
struct RelayConfig {
  string apiBaseUrl = DEFAULT_API_BASE_URL;
  string apiKey;
};

/**
 * @brief Settings read from termshare.ini.
 */
struct ShareConfig {
  RelayConfig relay;
  int verbose = 0;
  bool silent = false;
  // easylogging wants the rollover size as a string
  string maxLogSize = "20971520";
};

/** @brief <config home>/termshare, created on demand by the writers. */
string getConfigDirectory();

/** @brief Default location of termshare.ini. */
string getDefaultConfigPath();

/**
 * @brief Loads @p path into @p config. Keys missing from the file keep their
 * current values.
 * @return false if the file exists but cannot be parsed, or is missing and
 * @p required is set.
 */
bool loadShareConfig(const string& path, bool required, ShareConfig* config);
}  // namespace ts

#endif  // __TS_SHARE_CONFIG__
