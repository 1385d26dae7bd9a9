#ifndef __TS_HEADERS__
#define __TS_HEADERS__

#define CPPHTTPLIB_ZLIB_SUPPORT (1)
#define CPPHTTPLIB_OPENSSL_SUPPORT (1)
#include "httplib.h"

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#elif __NetBSD__  // do not need pty.h on NetBSD
#include <util.h>
#else
#include <pty.h>
#endif

#include <fcntl.h>
#include <paths.h>
#include <pwd.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "JsonLib.hpp"
#include "TermShare.pb.h"
#include "ThreadPool.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Sharing protocol timings (milliseconds)
const int METADATA_INTERVAL_MS = 2000;
const int PING_INTERVAL_MS = 30 * 1000;
// Must stay well below PING_INTERVAL_MS so only one pong wait is pending.
const int PONG_TIMEOUT_MS = 10 * 1000;
const int MAX_RECONNECT_ATTEMPTS = 5;

// Lines of terminal output kept for late joiners
const size_t SCROLLBACK_MAX_LINES = 5000;

// The interrupt byte (Ctrl+C) that observers may never send
const char INTERRUPT_BYTE = 0x03;

// Websocket close code for a clean shutdown
const int NORMAL_CLOSURE = 1000;
// Reported when the transport drops without a close handshake
const int ABNORMAL_CLOSURE = 1006;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef TS_VERSION
#define TS_VERSION "unknown"
#endif

namespace ts {
inline string genRandomAlphaNum(int len) {
  static const char alphanum[] =
      "0123456789"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "abcdefghijklmnopqrstuvwxyz";
  string s(len, '\0');

  for (int i = 0; i < len; ++i) {
    s[i] = alphanum[randombytes_uniform(sizeof(alphanum) - 1)];
  }

  return s;
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

/**
 * @brief Formats a wall clock time as an ISO 8601 UTC string with
 * milliseconds, e.g. 2024-05-01T12:00:00.000Z.
 */
inline string toIsoTimestamp(const chrono::system_clock::time_point &tp) {
  auto ms = chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch())
                .count() %
            1000;
  time_t seconds = chrono::system_clock::to_time_t(tp);
  struct tm utc;
  gmtime_r(&seconds, &utc);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  ostringstream oss;
  oss << buffer << "." << setw(3) << setfill('0') << ms << "Z";
  return oss.str();
}

inline string nowIsoTimestamp() {
  return toIsoTimestamp(chrono::system_clock::now());
}

inline int64_t nowUnixMillis() {
  return chrono::duration_cast<chrono::milliseconds>(
             chrono::system_clock::now().time_since_epoch())
      .count();
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace ts

#endif  // __TS_HEADERS__
