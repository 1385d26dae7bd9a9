#ifndef __TS_LOG_HANDLER__
#define __TS_LOG_HANDLER__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Configures easylogging++ for the sharing tools and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration.
   *
   * The returned configuration is not applied yet; callers add file/stdout
   * settings and then reconfigure the "default" logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Directs the default logger into a fresh file under @p directory.
   * @param maxlogsize Rollover threshold in bytes, as a string.
   * @return Full path of the created log file.
   */
  static string setupLogFile(el::Configurations *defaultConf,
                             const string &directory,
                             const string &filenamePrefix, bool logToStdout,
                             const string &maxlogsize = "20971520");

  /** @brief Applies a verbosity level to VLOG statements. */
  static void setVerbosity(int level);

  /** @brief Removes a rolled-over log file. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it prints bare messages for
   * user-facing output.
   */
  static void setupStdoutLogger();

  /** @brief Redirects stderr into a file in the given directory. */
  static void stderrToFile(const string &directory,
                           const string &filenamePrefix);

 private:
  /** @brief Creates the directory if needed and an exclusive empty file. */
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace ts
#endif  // __TS_LOG_HANDLER__
