#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace ts;

int main(int argc, char **argv) {
  srand(1);
  if (sodium_init() == -1) {
    cerr << "libsodium init failed" << endl;
    return 1;
  }

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      ts::LogHandler::setupLogHandler(&argc, &argv);
  ts::LogHandler::setupStdoutLogger();
  // ts::LogHandler::setVerbosity(9);

  ts::HandleTerminate();

  string logDirectoryPattern = GetTempDirectory() + string("ts_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  ts::LogHandler::setupLogFile(&defaultConf, logDirectory, "log", false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
