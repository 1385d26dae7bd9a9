#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ts {
namespace {
string timestampedName(const string &prefix) {
  time_t rawtime;
  time(&rawtime);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  return prefix + "-" + string(buffer) + "_" + to_string(getpid()) + ".log";
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFile(el::Configurations *defaultConf,
                                const string &directory,
                                const string &filenamePrefix,
                                bool logToStdout, const string &maxlogsize) {
  string fullFname =
      createLogFile(directory, timestampedName(filenamePrefix));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  return fullFname;
}

void LogHandler::setVerbosity(int level) {
  el::Loggers::setVerboseLevel(level);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, so nothing may be logged here.
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::stderrToFile(const string &directory,
                              const string &filenamePrefix) {
  string fullFname =
      createLogFile(directory, timestampedName(filenamePrefix + "-stderr"));
  FILE *stderrStream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Invalid filename " << fullFname;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}
}  // namespace ts
