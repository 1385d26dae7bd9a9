#include <cxxopts.hpp>

#include "HttpRelayClient.hpp"
#include "LogHandler.hpp"
#include "PtySessionProvider.hpp"
#include "ShareConfig.hpp"
#include "ShareUrls.hpp"
#include "SharingManager.hpp"
#include "TimerScheduler.hpp"
#include "WebSocketShareSocket.hpp"

using namespace ts;

namespace {
// Ctrl+] leaves a joined share
const char DETACH_BYTE = 0x1d;

void writeAll(int fd, const string& data) {
  size_t written = 0;
  while (written < data.length()) {
    ssize_t rc = ::write(fd, data.c_str() + written, data.length() - written);
    if (rc < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      LOG(ERROR) << "Failed to write to fd " << fd << ": " << strerror(errno);
      return;
    }
    written += rc;
  }
}

/**
 * @brief Puts the local terminal in raw mode while a session is mirrored.
 */
class RawConsole {
 public:
  RawConsole() : active(false) {}

  ~RawConsole() { teardown(); }

  void setup() {
    if (active || !isatty(STDIN_FILENO)) {
      return;
    }
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local);
    active = true;
  }

  void teardown() {
    if (!active) {
      return;
    }
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
    active = false;
  }

  /** @return false when stdout is not a terminal. */
  bool getWindowSize(int* cols, int* rows) {
    winsize win;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1) {
      return false;
    }
    *cols = win.ws_col;
    *rows = win.ws_row;
    return true;
  }

 protected:
  bool active;
  termios terminal_backup;
};

/**
 * @brief Prints sharing events to the local terminal and tracks whether the
 * share (or joined share) is still alive.
 */
class ConsoleListener : public SharingEventListener {
 public:
  explicit ConsoleListener(bool _autoGrant)
      : autoGrant(_autoGrant), done(false), inControl(false) {}

  /** @brief Used to answer control requests when auto-granting. */
  void setGrantHandler(function<void(const string&, const string&)> handler) {
    lock_guard<mutex> guard(listenerMutex);
    grantHandler = handler;
  }

  bool isDone() const { return done; }
  bool hasControl() const { return inControl; }

  virtual void onShareStarted(const string& sessionId,
                              const ShareInfo& shareInfo) {
    LOG(INFO) << "Share " << shareInfo.sharecode() << " started for "
              << sessionId;
  }

  virtual void onObserverJoined(const string& sessionId,
                                const ObserverInfo& observer) {
    notice(observer.displayname() + " joined");
  }

  virtual void onObserverLeft(const string& sessionId,
                              const string& observerId) {
    notice("Observer " + observerId + " left");
  }

  virtual void onControlRequested(const string& sessionId,
                                  const string& observerId,
                                  const string& displayName) {
    function<void(const string&, const string&)> handler;
    {
      lock_guard<mutex> guard(listenerMutex);
      handler = grantHandler;
    }
    if (autoGrant && handler) {
      notice("Granting control to " + displayName);
      handler(sessionId, observerId);
    } else {
      notice(displayName + " requested control");
    }
  }

  virtual void onShareStopped(const string& sessionId, const string& shareCode,
                              StopReason reason, const string& message) {
    notice("Share " + shareCode + " stopped (" + stopReasonName(reason) +
           "): " + message);
    done = true;
  }

  virtual void onControlGranted(const string& shareCode) {
    inControl = true;
    notice("You have control. Press Ctrl+] to leave.");
  }

  virtual void onControlRevoked(const string& shareCode,
                                const string& reason) {
    inControl = false;
    notice("Control revoked (" + reason + ")");
  }

  virtual void onJoinedShareStopped(const string& shareCode, StopReason reason,
                                    const string& message) {
    notice("Share " + shareCode + " ended (" + stopReasonName(reason) +
           "): " + message);
    done = true;
  }

  virtual void onShareOutput(const string& shareCode, const string& data) {
    writeAll(STDOUT_FILENO, data);
  }

  virtual void onShareMetadata(const string& shareCode, const json& metadata) {
    VLOG(2) << "Metadata from " << shareCode << ": " << metadata.dump();
  }

 protected:
  // The terminal is in raw mode, so newlines need a carriage return.
  void notice(const string& message) {
    LOG(INFO) << message;
    writeAll(STDOUT_FILENO, "\r\n[tshare] " + message + "\r\n");
  }

  bool autoGrant;
  atomic<bool> done;
  atomic<bool> inControl;
  mutex listenerMutex;
  function<void(const string&, const string&)> grantHandler;
};

/** @brief Waits up to 100ms for keystrokes. Empty when nothing arrived. */
optional<string> readStdin() {
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(STDIN_FILENO, &rfd);
  timeval tv;
  tv.tv_sec = 0;
  tv.tv_usec = 100 * 1000;
  int rc = select(STDIN_FILENO + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (errno == EINTR) {
      return string();
    }
    FATAL_FAIL(rc);
  }
  if (rc == 0) {
    return string();
  }
  char buf[4096];
  ssize_t bytesRead = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (bytesRead <= 0) {
    // stdin closed
    return nullopt;
  }
  return string(buf, bytesRead);
}

string defaultSessionName() {
  char hostname[256];
  if (gethostname(hostname, sizeof(hostname)) != 0) {
    return "Terminal";
  }
  hostname[sizeof(hostname) - 1] = '\0';
  passwd* pwd = getpwuid(getuid());
  string user = pwd ? string(pwd->pw_name) : string("user");
  return user + "@" + string(hostname);
}

int runHost(SharingManager* manager, PtySessionProvider* sessions,
            ConsoleListener* listener, const cxxopts::ParseResult& result) {
  string sessionId = sessions->spawnShell(defaultSessionName());
  RawConsole console;
  int cols = 0;
  int rows = 0;
  if (console.getWindowSize(&cols, &rows)) {
    sessions->updateTerminalSize(sessionId, cols, rows);
  }
  SessionProvider::Unsubscribe unsubscribe = sessions->subscribeToOutput(
      sessionId, [](const string& chunk) { writeAll(STDOUT_FILENO, chunk); });

  StartShareRequest request;
  request.sessionId = sessionId;
  if (result.count("password")) {
    request.password = result["password"].as<string>();
  }
  if (result.count("expire")) {
    request.expiresInMs = result["expire"].as<int64_t>();
  }
  ShareInfo info;
  ShareResult started = manager->startShare(request, &info);
  if (!started.success) {
    unsubscribe();
    CLOG(INFO, "stdout") << "Could not share the session: " << started.message
                         << " ("
                         << shareErrorCodeName(started.errorCode.value_or(
                                ShareErrorCode::UNKNOWN))
                         << ")" << endl;
    return 1;
  }
  CLOG(INFO, "stdout") << "Sharing as " << info.sharecode() << endl;
  if (!info.shareurl().empty()) {
    CLOG(INFO, "stdout") << "Observers can join with: " << info.shareurl()
                         << endl;
  }

  console.setup();
  while (!listener->isDone()) {
    optional<SessionInfo> session = sessions->getSession(sessionId);
    if (!session || session->status() != "running") {
      break;
    }
    int newCols = 0;
    int newRows = 0;
    if (console.getWindowSize(&newCols, &newRows) &&
        (newCols != cols || newRows != rows)) {
      cols = newCols;
      rows = newRows;
      sessions->updateTerminalSize(sessionId, cols, rows);
    }
    optional<string> keys = readStdin();
    if (!keys) {
      break;
    }
    if (keys->empty()) {
      continue;
    }
    try {
      sessions->sendInput(sessionId, *keys);
    } catch (const std::runtime_error& ex) {
      LOG(ERROR) << "Lost the local session: " << ex.what();
      break;
    }
  }
  console.teardown();
  unsubscribe();

  if (manager->getShareInfo(sessionId)) {
    ShareResult stopped = manager->stopShare(sessionId);
    if (!stopped.success) {
      LOG(WARNING) << "Failed to stop share: " << stopped.message;
    }
  }
  return 0;
}

int runJoin(SharingManager* manager, ConsoleListener* listener,
            const cxxopts::ParseResult& result) {
  JoinShareRequest request;
  request.codeOrUrl = result["join"].as<string>();
  if (result.count("password")) {
    request.password = result["password"].as<string>();
  }
  if (result.count("name")) {
    request.displayName = result["name"].as<string>();
  }
  ShareResult joined = manager->joinShare(request);
  if (!joined.success) {
    CLOG(INFO, "stdout") << "Could not join: " << joined.message << " ("
                         << shareErrorCodeName(joined.errorCode.value_or(
                                ShareErrorCode::UNKNOWN))
                         << ")" << endl;
    return 1;
  }
  // joinShare already validated the code
  string shareCode = extractShareCode(request.codeOrUrl).value();
  CLOG(INFO, "stdout") << "Joined " << shareCode
                       << ". Press Ctrl+] to leave." << endl;

  bool wantControl = result.count("request-control") > 0;
  RawConsole console;
  console.setup();
  while (!listener->isDone()) {
    if (wantControl) {
      // Fails until the socket is open
      if (manager->requestControl(shareCode).success) {
        wantControl = false;
      }
    }
    optional<string> keys = readStdin();
    if (!keys) {
      break;
    }
    if (keys->find(DETACH_BYTE) != string::npos) {
      break;
    }
    if (keys->empty() || !listener->hasControl()) {
      continue;
    }
    ShareResult sent = manager->sendInput(shareCode, *keys);
    if (!sent.success) {
      VLOG(1) << "Input not sent: " << sent.message;
    }
  }
  console.teardown();

  if (!listener->isDone()) {
    manager->leaveShare(shareCode);
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ts::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, ts::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tshare",
                           "Share a live terminal session through a relay");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Share a new shell session")  //
        ("join", "Join a share by code or url",
         cxxopts::value<std::string>())  //
        ("password", "Share password",
         cxxopts::value<std::string>())  //
        ("expire", "Stop sharing after this many milliseconds",
         cxxopts::value<int64_t>())  //
        ("grant-requests", "Grant every control request automatically")  //
        ("name", "Display name shown to the host",
         cxxopts::value<std::string>())                     //
        ("request-control", "Ask the host for control")     //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("api-key", "Relay api key", cxxopts::value<std::string>())  //
        ("api-url", "Relay api base url",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tshare version " << TS_VERSION << endl;
      exit(0);
    }
    bool host = result.count("host") > 0;
    bool join = result.count("join") > 0;
    if (host == join) {
      CLOG(INFO, "stdout") << "Pass exactly one of --host or --join" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    ShareConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    bool explicitConfig = !cfgfilename.empty();
    if (!explicitConfig) {
      cfgfilename = getDefaultConfigPath();
    }
    if (!loadShareConfig(cfgfilename, explicitConfig, &config)) {
      STFATAL << "Invalid config file: " << cfgfilename;
    }
    if (result.count("api-key")) {
      config.relay.apiKey = result["api-key"].as<string>();
    }
    if (result.count("api-url")) {
      config.relay.apiBaseUrl = result["api-url"].as<string>();
    }
    // prioritize command line option over cfgfile
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    LogHandler::setVerbosity(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    bool logToStdout = result.count("logtostdout") > 0;
    string logDirectory = GetTempDirectory() + "termshare";
    string logFile = LogHandler::setupLogFile(
        &defaultConf, logDirectory, "tshare", logToStdout, config.maxLogSize);
    if (!logToStdout) {
      // Redirect std streams to a file
      LogHandler::stderrToFile(logDirectory, "tshare");
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("tshare-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    LOG(INFO) << "tshare " << TS_VERSION << " logging to " << logFile;

    shared_ptr<HttpRelayClient> relay(new HttpRelayClient(config.relay));
    shared_ptr<TimerScheduler> scheduler(new TimerScheduler());
    shared_ptr<PtySessionProvider> sessions(new PtySessionProvider());
    shared_ptr<ConsoleListener> listener(
        new ConsoleListener(result.count("grant-requests") > 0));

    SharingContext context;
    context.sessionProvider = sessions;
    context.relay = relay;
    context.socketFactory.reset(new WebSocketShareSocketFactory());
    context.scheduler = scheduler;
    context.listener = listener;
    context.backgroundPool.reset(new ThreadPool(4));
    context.apiKey = config.relay.apiKey;

    shared_ptr<SettingsStore> settings(new SettingsStore(
        (fs::path(getConfigDirectory()) / "sharing-settings.json").string()));

    int rc;
    {
      SharingManager manager(context, relay, settings);
      listener->setGrantHandler(
          [&manager](const string& sessionId, const string& observerId) {
            ShareResult granted = manager.grantControl(sessionId, observerId);
            if (!granted.success) {
              LOG(WARNING) << "Auto-grant failed: " << granted.message;
            }
          });
      if (host) {
        rc = runHost(&manager, sessions.get(), listener.get(), result);
      } else {
        rc = runJoin(&manager, listener.get(), result);
      }
      listener->setGrantHandler(nullptr);
      manager.destroy();
    }
    sessions->shutdown();
    scheduler->shutdown();
    return rc;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  return 0;
}
