#include "PtySessionProvider.hpp"

namespace ts {
namespace {
const int BUF_SIZE = 16 * 1024;
}  // namespace

PtySessionProvider::PtySessionProvider() : nextSubscriberId(1), running(true) {
  pollThread = std::thread(&PtySessionProvider::pollLoop, this);
}

PtySessionProvider::~PtySessionProvider() { shutdown(); }

string PtySessionProvider::spawnShell(const string& name) {
  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, NULL);
  switch (pid) {
    case -1:
      FATAL_FAIL(pid);
      break;
    case 0: {
      passwd* pwd = getpwuid(getuid());
      if (pwd == NULL) {
        LOG(FATAL) << "Not able to fork a terminal because getpwuid returns "
                      "null";
      }
      const char* shellEnv = ::getenv("SHELL");
      string shell = shellEnv ? string(shellEnv) : string(pwd->pw_shell);
      setenv("TERMSHARE_VERSION", TS_VERSION, 1);
      execl(shell.c_str(), shell.c_str(), "-l", NULL);
      _exit(127);
    }
    default:
      break;
  }

  string sessionId = "pty-" + genRandomAlphaNum(8);
  VLOG(1) << "pty opened " << masterFd << " for session " << sessionId;
  PtySession session;
  session.info.set_id(sessionId);
  session.info.set_name(name);
  session.info.set_status("running");
  session.info.set_workingdirectory(fs::current_path().string());
  session.masterFd = masterFd;
  session.childPid = pid;
  session.running = true;

  lock_guard<recursive_mutex> guard(providerMutex);
  sessions[sessionId] = session;
  return sessionId;
}

optional<SessionInfo> PtySessionProvider::getSession(const string& sessionId) {
  lock_guard<recursive_mutex> guard(providerMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullopt;
  }
  return it->second.info;
}

SessionProvider::Unsubscribe PtySessionProvider::subscribeToOutput(
    const string& sessionId, OutputCallback callback) {
  lock_guard<recursive_mutex> guard(providerMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    LOG(WARNING) << "Subscribing to unknown session " << sessionId;
    return []() {};
  }
  int subscriberId = nextSubscriberId++;
  it->second.subscribers[subscriberId] = callback;
  return [this, sessionId, subscriberId]() {
    lock_guard<recursive_mutex> guard(providerMutex);
    auto session = sessions.find(sessionId);
    if (session != sessions.end()) {
      session->second.subscribers.erase(subscriberId);
    }
  };
}

void PtySessionProvider::sendInput(const string& sessionId,
                                   const string& text) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(providerMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end() || !it->second.running) {
      throw runtime_error("Session is not running: " + sessionId);
    }
    fd = it->second.masterFd;
  }
  size_t written = 0;
  while (written < text.length()) {
    ssize_t rc = ::write(fd, text.data() + written, text.length() - written);
    if (rc < 0) {
      if (errno == EAGAIN || errno == EINTR) {
        continue;
      }
      throw runtime_error(string("Write to pty failed: ") + strerror(errno));
    }
    written += rc;
  }
}

void PtySessionProvider::onSessionEnd(SessionEndCallback callback) {
  lock_guard<recursive_mutex> guard(providerMutex);
  endCallbacks.push_back(callback);
}

void PtySessionProvider::updateTerminalSize(const string& sessionId, int cols,
                                            int rows) {
  lock_guard<recursive_mutex> guard(providerMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end() || !it->second.running) {
    return;
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  ioctl(it->second.masterFd, TIOCSWINSZ, &tmpwin);
}

void PtySessionProvider::shutdown() {
  if (!running.exchange(false)) {
    return;
  }
  if (pollThread.joinable()) {
    pollThread.join();
  }
  lock_guard<recursive_mutex> guard(providerMutex);
  for (auto& it : sessions) {
    if (it.second.running) {
      kill(it.second.childPid, SIGKILL);
      markEnded(&it.second);
    }
  }
}

void PtySessionProvider::markEnded(PtySession* session) {
  session->running = false;
  session->info.set_status("ended");
  siginfo_t childInfo;
  int rc = waitid(P_PID, session->childPid, &childInfo, WEXITED);
  if (rc < 0 && errno != ECHILD) {
    LOG(ERROR) << "waitid failed: " << strerror(errno);
  }
  ::close(session->masterFd);
  session->subscribers.clear();
}

void PtySessionProvider::pollLoop() {
  char b[BUF_SIZE];
  while (running) {
    fd_set rfd;
    FD_ZERO(&rfd);
    int maxFd = -1;
    {
      lock_guard<recursive_mutex> guard(providerMutex);
      for (const auto& it : sessions) {
        if (it.second.running) {
          FD_SET(it.second.masterFd, &rfd);
          maxFd = max(maxFd, it.second.masterFd);
        }
      }
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    if (maxFd < 0) {
      select(0, NULL, NULL, NULL, &tv);
      continue;
    }
    int ready = select(maxFd + 1, &rfd, NULL, NULL, &tv);
    if (ready <= 0) {
      continue;
    }

    vector<pair<vector<OutputCallback>, string>> deliveries;
    vector<string> ended;
    {
      lock_guard<recursive_mutex> guard(providerMutex);
      for (auto& it : sessions) {
        PtySession& session = it.second;
        if (!session.running || !FD_ISSET(session.masterFd, &rfd)) {
          continue;
        }
        ssize_t rc = ::read(session.masterFd, b, BUF_SIZE);
        if (rc > 0) {
          vector<OutputCallback> callbacks;
          for (const auto& subscriber : session.subscribers) {
            callbacks.push_back(subscriber.second);
          }
          deliveries.push_back(make_pair(callbacks, string(b, rc)));
        } else {
          LOG(INFO) << "Terminal session " << it.first << " ended";
          markEnded(&session);
          ended.push_back(it.first);
        }
      }
    }

    for (const auto& delivery : deliveries) {
      for (const auto& callback : delivery.first) {
        callback(delivery.second);
      }
    }
    if (!ended.empty()) {
      vector<SessionEndCallback> callbacks;
      {
        lock_guard<recursive_mutex> guard(providerMutex);
        callbacks = endCallbacks;
      }
      for (const string& sessionId : ended) {
        for (const auto& callback : callbacks) {
          callback(sessionId);
        }
      }
    }
  }
}
}  // namespace ts
