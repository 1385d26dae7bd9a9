#ifndef __TS_PTY_SESSION_PROVIDER__
#define __TS_PTY_SESSION_PROVIDER__

#include "Headers.hpp"
#include "SessionProvider.hpp"

namespace ts {
/**
 * @brief SessionProvider that runs login shells in pseudo-terminals.
 *
 * A single poll thread reads every pty and fans the output out to the
 * subscribers of that session.
 */
class PtySessionProvider : public SessionProvider {
 public:
  PtySessionProvider();
  virtual ~PtySessionProvider();

  /**
   * @brief Forks the user's shell on a new pty.
   * @return Id of the new session.
   */
  string spawnShell(const string& name);

  virtual optional<SessionInfo> getSession(const string& sessionId);
  virtual Unsubscribe subscribeToOutput(const string& sessionId,
                                        OutputCallback callback);
  virtual void sendInput(const string& sessionId, const string& text);
  virtual void onSessionEnd(SessionEndCallback callback);

  /** @brief Updates the pty window size using TIOCSWINSZ. */
  void updateTerminalSize(const string& sessionId, int cols, int rows);

  /** @brief Kills all children and stops the poll thread. */
  void shutdown();

 protected:
  struct PtySession {
    SessionInfo info;
    int masterFd;
    pid_t childPid;
    bool running;
    map<int, OutputCallback> subscribers;
  };

  void pollLoop();
  /** @brief Reaps the child and closes the pty. Requires providerMutex. */
  void markEnded(PtySession* session);

  recursive_mutex providerMutex;
  map<string, PtySession> sessions;
  vector<SessionEndCallback> endCallbacks;
  int nextSubscriberId;
  atomic<bool> running;
  std::thread pollThread;
};
}  // namespace ts

#endif  // __TS_PTY_SESSION_PROVIDER__
