#ifndef __TS_SESSION_PROVIDER__
#define __TS_SESSION_PROVIDER__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Owner of the interactive sessions that can be shared.
 *
 * The sharing engine treats it as the only source of truth for session
 * liveness and the only sink for forwarded input.
 */
class SessionProvider {
 public:
  typedef function<void(const string&)> OutputCallback;
  typedef function<void(const string&)> SessionEndCallback;
  typedef function<void()> Unsubscribe;

  virtual ~SessionProvider() {}

  /** @brief Looks up a session; status "running" means it can be shared. */
  virtual optional<SessionInfo> getSession(const string& sessionId) = 0;

  /**
   * @brief Registers for the session's output chunks.
   * @return Function that removes the subscription. Calling it more than once
   * is harmless.
   */
  virtual Unsubscribe subscribeToOutput(const string& sessionId,
                                        OutputCallback callback) = 0;

  /** @brief Writes text to the session's input. */
  virtual void sendInput(const string& sessionId, const string& text) = 0;

  /**
   * @brief Registers a callback that receives the id of each ended session.
   * Providers invoke it without holding their own locks, since the callback
   * may unsubscribe from output.
   */
  virtual void onSessionEnd(SessionEndCallback callback) = 0;
};
}  // namespace ts

#endif  // __TS_SESSION_PROVIDER__
