#ifndef __TS_OBSERVER_SHARE__
#define __TS_OBSERVER_SHARE__

#include "Frame.hpp"
#include "Headers.hpp"
#include "SharingContext.hpp"

namespace ts {
/**
 * @brief Observer side of one joined share.
 *
 * Phases: resolving -> connecting -> active <-> reconnecting -> closed. An
 * abnormal socket close schedules a reconnect using the backoff table in
 * SharingTimings; after maxReconnectAttempts failures the share is closed
 * and listeners see a stopped notification with reason error.
 */
class ObserverShare : public enable_shared_from_this<ObserverShare> {
 public:
  enum class Phase { RESOLVING, CONNECTING, ACTIVE, RECONNECTING, CLOSED };

  typedef function<void(ObserverShare*)> TerminatedCallback;

  ObserverShare(const SharingContext& _context, const string& _shareCode,
                const string& _displayName, const optional<string>& _password,
                TerminatedCallback _onTerminated);
  virtual ~ObserverShare();

  /**
   * @brief Resolves the share code with the relay and opens the socket. The
   * announce is sent once the socket is open.
   */
  ShareResult join();

  ShareResult requestControl();
  ShareResult releaseControl();

  /** @brief Sends keystrokes to the host; requires control. */
  ShareResult sendInput(const string& text);

  /**
   * @brief Cancels any pending reconnect and closes the socket without
   * notifying listeners. Safe to call more than once.
   */
  void leave();

  JoinedShare describe();

  Phase getPhase() const { return phase; }
  ObserverRole getRole();
  int getReconnectAttempts();
  const string& getShareCode() const { return shareCode; }
  const string& getObserverId() const { return observerId; }

 protected:
  void connectSocket();
  void handleOpen(ShareSocket* source);
  void handleMessage(const string& data);
  void handleClose(ShareSocket* source, int code, const string& reason);
  void handleFrame(const Frame& frame);
  void handleControlGrant(const Frame& frame);
  void handleControlRevoke(const Frame& frame);
  void handleShareClose(const Frame& frame);

  /** @brief Requires observerMutex. */
  bool sendFrame(FrameType type, const string& payload = "");

  /**
   * @brief Moves to CLOSED and releases the socket and timers.
   * @return true for the call that actually closed the share.
   */
  bool close();

  SharingContext context;
  string shareCode;
  string observerId;
  string displayName;
  optional<string> password;

  recursive_mutex observerMutex;
  atomic<Phase> phase;
  string shareId;
  string sessionName;
  string wsEndpoint;
  ObserverRole role;
  int reconnectAttempts;
  TimerId reconnectTimer;
  shared_ptr<ShareSocket> socket;
  TerminatedCallback onTerminated;
};
}  // namespace ts

#endif  // __TS_OBSERVER_SHARE__
