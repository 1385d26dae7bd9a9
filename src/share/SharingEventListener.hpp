#ifndef __TS_SHARING_EVENT_LISTENER__
#define __TS_SHARING_EVENT_LISTENER__

#include "Headers.hpp"
#include "ShareTypes.hpp"

namespace ts {
/**
 * @brief Receives sharing notifications for the UI layer.
 *
 * Host-side events are addressed by session id, observer-side events by share
 * code. Notifications are delivered with no share lock held, from whichever
 * thread produced them (socket io thread, timer thread or the caller).
 * Every method has an empty default so listeners override what they need.
 */
class SharingEventListener {
 public:
  virtual ~SharingEventListener() {}

  // Host side
  virtual void onShareStarted(const string& sessionId,
                              const ShareInfo& shareInfo) {}
  virtual void onObserverJoined(const string& sessionId,
                                const ObserverInfo& observer) {}
  virtual void onObserverLeft(const string& sessionId,
                              const string& observerId) {}
  virtual void onControlRequested(const string& sessionId,
                                  const string& observerId,
                                  const string& displayName) {}
  virtual void onShareStopped(const string& sessionId, const string& shareCode,
                              StopReason reason, const string& message) {}

  // Observer side
  virtual void onControlGranted(const string& shareCode) {}
  virtual void onControlRevoked(const string& shareCode,
                                const string& reason) {}
  virtual void onJoinedShareStopped(const string& shareCode, StopReason reason,
                                    const string& message) {}
  virtual void onShareOutput(const string& shareCode, const string& data) {}
  virtual void onShareMetadata(const string& shareCode, const json& metadata) {
  }
};
}  // namespace ts

#endif  // __TS_SHARING_EVENT_LISTENER__
