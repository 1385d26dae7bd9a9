#ifndef __TS_HOST_SHARE__
#define __TS_HOST_SHARE__

#include "Frame.hpp"
#include "Headers.hpp"
#include "ScrollbackBuffer.hpp"
#include "SessionMetadata.hpp"
#include "SharingContext.hpp"

namespace ts {
/**
 * @brief Host side of one share: the relay socket, the observer registry,
 * control arbitration, scrollback and the metadata/keepalive timers.
 *
 * Status moves creating -> active -> (stopping -> stopped | error). Every
 * mutation is serialized by shareMutex; listener notifications and calls into
 * the session provider happen with the mutex released.
 */
class HostShare : public enable_shared_from_this<HostShare> {
 public:
  /** @brief Called once the share has been torn down, for any reason. */
  typedef function<void(HostShare*)> TerminatedCallback;

  HostShare(const SharingContext& _context, const SessionInfo& _session,
            const RelayRoom& room, bool hasPassword,
            TerminatedCallback _onTerminated);
  virtual ~HostShare();

  /**
   * @brief Opens the relay socket, subscribes to the session output and arms
   * the timers.
   * @param expiresInMs Stops the share with reason "expired" after this long.
   */
  void start(optional<int64_t> expiresInMs);

  /**
   * @brief Buffers a chunk of output and sends it to observers if the socket
   * is open. Output is never queued for a closed socket.
   */
  void broadcastOutput(const string& chunk);

  /**
   * @brief Graceful stop: ShareClose to observers, room deletion on the
   * relay, then cleanup. Notifies listeners with reason host-stopped.
   */
  void stop();

  ShareResult kickObserver(const string& observerId);
  ShareResult grantControl(const string& observerId);
  ShareResult revokeControl(const string& observerId);

  /**
   * @brief Tears down timers, subscription and socket without notifying
   * anyone. Safe to call any number of times.
   */
  void shutdown();

  /** @brief Snapshot of the public record. */
  ShareInfo getInfo();

  ShareStatus getStatus() const { return status; }
  const string& getSessionId() const { return sessionId; }
  const string& getShareId() const { return shareId; }

 protected:
  void handleSessionOutput(const string& chunk);
  void handleOpen();
  void handleMessage(const string& data);
  void handleClose(int code, const string& reason);
  void handleFrame(const Frame& frame);

  void handleObserverAnnounce(const Frame& frame);
  void handleControlRequest(const Frame& frame);
  void handleTerminalInput(const Frame& frame);
  void handleControlRelease(const Frame& frame);

  void sendMetadata();
  void sendPing();
  void handlePongTimeout();
  void handleExpiry();

  /** @brief Sends a frame if the socket is open. Requires shareMutex. */
  bool sendFrame(FrameType type, const string& payload = "");

  string observerListPayload();
  ObserverInfo* findObserver(const string& observerId);

  /**
   * @brief Cancels timers, drops the output subscription and closes (or
   * terminates) the socket.
   * @return true for the call that actually performed the cleanup.
   */
  bool cleanup(ShareStatus finalStatus, bool terminateSocket);

  void deleteRoomInBackground();
  void notifyStopped(StopReason reason, const string& message);

  SharingContext context;
  string sessionId;
  string shareId;
  string shareCode;
  string wsEndpoint;

  recursive_mutex shareMutex;
  atomic<ShareStatus> status;
  ShareInfo info;
  shared_ptr<ShareSocket> socket;
  ScrollbackBuffer scrollback;
  MetadataTracker metadata;
  SessionProvider::Unsubscribe unsubscribeOutput;
  TimerId metadataTimer;
  TimerId pingTimer;
  TimerId pongTimer;
  TimerId expiryTimer;
  bool cleanedUp;
  TerminatedCallback onTerminated;
};
}  // namespace ts

#endif  // __TS_HOST_SHARE__
