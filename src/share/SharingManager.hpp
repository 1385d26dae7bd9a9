#ifndef __TS_SHARING_MANAGER__
#define __TS_SHARING_MANAGER__

#include "AccountProvider.hpp"
#include "Headers.hpp"
#include "HostShare.hpp"
#include "ObserverShare.hpp"
#include "SharingContext.hpp"
#include "SharingSettings.hpp"

namespace ts {
struct StartShareRequest {
  string sessionId;
  optional<string> password;
  /** @brief Falls back to the autoExpireMs setting when unset. */
  optional<int64_t> expiresInMs;
};

struct JoinShareRequest {
  /** @brief Raw code, share url or deep link. */
  string codeOrUrl;
  optional<string> password;
  /** @brief Falls back to the displayName setting when unset. */
  optional<string> displayName;
};

/**
 * @brief Entry point of the sharing engine.
 *
 * Keeps one HostShare per shared session and one ObserverShare per joined
 * share code. Public operations report failures through ShareResult and
 * never throw. The manager lock only guards the two registries; controllers
 * are always called with it released.
 */
class SharingManager {
 public:
  SharingManager(const SharingContext& _context,
                 shared_ptr<AccountProvider> _accounts,
                 shared_ptr<SettingsStore> _settings,
                 RoomLimitPredicate _roomLimit = defaultRoomLimitPredicate);
  virtual ~SharingManager();

  // Host side
  Eligibility checkEligibility();
  /**
   * @brief Validates the session and account, creates a relay room and
   * starts sharing.
   * @param shareInfo Receives the new share record on success. May be null.
   */
  ShareResult startShare(const StartShareRequest& request,
                         ShareInfo* shareInfo);
  void broadcastOutput(const string& sessionId, const string& chunk);
  ShareResult stopShare(const string& sessionId);
  ShareResult kickObserver(const string& sessionId, const string& observerId);
  ShareResult grantControl(const string& sessionId, const string& observerId);
  ShareResult revokeControl(const string& sessionId,
                            const string& observerId);
  optional<ShareInfo> getShareInfo(const string& sessionId);
  vector<ShareInfo> listActiveShares();
  /**
   * @brief Deletes relay rooms that no local share owns.
   * @return Number of rooms deleted; 0 if the rooms cannot be listed.
   */
  int cleanupStaleShares();

  // Observer side
  ShareResult joinShare(const JoinShareRequest& request);
  ShareResult requestControl(const string& shareCode);
  ShareResult releaseControl(const string& shareCode);
  ShareResult sendInput(const string& shareCode, const string& text);
  ShareResult leaveShare(const string& shareCode);
  vector<JoinedShare> listJoinedShares();

  SharingSettings getSettings();
  SharingSettings updateSettings(const SharingSettingsUpdate& changes);

  /**
   * @brief Tears down every host and observer share without notifications.
   * Later operations fail. Idempotent.
   */
  void destroy();

 protected:
  void handleSessionEnd(const string& sessionId);
  RelayRoom createRoomWithRetry(const CreateRoomRequest& request);
  shared_ptr<HostShare> findHostShare(const string& sessionId);
  shared_ptr<ObserverShare> findObserverShare(const string& shareCode);
  void releaseReservation(const string& sessionId);
  void forgetHostShare(HostShare* share);
  void forgetObserverShare(ObserverShare* share);

  SharingContext context;
  shared_ptr<AccountProvider> accounts;
  shared_ptr<SettingsStore> settings;
  RoomLimitPredicate roomLimit;

  recursive_mutex managerMutex;
  // A null entry reserves the session while startShare is in flight.
  map<string, shared_ptr<HostShare>> hostShares;
  map<string, shared_ptr<ObserverShare>> observerShares;
  // Reserved sessions that ended before their share was created.
  set<string> endedWhileStarting;
  bool destroyed;
  // Expires with the manager so late callbacks become no-ops.
  shared_ptr<bool> aliveToken;
};
}  // namespace ts

#endif  // __TS_SHARING_MANAGER__
