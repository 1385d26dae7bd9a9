#include "SharingManager.hpp"

#include "ShareUrls.hpp"

namespace ts {
namespace {
const char* const NOT_SHARED_MESSAGE = "Session is not being shared";
const char* const NOT_JOINED_MESSAGE = "Not joined to this session";
const char* const SHUT_DOWN_MESSAGE = "Sharing has been shut down";
const char* const NO_API_KEY_MESSAGE = "No relay API key configured";
const char* const SESSION_ENDED_MESSAGE =
    "Session ended while the share was starting";

string normalizeShareCode(const string& shareCode) {
  return extractShareCode(shareCode).value_or(shareCode);
}
}  // namespace

SharingManager::SharingManager(const SharingContext& _context,
                               shared_ptr<AccountProvider> _accounts,
                               shared_ptr<SettingsStore> _settings,
                               RoomLimitPredicate _roomLimit)
    : context(_context),
      accounts(_accounts),
      settings(_settings),
      roomLimit(_roomLimit),
      destroyed(false),
      aliveToken(new bool(true)) {
  if (!context.listener) {
    context.listener.reset(new SharingEventListener());
  }
  if (!roomLimit) {
    roomLimit = defaultRoomLimitPredicate;
  }
  weak_ptr<bool> alive = aliveToken;
  context.sessionProvider->onSessionEnd([this, alive](const string& sessionId) {
    if (alive.lock()) {
      handleSessionEnd(sessionId);
    }
  });
}

SharingManager::~SharingManager() {
  destroy();
  aliveToken.reset();
}

Eligibility SharingManager::checkEligibility() {
  try {
    optional<AccountInfo> account = accounts->getAccount();
    if (!account) {
      return Eligibility{false, nullopt, string("No account connected")};
    }
    if (!isSharingPlan(account->plan())) {
      return Eligibility{
          false, account->plan(),
          string("Session sharing requires a Pro subscription")};
    }
    return Eligibility{true, account->plan(), nullopt};
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Eligibility check failed: " << ex.what();
    return Eligibility{false, nullopt,
                       string("Failed to verify subscription status")};
  }
}

ShareResult SharingManager::startShare(const StartShareRequest& request,
                                       ShareInfo* shareInfo) {
  const string& sessionId = request.sessionId;
  optional<SessionInfo> session =
      context.sessionProvider->getSession(sessionId);
  if (!session) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             "Session not found: " + sessionId);
  }
  if (session->status() != "running") {
    return ShareResult::fail(
        ShareErrorCode::SESSION_NOT_RUNNING,
        "Session is not running (status: " + session->status() + ")");
  }

  {
    lock_guard<recursive_mutex> guard(managerMutex);
    if (destroyed) {
      return ShareResult::fail(ShareErrorCode::UNKNOWN, SHUT_DOWN_MESSAGE);
    }
    if (hostShares.find(sessionId) != hostShares.end()) {
      return ShareResult::fail(ShareErrorCode::ALREADY_SHARED,
                               "Session is already being shared");
    }
    if (context.apiKey.empty()) {
      return ShareResult::fail(ShareErrorCode::NO_API_KEY, NO_API_KEY_MESSAGE);
    }
    hostShares[sessionId] = nullptr;
  }

  Eligibility eligibility = checkEligibility();
  if (!eligibility.eligible) {
    releaseReservation(sessionId);
    return ShareResult::fail(ShareErrorCode::NOT_SUBSCRIBED,
                             eligibility.reason.value_or("Not eligible"));
  }

  CreateRoomRequest roomRequest;
  roomRequest.set_sessionname(session->name());
  bool hasPassword = request.password && !request.password->empty();
  if (hasPassword) {
    roomRequest.set_password(*request.password);
  }
  optional<int64_t> expiresInMs = request.expiresInMs;
  if (!expiresInMs) {
    expiresInMs = settings->get().autoExpireMs;
  }
  if (expiresInMs) {
    roomRequest.set_expiresinms(*expiresInMs);
  }

  RelayRoom room;
  try {
    room = createRoomWithRetry(roomRequest);
  } catch (const RelayError& re) {
    releaseReservation(sessionId);
    LOG(ERROR) << "Failed to create share room for " << sessionId << ": "
               << re.what();
    return ShareResult::fail(errorCodeForRelayStatus(re.getStatus()),
                             string("Failed to create share: ") + re.what());
  } catch (const std::exception& ex) {
    releaseReservation(sessionId);
    LOG(ERROR) << "Unreadable create response for " << sessionId << ": "
               << ex.what();
    return ShareResult::fail(ShareErrorCode::RELAY_ERROR,
                             string("Failed to create share: ") + ex.what());
  }

  shared_ptr<HostShare> share;
  bool sessionEnded = false;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    auto it = hostShares.find(sessionId);
    if (endedWhileStarting.erase(sessionId)) {
      sessionEnded = true;
      if (it != hostShares.end() && !it->second) {
        hostShares.erase(it);
      }
    } else if (!destroyed && it != hostShares.end() && !it->second) {
      weak_ptr<bool> alive = aliveToken;
      share.reset(new HostShare(context, *session, room, hasPassword,
                                [this, alive](HostShare* terminated) {
                                  if (alive.lock()) {
                                    forgetHostShare(terminated);
                                  }
                                }));
      it->second = share;
    }
  }
  if (!share) {
    // The session ended or destroy() ran while the room was being created
    auto relay = context.relay;
    string roomId = room.id();
    context.runInBackground([relay, roomId]() {
      try {
        relay->deleteRoom(roomId);
      } catch (const RelayError& re) {
        LOG(WARNING) << "Failed to delete abandoned room " << roomId << ": "
                     << re.what();
      }
    });
    if (sessionEnded) {
      return ShareResult::fail(ShareErrorCode::SESSION_NOT_RUNNING,
                               SESSION_ENDED_MESSAGE);
    }
    return ShareResult::fail(ShareErrorCode::UNKNOWN, SHUT_DOWN_MESSAGE);
  }

  share->start(expiresInMs);
  ShareStatus startedStatus = share->getStatus();
  if (startedStatus == SHARE_ERROR) {
    return ShareResult::fail(ShareErrorCode::NETWORK_ERROR,
                             "Could not connect to the relay");
  }
  if (startedStatus == SHARE_STOPPING || startedStatus == SHARE_STOPPED) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_RUNNING,
                             SESSION_ENDED_MESSAGE);
  }
  ShareInfo info = share->getInfo();
  if (shareInfo) {
    *shareInfo = info;
  }
  context.listener->onShareStarted(sessionId, info);
  return ShareResult::ok("Sharing started");
}

RelayRoom SharingManager::createRoomWithRetry(
    const CreateRoomRequest& request) {
  try {
    return context.relay->createRoom(request);
  } catch (const RelayError& re) {
    if (!roomLimit(re.getStatus(), re.getBody())) {
      throw;
    }
    LOG(WARNING) << "Relay room limit reached, cleaning up stale rooms";
    int cleaned = cleanupStaleShares();
    if (cleaned == 0) {
      throw;
    }
    LOG(INFO) << "Cleaned " << cleaned
              << " stale share room(s), retrying create";
  }
  return context.relay->createRoom(request);
}

void SharingManager::broadcastOutput(const string& sessionId,
                                     const string& chunk) {
  shared_ptr<HostShare> share = findHostShare(sessionId);
  if (share) {
    share->broadcastOutput(chunk);
  }
}

ShareResult SharingManager::stopShare(const string& sessionId) {
  shared_ptr<HostShare> share = findHostShare(sessionId);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_SHARED_MESSAGE);
  }
  share->stop();
  forgetHostShare(share.get());
  return ShareResult::ok("Sharing stopped");
}

ShareResult SharingManager::kickObserver(const string& sessionId,
                                         const string& observerId) {
  shared_ptr<HostShare> share = findHostShare(sessionId);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_SHARED_MESSAGE);
  }
  return share->kickObserver(observerId);
}

ShareResult SharingManager::grantControl(const string& sessionId,
                                         const string& observerId) {
  shared_ptr<HostShare> share = findHostShare(sessionId);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_SHARED_MESSAGE);
  }
  return share->grantControl(observerId);
}

ShareResult SharingManager::revokeControl(const string& sessionId,
                                          const string& observerId) {
  shared_ptr<HostShare> share = findHostShare(sessionId);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_SHARED_MESSAGE);
  }
  return share->revokeControl(observerId);
}

optional<ShareInfo> SharingManager::getShareInfo(const string& sessionId) {
  shared_ptr<HostShare> share = findHostShare(sessionId);
  if (!share) {
    return nullopt;
  }
  return share->getInfo();
}

vector<ShareInfo> SharingManager::listActiveShares() {
  vector<shared_ptr<HostShare>> shares;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    for (const auto& it : hostShares) {
      if (it.second) {
        shares.push_back(it.second);
      }
    }
  }
  vector<ShareInfo> infos;
  for (const auto& share : shares) {
    infos.push_back(share->getInfo());
  }
  return infos;
}

int SharingManager::cleanupStaleShares() {
  vector<string> rooms;
  try {
    rooms = context.relay->listRooms();
  } catch (const RelayError& re) {
    VLOG(1) << "Cannot list relay rooms: " << re.what();
    return 0;
  }

  set<string> localShareIds;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    for (const auto& it : hostShares) {
      if (it.second) {
        localShareIds.insert(it.second->getShareId());
      }
    }
  }

  int deleted = 0;
  for (const string& roomId : rooms) {
    if (localShareIds.count(roomId)) {
      continue;
    }
    try {
      context.relay->deleteRoom(roomId);
      deleted++;
    } catch (const RelayError& re) {
      LOG(WARNING) << "Failed to delete stale room " << roomId << ": "
                   << re.what();
    }
  }
  return deleted;
}

ShareResult SharingManager::joinShare(const JoinShareRequest& request) {
  optional<string> shareCode = extractShareCode(request.codeOrUrl);
  if (!shareCode) {
    return ShareResult::fail(ShareErrorCode::INVALID_CODE,
                             "Invalid share code or URL");
  }
  string displayName = request.displayName && !request.displayName->empty()
                           ? *request.displayName
                           : settings->get().displayName;

  shared_ptr<ObserverShare> share;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    if (destroyed) {
      return ShareResult::fail(ShareErrorCode::UNKNOWN, SHUT_DOWN_MESSAGE);
    }
    if (observerShares.find(*shareCode) != observerShares.end()) {
      return ShareResult::fail(ShareErrorCode::ALREADY_SHARED,
                               "Already joined this session");
    }
    if (context.apiKey.empty()) {
      return ShareResult::fail(ShareErrorCode::NO_API_KEY, NO_API_KEY_MESSAGE);
    }
    weak_ptr<bool> alive = aliveToken;
    share.reset(new ObserverShare(context, *shareCode, displayName,
                                  request.password,
                                  [this, alive](ObserverShare* terminated) {
                                    if (alive.lock()) {
                                      forgetObserverShare(terminated);
                                    }
                                  }));
    observerShares[*shareCode] = share;
  }

  ShareResult result = share->join();
  if (!result.success) {
    forgetObserverShare(share.get());
  }
  return result;
}

ShareResult SharingManager::requestControl(const string& shareCode) {
  shared_ptr<ObserverShare> share = findObserverShare(shareCode);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_JOINED_MESSAGE);
  }
  return share->requestControl();
}

ShareResult SharingManager::releaseControl(const string& shareCode) {
  shared_ptr<ObserverShare> share = findObserverShare(shareCode);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_JOINED_MESSAGE);
  }
  return share->releaseControl();
}

ShareResult SharingManager::sendInput(const string& shareCode,
                                      const string& text) {
  shared_ptr<ObserverShare> share = findObserverShare(shareCode);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_JOINED_MESSAGE);
  }
  return share->sendInput(text);
}

ShareResult SharingManager::leaveShare(const string& shareCode) {
  shared_ptr<ObserverShare> share = findObserverShare(shareCode);
  if (!share) {
    return ShareResult::fail(ShareErrorCode::SESSION_NOT_FOUND,
                             NOT_JOINED_MESSAGE);
  }
  share->leave();
  forgetObserverShare(share.get());
  return ShareResult::ok("Left session");
}

vector<JoinedShare> SharingManager::listJoinedShares() {
  vector<shared_ptr<ObserverShare>> shares;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    for (const auto& it : observerShares) {
      // Not reported until the relay has resolved the code
      if (it.second->getPhase() != ObserverShare::Phase::RESOLVING) {
        shares.push_back(it.second);
      }
    }
  }
  vector<JoinedShare> joined;
  for (const auto& share : shares) {
    joined.push_back(share->describe());
  }
  return joined;
}

SharingSettings SharingManager::getSettings() { return settings->get(); }

SharingSettings SharingManager::updateSettings(
    const SharingSettingsUpdate& changes) {
  return settings->update(changes);
}

void SharingManager::destroy() {
  map<string, shared_ptr<HostShare>> hosts;
  map<string, shared_ptr<ObserverShare>> observers;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    if (destroyed) {
      return;
    }
    destroyed = true;
    endedWhileStarting.clear();
    hosts.swap(hostShares);
    observers.swap(observerShares);
  }
  for (auto& it : hosts) {
    if (it.second) {
      it.second->shutdown();
    }
  }
  for (auto& it : observers) {
    it.second->leave();
  }
  LOG(INFO) << "Sharing shut down (" << hosts.size() << " hosted, "
            << observers.size() << " joined)";
}

void SharingManager::handleSessionEnd(const string& sessionId) {
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    auto it = hostShares.find(sessionId);
    if (it == hostShares.end()) {
      return;
    }
    if (!it->second) {
      LOG(INFO) << "Session " << sessionId
                << " ended while its share was starting";
      endedWhileStarting.insert(sessionId);
      return;
    }
  }
  LOG(INFO) << "Session " << sessionId << " ended, stopping its share";
  try {
    ShareResult result = stopShare(sessionId);
    if (!result.success) {
      LOG(WARNING) << "Auto-stop of " << sessionId
                   << " failed: " << result.message;
    }
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Auto-stop of " << sessionId << " threw: " << ex.what();
  }
}

shared_ptr<HostShare> SharingManager::findHostShare(const string& sessionId) {
  lock_guard<recursive_mutex> guard(managerMutex);
  auto it = hostShares.find(sessionId);
  if (it == hostShares.end()) {
    return shared_ptr<HostShare>();
  }
  return it->second;
}

shared_ptr<ObserverShare> SharingManager::findObserverShare(
    const string& shareCode) {
  lock_guard<recursive_mutex> guard(managerMutex);
  auto it = observerShares.find(normalizeShareCode(shareCode));
  if (it == observerShares.end()) {
    return shared_ptr<ObserverShare>();
  }
  return it->second;
}

void SharingManager::releaseReservation(const string& sessionId) {
  lock_guard<recursive_mutex> guard(managerMutex);
  endedWhileStarting.erase(sessionId);
  auto it = hostShares.find(sessionId);
  if (it != hostShares.end() && !it->second) {
    hostShares.erase(it);
  }
}

void SharingManager::forgetHostShare(HostShare* share) {
  shared_ptr<HostShare> removed;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    auto it = hostShares.find(share->getSessionId());
    if (it != hostShares.end() && it->second.get() == share) {
      removed = it->second;
      hostShares.erase(it);
    }
  }
}

void SharingManager::forgetObserverShare(ObserverShare* share) {
  shared_ptr<ObserverShare> removed;
  {
    lock_guard<recursive_mutex> guard(managerMutex);
    auto it = observerShares.find(share->getShareCode());
    if (it != observerShares.end() && it->second.get() == share) {
      removed = it->second;
      observerShares.erase(it);
    }
  }
}
}  // namespace ts
