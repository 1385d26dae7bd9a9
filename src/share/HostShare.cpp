#include "HostShare.hpp"

#include "ShareUrls.hpp"

namespace ts {
namespace {
const char* const HOST_STOPPED_MESSAGE = "Host ended the session";
const char* const EXPIRED_MESSAGE = "Share expired";
}  // namespace

HostShare::HostShare(const SharingContext& _context,
                     const SessionInfo& _session, const RelayRoom& room,
                     bool hasPassword, TerminatedCallback _onTerminated)
    : context(_context),
      sessionId(_session.id()),
      shareId(room.id()),
      shareCode(room.sharecode()),
      wsEndpoint(room.wsendpoint()),
      status(SHARE_CREATING),
      scrollback(_context.timings.scrollbackMaxLines),
      metadata(_session.has_currentmodel()
                   ? optional<string>(_session.currentmodel())
                   : nullopt,
               _session.has_providerid()
                   ? optional<string>(_session.providerid())
                   : nullopt),
      metadataTimer(NULL_TIMER_ID),
      pingTimer(NULL_TIMER_ID),
      pongTimer(NULL_TIMER_ID),
      expiryTimer(NULL_TIMER_ID),
      cleanedUp(false),
      onTerminated(_onTerminated) {
  info.set_shareid(shareId);
  info.set_sharecode(shareCode);
  info.set_shareurl(room.shareurl());
  info.set_sessionid(sessionId);
  info.set_status(SHARE_CREATING);
  info.set_createdat(nowIsoTimestamp());
  if (room.has_expiresat() && !room.expiresat().empty()) {
    info.set_expiresat(room.expiresat());
  }
  info.set_haspassword(hasPassword);
}

HostShare::~HostShare() {
  onTerminated = nullptr;
  cleanup(SHARE_STOPPED, false);
}

void HostShare::start(optional<int64_t> expiresInMs) {
  weak_ptr<HostShare> weak = shared_from_this();
  shared_ptr<ShareSocket> newSocket = context.socketFactory->create(
      buildHostSocketUrl(wsEndpoint, shareId, context.apiKey));
  newSocket->setOnOpen([weak]() {
    auto self = weak.lock();
    if (self) self->handleOpen();
  });
  newSocket->setOnMessage([weak](const string& data) {
    auto self = weak.lock();
    if (self) self->handleMessage(data);
  });
  newSocket->setOnClose([weak](int code, const string& reason) {
    auto self = weak.lock();
    if (self) self->handleClose(code, reason);
  });
  newSocket->setOnError([weak](const string& error) {
    auto self = weak.lock();
    if (self) {
      LOG(ERROR) << "Host socket error for session " << self->sessionId
                 << ": " << error;
    }
  });

  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp) {
      // Stopped before it started
      return;
    }
    socket = newSocket;
    metadataTimer = context.scheduler->scheduleRepeating(
        context.timings.metadataIntervalMs, [weak]() {
          auto self = weak.lock();
          if (self) self->sendMetadata();
        });
    pingTimer = context.scheduler->scheduleRepeating(
        context.timings.pingIntervalMs, [weak]() {
          auto self = weak.lock();
          if (self) self->sendPing();
        });
    if (expiresInMs && *expiresInMs > 0) {
      expiryTimer = context.scheduler->schedule(*expiresInMs, [weak]() {
        auto self = weak.lock();
        if (self) self->handleExpiry();
      });
    }
  }

  SessionProvider::Unsubscribe unsubscribe =
      context.sessionProvider->subscribeToOutput(
          sessionId, [weak](const string& chunk) {
            auto self = weak.lock();
            if (self) self->handleSessionOutput(chunk);
          });
  bool alreadyCleanedUp;
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    alreadyCleanedUp = cleanedUp;
    if (!cleanedUp) {
      unsubscribeOutput = unsubscribe;
    }
  }
  if (alreadyCleanedUp) {
    if (unsubscribe) unsubscribe();
    return;
  }

  LOG(INFO) << "Sharing session " << sessionId << " as " << shareCode
            << " (share " << shareId << ")";
  newSocket->open();
}

void HostShare::handleSessionOutput(const string& chunk) {
  lock_guard<recursive_mutex> guard(shareMutex);
  if (cleanedUp) {
    return;
  }
  metadata.observe(chunk);
  broadcastOutput(chunk);
}

void HostShare::broadcastOutput(const string& chunk) {
  lock_guard<recursive_mutex> guard(shareMutex);
  if (cleanedUp) {
    return;
  }
  scrollback.append(chunk);
  sendFrame(FrameType::TERMINAL_DATA, chunk);
}

void HostShare::stop() {
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp) {
      return;
    }
    status = SHARE_STOPPING;
    info.set_status(SHARE_STOPPING);
    json payload;
    payload["reason"] = stopReasonName(StopReason::HOST_STOPPED);
    payload["message"] = HOST_STOPPED_MESSAGE;
    if (!sendFrame(FrameType::SHARE_CLOSE, payload.dump())) {
      VLOG(1) << "Could not send ShareClose for " << shareId;
    }
  }

  try {
    context.relay->deleteRoom(shareId);
  } catch (const RelayError& re) {
    LOG(WARNING) << "Failed to delete share room " << shareId << ": "
                 << re.what();
  }

  if (cleanup(SHARE_STOPPED, false)) {
    notifyStopped(StopReason::HOST_STOPPED, HOST_STOPPED_MESSAGE);
  }
}

ShareResult HostShare::kickObserver(const string& observerId) {
  try {
    context.relay->kickObserver(shareId, observerId);
  } catch (const RelayError& re) {
    LOG(ERROR) << "Failed to kick observer " << observerId << " from "
               << shareId << ": " << re.what();
  }

  {
    lock_guard<recursive_mutex> guard(shareMutex);
    auto* observers = info.mutable_observers();
    for (int i = 0; i < observers->size(); i++) {
      if (observers->Get(i).observerid() == observerId) {
        observers->DeleteSubrange(i, 1);
        break;
      }
    }
  }
  context.listener->onObserverLeft(sessionId, observerId);
  return ShareResult::ok("Observer kicked");
}

ShareResult HostShare::grantControl(const string& observerId) {
  lock_guard<recursive_mutex> guard(shareMutex);
  ObserverInfo* target = findObserver(observerId);
  if (!target) {
    return ShareResult::fail(ShareErrorCode::UNKNOWN, "Observer not found");
  }
  for (auto& observer : *info.mutable_observers()) {
    if (observer.role() == HAS_CONTROL) {
      observer.set_role(READ_ONLY);
    }
  }
  target->set_role(HAS_CONTROL);

  json payload;
  payload["observerId"] = observerId;
  sendFrame(FrameType::CONTROL_GRANT, payload.dump());
  LOG(INFO) << "Granted control of " << sessionId << " to " << observerId;
  return ShareResult::ok("Control granted");
}

ShareResult HostShare::revokeControl(const string& observerId) {
  lock_guard<recursive_mutex> guard(shareMutex);
  ObserverInfo* target = findObserver(observerId);
  if (target) {
    target->set_role(READ_ONLY);
  }

  json payload;
  payload["observerId"] = observerId;
  payload["reason"] = "host-revoked";
  sendFrame(FrameType::CONTROL_REVOKE, payload.dump());
  return ShareResult::ok("Control revoked");
}

void HostShare::shutdown() {
  if (cleanup(SHARE_STOPPED, false)) {
    deleteRoomInBackground();
  }
}

ShareInfo HostShare::getInfo() {
  lock_guard<recursive_mutex> guard(shareMutex);
  ShareInfo copy = info;
  copy.set_status(status);
  return copy;
}

void HostShare::handleOpen() {
  lock_guard<recursive_mutex> guard(shareMutex);
  if (cleanedUp) {
    return;
  }
  if (status == SHARE_CREATING) {
    status = SHARE_ACTIVE;
    info.set_status(SHARE_ACTIVE);
  }
  LOG(INFO) << "Relay socket open for share " << shareId;
}

void HostShare::handleMessage(const string& data) {
  optional<Frame> frame = decodeFrame(data);
  if (!frame) {
    VLOG(1) << "Dropping short frame (" << data.length() << " bytes) on share "
            << shareId;
    return;
  }
  if (!frame->isKnownType()) {
    VLOG(1) << "Ignoring unknown frame type " << int(frame->getTypeByte());
    return;
  }
  handleFrame(*frame);
}

void HostShare::handleFrame(const Frame& frame) {
  switch (frame.getType()) {
    case FrameType::OBSERVER_ANNOUNCE:
      handleObserverAnnounce(frame);
      return;
    case FrameType::CONTROL_REQUEST:
      handleControlRequest(frame);
      return;
    case FrameType::TERMINAL_INPUT:
      handleTerminalInput(frame);
      return;
    case FrameType::CONTROL_REVOKE:
      handleControlRelease(frame);
      return;
    case FrameType::PONG: {
      lock_guard<recursive_mutex> guard(shareMutex);
      context.scheduler->cancel(pongTimer);
      pongTimer = NULL_TIMER_ID;
      return;
    }
    case FrameType::PING: {
      lock_guard<recursive_mutex> guard(shareMutex);
      sendFrame(FrameType::PONG);
      return;
    }
    case FrameType::TERMINAL_DATA:
    case FrameType::METADATA:
    case FrameType::SCROLLBACK:
    case FrameType::CONTROL_GRANT:
    case FrameType::OBSERVER_LIST:
    case FrameType::SHARE_CLOSE:
      // Only hosts send these
      VLOG(1) << "Ignoring " << frameTypeName(frame.getType())
              << " frame on host share " << shareId;
      return;
  }
}

void HostShare::handleObserverAnnounce(const Frame& frame) {
  json payload;
  if (!parseJsonObject(frame.getPayload(), &payload)) {
    LOG(WARNING) << "Malformed ObserverAnnounce on share " << shareId;
    return;
  }
  string observerId = jsonString(payload, "observerId");
  if (observerId.empty()) {
    LOG(WARNING) << "ObserverAnnounce without an observer id on " << shareId;
    return;
  }
  string displayName = jsonString(payload, "displayName", "Observer");

  bool isNew = false;
  ObserverInfo joined;
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp) {
      return;
    }
    ObserverInfo* existing = findObserver(observerId);
    if (existing) {
      existing->set_displayname(displayName);
      joined = *existing;
    } else {
      ObserverInfo* observer = info.add_observers();
      observer->set_observerid(observerId);
      observer->set_displayname(displayName);
      observer->set_role(READ_ONLY);
      observer->set_joinedat(nowIsoTimestamp());
      joined = *observer;
      isNew = true;
    }

    try {
      optional<string> snapshot = scrollback.snapshot();
      if (snapshot) {
        sendFrame(FrameType::SCROLLBACK, *snapshot);
      }
    } catch (const std::runtime_error& ex) {
      LOG(ERROR) << "Failed to compress scrollback for " << shareId << ": "
                 << ex.what();
    }
    sendFrame(FrameType::OBSERVER_LIST, observerListPayload());
  }

  if (isNew) {
    LOG(INFO) << "Observer " << displayName << " (" << observerId
              << ") joined share " << shareId;
    context.listener->onObserverJoined(sessionId, joined);
  }
}

void HostShare::handleControlRequest(const Frame& frame) {
  json payload;
  if (!parseJsonObject(frame.getPayload(), &payload)) {
    LOG(WARNING) << "Malformed ControlRequest on share " << shareId;
    return;
  }
  string observerId = jsonString(payload, "observerId");
  string displayName = jsonString(payload, "displayName");
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp) {
      return;
    }
    ObserverInfo* observer = findObserver(observerId);
    if (observer) {
      observer->set_role(REQUESTING);
    }
  }
  context.listener->onControlRequested(sessionId, observerId, displayName);
}

void HostShare::handleTerminalInput(const Frame& frame) {
  string input;
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp) {
      return;
    }
    bool anyoneHasControl = false;
    for (const auto& observer : info.observers()) {
      if (observer.role() == HAS_CONTROL) {
        anyoneHasControl = true;
        break;
      }
    }
    if (!anyoneHasControl) {
      VLOG(2) << "Dropping input on " << shareId << ": nobody has control";
      return;
    }
    input = frame.getPayload();
  }

  // Observers may never interrupt the session
  input.erase(remove(input.begin(), input.end(), INTERRUPT_BYTE), input.end());
  if (input.empty()) {
    return;
  }
  try {
    context.sessionProvider->sendInput(sessionId, input);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to forward input to session " << sessionId << ": "
               << ex.what();
  }
}

void HostShare::handleControlRelease(const Frame& frame) {
  json payload;
  if (!parseJsonObject(frame.getPayload(), &payload)) {
    LOG(WARNING) << "Malformed ControlRevoke on share " << shareId;
    return;
  }
  if (jsonString(payload, "reason") != "observer-released") {
    return;
  }
  lock_guard<recursive_mutex> guard(shareMutex);
  ObserverInfo* observer = findObserver(jsonString(payload, "observerId"));
  if (observer && observer->role() != READ_ONLY) {
    VLOG(1) << "Observer " << observer->observerid() << " released control";
    observer->set_role(READ_ONLY);
  }
}

void HostShare::sendMetadata() {
  lock_guard<recursive_mutex> guard(shareMutex);
  if (cleanedUp || !socket || !socket->isOpen()) {
    return;
  }
  sendFrame(FrameType::METADATA,
            metadata.takeSnapshot(nowUnixMillis()).dump());
}

void HostShare::sendPing() {
  lock_guard<recursive_mutex> guard(shareMutex);
  if (cleanedUp || !sendFrame(FrameType::PING)) {
    return;
  }
  context.scheduler->cancel(pongTimer);
  weak_ptr<HostShare> weak = shared_from_this();
  pongTimer =
      context.scheduler->schedule(context.timings.pongTimeoutMs, [weak]() {
        auto self = weak.lock();
        if (self) self->handlePongTimeout();
      });
}

void HostShare::handlePongTimeout() {
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp || status == SHARE_STOPPING) {
      return;
    }
    pongTimer = NULL_TIMER_ID;
    LOG(WARNING) << "Pong timeout on share " << shareId
                 << ", terminating relay socket";
  }
  if (cleanup(SHARE_ERROR, true)) {
    deleteRoomInBackground();
    notifyStopped(StopReason::ERROR, "Relay stopped answering keepalives");
  }
}

void HostShare::handleExpiry() {
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp || status == SHARE_STOPPING) {
      return;
    }
    expiryTimer = NULL_TIMER_ID;
    status = SHARE_STOPPING;
    info.set_status(SHARE_STOPPING);
    json payload;
    payload["reason"] = stopReasonName(StopReason::EXPIRED);
    payload["message"] = EXPIRED_MESSAGE;
    sendFrame(FrameType::SHARE_CLOSE, payload.dump());
    LOG(INFO) << "Share " << shareId << " expired";
  }
  if (cleanup(SHARE_STOPPED, false)) {
    deleteRoomInBackground();
    notifyStopped(StopReason::EXPIRED, EXPIRED_MESSAGE);
  }
}

void HostShare::handleClose(int code, const string& reason) {
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp || status == SHARE_STOPPING) {
      return;
    }
    LOG(WARNING) << "Relay socket for share " << shareId
                 << " closed unexpectedly (" << code << " " << reason << ")";
  }
  if (cleanup(SHARE_ERROR, false)) {
    deleteRoomInBackground();
    notifyStopped(StopReason::ERROR, "Connection to relay lost");
  }
}

bool HostShare::sendFrame(FrameType type, const string& payload) {
  if (!socket || !socket->isOpen()) {
    return false;
  }
  return socket->send(encodeFrame(type, payload));
}

string HostShare::observerListPayload() {
  json observers = json::array();
  for (const auto& observer : info.observers()) {
    json entry;
    entry["observerId"] = observer.observerid();
    entry["displayName"] = observer.displayname();
    entry["role"] = observerRoleName(observer.role());
    entry["joinedAt"] = observer.joinedat();
    observers.push_back(entry);
  }
  json payload;
  payload["observers"] = observers;
  return payload.dump();
}

ObserverInfo* HostShare::findObserver(const string& observerId) {
  for (auto& observer : *info.mutable_observers()) {
    if (observer.observerid() == observerId) {
      return &observer;
    }
  }
  return NULL;
}

bool HostShare::cleanup(ShareStatus finalStatus, bool terminateSocket) {
  shared_ptr<ShareSocket> oldSocket;
  SessionProvider::Unsubscribe unsubscribe;
  vector<TimerId> timers;
  {
    lock_guard<recursive_mutex> guard(shareMutex);
    if (cleanedUp) {
      return false;
    }
    cleanedUp = true;
    status = finalStatus;
    info.set_status(finalStatus);
    timers = {metadataTimer, pingTimer, pongTimer, expiryTimer};
    metadataTimer = pingTimer = pongTimer = expiryTimer = NULL_TIMER_ID;
    oldSocket = socket;
    socket.reset();
    unsubscribe = unsubscribeOutput;
    unsubscribeOutput = nullptr;
  }

  for (TimerId id : timers) {
    context.scheduler->cancel(id);
  }
  if (unsubscribe) {
    unsubscribe();
  }
  if (oldSocket) {
    oldSocket->clearHandlers();
    if (terminateSocket) {
      oldSocket->terminate();
    } else {
      oldSocket->close(NORMAL_CLOSURE);
    }
  }
  VLOG(1) << "Cleaned up share " << shareId << " for session " << sessionId
          << " (" << shareStatusName(finalStatus) << ")";

  if (onTerminated) {
    onTerminated(this);
  }
  return true;
}

void HostShare::deleteRoomInBackground() {
  auto relay = context.relay;
  string id = shareId;
  context.runInBackground([relay, id]() {
    try {
      relay->deleteRoom(id);
    } catch (const RelayError& re) {
      VLOG(1) << "Background delete of share room " << id
              << " failed: " << re.what();
    }
  });
}

void HostShare::notifyStopped(StopReason reason, const string& message) {
  LOG(INFO) << "Share " << shareId << " stopped: " << stopReasonName(reason);
  context.listener->onShareStopped(sessionId, shareCode, reason, message);
}
}  // namespace ts
