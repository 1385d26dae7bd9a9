#include "ObserverShare.hpp"

#include "Compression.hpp"
#include "ShareUrls.hpp"

namespace ts {
namespace {
const char* const RECONNECT_EXHAUSTED_MESSAGE =
    "Connection lost after maximum reconnect attempts";

StopReason parseStopReason(const string& reason) {
  if (reason == "expired") {
    return StopReason::EXPIRED;
  }
  if (reason == "error") {
    return StopReason::ERROR;
  }
  return StopReason::HOST_STOPPED;
}
}  // namespace

ObserverShare::ObserverShare(const SharingContext& _context,
                             const string& _shareCode,
                             const string& _displayName,
                             const optional<string>& _password,
                             TerminatedCallback _onTerminated)
    : context(_context),
      shareCode(_shareCode),
      observerId(sole::uuid4().str()),
      displayName(_displayName),
      password(_password),
      phase(Phase::RESOLVING),
      role(READ_ONLY),
      reconnectAttempts(0),
      reconnectTimer(NULL_TIMER_ID),
      onTerminated(_onTerminated) {}

ObserverShare::~ObserverShare() {
  onTerminated = nullptr;
  close();
}

ShareResult ObserverShare::join() {
  ResolvedShare resolved;
  try {
    resolved = context.relay->resolveCode(shareCode);
  } catch (const RelayError& re) {
    LOG(WARNING) << "Could not resolve share " << shareCode << ": "
                 << re.what();
    close();
    ShareErrorCode code = errorCodeForRelayStatus(re.getStatus());
    if (code == ShareErrorCode::INVALID_CODE) {
      return ShareResult::fail(code, "Share code not found");
    }
    if (code == ShareErrorCode::SESSION_EXPIRED) {
      return ShareResult::fail(code, "Share has expired");
    }
    return ShareResult::fail(code,
                             string("Failed to resolve share: ") + re.what());
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Unreadable resolve response for " << shareCode << ": "
               << ex.what();
    close();
    return ShareResult::fail(ShareErrorCode::RELAY_ERROR,
                             string("Failed to resolve share: ") + ex.what());
  }

  if (resolved.requirespassword() && (!password || password->empty())) {
    close();
    return ShareResult::fail(ShareErrorCode::PASSWORD_REQUIRED,
                             "Password required");
  }

  {
    lock_guard<recursive_mutex> guard(observerMutex);
    if (phase == Phase::CLOSED) {
      return ShareResult::fail(ShareErrorCode::UNKNOWN,
                               "Left the share while joining");
    }
    shareId = resolved.shareid();
    sessionName = resolved.sessionname();
    wsEndpoint = resolved.wsendpoint();
    phase = Phase::CONNECTING;
  }
  LOG(INFO) << "Joining share " << shareCode << " (" << shareId << ") as "
            << observerId;
  connectSocket();
  return ShareResult::ok("Joined session");
}

void ObserverShare::connectSocket() {
  weak_ptr<ObserverShare> weak = shared_from_this();
  shared_ptr<ShareSocket> newSocket;
  {
    lock_guard<recursive_mutex> guard(observerMutex);
    if (phase == Phase::CLOSED) {
      return;
    }
    reconnectTimer = NULL_TIMER_ID;
    newSocket = context.socketFactory->create(buildObserverSocketUrl(
        wsEndpoint, shareId, context.apiKey, password));
    ShareSocket* source = newSocket.get();
    newSocket->setOnOpen([weak, source]() {
      auto self = weak.lock();
      if (self) self->handleOpen(source);
    });
    newSocket->setOnMessage([weak](const string& data) {
      auto self = weak.lock();
      if (self) self->handleMessage(data);
    });
    newSocket->setOnClose([weak, source](int code, const string& reason) {
      auto self = weak.lock();
      if (self) self->handleClose(source, code, reason);
    });
    newSocket->setOnError([weak](const string& error) {
      auto self = weak.lock();
      if (self) {
        LOG(ERROR) << "Observer socket error for " << self->shareCode << ": "
                   << error;
      }
    });
    socket = newSocket;
  }
  newSocket->open();
}

void ObserverShare::handleOpen(ShareSocket* source) {
  lock_guard<recursive_mutex> guard(observerMutex);
  if (phase == Phase::CLOSED || source != socket.get()) {
    return;
  }
  reconnectAttempts = 0;
  phase = Phase::ACTIVE;
  json payload;
  payload["observerId"] = observerId;
  payload["displayName"] = displayName;
  sendFrame(FrameType::OBSERVER_ANNOUNCE, payload.dump());
  LOG(INFO) << "Connected to share " << shareCode;
}

void ObserverShare::handleClose(ShareSocket* source, int code,
                                const string& reason) {
  {
    lock_guard<recursive_mutex> guard(observerMutex);
    if (phase == Phase::CLOSED || source != socket.get()) {
      return;
    }
    socket.reset();
    if (code != NORMAL_CLOSURE &&
        reconnectAttempts < context.timings.maxReconnectAttempts) {
      int64_t delayMs = context.timings.reconnectDelay(reconnectAttempts);
      reconnectAttempts++;
      phase = Phase::RECONNECTING;
      LOG(INFO) << "Observer socket for " << shareCode << " closed (" << code
                << "), reconnecting in " << delayMs << "ms (attempt "
                << reconnectAttempts << "/"
                << context.timings.maxReconnectAttempts << ")";
      context.scheduler->cancel(reconnectTimer);
      weak_ptr<ObserverShare> weak = shared_from_this();
      reconnectTimer = context.scheduler->schedule(delayMs, [weak]() {
        auto self = weak.lock();
        if (self) self->connectSocket();
      });
      return;
    }
  }

  if (!close()) {
    return;
  }
  if (code == NORMAL_CLOSURE) {
    LOG(INFO) << "Share " << shareCode << " closed by the relay: " << reason;
    context.listener->onJoinedShareStopped(shareCode, StopReason::HOST_STOPPED,
                                           reason);
  } else {
    LOG(ERROR) << "Giving up on share " << shareCode << " after "
               << context.timings.maxReconnectAttempts << " reconnect attempts";
    context.listener->onJoinedShareStopped(shareCode, StopReason::ERROR,
                                           RECONNECT_EXHAUSTED_MESSAGE);
  }
}

void ObserverShare::handleMessage(const string& data) {
  optional<Frame> frame = decodeFrame(data);
  if (!frame) {
    VLOG(1) << "Dropping short frame on " << shareCode;
    return;
  }
  if (!frame->isKnownType()) {
    VLOG(1) << "Ignoring unknown frame type " << int(frame->getTypeByte());
    return;
  }
  if (phase == Phase::CLOSED) {
    return;
  }
  handleFrame(*frame);
}

void ObserverShare::handleFrame(const Frame& frame) {
  switch (frame.getType()) {
    case FrameType::TERMINAL_DATA:
      context.listener->onShareOutput(shareCode, frame.getPayload());
      return;
    case FrameType::SCROLLBACK: {
      string text;
      try {
        text = gzipDecompress(frame.getPayload());
      } catch (const std::runtime_error& ex) {
        LOG(ERROR) << "Failed to decompress scrollback for " << shareCode
                   << ": " << ex.what();
        return;
      }
      context.listener->onShareOutput(shareCode, text);
      return;
    }
    case FrameType::METADATA: {
      json metadata;
      if (!parseJsonObject(frame.getPayload(), &metadata)) {
        LOG(WARNING) << "Malformed Metadata frame on " << shareCode;
        return;
      }
      context.listener->onShareMetadata(shareCode, metadata);
      return;
    }
    case FrameType::CONTROL_GRANT:
      handleControlGrant(frame);
      return;
    case FrameType::CONTROL_REVOKE:
      handleControlRevoke(frame);
      return;
    case FrameType::SHARE_CLOSE:
      handleShareClose(frame);
      return;
    case FrameType::PING: {
      lock_guard<recursive_mutex> guard(observerMutex);
      sendFrame(FrameType::PONG);
      return;
    }
    case FrameType::PONG:
      return;
    case FrameType::OBSERVER_LIST:
      VLOG(1) << "Observer list for " << shareCode << ": "
              << frame.getPayload();
      return;
    case FrameType::TERMINAL_INPUT:
    case FrameType::CONTROL_REQUEST:
    case FrameType::OBSERVER_ANNOUNCE:
      // Only observers send these
      return;
  }
}

void ObserverShare::handleControlGrant(const Frame& frame) {
  json payload;
  string target;
  if (parseJsonObject(frame.getPayload(), &payload)) {
    target = jsonString(payload, "observerId");
  }

  bool granted = false;
  bool lostControl = false;
  {
    lock_guard<recursive_mutex> guard(observerMutex);
    if (target.empty() || target == observerId) {
      role = HAS_CONTROL;
      granted = true;
    } else if (role == HAS_CONTROL) {
      // Control is exclusive, so a grant to someone else ends ours.
      role = READ_ONLY;
      lostControl = true;
    }
  }
  if (granted) {
    LOG(INFO) << "Control granted on " << shareCode;
    context.listener->onControlGranted(shareCode);
  } else if (lostControl) {
    context.listener->onControlRevoked(shareCode, "host-revoked");
  }
}

void ObserverShare::handleControlRevoke(const Frame& frame) {
  json payload;
  string reason = "host-revoked";
  if (parseJsonObject(frame.getPayload(), &payload)) {
    string target = jsonString(payload, "observerId");
    if (!target.empty() && target != observerId) {
      return;
    }
    reason = jsonString(payload, "reason", reason);
  }
  {
    lock_guard<recursive_mutex> guard(observerMutex);
    role = READ_ONLY;
  }
  context.listener->onControlRevoked(shareCode, reason);
}

void ObserverShare::handleShareClose(const Frame& frame) {
  json payload;
  StopReason reason = StopReason::HOST_STOPPED;
  string message;
  if (parseJsonObject(frame.getPayload(), &payload)) {
    reason = parseStopReason(jsonString(payload, "reason", "host-stopped"));
    message = jsonString(payload, "message");
  }
  if (close()) {
    LOG(INFO) << "Share " << shareCode << " ended: " << stopReasonName(reason);
    context.listener->onJoinedShareStopped(shareCode, reason, message);
  }
}

ShareResult ObserverShare::requestControl() {
  lock_guard<recursive_mutex> guard(observerMutex);
  if (!socket || !socket->isOpen()) {
    return ShareResult::fail(ShareErrorCode::NETWORK_ERROR,
                             "WebSocket not connected");
  }
  role = REQUESTING;
  json payload;
  payload["observerId"] = observerId;
  payload["displayName"] = displayName;
  sendFrame(FrameType::CONTROL_REQUEST, payload.dump());
  return ShareResult::ok("Control requested");
}

ShareResult ObserverShare::releaseControl() {
  lock_guard<recursive_mutex> guard(observerMutex);
  if (!socket || !socket->isOpen()) {
    return ShareResult::fail(ShareErrorCode::NETWORK_ERROR,
                             "WebSocket not connected");
  }
  role = READ_ONLY;
  json payload;
  payload["observerId"] = observerId;
  payload["reason"] = "observer-released";
  sendFrame(FrameType::CONTROL_REVOKE, payload.dump());
  return ShareResult::ok("Control released");
}

ShareResult ObserverShare::sendInput(const string& text) {
  lock_guard<recursive_mutex> guard(observerMutex);
  if (role != HAS_CONTROL) {
    return ShareResult::fail(ShareErrorCode::UNKNOWN,
                             "Observer does not have control");
  }
  if (!sendFrame(FrameType::TERMINAL_INPUT, text)) {
    return ShareResult::fail(ShareErrorCode::NETWORK_ERROR,
                             "WebSocket not connected");
  }
  return ShareResult::ok();
}

void ObserverShare::leave() { close(); }

JoinedShare ObserverShare::describe() {
  lock_guard<recursive_mutex> guard(observerMutex);
  return JoinedShare{shareCode, shareId, sessionName, role};
}

ObserverRole ObserverShare::getRole() {
  lock_guard<recursive_mutex> guard(observerMutex);
  return role;
}

int ObserverShare::getReconnectAttempts() {
  lock_guard<recursive_mutex> guard(observerMutex);
  return reconnectAttempts;
}

bool ObserverShare::sendFrame(FrameType type, const string& payload) {
  if (!socket || !socket->isOpen()) {
    return false;
  }
  return socket->send(encodeFrame(type, payload));
}

bool ObserverShare::close() {
  shared_ptr<ShareSocket> oldSocket;
  TimerId timer;
  {
    lock_guard<recursive_mutex> guard(observerMutex);
    if (phase == Phase::CLOSED) {
      return false;
    }
    phase = Phase::CLOSED;
    timer = reconnectTimer;
    reconnectTimer = NULL_TIMER_ID;
    oldSocket = socket;
    socket.reset();
  }
  context.scheduler->cancel(timer);
  if (oldSocket) {
    oldSocket->clearHandlers();
    oldSocket->close(NORMAL_CLOSURE);
  }
  if (onTerminated) {
    onTerminated(this);
  }
  return true;
}
}  // namespace ts
