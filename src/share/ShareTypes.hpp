#ifndef __TS_SHARE_TYPES__
#define __TS_SHARE_TYPES__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Failure categories reported by the sharing operations.
 */
enum class ShareErrorCode {
  SESSION_NOT_FOUND,
  SESSION_NOT_RUNNING,
  ALREADY_SHARED,
  INVALID_CODE,
  PASSWORD_REQUIRED,
  SESSION_EXPIRED,
  NETWORK_ERROR,
  NO_API_KEY,
  INVALID_API_KEY,
  NOT_SUBSCRIBED,
  RELAY_ERROR,
  UNKNOWN,
};

const char* shareErrorCodeName(ShareErrorCode code);

/**
 * @brief Maps a failed relay call to an error code: 401/403 invalid api key,
 * 404 invalid code, 410 expired, 0 (no response) network error, anything else
 * a relay error.
 */
ShareErrorCode errorCodeForRelayStatus(int status);

/**
 * @brief Outcome of a public sharing operation. Operations report failures
 * here instead of throwing.
 */
struct ShareResult {
  bool success;
  string message;
  optional<ShareErrorCode> errorCode;

  static ShareResult ok(const string& message = "") {
    return ShareResult{true, message, nullopt};
  }
  static ShareResult fail(ShareErrorCode code, const string& message) {
    return ShareResult{false, message, code};
  }
};

/** @brief Why a share ended, as seen by listeners. */
enum class StopReason { HOST_STOPPED, ERROR, EXPIRED };

const char* stopReasonName(StopReason reason);

/** @brief Wire names used in ObserverList payloads ("read-only", ...). */
const char* observerRoleName(ObserverRole role);

/** @brief Lower case name of a share status, for logs and the CLI. */
const char* shareStatusName(ShareStatus status);

/**
 * @brief Timing knobs of the sharing engine. Defaults are the protocol
 * values; tests shrink them.
 */
struct SharingTimings {
  int64_t metadataIntervalMs = METADATA_INTERVAL_MS;
  int64_t pingIntervalMs = PING_INTERVAL_MS;
  int64_t pongTimeoutMs = PONG_TIMEOUT_MS;
  vector<int64_t> reconnectDelaysMs = {1000, 2000, 4000, 8000, 30000};
  int maxReconnectAttempts = MAX_RECONNECT_ATTEMPTS;
  size_t scrollbackMaxLines = SCROLLBACK_MAX_LINES;

  /** @brief Backoff delay for the given attempt, clamped to the last entry. */
  int64_t reconnectDelay(int attempt) const {
    if (reconnectDelaysMs.empty()) {
      return 0;
    }
    size_t index = min(size_t(max(attempt, 0)), reconnectDelaysMs.size() - 1);
    return reconnectDelaysMs[index];
  }
};

/**
 * @brief Decides whether a failed room creation means the account hit its
 * concurrent room limit, which triggers an orphan cleanup and one retry.
 * Arguments are the HTTP status and the response body.
 */
typedef function<bool(int, const string&)> RoomLimitPredicate;

/** @brief Matches the relay's TIER_LIMIT_EXCEEDED error body. */
bool defaultRoomLimitPredicate(int status, const string& body);

/** @brief Plans that may host shares. */
bool isSharingPlan(const string& plan);

/** @brief Result of checkEligibility(). */
struct Eligibility {
  bool eligible;
  optional<string> plan;
  optional<string> reason;
};

/** @brief One observer-side subscription, as reported to callers. */
struct JoinedShare {
  string shareCode;
  string shareId;
  string sessionName;
  ObserverRole role;
};
}  // namespace ts

#endif  // __TS_SHARE_TYPES__
