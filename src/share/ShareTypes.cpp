#include "ShareTypes.hpp"

namespace ts {
const char* shareErrorCodeName(ShareErrorCode code) {
  switch (code) {
    case ShareErrorCode::SESSION_NOT_FOUND:
      return "SESSION_NOT_FOUND";
    case ShareErrorCode::SESSION_NOT_RUNNING:
      return "SESSION_NOT_RUNNING";
    case ShareErrorCode::ALREADY_SHARED:
      return "ALREADY_SHARED";
    case ShareErrorCode::INVALID_CODE:
      return "INVALID_CODE";
    case ShareErrorCode::PASSWORD_REQUIRED:
      return "PASSWORD_REQUIRED";
    case ShareErrorCode::SESSION_EXPIRED:
      return "SESSION_EXPIRED";
    case ShareErrorCode::NETWORK_ERROR:
      return "NETWORK_ERROR";
    case ShareErrorCode::NO_API_KEY:
      return "NO_API_KEY";
    case ShareErrorCode::INVALID_API_KEY:
      return "INVALID_API_KEY";
    case ShareErrorCode::NOT_SUBSCRIBED:
      return "NOT_SUBSCRIBED";
    case ShareErrorCode::RELAY_ERROR:
      return "RELAY_ERROR";
    case ShareErrorCode::UNKNOWN:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

ShareErrorCode errorCodeForRelayStatus(int status) {
  switch (status) {
    case 0:
      return ShareErrorCode::NETWORK_ERROR;
    case 401:
    case 403:
      return ShareErrorCode::INVALID_API_KEY;
    case 404:
      return ShareErrorCode::INVALID_CODE;
    case 410:
      return ShareErrorCode::SESSION_EXPIRED;
    default:
      return ShareErrorCode::RELAY_ERROR;
  }
}

const char* stopReasonName(StopReason reason) {
  switch (reason) {
    case StopReason::HOST_STOPPED:
      return "host-stopped";
    case StopReason::ERROR:
      return "error";
    case StopReason::EXPIRED:
      return "expired";
  }
  return "error";
}

const char* observerRoleName(ObserverRole role) {
  switch (role) {
    case READ_ONLY:
      return "read-only";
    case REQUESTING:
      return "requesting";
    case HAS_CONTROL:
      return "has-control";
  }
  return "read-only";
}


const char* shareStatusName(ShareStatus status) {
  switch (status) {
    case SHARE_CREATING:
      return "creating";
    case SHARE_ACTIVE:
      return "active";
    case SHARE_STOPPING:
      return "stopping";
    case SHARE_STOPPED:
      return "stopped";
    case SHARE_ERROR:
      return "error";
  }
  return "error";
}

bool defaultRoomLimitPredicate(int status, const string& body) {
  return body.find("TIER_LIMIT_EXCEEDED") != string::npos;
}

bool isSharingPlan(const string& plan) {
  return plan == "pro" || plan == "team" || plan == "enterprise";
}
}  // namespace ts
