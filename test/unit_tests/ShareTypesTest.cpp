#include "ShareTypes.hpp"

#include "TestHeaders.hpp"

using namespace ts;

TEST_CASE("Relay status mapping", "[ShareTypes]") {
  REQUIRE(errorCodeForRelayStatus(0) == ShareErrorCode::NETWORK_ERROR);
  REQUIRE(errorCodeForRelayStatus(401) == ShareErrorCode::INVALID_API_KEY);
  REQUIRE(errorCodeForRelayStatus(403) == ShareErrorCode::INVALID_API_KEY);
  REQUIRE(errorCodeForRelayStatus(404) == ShareErrorCode::INVALID_CODE);
  REQUIRE(errorCodeForRelayStatus(410) == ShareErrorCode::SESSION_EXPIRED);
  REQUIRE(errorCodeForRelayStatus(500) == ShareErrorCode::RELAY_ERROR);
  REQUIRE(errorCodeForRelayStatus(429) == ShareErrorCode::RELAY_ERROR);
  REQUIRE(string(shareErrorCodeName(ShareErrorCode::NOT_SUBSCRIBED)) ==
          "NOT_SUBSCRIBED");
}

TEST_CASE("Reconnect backoff", "[ShareTypes]") {
  SharingTimings timings;
  REQUIRE(timings.reconnectDelay(0) == 1000);
  REQUIRE(timings.reconnectDelay(1) == 2000);
  REQUIRE(timings.reconnectDelay(3) == 8000);
  REQUIRE(timings.reconnectDelay(4) == 30000);
  // Past the table the last delay repeats
  REQUIRE(timings.reconnectDelay(9) == 30000);
  REQUIRE(timings.reconnectDelay(-1) == 1000);

  timings.reconnectDelaysMs.clear();
  REQUIRE(timings.reconnectDelay(2) == 0);
}

TEST_CASE("Room limit detection", "[ShareTypes]") {
  REQUIRE(defaultRoomLimitPredicate(
      403, "{\"error\":{\"code\":\"TIER_LIMIT_EXCEEDED\"}}"));
  REQUIRE_FALSE(defaultRoomLimitPredicate(403, "{\"error\":\"forbidden\"}"));
  REQUIRE_FALSE(defaultRoomLimitPredicate(500, ""));
}

TEST_CASE("Sharing plans", "[ShareTypes]") {
  REQUIRE(isSharingPlan("pro"));
  REQUIRE(isSharingPlan("team"));
  REQUIRE(isSharingPlan("enterprise"));
  REQUIRE_FALSE(isSharingPlan("free"));
  REQUIRE_FALSE(isSharingPlan(""));
  REQUIRE_FALSE(isSharingPlan("Pro"));
}

TEST_CASE("Role and reason names", "[ShareTypes]") {
  REQUIRE(string(observerRoleName(READ_ONLY)) == "read-only");
  REQUIRE(string(observerRoleName(REQUESTING)) == "requesting");
  REQUIRE(string(observerRoleName(HAS_CONTROL)) == "has-control");

  REQUIRE(string(stopReasonName(StopReason::HOST_STOPPED)) == "host-stopped");
  REQUIRE(string(stopReasonName(StopReason::EXPIRED)) == "expired");
  REQUIRE(string(shareStatusName(SHARE_ACTIVE)) == "active");
}
