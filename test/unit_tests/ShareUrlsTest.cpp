#include "ShareUrls.hpp"

#include "TestHeaders.hpp"

using namespace ts;

TEST_CASE("Share code extraction", "[ShareUrls]") {
  SECTION("Raw codes are upper-cased") {
    REQUIRE(extractShareCode("abc123") == optional<string>("ABC123"));
    REQUIRE(extractShareCode("  XK42  ") == optional<string>("XK42"));
  }

  SECTION("Length limits") {
    REQUIRE_FALSE(extractShareCode("abc"));
    REQUIRE(extractShareCode("abcd"));
    REQUIRE(extractShareCode("abcdefghij"));
    REQUIRE_FALSE(extractShareCode("abcdefghijk"));
  }

  SECTION("Only letters and digits") {
    REQUIRE_FALSE(extractShareCode("ab-cd"));
    REQUIRE_FALSE(extractShareCode("ab cd"));
    REQUIRE_FALSE(extractShareCode(""));
    REQUIRE_FALSE(extractShareCode("   "));
  }

  SECTION("Share urls use the last path segment") {
    REQUIRE(extractShareCode("https://share.example.com/s/abcd12") ==
            optional<string>("ABCD12"));
    REQUIRE(extractShareCode("https://share.example.com/s/abcd12/") ==
            optional<string>("ABCD12"));
    REQUIRE(extractShareCode("http://localhost:8080/join/Q1W2E3?ref=x#top") ==
            optional<string>("Q1W2E3"));
  }

  SECTION("Deep links never use the host as the code") {
    REQUIRE(extractShareCode("termshare://join/XYZ789") ==
            optional<string>("XYZ789"));
    REQUIRE_FALSE(extractShareCode("termshare://ABCD"));
    REQUIRE_FALSE(extractShareCode("https://share.example.com"));
  }

  SECTION("Bad final segments are rejected") {
    REQUIRE_FALSE(extractShareCode("https://share.example.com/s/x"));
    REQUIRE_FALSE(extractShareCode("https://share.example.com/s/bad_code"));
  }
}

TEST_CASE("Socket urls", "[ShareUrls]") {
  SECTION("Host url") {
    REQUIRE(buildHostSocketUrl("wss://relay.example.com/ws", "room-1",
                               "key") ==
            "wss://relay.example.com/ws?share_id=room-1&role=host&token=key");
  }

  SECTION("Existing query strings are extended") {
    REQUIRE(buildHostSocketUrl("wss://relay.example.com/ws?v=2", "r", "k") ==
            "wss://relay.example.com/ws?v=2&share_id=r&role=host&token=k");
  }

  SECTION("Observer password is only sent when set") {
    REQUIRE(buildObserverSocketUrl("ws://r/ws", "room-1", "key", nullopt) ==
            "ws://r/ws?share_id=room-1&role=observer&token=key");
    REQUIRE(buildObserverSocketUrl("ws://r/ws", "room-1", "key",
                                   string("")) ==
            "ws://r/ws?share_id=room-1&role=observer&token=key");
    REQUIRE(buildObserverSocketUrl("ws://r/ws", "room-1", "key",
                                   string("p w&d")) ==
            "ws://r/ws?share_id=room-1&role=observer&token=key&password=p%20w%"
            "26d");
  }

  SECTION("Url encoding") {
    REQUIRE(urlEncode("aZ09-_.~") == "aZ09-_.~");
    REQUIRE(urlEncode("a/b=c") == "a%2Fb%3Dc");
  }
}
