#include "ShareConfig.hpp"

#include "TestHeaders.hpp"

using namespace ts;

namespace {
string writeConfig(const string& contents) {
  string path = (fs::path(GetTempDirectory()) /
                 ("termshare_test_" + genRandomAlphaNum(8) + ".ini"))
                    .string();
  ofstream out(path);
  out << contents;
  return path;
}
}  // namespace

TEST_CASE("Missing config file", "[ShareConfig]") {
  string path = (fs::path(GetTempDirectory()) /
                 ("termshare_missing_" + genRandomAlphaNum(8) + ".ini"))
                    .string();
  ShareConfig config;
  REQUIRE(loadShareConfig(path, false, &config));
  REQUIRE(config.relay.apiBaseUrl == DEFAULT_API_BASE_URL);
  REQUIRE(config.relay.apiKey.empty());
  REQUIRE_FALSE(loadShareConfig(path, true, &config));
}

TEST_CASE("Config file values", "[ShareConfig]") {
  string path = writeConfig(
      "[Relay]\n"
      "api_base_url = http://127.0.0.1:9000/api\n"
      "api_key = lt_testkey\n"
      "\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1024\n");
  ShareConfig config;
  REQUIRE(loadShareConfig(path, true, &config));
  REQUIRE(config.relay.apiBaseUrl == "http://127.0.0.1:9000/api");
  REQUIRE(config.relay.apiKey == "lt_testkey");
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1024");
  fs::remove(path);
}

TEST_CASE("Absent keys keep their values", "[ShareConfig]") {
  string path = writeConfig(
      "[Relay]\n"
      "api_base_url =\n"
      "[Debug]\n"
      "logsize = 0\n");
  ShareConfig config;
  config.relay.apiKey = "from_cli";
  config.verbose = 1;
  REQUIRE(loadShareConfig(path, false, &config));
  REQUIRE(config.relay.apiBaseUrl == DEFAULT_API_BASE_URL);
  REQUIRE(config.relay.apiKey == "from_cli");
  REQUIRE(config.verbose == 1);
  REQUIRE_FALSE(config.silent);
  REQUIRE(config.maxLogSize == "20971520");
  fs::remove(path);
}
