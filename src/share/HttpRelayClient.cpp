#include "HttpRelayClient.hpp"

#include "ShareUrls.hpp"

namespace ts {
namespace {
const int CONNECT_TIMEOUT_SECONDS = 10;
const int IO_TIMEOUT_SECONDS = 30;
}  // namespace

HttpRelayClient::HttpRelayClient(const RelayConfig& _config) : config(_config) {
  string base = config.apiBaseUrl;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  size_t schemeEnd = base.find("://");
  size_t pathStart =
      base.find('/', schemeEnd == string::npos ? 0 : schemeEnd + 3);
  if (pathStart == string::npos) {
    origin = base;
  } else {
    origin = base.substr(0, pathStart);
    pathPrefix = base.substr(pathStart);
  }
}

json HttpRelayClient::request(const string& method, const string& endpoint,
                              const json* body) {
  httplib::Client client(origin);
  client.set_connection_timeout(CONNECT_TIMEOUT_SECONDS, 0);
  client.set_read_timeout(IO_TIMEOUT_SECONDS, 0);
  client.set_write_timeout(IO_TIMEOUT_SECONDS, 0);

  httplib::Headers headers;
  headers.emplace("Accept", "application/json");
  if (!config.apiKey.empty()) {
    headers.emplace("Authorization", "Bearer " + config.apiKey);
  }

  string path = pathPrefix + endpoint;
  string payload = body ? body->dump() : "";
  if (method != "GET" && method != "POST" && method != "DELETE") {
    STFATAL << "Unsupported relay method: " << method;
  }
  auto send = [&]() -> httplib::Result {
    if (method == "POST") {
      return client.Post(path, headers, payload, "application/json");
    }
    if (method == "DELETE") {
      return client.Delete(path, headers);
    }
    return client.Get(path, headers);
  };
  httplib::Result res = send();

  if (!res) {
    throw RelayError(0, method + " " + endpoint + ": " +
                            httplib::to_string(res.error()));
  }
  VLOG(1) << method << " " << endpoint << " -> " << res->status;
  if (res->status < 200 || res->status >= 300) {
    throw RelayError(res->status, res->body);
  }
  if (res->body.empty()) {
    return json::object();
  }
  json parsed = json::parse(res->body, nullptr, false);
  if (parsed.is_discarded()) {
    throw RelayError(res->status, "Invalid JSON from relay: " + res->body);
  }
  return parsed;
}

RelayRoom HttpRelayClient::createRoom(const CreateRoomRequest& request) {
  json body;
  body["session_name"] = request.sessionname();
  if (request.has_password()) {
    body["password"] = request.password();
  }
  if (request.has_expiresinms()) {
    body["expires_in_ms"] = request.expiresinms();
  }
  json response = this->request("POST", "/v1/shares", &body);
  auto share = response.find("share");
  if (share == response.end() || !share->is_object()) {
    throw RelayError(200, "Missing share in create response");
  }

  RelayRoom room;
  room.set_id(jsonString(*share, "id"));
  room.set_sharecode(jsonString(*share, "share_code"));
  room.set_shareurl(jsonString(*share, "share_url"));
  room.set_wsendpoint(jsonString(*share, "ws_endpoint"));
  string expiresAt = jsonString(*share, "expires_at");
  if (!expiresAt.empty()) {
    room.set_expiresat(expiresAt);
  }
  room.set_haspassword(jsonBool(*share, "has_password", false));
  if (room.id().empty() || room.wsendpoint().empty()) {
    throw RelayError(200, "Incomplete create response: " + share->dump());
  }
  return room;
}

ResolvedShare HttpRelayClient::resolveCode(const string& shareCode) {
  json response =
      request("GET", "/v1/shares/" + urlEncode(shareCode) + "/resolve");
  ResolvedShare resolved;
  resolved.set_shareid(jsonString(response, "share_id"));
  resolved.set_wsendpoint(jsonString(response, "ws_endpoint"));
  resolved.set_requirespassword(
      jsonBool(response, "requires_password", false));
  resolved.set_sessionname(jsonString(response, "session_name"));
  if (resolved.shareid().empty() || resolved.wsendpoint().empty()) {
    throw RelayError(200, "Incomplete resolve response: " + response.dump());
  }
  return resolved;
}

void HttpRelayClient::deleteRoom(const string& shareId) {
  request("DELETE", "/v1/shares/" + urlEncode(shareId));
}

void HttpRelayClient::kickObserver(const string& shareId,
                                   const string& observerId) {
  json body;
  body["observerId"] = observerId;
  request("POST", "/v1/shares/" + urlEncode(shareId) + "/kick", &body);
}

vector<string> HttpRelayClient::listRooms() {
  json response = request("GET", "/v1/shares");
  vector<string> ids;
  auto shares = response.find("shares");
  if (shares == response.end() || !shares->is_array()) {
    return ids;
  }
  for (const auto& share : *shares) {
    if (share.is_object()) {
      string id = jsonString(share, "id");
      if (!id.empty()) {
        ids.push_back(id);
      }
    }
  }
  return ids;
}

optional<AccountInfo> HttpRelayClient::getAccount() {
  if (config.apiKey.empty()) {
    return nullopt;
  }
  json response;
  try {
    response = request("GET", "/v1/account/me");
  } catch (const RelayError& re) {
    if (re.getStatus() == 401 || re.getStatus() == 404) {
      return nullopt;
    }
    throw;
  }
  auto user = response.find("user");
  if (user == response.end() || !user->is_object()) {
    return nullopt;
  }
  AccountInfo account;
  account.set_plan(jsonString(*user, "plan", "free"));
  account.set_email(jsonString(*user, "email"));
  return account;
}
}  // namespace ts
