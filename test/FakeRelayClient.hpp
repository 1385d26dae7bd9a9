#ifndef __TS_FAKE_RELAY_CLIENT__
#define __TS_FAKE_RELAY_CLIENT__

#include "AccountProvider.hpp"
#include "RelayClient.hpp"

namespace ts {
/**
 * @brief Scriptable relay. Rooms are numbered room-1, room-2, ... with share
 * codes SHARE1, SHARE2, ...
 */
class FakeRelayClient : public RelayClient, public AccountProvider {
 public:
  FakeRelayClient()
      : nextRoom(1),
        malformedCreates(0),
        malformedResolve(false),
        accountThrows(false) {
    AccountInfo pro;
    pro.set_email("host@example.com");
    pro.set_plan("pro");
    account = pro;
  }

  virtual RelayRoom createRoom(const CreateRoomRequest& request) {
    lock_guard<recursive_mutex> guard(relayMutex);
    createRequests.push_back(request);
    if (duringCreate) {
      duringCreate();
    }
    if (malformedCreates > 0) {
      malformedCreates--;
      throwTypeError();
    }
    if (!createErrors.empty()) {
      RelayError error = createErrors.front();
      createErrors.pop_front();
      throw error;
    }
    int n = nextRoom++;
    RelayRoom room;
    room.set_id("room-" + to_string(n));
    room.set_sharecode("SHARE" + to_string(n));
    room.set_shareurl("https://share.example.com/s/SHARE" + to_string(n));
    room.set_wsendpoint("wss://relay.example.com/ws");
    room.set_haspassword(request.has_password());
    rooms.push_back(room.id());
    return room;
  }

  virtual ResolvedShare resolveCode(const string& shareCode) {
    lock_guard<recursive_mutex> guard(relayMutex);
    resolvedCodes.push_back(shareCode);
    if (duringResolve) {
      duringResolve();
    }
    if (resolveError) {
      throw *resolveError;
    }
    if (malformedResolve) {
      throwTypeError();
    }
    auto it = resolvable.find(shareCode);
    if (it == resolvable.end()) {
      throw RelayError(404, "{\"error\":\"not found\"}");
    }
    return it->second;
  }

  virtual void deleteRoom(const string& shareId) {
    lock_guard<recursive_mutex> guard(relayMutex);
    deletedRooms.push_back(shareId);
    if (deleteError) {
      throw *deleteError;
    }
    rooms.erase(remove(rooms.begin(), rooms.end(), shareId), rooms.end());
  }

  virtual void kickObserver(const string& shareId, const string& observerId) {
    lock_guard<recursive_mutex> guard(relayMutex);
    kicked.push_back(make_pair(shareId, observerId));
  }

  virtual vector<string> listRooms() {
    lock_guard<recursive_mutex> guard(relayMutex);
    if (listError) {
      throw *listError;
    }
    return rooms;
  }

  virtual optional<AccountInfo> getAccount() {
    lock_guard<recursive_mutex> guard(relayMutex);
    if (accountThrows) {
      throw RelayError(0, "connection refused");
    }
    return account;
  }

  /** @brief Makes @p shareCode resolvable. */
  void addResolvable(const string& shareCode, const string& shareId,
                     bool requiresPassword = false) {
    ResolvedShare resolved;
    resolved.set_shareid(shareId);
    resolved.set_wsendpoint("wss://relay.example.com/ws");
    resolved.set_requirespassword(requiresPassword);
    resolved.set_sessionname("Remote session");
    resolvable[shareCode] = resolved;
  }

  /** @brief Fails the way reading a null field as a boolean does. */
  static void throwTypeError() {
    json field = nullptr;
    field.get<bool>();
  }

  recursive_mutex relayMutex;
  int nextRoom;
  // Rooms the account owns on the relay
  vector<string> rooms;
  vector<CreateRoomRequest> createRequests;
  deque<RelayError> createErrors;
  // Create calls that fail with a json type error
  int malformedCreates;
  // Runs inside createRoom, before any scripted failure
  function<void()> duringCreate;
  map<string, ResolvedShare> resolvable;
  vector<string> resolvedCodes;
  optional<RelayError> resolveError;
  bool malformedResolve;
  function<void()> duringResolve;
  vector<string> deletedRooms;
  optional<RelayError> deleteError;
  vector<pair<string, string>> kicked;
  optional<RelayError> listError;
  optional<AccountInfo> account;
  bool accountThrows;
};
}  // namespace ts

#endif  // __TS_FAKE_RELAY_CLIENT__
