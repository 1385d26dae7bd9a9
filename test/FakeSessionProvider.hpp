#ifndef __TS_FAKE_SESSION_PROVIDER__
#define __TS_FAKE_SESSION_PROVIDER__

#include "SessionProvider.hpp"

namespace ts {
class FakeSessionProvider : public SessionProvider {
 public:
  FakeSessionProvider() : nextSubscriberId(1), inputThrows(false) {}

  virtual optional<SessionInfo> getSession(const string& sessionId) {
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      return nullopt;
    }
    return it->second;
  }

  virtual Unsubscribe subscribeToOutput(const string& sessionId,
                                        OutputCallback callback) {
    int id = nextSubscriberId++;
    subscribers[sessionId][id] = callback;
    return [this, sessionId, id]() { subscribers[sessionId].erase(id); };
  }

  virtual void sendInput(const string& sessionId, const string& text) {
    if (inputThrows) {
      throw std::runtime_error("session input closed");
    }
    inputs.push_back(make_pair(sessionId, text));
  }

  virtual void onSessionEnd(SessionEndCallback callback) {
    endCallbacks.push_back(callback);
  }

  void addSession(const string& id, const string& name,
                  const string& status = "running") {
    SessionInfo info;
    info.set_id(id);
    info.set_name(name);
    info.set_status(status);
    info.set_workingdirectory("/home/user/project");
    sessions[id] = info;
  }

  void emitOutput(const string& sessionId, const string& chunk) {
    // Copy so callbacks may unsubscribe while we iterate
    map<int, OutputCallback> current = subscribers[sessionId];
    for (auto& it : current) {
      it.second(chunk);
    }
  }

  void endSession(const string& sessionId) {
    sessions[sessionId].set_status("ended");
    for (auto& callback : endCallbacks) {
      callback(sessionId);
    }
  }

  size_t subscriberCount(const string& sessionId) {
    return subscribers[sessionId].size();
  }

  map<string, SessionInfo> sessions;
  map<string, map<int, OutputCallback>> subscribers;
  vector<SessionEndCallback> endCallbacks;
  vector<pair<string, string>> inputs;
  int nextSubscriberId;
  bool inputThrows;
};
}  // namespace ts

#endif  // __TS_FAKE_SESSION_PROVIDER__
