#ifndef __TS_RELAY_CLIENT__
#define __TS_RELAY_CLIENT__

#include "Headers.hpp"

namespace ts {
/**
 * @brief A relay call that did not succeed.
 *
 * status is the HTTP status code, or 0 when no response was received.
 */
class RelayError : public std::runtime_error {
 public:
  RelayError(int _status, const string& _body)
      : std::runtime_error(describe(_status, _body)),
        status(_status),
        body(_body) {}

  int getStatus() const { return status; }
  const string& getBody() const { return body; }

 protected:
  static string describe(int status, const string& body) {
    if (status == 0) {
      return "Relay unreachable: " + body;
    }
    return "Relay returned " + to_string(status) + ": " + body;
  }

  int status;
  string body;
};

/**
 * @brief REST surface of the relay that brokers share rooms.
 *
 * Every method throws RelayError on failure.
 */
class RelayClient {
 public:
  virtual ~RelayClient() {}

  virtual RelayRoom createRoom(const CreateRoomRequest& request) = 0;
  virtual ResolvedShare resolveCode(const string& shareCode) = 0;
  virtual void deleteRoom(const string& shareId) = 0;
  virtual void kickObserver(const string& shareId,
                            const string& observerId) = 0;
  /** @brief Ids of every room the account currently owns. */
  virtual vector<string> listRooms() = 0;
};
}  // namespace ts

#endif  // __TS_RELAY_CLIENT__
