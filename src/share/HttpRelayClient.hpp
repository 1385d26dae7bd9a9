#ifndef __TS_HTTP_RELAY_CLIENT__
#define __TS_HTTP_RELAY_CLIENT__

#include "AccountProvider.hpp"
#include "Headers.hpp"
#include "RelayClient.hpp"
#include "ShareConfig.hpp"

namespace ts {
/**
 * @brief Talks to the relay REST api with bearer token authentication.
 *
 * Also serves the account lookup, which lives on the same api.
 */
class HttpRelayClient : public RelayClient, public AccountProvider {
 public:
  explicit HttpRelayClient(const RelayConfig& _config);
  virtual ~HttpRelayClient() {}

  virtual RelayRoom createRoom(const CreateRoomRequest& request);
  virtual ResolvedShare resolveCode(const string& shareCode);
  virtual void deleteRoom(const string& shareId);
  virtual void kickObserver(const string& shareId, const string& observerId);
  virtual vector<string> listRooms();

  virtual optional<AccountInfo> getAccount();

 protected:
  /**
   * @brief Performs one call and returns the parsed body (an empty object for
   * empty bodies).
   * @throws RelayError on transport failures and non-2xx statuses.
   */
  json request(const string& method, const string& endpoint,
               const json* body = nullptr);

  RelayConfig config;
  // scheme://host[:port] and the path prefix of apiBaseUrl
  string origin;
  string pathPrefix;
};
}  // namespace ts

#endif  // __TS_HTTP_RELAY_CLIENT__
