#ifndef __TS_ACCOUNT_PROVIDER__
#define __TS_ACCOUNT_PROVIDER__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Reports the connected account and its plan.
 */
class AccountProvider {
 public:
  virtual ~AccountProvider() {}

  /**
   * @return nullopt when no account is connected.
   * @throws std::runtime_error when the lookup itself failed.
   */
  virtual optional<AccountInfo> getAccount() = 0;
};
}  // namespace ts

#endif  // __TS_ACCOUNT_PROVIDER__
