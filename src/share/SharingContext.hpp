#ifndef __TS_SHARING_CONTEXT__
#define __TS_SHARING_CONTEXT__

#include "Headers.hpp"
#include "RelayClient.hpp"
#include "Scheduler.hpp"
#include "SessionProvider.hpp"
#include "ShareSocket.hpp"
#include "ShareTypes.hpp"
#include "SharingEventListener.hpp"

namespace ts {
/**
 * @brief Collaborators shared by every share controller. All members are
 * read-only after the SharingManager is constructed.
 */
struct SharingContext {
  shared_ptr<SessionProvider> sessionProvider;
  shared_ptr<RelayClient> relay;
  shared_ptr<ShareSocketFactory> socketFactory;
  shared_ptr<Scheduler> scheduler;
  shared_ptr<SharingEventListener> listener;
  /** @brief Runs best-effort relay calls off the socket and timer threads.
   * When null those calls run inline. */
  shared_ptr<ThreadPool> backgroundPool;
  SharingTimings timings;
  /** @brief Bearer token for the relay, also sent as the socket token. */
  string apiKey;

  /** @brief Runs @p task on the background pool, or inline without one. */
  void runInBackground(function<void()> task) const {
    if (backgroundPool) {
      backgroundPool->enqueue(task);
    } else {
      task();
    }
  }
};
}  // namespace ts

#endif  // __TS_SHARING_CONTEXT__
