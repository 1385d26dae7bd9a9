#ifndef __TS_SCHEDULER__
#define __TS_SCHEDULER__

#include "Headers.hpp"

namespace ts {
typedef uint64_t TimerId;
/** @brief Never returned by schedule(); safe to cancel. */
const TimerId NULL_TIMER_ID = 0;

/**
 * @brief Source of one-shot and repeating timers for the share controllers.
 *
 * Callbacks run without any scheduler lock held, so they may schedule or
 * cancel other timers.
 */
class Scheduler {
 public:
  typedef function<void()> Task;

  virtual ~Scheduler() {}

  /** @brief Runs @p task once after @p delayMs milliseconds. */
  virtual TimerId schedule(int64_t delayMs, Task task) = 0;

  /** @brief Runs @p task every @p intervalMs until cancelled. */
  virtual TimerId scheduleRepeating(int64_t intervalMs, Task task) = 0;

  /**
   * @brief Cancels a pending timer. Unknown, already fired and null ids are
   * ignored.
   */
  virtual void cancel(TimerId id) = 0;
};
}  // namespace ts

#endif  // __TS_SCHEDULER__
