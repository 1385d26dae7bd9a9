#ifndef __TS_TIMER_SCHEDULER__
#define __TS_TIMER_SCHEDULER__

#include "Headers.hpp"
#include "Scheduler.hpp"

namespace ts {
/**
 * @brief Scheduler backed by one worker thread and a deadline-ordered queue.
 */
class TimerScheduler : public Scheduler {
 public:
  TimerScheduler();
  virtual ~TimerScheduler();

  virtual TimerId schedule(int64_t delayMs, Task task);
  virtual TimerId scheduleRepeating(int64_t intervalMs, Task task);
  virtual void cancel(TimerId id);

  /** @brief Stops the worker. Pending timers are discarded. */
  void shutdown();

 protected:
  struct Entry {
    chrono::steady_clock::time_point deadline;
    TimerId id;
    int64_t intervalMs;  // 0 for one-shot timers
    shared_ptr<Task> task;
  };

  TimerId add(int64_t delayMs, int64_t intervalMs, Task task);
  void run();

  mutex schedulerMutex;
  condition_variable wakeup;
  // Ordered by (deadline, id) so equal deadlines fire in schedule order.
  map<pair<chrono::steady_clock::time_point, TimerId>, Entry> queue;
  unordered_map<TimerId, chrono::steady_clock::time_point> deadlines;
  TimerId nextId;
  bool running;
  std::thread worker;
};
}  // namespace ts

#endif  // __TS_TIMER_SCHEDULER__
