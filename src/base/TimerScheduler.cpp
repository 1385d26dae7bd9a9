#include "TimerScheduler.hpp"

namespace ts {
TimerScheduler::TimerScheduler() : nextId(1), running(true) {
  worker = std::thread(&TimerScheduler::run, this);
}

TimerScheduler::~TimerScheduler() { shutdown(); }

void TimerScheduler::shutdown() {
  {
    lock_guard<mutex> guard(schedulerMutex);
    if (!running) {
      return;
    }
    running = false;
    queue.clear();
    deadlines.clear();
  }
  wakeup.notify_all();
  if (worker.joinable()) {
    if (worker.get_id() == std::this_thread::get_id()) {
      worker.detach();
    } else {
      worker.join();
    }
  }
}

TimerId TimerScheduler::schedule(int64_t delayMs, Task task) {
  return add(delayMs, 0, task);
}

TimerId TimerScheduler::scheduleRepeating(int64_t intervalMs, Task task) {
  if (intervalMs <= 0) {
    STFATAL << "Repeating timers need a positive interval: " << intervalMs;
  }
  return add(intervalMs, intervalMs, task);
}

TimerId TimerScheduler::add(int64_t delayMs, int64_t intervalMs, Task task) {
  lock_guard<mutex> guard(schedulerMutex);
  if (!running) {
    LOG(WARNING) << "Timer scheduled after shutdown";
    return NULL_TIMER_ID;
  }
  TimerId id = nextId++;
  Entry entry;
  entry.deadline = chrono::steady_clock::now() +
                   chrono::milliseconds(max<int64_t>(delayMs, 0));
  entry.id = id;
  entry.intervalMs = intervalMs;
  entry.task = make_shared<Task>(task);
  queue[make_pair(entry.deadline, id)] = entry;
  deadlines[id] = entry.deadline;
  wakeup.notify_all();
  return id;
}

void TimerScheduler::cancel(TimerId id) {
  lock_guard<mutex> guard(schedulerMutex);
  auto it = deadlines.find(id);
  if (it == deadlines.end()) {
    return;
  }
  queue.erase(make_pair(it->second, id));
  deadlines.erase(it);
}

void TimerScheduler::run() {
  unique_lock<mutex> lock(schedulerMutex);
  while (running) {
    if (queue.empty()) {
      wakeup.wait(lock);
      continue;
    }
    auto next = queue.begin();
    auto now = chrono::steady_clock::now();
    if (next->second.deadline > now) {
      wakeup.wait_until(lock, next->second.deadline);
      continue;
    }

    Entry entry = next->second;
    queue.erase(next);
    if (entry.intervalMs > 0) {
      entry.deadline = now + chrono::milliseconds(entry.intervalMs);
      queue[make_pair(entry.deadline, entry.id)] = entry;
      deadlines[entry.id] = entry.deadline;
    } else {
      deadlines.erase(entry.id);
    }

    lock.unlock();
    try {
      (*entry.task)();
    } catch (const std::exception& ex) {
      STERROR << "Timer " << entry.id << " threw: " << ex.what();
    }
    lock.lock();
  }
}
}  // namespace ts
