#ifndef __MT_EVENT_LOOP_HPP__
#define __MT_EVENT_LOOP_HPP__

#include <condition_variable>

#include "Headers.hpp"

namespace mt {
/**
 * @brief Single-threaded cooperative control loop.
 *
 * Every registry mutation, surface transition and timer callback runs from
 * here, one task at a time.  `post()` may be called from any thread; all
 * other methods belong to the loop thread.
 */
class EventLoop {
 public:
  typedef std::function<void()> Task;
  typedef int64_t TimerId;
  typedef std::function<TimePoint()> Clock;

  /** @brief Creates a loop driven by std::chrono::steady_clock. */
  EventLoop();
  /** @brief Creates a loop driven by a custom clock (used by tests). */
  explicit EventLoop(Clock _clock);

  /** @brief Queues a task to run on the next iteration. Thread-safe. */
  void post(Task task);
  /**
   * @brief Schedules a one-shot task after `delay`.
   * @return An id that can be handed to `cancel()`.
   */
  TimerId postDelayed(std::chrono::milliseconds delay, Task task);
  /** @brief Cancels a pending timer. Returns false if it already ran. */
  bool cancel(TimerId id);
  /** @brief Returns true while the timer has not fired or been cancelled. */
  bool isPending(TimerId id);

  /**
   * @brief Runs every queued task and every timer that is due now.
   * @return The number of tasks and timers that ran.
   */
  int runOnce();
  /** @brief Calls `runOnce()` until nothing is runnable at the current time. */
  void runUntilIdle();
  /** @brief Runs until `stop()` is called, sleeping between deadlines. */
  void run();
  /** @brief Makes `run()` return after the current iteration. Thread-safe. */
  void stop();

  TimePoint now() { return clock(); }
  int numPendingTimers();

 protected:
  struct Timer {
    TimePoint when;
    Task task;
  };

  void runGuarded(const Task& task);

  Clock clock;
  std::mutex queueMutex;
  std::condition_variable wakeup;
  deque<Task> tasks;
  map<TimerId, Timer> timers;
  TimerId nextTimerId;
  bool running;
};
}  // namespace mt

#endif  // __MT_EVENT_LOOP_HPP__
