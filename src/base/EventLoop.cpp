#include "EventLoop.hpp"

namespace mt {
EventLoop::EventLoop()
    : EventLoop([]() { return std::chrono::steady_clock::now(); }) {}

EventLoop::EventLoop(Clock _clock)
    : clock(_clock), nextTimerId(1), running(false) {}

void EventLoop::post(Task task) {
  {
    lock_guard<std::mutex> guard(queueMutex);
    tasks.push_back(std::move(task));
  }
  wakeup.notify_one();
}

EventLoop::TimerId EventLoop::postDelayed(std::chrono::milliseconds delay,
                                          Task task) {
  lock_guard<std::mutex> guard(queueMutex);
  TimerId id = nextTimerId++;
  Timer timer;
  timer.when = clock() + delay;
  timer.task = std::move(task);
  timers.insert(make_pair(id, std::move(timer)));
  return id;
}

bool EventLoop::cancel(TimerId id) {
  lock_guard<std::mutex> guard(queueMutex);
  return timers.erase(id) > 0;
}

bool EventLoop::isPending(TimerId id) {
  lock_guard<std::mutex> guard(queueMutex);
  return timers.find(id) != timers.end();
}

int EventLoop::numPendingTimers() {
  lock_guard<std::mutex> guard(queueMutex);
  return int(timers.size());
}

void EventLoop::runGuarded(const Task& task) {
  try {
    task();
  } catch (const std::exception& ex) {
    STERROR << "Uncaught exception in control loop task: " << ex.what();
  }
}

int EventLoop::runOnce() {
  deque<Task> readyTasks;
  {
    lock_guard<std::mutex> guard(queueMutex);
    readyTasks.swap(tasks);
  }
  int count = 0;
  for (auto& task : readyTasks) {
    runGuarded(task);
    count++;
  }

  // Timers are fired in deadline order, ties broken by creation order.  A
  // timer cancelled by an earlier callback in this pass does not run.
  vector<pair<TimePoint, TimerId>> due;
  {
    lock_guard<std::mutex> guard(queueMutex);
    TimePoint current = clock();
    for (auto& it : timers) {
      if (it.second.when <= current) {
        due.push_back(make_pair(it.second.when, it.first));
      }
    }
  }
  sort(due.begin(), due.end());
  for (auto& it : due) {
    Task task;
    {
      lock_guard<std::mutex> guard(queueMutex);
      auto timerIt = timers.find(it.second);
      if (timerIt == timers.end()) {
        continue;
      }
      task = std::move(timerIt->second.task);
      timers.erase(timerIt);
    }
    runGuarded(task);
    count++;
  }
  return count;
}

void EventLoop::runUntilIdle() {
  while (runOnce() > 0) {
  }
}

void EventLoop::run() {
  {
    lock_guard<std::mutex> guard(queueMutex);
    running = true;
  }
  while (true) {
    runOnce();

    unique_lock<std::mutex> lock(queueMutex);
    if (!running) {
      break;
    }
    if (!tasks.empty()) {
      continue;
    }
    if (timers.empty()) {
      wakeup.wait(lock);
      continue;
    }
    TimePoint nextDeadline = timers.begin()->second.when;
    for (auto& it : timers) {
      nextDeadline = min(nextDeadline, it.second.when);
    }
    wakeup.wait_until(lock, nextDeadline);
  }
  LOG(INFO) << "Control loop stopped";
}

void EventLoop::stop() {
  {
    lock_guard<std::mutex> guard(queueMutex);
    running = false;
  }
  wakeup.notify_all();
}
}  // namespace mt
