#include "Scheduler.hpp"

namespace ft {
TimerThreadScheduler::TimerThreadScheduler() : nextId(1), stopping(false) {
  timerThread = std::thread(&TimerThreadScheduler::run, this);
}

TimerThreadScheduler::~TimerThreadScheduler() { stop(); }

Scheduler::TimerId TimerThreadScheduler::schedule(
    std::chrono::milliseconds delay, std::function<void()> task) {
  lock_guard<mutex> guard(timerMutex);
  TimerId id = nextId++;
  tasks[id] = task;
  deadlines.insert(make_pair(Clock::now() + delay, id));
  timerCondition.notify_one();
  return id;
}

void TimerThreadScheduler::cancel(TimerId id) {
  lock_guard<mutex> guard(timerMutex);
  tasks.erase(id);
}

void TimerThreadScheduler::stop() {
  {
    lock_guard<mutex> guard(timerMutex);
    if (stopping) {
      return;
    }
    stopping = true;
    tasks.clear();
    deadlines.clear();
    timerCondition.notify_one();
  }
  timerThread.join();
}

void TimerThreadScheduler::run() {
  el::Helpers::setThreadName("timer");
  std::unique_lock<mutex> lock(timerMutex);
  while (!stopping) {
    if (deadlines.empty()) {
      timerCondition.wait(lock);
      continue;
    }
    auto next = deadlines.begin();
    if (next->first > Clock::now()) {
      timerCondition.wait_until(lock, next->first);
      continue;
    }
    TimerId id = next->second;
    deadlines.erase(next);
    auto it = tasks.find(id);
    if (it == tasks.end()) {
      // Cancelled.
      continue;
    }
    auto task = it->second;
    tasks.erase(it);
    lock.unlock();
    task();
    lock.lock();
  }
}
}  // namespace ft
