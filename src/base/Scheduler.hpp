#ifndef __FT_SCHEDULER__
#define __FT_SCHEDULER__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Runs callbacks after a delay.  Lets time-driven logic be tested
 * without sleeping.
 */
class Scheduler {
 public:
  typedef uint64_t TimerId;

  virtual ~Scheduler() {}

  /** @brief Runs task once, delay from now.  Returns a non-zero id. */
  virtual TimerId schedule(std::chrono::milliseconds delay,
                           std::function<void()> task) = 0;

  /** @brief Drops a pending task.  Unknown or fired ids are ignored. */
  virtual void cancel(TimerId id) = 0;
};

/**
 * @brief Scheduler backed by one timer thread.  Tasks run on that thread in
 * deadline order.
 */
class TimerThreadScheduler : public Scheduler {
 public:
  TimerThreadScheduler();
  virtual ~TimerThreadScheduler();

  virtual TimerId schedule(std::chrono::milliseconds delay,
                           std::function<void()> task);
  virtual void cancel(TimerId id);

  /** @brief Drops pending tasks and joins the timer thread. */
  void stop();

 protected:
  typedef std::chrono::steady_clock Clock;

  void run();

  mutex timerMutex;
  std::condition_variable timerCondition;
  /** @brief Pending tasks ordered by deadline. */
  multimap<Clock::time_point, TimerId> deadlines;
  unordered_map<TimerId, std::function<void()>> tasks;
  TimerId nextId;
  bool stopping;
  std::thread timerThread;
};
}  // namespace ft

#endif  // __FT_SCHEDULER__
