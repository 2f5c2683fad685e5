#include "Scheduler.hpp"
#include "TestHeaders.hpp"

using namespace ft;

TEST_CASE("Timer tasks run in deadline order", "[Scheduler]") {
  TimerThreadScheduler scheduler;
  mutex orderMutex;
  vector<int> order;
  auto record = [&](int value) {
    return [&, value]() {
      lock_guard<mutex> guard(orderMutex);
      order.push_back(value);
    };
  };
  scheduler.schedule(std::chrono::milliseconds(150), record(3));
  scheduler.schedule(std::chrono::milliseconds(10), record(1));
  scheduler.schedule(std::chrono::milliseconds(80), record(2));

  REQUIRE(waitFor([&]() {
    lock_guard<mutex> guard(orderMutex);
    return order.size() == 3;
  }));
  lock_guard<mutex> guard(orderMutex);
  REQUIRE(order == vector<int>{1, 2, 3});
}

TEST_CASE("Cancelled timer tasks never run", "[Scheduler]") {
  TimerThreadScheduler scheduler;
  std::atomic<bool> cancelledRan(false);
  std::atomic<bool> keptRan(false);
  auto id = scheduler.schedule(std::chrono::milliseconds(50),
                               [&]() { cancelledRan = true; });
  scheduler.schedule(std::chrono::milliseconds(100), [&]() { keptRan = true; });
  scheduler.cancel(id);

  REQUIRE(waitFor([&]() { return keptRan.load(); }));
  REQUIRE_FALSE(cancelledRan);
  // Unknown ids are ignored.
  scheduler.cancel(id);
  scheduler.cancel(9999);
}

TEST_CASE("Stopping drops pending timer tasks", "[Scheduler]") {
  TimerThreadScheduler scheduler;
  std::atomic<bool> ran(false);
  scheduler.schedule(std::chrono::milliseconds(50), [&]() { ran = true; });
  scheduler.stop();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE_FALSE(ran);
  scheduler.stop();
}

TEST_CASE("Timer tasks may schedule more work", "[Scheduler]") {
  TimerThreadScheduler scheduler;
  std::atomic<int> count(0);
  std::function<void()> tick = [&]() {
    if (++count < 3) {
      scheduler.schedule(std::chrono::milliseconds(5), tick);
    }
  };
  scheduler.schedule(std::chrono::milliseconds(5), tick);
  REQUIRE(waitFor([&]() { return count.load() == 3; }));
}
