#include "BoundedQueue.hpp"
#include "TestHeaders.hpp"

using namespace ft;

typedef BoundedQueue<int>::PopResult PopResult;

TEST_CASE("tryPush refuses when full", "[BoundedQueue]") {
  BoundedQueue<int> queue(2);
  REQUIRE(queue.tryPush(1));
  REQUIRE(queue.tryPush(2));
  REQUIRE_FALSE(queue.tryPush(3));
  REQUIRE(queue.size() == 2);
  REQUIRE(queue.getCapacity() == 2);

  int value = 0;
  REQUIRE(queue.pop(&value) == PopResult::ITEM);
  REQUIRE(value == 1);
  REQUIRE(queue.tryPush(3));
  REQUIRE(queue.pop(&value) == PopResult::ITEM);
  REQUIRE(value == 2);
  REQUIRE(queue.pop(&value) == PopResult::ITEM);
  REQUIRE(value == 3);
}

TEST_CASE("pop times out on an empty queue", "[BoundedQueue]") {
  BoundedQueue<int> queue(4);
  int value = 0;
  REQUIRE(queue.pop(&value, std::chrono::milliseconds(10)) ==
          PopResult::TIMEOUT);
}

TEST_CASE("Closing drains before reporting closed", "[BoundedQueue]") {
  BoundedQueue<int> queue(4);
  queue.tryPush(7);
  queue.tryPush(8);
  queue.close();
  REQUIRE(queue.isClosed());
  REQUIRE_FALSE(queue.tryPush(9));
  REQUIRE_FALSE(queue.push(9));

  int value = 0;
  REQUIRE(queue.pop(&value) == PopResult::ITEM);
  REQUIRE(value == 7);
  REQUIRE(queue.pop(&value, std::chrono::milliseconds(10)) ==
          PopResult::ITEM);
  REQUIRE(value == 8);
  REQUIRE(queue.pop(&value) == PopResult::CLOSED);
}

TEST_CASE("Blocking push waits for room", "[BoundedQueue]") {
  BoundedQueue<int> queue(1);
  queue.tryPush(1);
  std::atomic<bool> pushed(false);
  std::thread producer([&]() { pushed = queue.push(2); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(pushed);

  int value = 0;
  REQUIRE(queue.pop(&value) == PopResult::ITEM);
  producer.join();
  REQUIRE(pushed);
  REQUIRE(queue.pop(&value) == PopResult::ITEM);
  REQUIRE(value == 2);
}

TEST_CASE("Closing wakes a blocked consumer", "[BoundedQueue]") {
  BoundedQueue<int> queue(1);
  std::atomic<bool> sawClosed(false);
  std::thread consumer([&]() {
    int value;
    sawClosed = queue.pop(&value) == PopResult::CLOSED;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();
  REQUIRE(sawClosed);
}
