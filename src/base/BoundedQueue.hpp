#ifndef __FT_BOUNDED_QUEUE__
#define __FT_BOUNDED_QUEUE__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Fixed-capacity FIFO shared between one or more producers and a
 * single consumer thread.
 *
 * Producers choose between a blocking push and a non-blocking tryPush.  Once
 * closed, pushes fail, and pops keep returning whatever is still buffered
 * before reporting CLOSED.
 */
template <typename T>
class BoundedQueue {
 public:
  enum class PopResult { ITEM, TIMEOUT, CLOSED };

  explicit BoundedQueue(size_t _capacity) : capacity(_capacity), closed(false) {
    if (capacity == 0) {
      STFATAL << "BoundedQueue needs a positive capacity";
    }
  }

  /** @brief Enqueues without waiting; false when the queue is full or closed. */
  bool tryPush(T item) {
    {
      lock_guard<mutex> guard(queueMutex);
      if (closed || items.size() >= capacity) {
        return false;
      }
      items.push_back(std::move(item));
    }
    notEmpty.notify_one();
    return true;
  }

  /** @brief Waits for room, then enqueues; false if the queue was closed. */
  bool push(T item) {
    {
      unique_lock<mutex> lock(queueMutex);
      notFull.wait(lock, [this] { return closed || items.size() < capacity; });
      if (closed) {
        return false;
      }
      items.push_back(std::move(item));
    }
    notEmpty.notify_one();
    return true;
  }

  /** @brief Waits up to @p timeout for the next item. */
  PopResult pop(T* item, std::chrono::milliseconds timeout) {
    unique_lock<mutex> lock(queueMutex);
    if (!notEmpty.wait_for(lock, timeout,
                           [this] { return closed || !items.empty(); })) {
      return PopResult::TIMEOUT;
    }
    return takeFront(item, &lock);
  }

  /** @brief Waits indefinitely for the next item. */
  PopResult pop(T* item) {
    unique_lock<mutex> lock(queueMutex);
    notEmpty.wait(lock, [this] { return closed || !items.empty(); });
    return takeFront(item, &lock);
  }

  void close() {
    {
      lock_guard<mutex> guard(queueMutex);
      closed = true;
    }
    notEmpty.notify_all();
    notFull.notify_all();
  }

  bool isClosed() {
    lock_guard<mutex> guard(queueMutex);
    return closed;
  }

  size_t size() {
    lock_guard<mutex> guard(queueMutex);
    return items.size();
  }

  size_t getCapacity() const { return capacity; }

 protected:
  PopResult takeFront(T* item, unique_lock<mutex>* lock) {
    if (items.empty()) {
      return PopResult::CLOSED;
    }
    *item = std::move(items.front());
    items.pop_front();
    lock->unlock();
    notFull.notify_one();
    return PopResult::ITEM;
  }

  const size_t capacity;
  bool closed;
  deque<T> items;
  mutex queueMutex;
  condition_variable notEmpty;
  condition_variable notFull;
};
}  // namespace ft

#endif  // __FT_BOUNDED_QUEUE__
