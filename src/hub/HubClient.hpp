#ifndef __FT_HUB_CLIENT_HPP__
#define __FT_HUB_CLIENT_HPP__

#include "BoundedQueue.hpp"
#include "FrameSocket.hpp"
#include "Headers.hpp"

namespace ft {
class Hub;

/**
 * @brief One broadcast subscriber: a bounded outbound queue drained to its
 * socket by a writer thread.
 *
 * Inbound frames are read only to notice the peer going away and are
 * otherwise discarded.
 */
class HubClient : public std::enable_shared_from_this<HubClient> {
 public:
  static const size_t SEND_QUEUE_CAPACITY = 256;

  HubClient(Hub* _hub, shared_ptr<FrameSocket> _socket,
            size_t queueCapacity = SEND_QUEUE_CAPACITY);

  /**
   * @brief Registers with the hub and pumps until the connection ends.  The
   * client is unregistered and its writer joined before this returns.
   */
  void run();

  /** @brief Never blocks; false when the queue is full or closed. */
  bool enqueue(const string& message);

  /**
   * @brief Stops accepting messages.  The writer sends what is already
   * queued, then closes the socket with the given code.
   */
  void closeQueue(uint16_t code, const string& reason);

  const string& getId() { return id; }

 protected:
  void runWritePump();

  string id;
  Hub* hub;
  shared_ptr<FrameSocket> socket;
  BoundedQueue<string> outbound;
  mutex closeMutex;
  CloseReason queueCloseReason;
};
}  // namespace ft

#endif  // __FT_HUB_CLIENT_HPP__
