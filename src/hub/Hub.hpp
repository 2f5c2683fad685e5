#ifndef __FT_HUB_HPP__
#define __FT_HUB_HPP__

#include "BoundedQueue.hpp"
#include "Headers.hpp"
#include "HubEvents.hpp"

namespace ft {
class HubClient;

/**
 * @brief Fans broadcast messages out to every connected subscriber.
 *
 * The subscriber set belongs to a single coordinator thread.  Every other
 * thread talks to it through the request queue, including the membership
 * queries, which wait for the coordinator's reply.  Delivery never blocks: a
 * subscriber whose outbound queue is full is dropped on the spot.
 */
class Hub {
 public:
  static const size_t REQUEST_QUEUE_CAPACITY = 256;

  Hub();
  ~Hub();

  void start();
  /** @brief Stops the coordinator and closes every subscriber's queue. */
  void stop();

  void registerClient(shared_ptr<HubClient> client);
  void unregisterClient(shared_ptr<HubClient> client);

  /** @brief Queues message for every subscriber registered when it is
   * processed. */
  void broadcast(const string& message);
  /** @brief Unicast with the same overflow policy as broadcast. */
  void sendToClient(shared_ptr<HubClient> client, const string& message);
  void broadcastEvent(const HubEvent& event);

  void flowStarted(int64_t flowId);
  void nodeStarted(int64_t flowId, const string& nodeId, const string& label);
  void nodeCompleted(int64_t flowId, const string& nodeId, int64_t inputTokens,
                     int64_t outputTokens, double cost);
  void flowCompleted(int64_t flowId, int64_t executionTimeMs);
  void flowFailed(int64_t flowId, const string& error);
  void ledgerUpdate(int64_t entryId);
  void optimizationAvailable(int64_t optimizationId);

  /** @brief 0 once the hub is stopped. */
  size_t getClientCount();
  bool hasClient(shared_ptr<HubClient> client);

 protected:
  struct Request {
    enum class Kind { REGISTER, UNREGISTER, BROADCAST, UNICAST, COUNT, MEMBER };
    Kind kind;
    shared_ptr<HubClient> client;
    string message;
    shared_ptr<promise<size_t>> reply;
  };

  bool submit(Request request);
  size_t query(Request::Kind kind, shared_ptr<HubClient> client);
  void run();
  void handle(Request& request);
  void deliver(const shared_ptr<HubClient>& client, const string& message);

  BoundedQueue<Request> requests;
  /** @brief Touched only by the coordinator thread. */
  unordered_set<shared_ptr<HubClient>> clients;
  std::thread coordinator;
  mutex lifecycleMutex;
  bool started;
};
}  // namespace ft

#endif  // __FT_HUB_HPP__
