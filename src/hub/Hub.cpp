#include "Hub.hpp"

#include "HubClient.hpp"

namespace ft {
Hub::Hub() : requests(REQUEST_QUEUE_CAPACITY), started(false) {}

Hub::~Hub() { stop(); }

void Hub::start() {
  lock_guard<mutex> guard(lifecycleMutex);
  if (started) {
    STFATAL << "Hub started twice";
  }
  started = true;
  coordinator = std::thread(&Hub::run, this);
}

void Hub::stop() {
  {
    lock_guard<mutex> guard(lifecycleMutex);
    if (!started || requests.isClosed()) {
      requests.close();
      return;
    }
    requests.close();
  }
  coordinator.join();
}

void Hub::registerClient(shared_ptr<HubClient> client) {
  submit({Request::Kind::REGISTER, client, "", nullptr});
}

void Hub::unregisterClient(shared_ptr<HubClient> client) {
  submit({Request::Kind::UNREGISTER, client, "", nullptr});
}

void Hub::broadcast(const string& message) {
  if (!submit({Request::Kind::BROADCAST, nullptr, message, nullptr})) {
    VLOG(1) << "Broadcast after the hub stopped";
  }
}

void Hub::sendToClient(shared_ptr<HubClient> client, const string& message) {
  submit({Request::Kind::UNICAST, client, message, nullptr});
}

void Hub::broadcastEvent(const HubEvent& event) {
  VLOG(2) << "Broadcasting " << hubEventTypeName(event.type);
  broadcast(event.toJson());
}

void Hub::flowStarted(int64_t flowId) {
  broadcastEvent(HubEvent::flowStarted(flowId));
}

void Hub::nodeStarted(int64_t flowId, const string& nodeId,
                      const string& label) {
  broadcastEvent(HubEvent::nodeStarted(flowId, nodeId, label));
}

void Hub::nodeCompleted(int64_t flowId, const string& nodeId,
                        int64_t inputTokens, int64_t outputTokens,
                        double cost) {
  broadcastEvent(
      HubEvent::nodeCompleted(flowId, nodeId, inputTokens, outputTokens, cost));
}

void Hub::flowCompleted(int64_t flowId, int64_t executionTimeMs) {
  broadcastEvent(HubEvent::flowCompleted(flowId, executionTimeMs));
}

void Hub::flowFailed(int64_t flowId, const string& error) {
  broadcastEvent(HubEvent::flowFailed(flowId, error));
}

void Hub::ledgerUpdate(int64_t entryId) {
  broadcastEvent(HubEvent::ledgerUpdate(entryId));
}

void Hub::optimizationAvailable(int64_t optimizationId) {
  broadcastEvent(HubEvent::optimizationAvailable(optimizationId));
}

size_t Hub::getClientCount() { return query(Request::Kind::COUNT, nullptr); }

bool Hub::hasClient(shared_ptr<HubClient> client) {
  return query(Request::Kind::MEMBER, client) > 0;
}

bool Hub::submit(Request request) {
  // Requests wait for room; only the coordinator consumes them and it never
  // blocks.
  return requests.push(std::move(request));
}

size_t Hub::query(Request::Kind kind, shared_ptr<HubClient> client) {
  auto reply = make_shared<promise<size_t>>();
  auto answer = reply->get_future();
  if (!submit({kind, client, "", reply})) {
    return 0;
  }
  return answer.get();
}

void Hub::run() {
  el::Helpers::setThreadName("hub-coordinator");
  Request request;
  while (requests.pop(&request) == BoundedQueue<Request>::PopResult::ITEM) {
    handle(request);
  }
  LOG(INFO) << "Hub stopping, closing " << clients.size() << " subscribers";
  for (auto& it : clients) {
    it->closeQueue(CLOSE_GOING_AWAY, "server shutting down");
  }
  clients.clear();
}

void Hub::handle(Request& request) {
  switch (request.kind) {
    case Request::Kind::REGISTER:
      clients.insert(request.client);
      LOG(INFO) << "Hub client " << request.client->getId() << " connected ("
                << clients.size() << " total)";
      break;
    case Request::Kind::UNREGISTER:
      if (clients.erase(request.client)) {
        request.client->closeQueue(CLOSE_NORMAL, "");
        LOG(INFO) << "Hub client " << request.client->getId()
                  << " disconnected (" << clients.size() << " total)";
      }
      break;
    case Request::Kind::BROADCAST: {
      // deliver() may erase, so iterate over a snapshot.
      vector<shared_ptr<HubClient>> snapshot(clients.begin(), clients.end());
      for (auto& it : snapshot) {
        deliver(it, request.message);
      }
      break;
    }
    case Request::Kind::UNICAST:
      if (clients.find(request.client) != clients.end()) {
        deliver(request.client, request.message);
      }
      break;
    case Request::Kind::COUNT:
      request.reply->set_value(clients.size());
      break;
    case Request::Kind::MEMBER:
      request.reply->set_value(clients.count(request.client));
      break;
  }
}

void Hub::deliver(const shared_ptr<HubClient>& client, const string& message) {
  if (client->enqueue(message)) {
    return;
  }
  LOG(WARNING) << "Hub client " << client->getId()
               << " is not keeping up, dropping it";
  client->closeQueue(CLOSE_TRY_AGAIN_LATER, "subscriber too slow");
  clients.erase(client);
}
}  // namespace ft
