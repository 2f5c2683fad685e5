#include "FakeFrameSocket.hpp"
#include "Hub.hpp"
#include "HubClient.hpp"
#include "TestHeaders.hpp"

using namespace ft;

namespace {
struct RunningClient {
  shared_ptr<FakeFrameSocket> socket;
  shared_ptr<HubClient> client;
  shared_ptr<std::thread> thread;

  RunningClient(Hub* hub, size_t capacity = HubClient::SEND_QUEUE_CAPACITY)
      : socket(new FakeFrameSocket()),
        client(new HubClient(hub, socket, capacity)) {
    auto runner = client;
    thread.reset(new std::thread([runner]() { runner->run(); }));
  }

  void disconnect() {
    socket->close(CLOSE_NORMAL, "bye");
    thread->join();
  }
};

vector<string> texts(shared_ptr<FakeFrameSocket> socket) {
  vector<string> result;
  for (const auto& it : socket->getOutbound()) {
    REQUIRE_FALSE(it.binary);
    result.push_back(it.data);
  }
  return result;
}
}  // namespace

TEST_CASE("Broadcasts reach every subscriber in order", "[Hub]") {
  Hub hub;
  hub.start();
  vector<shared_ptr<RunningClient>> clients;
  for (int a = 0; a < 3; a++) {
    clients.push_back(make_shared<RunningClient>(&hub));
  }
  REQUIRE(waitFor([&]() { return hub.getClientCount() == 3; }));

  hub.broadcast("one");
  hub.broadcast("two");
  hub.broadcast("three");
  for (auto& it : clients) {
    REQUIRE(it->socket->waitForOutbound(3));
    REQUIRE(texts(it->socket) == vector<string>{"one", "two", "three"});
  }

  for (auto& it : clients) {
    it->disconnect();
  }
  REQUIRE(hub.getClientCount() == 0);
  hub.stop();
}

TEST_CASE("Unicast reaches only its target", "[Hub]") {
  Hub hub;
  hub.start();
  RunningClient target(&hub);
  RunningClient bystander(&hub);
  REQUIRE(waitFor([&]() { return hub.getClientCount() == 2; }));

  hub.sendToClient(target.client, "just you");
  hub.broadcast("everyone");
  REQUIRE(target.socket->waitForOutbound(2));
  REQUIRE(bystander.socket->waitForOutbound(1));
  REQUIRE(texts(target.socket) == vector<string>{"just you", "everyone"});
  REQUIRE(texts(bystander.socket) == vector<string>{"everyone"});

  target.disconnect();
  bystander.disconnect();
  hub.stop();
}

TEST_CASE("A full subscriber is dropped without affecting others", "[Hub]") {
  Hub hub;
  hub.start();
  auto slowSocket = make_shared<FakeFrameSocket>();
  auto slow = make_shared<HubClient>(&hub, slowSocket, 2);
  auto fastSocket = make_shared<FakeFrameSocket>();
  auto fast = make_shared<HubClient>(&hub, fastSocket);
  // Registered directly, so nothing drains their queues.
  hub.registerClient(slow);
  hub.registerClient(fast);
  REQUIRE(hub.getClientCount() == 2);

  hub.broadcast("1");
  hub.broadcast("2");
  REQUIRE(hub.hasClient(slow));
  hub.broadcast("3");
  REQUIRE_FALSE(hub.hasClient(slow));
  REQUIRE(hub.hasClient(fast));
  REQUIRE(hub.getClientCount() == 1);
  REQUIRE_FALSE(slow->enqueue("4"));
  REQUIRE(fast->enqueue("4"));
  hub.stop();
}

TEST_CASE("A stalled writer gets its subscriber closed with 1013", "[Hub]") {
  Hub hub;
  hub.start();
  RunningClient stalled(&hub, 2);
  RunningClient healthy(&hub);
  REQUIRE(waitFor([&]() { return hub.getClientCount() == 2; }));

  stalled.socket->setWritesBlocked(true);
  for (int a = 0; a < 5; a++) {
    hub.broadcast("event " + to_string(a));
  }
  REQUIRE(waitFor([&]() { return hub.getClientCount() == 1; }));
  REQUIRE(healthy.socket->waitForOutbound(5));

  stalled.socket->setWritesBlocked(false);
  REQUIRE(stalled.socket->waitForClose());
  REQUIRE(stalled.socket->getCloseReason().code == CLOSE_TRY_AGAIN_LATER);
  stalled.thread->join();

  healthy.disconnect();
  hub.stop();
}

TEST_CASE("Stopping the hub closes subscribers as going away", "[Hub]") {
  Hub hub;
  hub.start();
  RunningClient client(&hub);
  REQUIRE(waitFor([&]() { return hub.getClientCount() == 1; }));

  hub.stop();
  REQUIRE(client.socket->waitForClose());
  REQUIRE(client.socket->getCloseReason().code == CLOSE_GOING_AWAY);
  client.thread->join();

  // Late calls are harmless.
  hub.broadcast("too late");
  REQUIRE(hub.getClientCount() == 0);
  hub.stop();
}

TEST_CASE("Typed events are broadcast as JSON", "[Hub]") {
  Hub hub;
  hub.start();
  RunningClient client(&hub);
  REQUIRE(waitFor([&]() { return hub.getClientCount() == 1; }));

  hub.flowStarted(17);
  hub.ledgerUpdate(99);
  REQUIRE(client.socket->waitForOutbound(2));
  auto messages = texts(client.socket);
  json started = json::parse(messages[0]);
  REQUIRE(started["type"] == "FLOW_STARTED");
  REQUIRE(started["payload"]["flowId"] == 17);
  json ledger = json::parse(messages[1]);
  REQUIRE(ledger["type"] == "LEDGER_UPDATE");
  REQUIRE(ledger["payload"]["entryId"] == 99);

  client.disconnect();
  hub.stop();
}
