#include "ConnectionController.hpp"
#include "ControlFrame.hpp"
#include "FakeScheduler.hpp"
#include "FakeTransport.hpp"
#include "TestHeaders.hpp"

using namespace ft;

namespace {
struct ControllerFixture {
  ControllerFixture()
      : transport(new FakeTransport()),
        scheduler(new FakeScheduler()),
        controller(new ConnectionController(transport, scheduler)) {
    controller->setStateListener(
        [this](ConnectionState state) { states.push_back(state); });
    controller->setOutputListener(
        [this](const string& output) { received += output; });
  }

  void connectAndOpen() {
    controller->connect();
    transport->acceptOpen();
  }

  vector<ControlFrame> sentInputs() {
    vector<ControlFrame> inputs;
    for (const auto& it : transport->sent) {
      auto frame = parseControlFrame(it);
      if (frame.kind == ControlFrame::Kind::INPUT) {
        inputs.push_back(frame);
      }
    }
    return inputs;
  }

  shared_ptr<FakeTransport> transport;
  shared_ptr<FakeScheduler> scheduler;
  shared_ptr<ConnectionController> controller;
  vector<ConnectionState> states;
  string received;
};
}  // namespace

TEST_CASE("Backoff doubles up to the cap", "[ConnectionController]") {
  ReconnectPolicy policy;
  REQUIRE(ConnectionController::backoffDelay(policy, 0).count() == 1000);
  REQUIRE(ConnectionController::backoffDelay(policy, 1).count() == 2000);
  REQUIRE(ConnectionController::backoffDelay(policy, 2).count() == 4000);
  REQUIRE(ConnectionController::backoffDelay(policy, 3).count() == 8000);
  REQUIRE(ConnectionController::backoffDelay(policy, 5).count() == 30000);
  REQUIRE(ConnectionController::backoffDelay(policy, 60).count() == 30000);
}

TEST_CASE("Close codes are classified", "[ConnectionController]") {
  for (uint16_t code : {1001, 1006, 1011, 1012, 1013}) {
    REQUIRE(ConnectionController::isRetryable(code));
  }
  for (uint16_t code : {1000, 1008, 4000, 4001}) {
    REQUIRE_FALSE(ConnectionController::isRetryable(code));
  }
}

TEST_CASE("Connecting sends the current size", "[ConnectionController]") {
  ControllerFixture f;
  TerminalInfo size;
  size.set_row(40);
  size.set_column(100);
  f.controller->setTerminalSize(size);
  REQUIRE(f.transport->sent.empty());

  f.controller->connect();
  REQUIRE(f.controller->getState() == ConnectionState::CONNECTING);
  REQUIRE(f.transport->openCount == 1);

  f.transport->acceptOpen();
  REQUIRE(f.controller->getState() == ConnectionState::CONNECTED);
  REQUIRE(f.transport->sent.size() == 1);
  auto frame = parseControlFrame(f.transport->sent[0]);
  REQUIRE(frame.kind == ControlFrame::Kind::RESIZE);
  REQUIRE(frame.size.row() == 40);
  REQUIRE(frame.size.column() == 100);
  REQUIRE(f.states == vector<ConnectionState>{ConnectionState::CONNECTING,
                                              ConnectionState::CONNECTED});
}

TEST_CASE("Retryable closes back off and eventually fail",
          "[ConnectionController]") {
  ControllerFixture f;
  f.connectAndOpen();

  int64_t expectedDelays[] = {1000, 2000, 4000, 8000};
  for (int a = 0; a < 4; a++) {
    f.transport->drop(1006);
    REQUIRE(f.controller->getState() == ConnectionState::RECONNECTING);
    REQUIRE(f.controller->getAttempt() == a + 1);
    REQUIRE(f.scheduler->getNextDelay() == expectedDelays[a]);

    int opensBefore = f.transport->openCount;
    f.scheduler->advance(std::chrono::milliseconds(expectedDelays[a] - 1));
    REQUIRE(f.transport->openCount == opensBefore);
    f.scheduler->advance(std::chrono::milliseconds(1));
    REQUIRE(f.transport->openCount == opensBefore + 1);
    REQUIRE(f.controller->getState() == ConnectionState::CONNECTING);
  }

  f.transport->drop(1006);
  REQUIRE(f.controller->getState() == ConnectionState::FAILED);
  REQUIRE(f.scheduler->getPendingCount() == 0);
  int opens = f.transport->openCount;
  f.scheduler->advance(std::chrono::milliseconds(120000));
  REQUIRE(f.transport->openCount == opens);

  // Only the user gets out of FAILED.
  f.controller->retry();
  REQUIRE(f.controller->getState() == ConnectionState::CONNECTING);
  REQUIRE(f.controller->getAttempt() == 0);
  REQUIRE(f.transport->openCount == opens + 1);
  f.transport->acceptOpen();
  REQUIRE(f.controller->getState() == ConnectionState::CONNECTED);
}

TEST_CASE("A successful reconnect resets the attempt count",
          "[ConnectionController]") {
  ControllerFixture f;
  f.connectAndOpen();
  f.transport->drop(1011);
  f.scheduler->advance(std::chrono::milliseconds(1000));
  f.transport->drop(1011);
  REQUIRE(f.controller->getAttempt() == 2);
  f.scheduler->advance(std::chrono::milliseconds(2000));
  f.transport->acceptOpen();
  REQUIRE(f.controller->getState() == ConnectionState::CONNECTED);
  REQUIRE(f.controller->getAttempt() == 0);

  f.transport->drop(1001);
  REQUIRE(f.scheduler->getNextDelay() == 1000);
}

TEST_CASE("Terminal closes do not reconnect", "[ConnectionController]") {
  for (uint16_t code : {1000, 4000}) {
    ControllerFixture f;
    f.connectAndOpen();
    f.transport->drop(code);
    REQUIRE(f.controller->getState() == ConnectionState::DISCONNECTED);
    REQUIRE(f.scheduler->getPendingCount() == 0);
  }
}

TEST_CASE("Disconnect cancels a pending reconnect", "[ConnectionController]") {
  ControllerFixture f;
  f.connectAndOpen();
  f.transport->drop(1006);
  REQUIRE(f.scheduler->getPendingCount() == 1);

  f.controller->disconnect();
  REQUIRE(f.controller->getState() == ConnectionState::DISCONNECTED);
  REQUIRE(f.scheduler->getPendingCount() == 0);
  REQUIRE(f.transport->closeCodes.back() == 1000);
  f.scheduler->advance(std::chrono::milliseconds(60000));
  REQUIRE(f.transport->openCount == 1);
}

TEST_CASE("Input is only sent while connected", "[ConnectionController]") {
  ControllerFixture f;
  f.controller->sendInput("lost\r");
  REQUIRE(f.transport->sent.empty());

  f.connectAndOpen();
  f.controller->sendInput("ls\r");
  auto inputs = f.sentInputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].data == "ls\r");

  f.transport->drop(1006);
  f.controller->sendInput("also lost\r");
  REQUIRE(f.sentInputs().size() == 1);
}

TEST_CASE("Output reaches the listener", "[ConnectionController]") {
  ControllerFixture f;
  f.connectAndOpen();
  f.transport->deliver("hello ");
  f.transport->deliver("world");
  REQUIRE(f.received == "hello world");
}

TEST_CASE("The prompt watcher answers after the output settles",
          "[ConnectionController]") {
  ControllerFixture f;
  f.connectAndOpen();
  f.controller->setPromptWatcherEnabled(true);
  auto toggle = parseControlFrame(f.transport->sent.back());
  REQUIRE(toggle.kind == ControlFrame::Kind::PROMPT_WATCHER);
  REQUIRE(toggle.enabled);

  f.transport->deliver("Do you want to continue?");
  f.scheduler->advance(std::chrono::milliseconds(400));
  f.transport->deliver(" [Y/n]\n");
  f.scheduler->advance(std::chrono::milliseconds(400));
  REQUIRE(f.sentInputs().empty());

  f.scheduler->advance(std::chrono::milliseconds(100));
  auto inputs = f.sentInputs();
  REQUIRE(inputs.size() == 1);
  REQUIRE(inputs[0].data == "y\r");

  // The answered prompt is forgotten.
  f.transport->deliver("ok\r\n");
  f.scheduler->advance(std::chrono::milliseconds(1000));
  REQUIRE(f.sentInputs().size() == 1);
}

TEST_CASE("The prompt watcher stays quiet when it should",
          "[ConnectionController]") {
  SECTION("Disabled") {
    ControllerFixture f;
    f.connectAndOpen();
    f.transport->deliver("Do you want to continue? [Y/n]\n");
    f.scheduler->advance(std::chrono::milliseconds(1000));
    REQUIRE(f.sentInputs().empty());
  }

  SECTION("Low confidence") {
    ControllerFixture f;
    f.connectAndOpen();
    f.controller->setPromptWatcherEnabled(true);
    f.transport->deliver("Select an option\n❯ Yes\n  No\n");
    f.scheduler->advance(std::chrono::milliseconds(1000));
    REQUIRE(f.sentInputs().empty());
  }

  SECTION("Menu with instructions is acknowledged") {
    ControllerFixture f;
    f.connectAndOpen();
    f.controller->setPromptWatcherEnabled(true);
    f.transport->deliver("❯ Yes\nUse arrow keys or Enter to select\n");
    f.scheduler->advance(std::chrono::milliseconds(500));
    auto inputs = f.sentInputs();
    REQUIRE(inputs.size() == 1);
    REQUIRE(inputs[0].data == "\r");
  }
}

TEST_CASE("Toggling the watcher off and on restores it",
          "[ConnectionController]") {
  ControllerFixture f;
  f.controller->setPromptWatcherEnabled(true);
  f.connectAndOpen();
  size_t sentAfterOpen = f.transport->sent.size();
  REQUIRE(parseControlFrame(f.transport->sent.back()).kind ==
          ControlFrame::Kind::PROMPT_WATCHER);

  f.controller->setPromptWatcherEnabled(false);
  f.controller->setPromptWatcherEnabled(true);
  REQUIRE(f.controller->isPromptWatcherEnabled());
  REQUIRE(f.controller->getState() == ConnectionState::CONNECTED);
  REQUIRE(f.transport->sent.size() == sentAfterOpen + 2);
}
