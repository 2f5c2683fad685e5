#include "ConnectionController.hpp"

#include "ControlFrame.hpp"

namespace ft {
string connectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::DISCONNECTED:
      return "disconnected";
    case ConnectionState::CONNECTING:
      return "connecting";
    case ConnectionState::CONNECTED:
      return "connected";
    case ConnectionState::RECONNECTING:
      return "reconnecting";
    case ConnectionState::FAILED:
      return "failed";
  }
  return "unknown";
}

ConnectionController::ConnectionController(shared_ptr<Transport> _transport,
                                           shared_ptr<Scheduler> _scheduler,
                                           const ReconnectPolicy& _policy)
    : transport(_transport),
      scheduler(_scheduler),
      policy(_policy),
      state(ConnectionState::DISCONNECTED),
      attempt(0),
      backoffTimer(0),
      debounceTimer(0),
      promptWatcherEnabled(false) {
  transport->setListener(this);
}

ConnectionController::~ConnectionController() {
  lock_guard<recursive_mutex> guard(controllerMutex);
  if (backoffTimer) {
    scheduler->cancel(backoffTimer);
  }
  if (debounceTimer) {
    scheduler->cancel(debounceTimer);
  }
  transport->setListener(NULL);
}

void ConnectionController::setStateListener(StateListener _stateListener) {
  lock_guard<recursive_mutex> guard(controllerMutex);
  stateListener = _stateListener;
}

void ConnectionController::setOutputListener(OutputListener _outputListener) {
  lock_guard<recursive_mutex> guard(controllerMutex);
  outputListener = _outputListener;
}

void ConnectionController::connect() {
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    if (state != ConnectionState::DISCONNECTED) {
      VLOG(1) << "connect() ignored while " << connectionStateName(state);
      return;
    }
    attempt = 0;
    setStateLocked(ConnectionState::CONNECTING);
  }
  notifyState(ConnectionState::CONNECTING);
  transport->open();
}

void ConnectionController::retry() {
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    if (state != ConnectionState::FAILED &&
        state != ConnectionState::DISCONNECTED) {
      VLOG(1) << "retry() ignored while " << connectionStateName(state);
      return;
    }
    if (backoffTimer) {
      scheduler->cancel(backoffTimer);
      backoffTimer = 0;
    }
    attempt = 0;
    setStateLocked(ConnectionState::CONNECTING);
  }
  notifyState(ConnectionState::CONNECTING);
  transport->open();
}

void ConnectionController::disconnect() {
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    if (backoffTimer) {
      scheduler->cancel(backoffTimer);
      backoffTimer = 0;
    }
    if (debounceTimer) {
      scheduler->cancel(debounceTimer);
      debounceTimer = 0;
    }
    setStateLocked(ConnectionState::DISCONNECTED);
  }
  notifyState(ConnectionState::DISCONNECTED);
  transport->close(CLOSE_NORMAL, "client closed");
}

void ConnectionController::sendInput(const string& data) {
  if (getState() != ConnectionState::CONNECTED) {
    VLOG(2) << "Dropping " << data.length() << " bytes of input while "
            << connectionStateName(getState());
    return;
  }
  sendFrame(encodeInputFrame(data));
}

void ConnectionController::setTerminalSize(const TerminalInfo& size) {
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    terminalSize = size;
    if (state != ConnectionState::CONNECTED) {
      return;
    }
  }
  sendFrame(encodeResizeFrame(size));
}

void ConnectionController::setPromptWatcherEnabled(bool enabled) {
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    promptWatcherEnabled = enabled;
    if (state != ConnectionState::CONNECTED) {
      return;
    }
  }
  sendFrame(encodePromptWatcherFrame(enabled));
}

bool ConnectionController::isPromptWatcherEnabled() {
  lock_guard<recursive_mutex> guard(controllerMutex);
  return promptWatcherEnabled;
}

ConnectionState ConnectionController::getState() {
  lock_guard<recursive_mutex> guard(controllerMutex);
  return state;
}

int ConnectionController::getAttempt() {
  lock_guard<recursive_mutex> guard(controllerMutex);
  return attempt;
}

bool ConnectionController::isRetryable(uint16_t code) {
  switch (code) {
    case CLOSE_GOING_AWAY:
    case CLOSE_ABNORMAL:
    case CLOSE_INTERNAL_ERROR:
    case CLOSE_SERVICE_RESTART:
    case CLOSE_TRY_AGAIN_LATER:
      return true;
    default:
      return false;
  }
}

std::chrono::milliseconds ConnectionController::backoffDelay(
    const ReconnectPolicy& policy, int attempt) {
  auto delay = policy.baseDelay;
  for (int a = 0; a < attempt && delay < policy.maxDelay; a++) {
    delay *= 2;
  }
  return std::min(delay, policy.maxDelay);
}

void ConnectionController::onOpen() {
  TerminalInfo size;
  bool watcher;
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    if (state == ConnectionState::DISCONNECTED) {
      // disconnect() raced with the connect.
      transport->close(CLOSE_NORMAL, "client closed");
      return;
    }
    if (backoffTimer) {
      scheduler->cancel(backoffTimer);
      backoffTimer = 0;
    }
    attempt = 0;
    outputBuffer.clear();
    setStateLocked(ConnectionState::CONNECTED);
    size = terminalSize;
    watcher = promptWatcherEnabled;
  }
  notifyState(ConnectionState::CONNECTED);
  if (size.row() > 0 && size.column() > 0) {
    sendFrame(encodeResizeFrame(size));
  }
  if (watcher) {
    sendFrame(encodePromptWatcherFrame(true));
  }
}

void ConnectionController::onMessage(const string& frame) {
  OutputListener listener;
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    outputBuffer.append(frame);
    if (outputBuffer.length() > policy.maxBufferLength) {
      outputBuffer.erase(0, outputBuffer.length() - policy.maxBufferLength);
    }
    if (debounceTimer) {
      scheduler->cancel(debounceTimer);
    }
    debounceTimer =
        scheduler->schedule(policy.debounce, [this]() { runPromptCheck(); });
    listener = outputListener;
  }
  if (listener) {
    listener(frame);
  }
}

void ConnectionController::onClose(const CloseReason& reason) {
  ConnectionState newState;
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    if (debounceTimer) {
      scheduler->cancel(debounceTimer);
      debounceTimer = 0;
    }
    if (state == ConnectionState::DISCONNECTED ||
        state == ConnectionState::FAILED) {
      VLOG(1) << "Close " << reason.code << " after the controller stopped";
      return;
    }
    LOG(INFO) << "Connection closed: " << reason.code << " " << reason.reason;
    if (!isRetryable(reason.code)) {
      setStateLocked(ConnectionState::DISCONNECTED);
    } else {
      attempt++;
      if (attempt >= policy.maxAttempts) {
        LOG(WARNING) << "Giving up after " << attempt << " attempts";
        setStateLocked(ConnectionState::FAILED);
      } else {
        auto delay = backoffDelay(policy, attempt - 1);
        LOG(INFO) << "Reconnecting in " << delay.count() << "ms (attempt "
                  << attempt << ")";
        setStateLocked(ConnectionState::RECONNECTING);
        backoffTimer =
            scheduler->schedule(delay, [this]() { reconnectNow(); });
      }
    }
    newState = state;
  }
  notifyState(newState);
}

void ConnectionController::setStateLocked(ConnectionState newState) {
  VLOG(1) << "Connection state " << connectionStateName(state) << " -> "
          << connectionStateName(newState);
  state = newState;
}

void ConnectionController::notifyState(ConnectionState newState) {
  StateListener listener;
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    listener = stateListener;
  }
  if (listener) {
    listener(newState);
  }
}

void ConnectionController::reconnectNow() {
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    backoffTimer = 0;
    if (state != ConnectionState::RECONNECTING) {
      return;
    }
    setStateLocked(ConnectionState::CONNECTING);
  }
  notifyState(ConnectionState::CONNECTING);
  transport->open();
}

void ConnectionController::runPromptCheck() {
  string keys;
  {
    lock_guard<recursive_mutex> guard(controllerMutex);
    debounceTimer = 0;
    if (state != ConnectionState::CONNECTED || !promptWatcherEnabled) {
      return;
    }
    auto detection = PromptDetector::detect(outputBuffer);
    if (!detection.shouldAutoRespond()) {
      if (detection.waiting) {
        VLOG(1) << "Prompt seen but confidence too low to answer";
      }
      return;
    }
    keys = detection.responseKeys();
    outputBuffer.clear();
  }
  LOG(INFO) << "Prompt watcher answering a confirmation prompt";
  sendFrame(encodeInputFrame(keys));
}

void ConnectionController::sendFrame(const string& frame) {
  try {
    transport->send(frame);
  } catch (const std::runtime_error& re) {
    VLOG(1) << "Send failed: " << re.what();
  }
}
}  // namespace ft
