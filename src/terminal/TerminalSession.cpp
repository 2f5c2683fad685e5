#include "TerminalSession.hpp"

namespace ft {
TerminalSession::TerminalSession(const string& _id,
                                 shared_ptr<ProcessAdapter> _adapter,
                                 shared_ptr<FrameSocket> _socket,
                                 const TerminalInfo& _dimensions)
    : id(_id),
      adapter(_adapter),
      socket(_socket),
      dimensions(_dimensions),
      promptWatcherEnabled(false),
      shuttingDown(false),
      finished(false) {}

TerminalSession::~TerminalSession() {
  if (!finished) {
    adapter->close();
  }
}

void TerminalSession::run(const string& banner) {
  if (!banner.empty()) {
    try {
      socket->writeFrame(banner, true);
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Could not send banner for session " << id << ": "
              << re.what();
    }
  }

  std::thread outputThread(&TerminalSession::runOutputPump, this);
  string frame;
  while (socket->readFrame(&frame)) {
    try {
      handleFrame(frame);
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Shell input failed for session " << id << ": "
                << re.what();
      socket->close(CLOSE_INTERNAL_ERROR, "terminal write failed");
      break;
    }
  }
  auto reason = socket->getCloseReason();
  LOG(INFO) << "Session " << id << " connection ended (" << reason.code << " "
            << reason.reason << ")";

  {
    lock_guard<recursive_mutex> guard(stateMutex);
    shuttingDown = true;
  }
  socket->close(CLOSE_NORMAL, "session closed");
  outputThread.join();
  // Once the process is dead no write can block, so the input lock frees up.
  // Closing under it keeps an injected command from reaching a reused fd.
  adapter->terminate();
  {
    lock_guard<mutex> guard(inputMutex);
    adapter->close();
  }
  finished = true;
  VLOG(1) << "Session " << id << " released its process";
}

void TerminalSession::shutdown() {
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    shuttingDown = true;
  }
  socket->close(CLOSE_GOING_AWAY, "server shutting down");
}

void TerminalSession::writeCommand(const string& command) {
  writeToProcess(command + "\n");
}

bool TerminalSession::isPromptWatcherEnabled() {
  lock_guard<recursive_mutex> guard(stateMutex);
  return promptWatcherEnabled;
}

void TerminalSession::setPromptWatcherEnabled(bool enabled) {
  lock_guard<recursive_mutex> guard(stateMutex);
  promptWatcherEnabled = enabled;
}

TerminalInfo TerminalSession::getDimensions() {
  lock_guard<recursive_mutex> guard(stateMutex);
  return dimensions;
}

void TerminalSession::runOutputPump() {
  el::Helpers::setThreadName("pty-output-" + id.substr(0, 8));
  string data;
  while (true) {
    {
      lock_guard<recursive_mutex> guard(stateMutex);
      if (shuttingDown) {
        break;
      }
    }
    ProcessAdapter::ReadStatus status;
    try {
      status = adapter->read(&data);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Terminal read error on session " << id << ": "
                   << re.what();
      socket->close(CLOSE_INTERNAL_ERROR, "terminal read failed");
      break;
    }
    if (status == ProcessAdapter::ReadStatus::TIMEOUT) {
      continue;
    }
    if (status == ProcessAdapter::ReadStatus::END) {
      LOG(INFO) << "Shell exited for session " << id;
      socket->close(CLOSE_PROCESS_EXITED, "process exited");
      break;
    }
    VLOG(4) << "Forwarding " << data.length() << " bytes for session " << id;
    try {
      socket->writeFrame(data, true);
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Write to client failed on session " << id << ": "
              << re.what();
      socket->close(CLOSE_INTERNAL_ERROR, "write failed");
      break;
    }
  }
}

void TerminalSession::handleFrame(const string& frame) {
  ControlFrame control = parseControlFrame(frame);
  switch (control.kind) {
    case ControlFrame::Kind::INPUT:
    case ControlFrame::Kind::RAW:
      writeToProcess(control.data);
      break;
    case ControlFrame::Kind::RESIZE: {
      if (!control.sizeValid) {
        LOG(WARNING) << "Ignoring resize with bad dimensions on session " << id
                     << ": " << control.size.row() << "x"
                     << control.size.column();
        break;
      }
      try {
        adapter->resize(control.size);
      } catch (const std::runtime_error& re) {
        LOG(WARNING) << "Resize error on session " << id << ": " << re.what();
        break;
      }
      lock_guard<recursive_mutex> guard(stateMutex);
      dimensions = control.size;
      break;
    }
    case ControlFrame::Kind::PROMPT_WATCHER:
      VLOG(1) << "Prompt watcher " << (control.enabled ? "on" : "off")
              << " for session " << id;
      setPromptWatcherEnabled(control.enabled);
      break;
  }
}

void TerminalSession::writeToProcess(const string& data) {
  if (data.empty()) {
    return;
  }
  lock_guard<mutex> guard(inputMutex);
  {
    lock_guard<recursive_mutex> stateGuard(stateMutex);
    if (shuttingDown) {
      throw std::runtime_error("Session is closing");
    }
  }
  adapter->write(data);
}
}  // namespace ft
