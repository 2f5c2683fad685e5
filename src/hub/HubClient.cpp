#include "HubClient.hpp"

#include "Hub.hpp"

namespace ft {
HubClient::HubClient(Hub* _hub, shared_ptr<FrameSocket> _socket,
                     size_t queueCapacity)
    : id(sole::uuid4().str()),
      hub(_hub),
      socket(_socket),
      outbound(queueCapacity),
      queueCloseReason({CLOSE_NORMAL, ""}) {}

void HubClient::run() {
  auto self = shared_from_this();
  hub->registerClient(self);
  std::thread writer(&HubClient::runWritePump, this);

  string frame;
  while (socket->readFrame(&frame)) {
    VLOG(3) << "Discarding " << frame.length() << " bytes from hub client "
            << id;
  }
  auto reason = socket->getCloseReason();
  VLOG(1) << "Hub client " << id << " read ended (" << reason.code << " "
          << reason.reason << ")";

  hub->unregisterClient(self);
  // The hub may already be stopped, in which case nobody else closes it.
  closeQueue(CLOSE_NORMAL, "");
  writer.join();
}

bool HubClient::enqueue(const string& message) {
  return outbound.tryPush(message);
}

void HubClient::closeQueue(uint16_t code, const string& reason) {
  lock_guard<mutex> guard(closeMutex);
  if (outbound.isClosed()) {
    return;
  }
  queueCloseReason = {code, reason};
  outbound.close();
}

void HubClient::runWritePump() {
  el::Helpers::setThreadName("hub-writer");
  string message;
  while (outbound.pop(&message) == BoundedQueue<string>::PopResult::ITEM) {
    try {
      socket->writeFrame(message, false);
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Write to hub client " << id << " failed: " << re.what();
      socket->close(CLOSE_INTERNAL_ERROR, "write failed");
      return;
    }
  }
  CloseReason reason;
  {
    lock_guard<mutex> guard(closeMutex);
    reason = queueCloseReason;
  }
  socket->close(reason.code, reason.reason);
}
}  // namespace ft
