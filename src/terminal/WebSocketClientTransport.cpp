#include "WebSocketClientTransport.hpp"

namespace ft {
WebSocketClientTransport::WebSocketClientTransport(
    const SocketEndpoint& _endpoint, const string& _target,
    const string& _origin)
    : endpoint(_endpoint),
      target(_target),
      origin(_origin),
      work(net::make_work_guard(ioContext)),
      listener(NULL) {
  ioThread = std::thread([this]() {
    el::Helpers::setThreadName("ws-io");
    ioContext.run();
  });
}

WebSocketClientTransport::~WebSocketClientTransport() {
  close(CLOSE_GOING_AWAY, "client exiting");
  std::thread lastConnection;
  {
    lock_guard<mutex> guard(transportMutex);
    listener = NULL;
    lastConnection = std::move(connectionThread);
  }
  if (lastConnection.joinable()) {
    lastConnection.join();
  }
  work.reset();
  ioContext.stop();
  ioThread.join();
}

void WebSocketClientTransport::setListener(TransportListener* _listener) {
  lock_guard<mutex> guard(transportMutex);
  listener = _listener;
}

void WebSocketClientTransport::open() {
  std::thread previous;
  {
    lock_guard<mutex> guard(transportMutex);
    previous = std::move(connectionThread);
  }
  // The previous connection has already reported onClose.
  if (previous.joinable()) {
    previous.join();
  }
  lock_guard<mutex> guard(transportMutex);
  connectionThread =
      std::thread(&WebSocketClientTransport::runConnection, this);
}

void WebSocketClientTransport::send(const string& frame) {
  shared_ptr<WebSocketFrameSocket> current;
  {
    lock_guard<mutex> guard(transportMutex);
    current = socket;
  }
  if (!current) {
    throw std::runtime_error("Not connected");
  }
  current->writeFrame(frame, false);
}

void WebSocketClientTransport::close(uint16_t code, const string& reason) {
  shared_ptr<WebSocketFrameSocket> current;
  {
    lock_guard<mutex> guard(transportMutex);
    current = socket;
  }
  if (current) {
    current->close(code, reason);
  }
}

TransportListener* WebSocketClientTransport::getListener() {
  lock_guard<mutex> guard(transportMutex);
  return listener;
}

void WebSocketClientTransport::runConnection() {
  el::Helpers::setThreadName("ws-client");
  shared_ptr<WebSocketFrameSocket> newSocket;
  try {
    newSocket = WebSocketFrameSocket::connect(ioContext, endpoint, target,
                                              origin);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Could not connect to " << endpoint << ": " << re.what();
    auto current = getListener();
    if (current) {
      current->onClose({CLOSE_ABNORMAL, re.what()});
    }
    return;
  }
  {
    lock_guard<mutex> guard(transportMutex);
    socket = newSocket;
  }
  LOG(INFO) << "Connected to " << endpoint << target;
  auto current = getListener();
  if (current) {
    current->onOpen();
  }

  string frame;
  while (newSocket->readFrame(&frame)) {
    current = getListener();
    if (current) {
      current->onMessage(frame);
    }
  }

  {
    lock_guard<mutex> guard(transportMutex);
    if (socket == newSocket) {
      socket.reset();
    }
  }
  // Release the transport on our side too.
  newSocket->close(CLOSE_NORMAL, "");
  current = getListener();
  if (current) {
    current->onClose(newSocket->getCloseReason());
  }
}
}  // namespace ft
