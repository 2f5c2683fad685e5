#ifndef __FT_FAKE_FRAME_SOCKET_HPP__
#define __FT_FAKE_FRAME_SOCKET_HPP__

#include "FrameSocket.hpp"

namespace ft {
/**
 * @brief In-memory FrameSocket.  The test plays the remote peer: it queues
 * inbound frames, inspects what was written and can stall writes to simulate
 * a slow consumer.
 */
class FakeFrameSocket : public FrameSocket {
 public:
  struct Frame {
    string data;
    bool binary;
  };

  FakeFrameSocket()
      : closed(false), closeReason({0, ""}), writesBlocked(false) {}

  virtual bool readFrame(string* frame) {
    unique_lock<mutex> lock(socketMutex);
    socketCondition.wait(lock, [this] { return closed || !inbound.empty(); });
    if (closed) {
      return false;
    }
    *frame = inbound.front();
    inbound.pop_front();
    return true;
  }

  virtual void writeFrame(const string& frame, bool binary) {
    unique_lock<mutex> lock(socketMutex);
    socketCondition.wait(lock, [this] { return closed || !writesBlocked; });
    if (closed) {
      throw std::runtime_error("Socket is closed");
    }
    outbound.push_back({frame, binary});
    socketCondition.notify_all();
  }

  virtual void close(uint16_t code, const string& reason) {
    lock_guard<mutex> guard(socketMutex);
    if (!closed) {
      closed = true;
      closeReason = {code, reason};
    }
    socketCondition.notify_all();
  }

  virtual bool isClosed() {
    lock_guard<mutex> guard(socketMutex);
    return closed;
  }

  virtual CloseReason getCloseReason() {
    lock_guard<mutex> guard(socketMutex);
    return closeReason;
  }

  void pushInbound(const string& frame) {
    lock_guard<mutex> guard(socketMutex);
    inbound.push_back(frame);
    socketCondition.notify_all();
  }

  void setWritesBlocked(bool blocked) {
    lock_guard<mutex> guard(socketMutex);
    writesBlocked = blocked;
    socketCondition.notify_all();
  }

  bool waitForOutbound(size_t count, std::chrono::milliseconds timeout =
                                         std::chrono::milliseconds(5000)) {
    unique_lock<mutex> lock(socketMutex);
    return socketCondition.wait_for(
        lock, timeout, [this, count] { return outbound.size() >= count; });
  }

  bool waitForClose(std::chrono::milliseconds timeout =
                        std::chrono::milliseconds(5000)) {
    unique_lock<mutex> lock(socketMutex);
    return socketCondition.wait_for(lock, timeout, [this] { return closed; });
  }

  vector<Frame> getOutbound() {
    lock_guard<mutex> guard(socketMutex);
    return vector<Frame>(outbound.begin(), outbound.end());
  }

 protected:
  mutex socketMutex;
  std::condition_variable socketCondition;
  deque<string> inbound;
  deque<Frame> outbound;
  bool closed;
  CloseReason closeReason;
  bool writesBlocked;
};
}  // namespace ft

#endif  // __FT_FAKE_FRAME_SOCKET_HPP__
