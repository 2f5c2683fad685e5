#ifndef __FT_TRANSPORT_HPP__
#define __FT_TRANSPORT_HPP__

#include "CloseCodes.hpp"
#include "Headers.hpp"

namespace ft {
/**
 * @brief Receives the events of a client transport.  Callbacks arrive on the
 * transport's own thread.
 */
class TransportListener {
 public:
  virtual ~TransportListener() {}
  virtual void onOpen() = 0;
  virtual void onMessage(const string& frame) = 0;
  /** @brief Called once per open(), whether it connected or not. */
  virtual void onClose(const CloseReason& reason) = 0;
};

/**
 * @brief A client connection that can be reopened after it closes.
 */
class Transport {
 public:
  virtual ~Transport() {}

  virtual void setListener(TransportListener* _listener) = 0;

  /**
   * @brief Starts connecting.  The outcome is reported through onOpen or
   * onClose.
   */
  virtual void open() = 0;

  /** @throws std::runtime_error when not connected or the write fails. */
  virtual void send(const string& frame) = 0;

  virtual void close(uint16_t code, const string& reason) = 0;
};
}  // namespace ft

#endif  // __FT_TRANSPORT_HPP__
