#ifndef __FT_FRAME_SOCKET__
#define __FT_FRAME_SOCKET__

#include "CloseCodes.hpp"
#include "Headers.hpp"

namespace ft {
/**
 * @brief Message-oriented, full-duplex connection (one WebSocket).
 *
 * One thread may sit in readFrame() while another writes or closes.  Writes
 * from several threads are serialized by the implementation.
 */
class FrameSocket {
 public:
  virtual ~FrameSocket() {}

  /**
   * @brief Blocks until the next data frame arrives.
   * @return false once the connection is closed, by the peer, by close(), or
   * by a transport error.  getCloseReason() then says why.
   */
  virtual bool readFrame(string* frame) = 0;

  /**
   * @brief Sends one frame.
   * @param binary Send as a binary frame instead of a text frame.
   * @throws std::runtime_error when the connection can no longer be written.
   */
  virtual void writeFrame(const string& frame, bool binary) = 0;

  /**
   * @brief Starts the closing handshake with @p code and shuts the transport
   * down.  Safe to call more than once and from any thread.
   */
  virtual void close(uint16_t code, const string& reason) = 0;

  /** @brief True once close() ran or the peer went away. */
  virtual bool isClosed() = 0;

  /**
   * @brief Close code and reason the peer sent, or CLOSE_ABNORMAL when the
   * connection dropped without a close frame.
   */
  virtual CloseReason getCloseReason() = 0;
};
}  // namespace ft

#endif  // __FT_FRAME_SOCKET__
