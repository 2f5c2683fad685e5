#ifndef __FT_WEBSOCKET_FRAME_SOCKET__
#define __FT_WEBSOCKET_FRAME_SOCKET__

// Boost has to come before Headers.hpp pulls std into the global namespace.
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "FrameSocket.hpp"
#include "Headers.hpp"

namespace ft {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

typedef websocket::stream<beast::tcp_stream> WebSocketStream;
typedef http::request<http::string_body> HttpRequest;
typedef http::response<http::string_body> HttpResponse;

/**
 * @brief FrameSocket over a Beast WebSocket stream.
 *
 * The stream lives on a strand of an io_context that some other thread is
 * running.  Each call posts the matching async operation onto the strand and
 * waits for its completion, which is what lets one thread read while others
 * write or close: Beast allows one read, one write and one close in flight.
 */
class WebSocketFrameSocket
    : public FrameSocket,
      public std::enable_shared_from_this<WebSocketFrameSocket> {
 public:
  explicit WebSocketFrameSocket(std::unique_ptr<WebSocketStream> _ws);
  virtual ~WebSocketFrameSocket();

  /**
   * @brief Completes the server side of an HTTP upgrade.
   * @param stream Connection whose executor is a strand of a running
   * io_context.
   * @param maxMessageSize Largest inbound message accepted, 0 for Beast's
   * default.
   * @throws boost::system::system_error when the handshake fails.
   */
  static shared_ptr<WebSocketFrameSocket> acceptUpgrade(
      beast::tcp_stream stream, const HttpRequest& request,
      size_t maxMessageSize);

  /**
   * @brief Opens a client connection to ws://endpoint/target.
   * @param origin Value of the Origin header, or empty to send none.
   * @throws boost::system::system_error when resolve/connect/handshake fails.
   */
  static shared_ptr<WebSocketFrameSocket> connect(
      net::io_context& ioc, const SocketEndpoint& endpoint,
      const string& target, const string& origin);

  virtual bool readFrame(string* frame);
  virtual void writeFrame(const string& frame, bool binary);
  virtual void close(uint16_t code, const string& reason);
  virtual bool isClosed();
  virtual CloseReason getCloseReason();

 protected:
  void recordClose(const CloseReason& reason);
  void closeTransport();

  std::unique_ptr<WebSocketStream> ws;
  /** @brief Serializes writers so only one async_write is in flight. */
  mutex writeMutex;
  /** @brief Guards the fields below. */
  mutex stateMutex;
  bool closing;
  bool closed;
  CloseReason closeReason;
};
}  // namespace ft

#endif  // __FT_WEBSOCKET_FRAME_SOCKET__
