#ifndef __FT_WEBSOCKET_CLIENT_TRANSPORT_HPP__
#define __FT_WEBSOCKET_CLIENT_TRANSPORT_HPP__

#include "WebSocketFrameSocket.hpp"

#include "Headers.hpp"
#include "Transport.hpp"

namespace ft {
/**
 * @brief Transport that dials ws://endpoint/target.  Each open() runs the
 * connect and the read loop on a fresh connection thread.
 */
class WebSocketClientTransport : public Transport {
 public:
  WebSocketClientTransport(const SocketEndpoint& _endpoint,
                           const string& _target, const string& _origin);
  virtual ~WebSocketClientTransport();

  virtual void setListener(TransportListener* _listener);
  virtual void open();
  virtual void send(const string& frame);
  virtual void close(uint16_t code, const string& reason);

 protected:
  void runConnection();
  TransportListener* getListener();

  SocketEndpoint endpoint;
  string target;
  string origin;
  net::io_context ioContext;
  net::executor_work_guard<net::io_context::executor_type> work;
  std::thread ioThread;

  mutex transportMutex;
  TransportListener* listener;
  shared_ptr<WebSocketFrameSocket> socket;
  std::thread connectionThread;
};
}  // namespace ft

#endif  // __FT_WEBSOCKET_CLIENT_TRANSPORT_HPP__
