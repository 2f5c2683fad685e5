#include "WebSocketFrameSocket.hpp"

namespace ft {
namespace {
const std::chrono::seconds CLOSE_HANDSHAKE_TIMEOUT(5);
}

WebSocketFrameSocket::WebSocketFrameSocket(std::unique_ptr<WebSocketStream> _ws)
    : ws(std::move(_ws)),
      closing(false),
      closed(false),
      closeReason({CLOSE_ABNORMAL, ""}) {}

WebSocketFrameSocket::~WebSocketFrameSocket() {}

shared_ptr<WebSocketFrameSocket> WebSocketFrameSocket::acceptUpgrade(
    beast::tcp_stream stream, const HttpRequest& request,
    size_t maxMessageSize) {
  std::unique_ptr<WebSocketStream> ws(new WebSocketStream(std::move(stream)));
  // The websocket layer has its own timeouts; the tcp_stream one must be off.
  beast::get_lowest_layer(*ws).expires_never();
  ws->set_option(websocket::stream_base::timeout::suggested(
      beast::role_type::server));
  ws->set_option(
      websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, string("ftserver/") + FT_VERSION);
      }));
  if (maxMessageSize > 0) {
    ws->read_message_max(maxMessageSize);
  }
  ws->accept(request);
  return std::make_shared<WebSocketFrameSocket>(std::move(ws));
}

shared_ptr<WebSocketFrameSocket> WebSocketFrameSocket::connect(
    net::io_context& ioc, const SocketEndpoint& endpoint, const string& target,
    const string& origin) {
  tcp::resolver resolver(ioc);
  auto results = resolver.resolve(endpoint.name(), to_string(endpoint.port()));
  std::unique_ptr<WebSocketStream> ws(
      new WebSocketStream(net::make_strand(ioc)));
  beast::get_lowest_layer(*ws).connect(results);
  ws->set_option(websocket::stream_base::decorator(
      [origin](websocket::request_type& req) {
        req.set(http::field::user_agent, string("ftclient/") + FT_VERSION);
        if (!origin.empty()) {
          req.set(http::field::origin, origin);
        }
      }));
  VLOG(1) << "Websocket handshake with " << endpoint << target;
  ws->handshake(endpoint.name() + ":" + to_string(endpoint.port()), target);
  beast::get_lowest_layer(*ws).expires_never();
  ws->set_option(websocket::stream_base::timeout::suggested(
      beast::role_type::client));
  return std::make_shared<WebSocketFrameSocket>(std::move(ws));
}

bool WebSocketFrameSocket::readFrame(string* frame) {
  auto self = shared_from_this();
  auto done = make_shared<promise<beast::error_code>>();
  auto result = done->get_future();
  auto buffer = make_shared<beast::flat_buffer>();
  auto peerReason = make_shared<websocket::close_reason>();
  net::dispatch(ws->get_executor(), [self, done, buffer, peerReason]() {
    self->ws->async_read(
        *buffer, [self, done, peerReason](beast::error_code ec, size_t) {
          if (ec == websocket::error::closed) {
            *peerReason = self->ws->reason();
          }
          done->set_value(ec);
        });
  });

  beast::error_code ec = result.get();
  if (!ec) {
    *frame = beast::buffers_to_string(buffer->data());
    return true;
  }
  if (ec == websocket::error::closed) {
    VLOG(1) << "Peer closed websocket: " << peerReason->code << " "
            << peerReason->reason;
    recordClose({uint16_t(peerReason->code), string(peerReason->reason)});
  } else {
    VLOG(1) << "Websocket read ended: " << ec.message();
    recordClose({CLOSE_ABNORMAL, ec.message()});
  }
  return false;
}

void WebSocketFrameSocket::writeFrame(const string& frame, bool binary) {
  lock_guard<mutex> guard(writeMutex);
  if (isClosed()) {
    throw std::runtime_error("Tried to write to a closed websocket");
  }
  auto self = shared_from_this();
  auto done = make_shared<promise<beast::error_code>>();
  auto result = done->get_future();
  auto payload = make_shared<string>(frame);
  net::dispatch(ws->get_executor(), [self, done, payload, binary]() {
    self->ws->binary(binary);
    self->ws->async_write(
        net::buffer(*payload),
        [done, payload](beast::error_code ec, size_t) { done->set_value(ec); });
  });
  beast::error_code ec = result.get();
  if (ec) {
    recordClose({CLOSE_ABNORMAL, ec.message()});
    throw std::runtime_error("Websocket write failed: " + ec.message());
  }
}

void WebSocketFrameSocket::close(uint16_t code, const string& reason) {
  {
    lock_guard<mutex> guard(stateMutex);
    if (closing) {
      return;
    }
    closing = true;
  }
  auto self = shared_from_this();
  auto done = make_shared<promise<beast::error_code>>();
  auto result = done->get_future();
  websocket::close_reason closeFrame(code, reason);
  net::dispatch(ws->get_executor(), [self, done, closeFrame]() {
    self->ws->async_close(closeFrame, [done](beast::error_code ec) {
      done->set_value(ec);
    });
  });

  if (result.wait_for(CLOSE_HANDSHAKE_TIMEOUT) == std::future_status::timeout) {
    LOG(WARNING) << "Close handshake timed out, dropping the connection";
  } else {
    beast::error_code ec = result.get();
    if (ec) {
      VLOG(1) << "Close handshake ended with: " << ec.message();
    }
  }
  closeTransport();
  lock_guard<mutex> guard(stateMutex);
  if (!closed) {
    closed = true;
    closeReason = {code, reason};
  }
}

bool WebSocketFrameSocket::isClosed() {
  lock_guard<mutex> guard(stateMutex);
  return closed || closing;
}

CloseReason WebSocketFrameSocket::getCloseReason() {
  lock_guard<mutex> guard(stateMutex);
  return closeReason;
}

void WebSocketFrameSocket::recordClose(const CloseReason& reason) {
  lock_guard<mutex> guard(stateMutex);
  if (!closed) {
    closed = true;
    closeReason = reason;
  }
}

void WebSocketFrameSocket::closeTransport() {
  auto self = shared_from_this();
  net::dispatch(ws->get_executor(), [self]() {
    beast::error_code ignored;
    beast::get_lowest_layer(*self->ws).socket().shutdown(
        tcp::socket::shutdown_both, ignored);
    beast::get_lowest_layer(*self->ws).close();
  });
}
}  // namespace ft
