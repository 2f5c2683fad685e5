#ifndef __FT_TERMINAL_SERVER__
#define __FT_TERMINAL_SERVER__

#include "WebSocketFrameSocket.hpp"

#include "ApiHandler.hpp"
#include "Headers.hpp"
#include "Hub.hpp"
#include "OriginPolicy.hpp"
#include "SessionRegistry.hpp"

namespace ft {
/**
 * @brief ftserver's listener.
 *
 * Routes each accepted connection by path: /ws/pty upgrades into a terminal
 * session, /ws into a hub subscriber, and everything else goes to the
 * ApiHandler.  Handshakes run on a small thread pool.  Each live session or
 * subscriber then gets its own thread until it ends.
 */
class TerminalServer {
 public:
  static const int IO_THREADS = 2;
  static const int HANDSHAKE_THREADS = 8;
  /** @brief Largest frame a hub subscriber may send. */
  static const size_t HUB_MAX_MESSAGE_SIZE = 512;

  TerminalServer(const SocketEndpoint& _serverEndpoint,
                 shared_ptr<SessionRegistry> _registry, shared_ptr<Hub> _hub,
                 shared_ptr<OriginPolicy> _originPolicy);
  virtual ~TerminalServer();

  /**
   * @brief Binds the listening socket.
   * @return The bound port (useful when asked for port 0).
   * @throws boost::system::system_error when the address is unavailable.
   */
  int listen();

  /** @brief Accepts connections until shutdown(), then tears everything
   * down. */
  void run();

  /** @brief Signals the accept loop to stop. */
  void shutdown() {
    lock_guard<std::mutex> guard(connectionThreadMutex);
    halt = true;
  }

 protected:
  void handleConnection(shared_ptr<tcp::socket> socket);
  void acceptTerminal(beast::tcp_stream stream, const HttpRequest& request);
  void acceptHubClient(beast::tcp_stream stream, const HttpRequest& request);
  void writeResponse(beast::tcp_stream& stream, HttpResponse& response);
  void startConnectionThread(const string& name, std::function<void()> body);
  void reapConnectionThreads(bool wait);

  struct ConnectionThread {
    shared_ptr<std::atomic<bool>> done;
    shared_ptr<std::thread> thread;
  };

  SocketEndpoint serverEndpoint;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<Hub> hub;
  shared_ptr<OriginPolicy> originPolicy;
  ApiHandler apiHandler;

  net::io_context ioContext;
  net::executor_work_guard<net::io_context::executor_type> work;
  vector<std::thread> ioThreads;
  tcp::acceptor acceptor;
  std::unique_ptr<ThreadPool> handshakeThreadPool;

  /** @brief Guards connectionThreads and halt. */
  mutex connectionThreadMutex;
  vector<ConnectionThread> connectionThreads;
  bool halt;
};
}  // namespace ft

#endif  // __FT_TERMINAL_SERVER__
