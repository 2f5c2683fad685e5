#include "TerminalServer.hpp"

#include "HubClient.hpp"
#include "RawSocketUtils.hpp"
#include "ShellResolver.hpp"

namespace ft {
namespace {
const std::chrono::seconds HANDSHAKE_TIMEOUT(30);
const int ACCEPT_POLL_MS = 100;

#ifdef WIN32
const bool BUILT_FOR_WINDOWS = true;
#else
const bool BUILT_FOR_WINDOWS = false;
#endif
}  // namespace

TerminalServer::TerminalServer(const SocketEndpoint& _serverEndpoint,
                               shared_ptr<SessionRegistry> _registry,
                               shared_ptr<Hub> _hub,
                               shared_ptr<OriginPolicy> _originPolicy)
    : serverEndpoint(_serverEndpoint),
      registry(_registry),
      hub(_hub),
      originPolicy(_originPolicy),
      apiHandler(_registry, _originPolicy),
      work(net::make_work_guard(ioContext)),
      acceptor(ioContext),
      handshakeThreadPool(new ThreadPool(HANDSHAKE_THREADS)),
      halt(false) {
  for (int a = 0; a < IO_THREADS; a++) {
    ioThreads.push_back(std::thread([this, a]() {
      el::Helpers::setThreadName("io-" + to_string(a));
      ioContext.run();
    }));
  }
}

TerminalServer::~TerminalServer() {
  handshakeThreadPool.reset();
  reapConnectionThreads(true);
  work.reset();
  ioContext.stop();
  for (auto& it : ioThreads) {
    if (it.joinable()) {
      it.join();
    }
  }
}

int TerminalServer::listen() {
  string host =
      serverEndpoint.name().empty() ? string("127.0.0.1") : serverEndpoint.name();
  tcp::resolver resolver(ioContext);
  auto results = resolver.resolve(host, to_string(serverEndpoint.port()),
                                  tcp::resolver::passive);
  tcp::endpoint endpoint = results.begin()->endpoint();

  acceptor.open(endpoint.protocol());
  acceptor.set_option(net::socket_base::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen(net::socket_base::max_listen_connections);
  int boundPort = acceptor.local_endpoint().port();
  LOG(INFO) << "Listening on " << endpoint.address().to_string() << ":"
            << boundPort;
  return boundPort;
}

void TerminalServer::run() {
  if (!acceptor.is_open()) {
    listen();
  }

  while (true) {
    {
      lock_guard<std::mutex> guard(connectionThreadMutex);
      if (halt) {
        break;
      }
    }
    reapConnectionThreads(false);
    if (!RawSocketUtils::waitOnData(int(acceptor.native_handle()),
                                    ACCEPT_POLL_MS)) {
      continue;
    }
    auto socket = make_shared<tcp::socket>(net::make_strand(ioContext));
    beast::error_code ec;
    acceptor.accept(*socket, ec);
    if (ec) {
      LOG(WARNING) << "Accept failed: " << ec.message();
      continue;
    }
    VLOG(1) << "Accepted connection from " << socket->remote_endpoint(ec);
    handshakeThreadPool->enqueue(
        [this, socket]() { handleConnection(socket); });
  }

  LOG(INFO) << "Server shutting down";
  beast::error_code ignored;
  acceptor.close(ignored);
  // Let in-flight handshakes finish so nothing registers after closeAll().
  handshakeThreadPool.reset();
  registry->closeAll();
  hub->stop();
  reapConnectionThreads(true);
  work.reset();
  ioContext.stop();
  for (auto& it : ioThreads) {
    it.join();
  }
}

void TerminalServer::handleConnection(shared_ptr<tcp::socket> socket) {
  beast::tcp_stream stream(std::move(*socket));
  beast::flat_buffer buffer;
  HttpRequest request;

  stream.expires_after(HANDSHAKE_TIMEOUT);
  promise<beast::error_code> readDone;
  auto readResult = readDone.get_future();
  http::async_read(stream, buffer, request,
                   [&readDone](beast::error_code ec, size_t) {
                     readDone.set_value(ec);
                   });
  beast::error_code ec = readResult.get();
  if (ec) {
    VLOG(1) << "Dropping connection before a request arrived: "
            << ec.message();
    return;
  }
  stream.expires_never();

  const string path = ApiHandler::getPath(request);
  VLOG(1) << request.method_string() << " " << path;
  try {
    if (!websocket::is_upgrade(request)) {
      auto response = apiHandler.handle(request);
      writeResponse(stream, response);
      return;
    }

    auto rawOrigin = request[http::field::origin];
    string origin(rawOrigin.data(), rawOrigin.size());
    if (!originPolicy->isAllowed(origin)) {
      HttpResponse response(http::status::forbidden, request.version());
      response.set(http::field::content_type, "text/plain");
      response.keep_alive(false);
      response.body() = "Forbidden";
      response.prepare_payload();
      writeResponse(stream, response);
      return;
    }

    if (path == "/ws/pty") {
      acceptTerminal(std::move(stream), request);
    } else if (path == "/ws") {
      acceptHubClient(std::move(stream), request);
    } else {
      HttpResponse response(http::status::not_found, request.version());
      response.set(http::field::content_type, "text/plain");
      response.keep_alive(false);
      response.body() = "Not Found";
      response.prepare_payload();
      writeResponse(stream, response);
    }
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Connection for " << path << " failed: " << re.what();
  }
}

void TerminalServer::acceptTerminal(beast::tcp_stream stream,
                                    const HttpRequest& request) {
  auto socket =
      WebSocketFrameSocket::acceptUpgrade(std::move(stream), request, 0);
  TerminalInfo initialSize;
  initialSize.set_row(24);
  initialSize.set_column(80);

  shared_ptr<TerminalSession> session;
  try {
    session = registry->createSession(socket, initialSize);
  } catch (const std::runtime_error& re) {
    try {
      socket->writeFrame(
          ShellResolver::spawnFailureBanner(re.what(), BUILT_FOR_WINDOWS),
          true);
    } catch (const std::runtime_error& writeError) {
      VLOG(1) << "Could not report spawn failure: " << writeError.what();
    }
    socket->close(CLOSE_SPAWN_FAILED, "spawn failed");
    return;
  }

  LOG(INFO) << "Terminal session " << session->getId() << " created";
  string banner = ShellResolver::connectedBanner(registry->getShellSettings());
  auto sessionRegistry = registry;
  startConnectionThread("pty-" + session->getId().substr(0, 8),
                        [sessionRegistry, session, banner]() {
                          sessionRegistry->runSession(session, banner);
                        });
}

void TerminalServer::acceptHubClient(beast::tcp_stream stream,
                                     const HttpRequest& request) {
  auto socket = WebSocketFrameSocket::acceptUpgrade(std::move(stream), request,
                                                    HUB_MAX_MESSAGE_SIZE);
  auto client = make_shared<HubClient>(hub.get(), socket);
  startConnectionThread("hub-" + client->getId().substr(0, 8),
                        [client]() { client->run(); });
}

void TerminalServer::writeResponse(beast::tcp_stream& stream,
                                   HttpResponse& response) {
  stream.expires_after(HANDSHAKE_TIMEOUT);
  promise<beast::error_code> writeDone;
  auto writeResult = writeDone.get_future();
  http::async_write(stream, response,
                    [&writeDone](beast::error_code ec, size_t) {
                      writeDone.set_value(ec);
                    });
  beast::error_code ec = writeResult.get();
  if (ec) {
    VLOG(1) << "Response write failed: " << ec.message();
  }
  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

void TerminalServer::startConnectionThread(const string& name,
                                           std::function<void()> body) {
  auto done = make_shared<std::atomic<bool>>(false);
  auto thread = make_shared<std::thread>([name, body, done]() {
    el::Helpers::setThreadName(name);
    body();
    *done = true;
  });
  lock_guard<std::mutex> guard(connectionThreadMutex);
  connectionThreads.push_back({done, thread});
}

void TerminalServer::reapConnectionThreads(bool wait) {
  lock_guard<std::mutex> guard(connectionThreadMutex);
  auto it = connectionThreads.begin();
  while (it != connectionThreads.end()) {
    if (wait || *(it->done)) {
      it->thread->join();
      it = connectionThreads.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace ft
