#ifndef __FT_API_HANDLER_HPP__
#define __FT_API_HANDLER_HPP__

#include "WebSocketFrameSocket.hpp"

#include "Headers.hpp"
#include "OriginPolicy.hpp"
#include "SessionRegistry.hpp"

namespace ft {
/**
 * @brief Answers the plain HTTP routes of ftserver:
 *
 *   GET  /api/health       {"status":"ok"}
 *   POST /api/pty/execute  {"sessionId": ..., "command": ...}
 *
 * Declared origins outside the allow-list get 403.  Allowed origins get CORS
 * headers, and OPTIONS preflights are answered directly.
 */
class ApiHandler {
 public:
  ApiHandler(shared_ptr<SessionRegistry> _registry,
             shared_ptr<OriginPolicy> _originPolicy);

  HttpResponse handle(const HttpRequest& request);

  /** @brief The request target without its query string. */
  static string getPath(const HttpRequest& request);

 protected:
  HttpResponse handleInjectCommand(const HttpRequest& request);

  shared_ptr<SessionRegistry> registry;
  shared_ptr<OriginPolicy> originPolicy;
};
}  // namespace ft

#endif  // __FT_API_HANDLER_HPP__
