#include "ApiHandler.hpp"

namespace ft {
namespace {
HttpResponse makeResponse(const HttpRequest& request, http::status status,
                          const json& body) {
  HttpResponse response(status, request.version());
  response.set(http::field::server, string("ftserver/") + FT_VERSION);
  response.set(http::field::content_type, "application/json");
  response.keep_alive(false);
  response.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
  response.prepare_payload();
  return response;
}

HttpResponse commandResponse(const HttpRequest& request, http::status status,
                             bool success, const string& message) {
  json body;
  body["success"] = success;
  body["message"] = message;
  return makeResponse(request, status, body);
}
}  // namespace

ApiHandler::ApiHandler(shared_ptr<SessionRegistry> _registry,
                       shared_ptr<OriginPolicy> _originPolicy)
    : registry(_registry), originPolicy(_originPolicy) {}

string ApiHandler::getPath(const HttpRequest& request) {
  auto rawTarget = request.target();
  string target(rawTarget.data(), rawTarget.size());
  auto query = target.find('?');
  if (query != string::npos) {
    target = target.substr(0, query);
  }
  return target;
}

HttpResponse ApiHandler::handle(const HttpRequest& request) {
  auto rawOrigin = request[http::field::origin];
  string origin(rawOrigin.data(), rawOrigin.size());
  if (!originPolicy->isAllowed(origin)) {
    HttpResponse response(http::status::forbidden, request.version());
    response.set(http::field::content_type, "text/plain");
    response.keep_alive(false);
    response.body() = "Forbidden";
    response.prepare_payload();
    return response;
  }

  HttpResponse response;
  const string path = getPath(request);
  if (request.method() == http::verb::options) {
    response = HttpResponse(http::status::ok, request.version());
    response.keep_alive(false);
    response.prepare_payload();
  } else if (path == "/api/health") {
    json body;
    body["status"] = "ok";
    response = makeResponse(request, http::status::ok, body);
  } else if (path == "/api/pty/execute") {
    if (request.method() != http::verb::post) {
      response = commandResponse(request, http::status::method_not_allowed,
                                 false, "Use POST");
    } else {
      response = handleInjectCommand(request);
    }
  } else {
    json body;
    body["success"] = false;
    body["message"] = "Not found";
    response = makeResponse(request, http::status::not_found, body);
  }

  if (!origin.empty()) {
    response.set(http::field::access_control_allow_origin, origin);
    response.set(http::field::access_control_allow_methods,
                 "GET, POST, OPTIONS");
    response.set(http::field::access_control_allow_headers, "Content-Type");
    response.set(http::field::access_control_allow_credentials, "true");
    response.set(http::field::access_control_max_age, "86400");
  }
  return response;
}

HttpResponse ApiHandler::handleInjectCommand(const HttpRequest& request) {
  json body = json::parse(request.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return commandResponse(request, http::status::bad_request, false,
                           "Invalid request body");
  }
  string sessionId;
  string command;
  auto idIt = body.find("sessionId");
  auto commandIt = body.find("command");
  if ((idIt != body.end() && !idIt->is_string()) ||
      (commandIt != body.end() && !commandIt->is_string())) {
    return commandResponse(request, http::status::bad_request, false,
                           "Invalid request body");
  }
  if (idIt != body.end()) {
    sessionId = idIt->get<string>();
  }
  if (commandIt != body.end()) {
    command = commandIt->get<string>();
  }
  if (command.empty()) {
    return commandResponse(request, http::status::bad_request, false,
                           "Command is required");
  }

  switch (registry->injectCommand(sessionId, command)) {
    case InjectStatus::INJECTED:
      return commandResponse(request, http::status::ok, true,
                             "Command injected successfully");
    case InjectStatus::SESSION_NOT_FOUND:
      return commandResponse(request, http::status::not_found, false,
                             "PTY session not found");
    case InjectStatus::WRITE_FAILED:
      break;
  }
  return commandResponse(request, http::status::internal_server_error, false,
                         "Failed to inject command");
}
}  // namespace ft
