#include "HttpApiServer.hpp"

namespace tt {
HttpApiServer::HttpApiServer(shared_ptr<TerminalApi> _api) : api(_api) {
  registerRoutes();
}

HttpApiServer::~HttpApiServer() { stop(); }

bool HttpApiServer::listen(const string& host, int port) {
  LOG(INFO) << "HTTP API listening on " << host << ":" << port;
  return server.listen(host.c_str(), port);
}

int HttpApiServer::bindToAnyPort(const string& host) {
  return server.bind_to_any_port(host.c_str());
}

bool HttpApiServer::listenAfterBind() { return server.listen_after_bind(); }

void HttpApiServer::stop() {
  if (server.is_running()) {
    server.stop();
  }
}

httplib::Server::Handler HttpApiServer::route(RouteHandler handler,
                                              bool guarded) {
  return [this, handler, guarded](const httplib::Request& req,
                                  httplib::Response& res) {
    ApiResponse response;
    optional<ApiResponse> denied;
    if (guarded) {
      denied = api->authorize(req.get_header_value("Authorization"));
    }
    if (denied) {
      response = *denied;
    } else {
      try {
        response = handler(req);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Error handling " << req.method << " " << req.path
                   << ": " << e.what();
        response = ApiResponse{
            500, json{{"success", false}, {"error", "Internal error"}}};
      }
    }
    VLOG(1) << req.method << " " << req.path << " -> " << response.status;
    res.status = response.status;
    res.set_content(response.body.dump(), "application/json");
  };
}

void HttpApiServer::registerRoutes() {
  server.Post(R"(/api/worktrees/([^/]+)/terminals)",
              route(
                  [this](const httplib::Request& req) {
                    return api->createTerminal(req.matches[1], req.body);
                  },
                  true));
  server.Get(R"(/api/worktrees/([^/]+)/terminals/active)",
             route(
                 [this](const httplib::Request& req) {
                   return api->activeTerminal(
                       req.matches[1], req.get_param_value("scope"));
                 },
                 true));
  server.Delete(R"(/api/worktrees/([^/]+)/terminals)",
                route(
                    [this](const httplib::Request& req) {
                      return api->destroyWorktreeTerminals(req.matches[1]);
                    },
                    true));
  server.Post(R"(/api/terminals/([^/]+)/resize)",
              route(
                  [this](const httplib::Request& req) {
                    return api->resizeTerminal(req.matches[1], req.body);
                  },
                  true));
  server.Delete(R"(/api/terminals/([^/]+))",
                route(
                    [this](const httplib::Request& req) {
                      return api->destroyTerminal(req.matches[1]);
                    },
                    true));
  server.Get("/mobile/v1/agent-sessions",
             route(
                 [this](const httplib::Request& req) {
                   return api->listAgentSessions(
                       req.get_param_value("worktreeId"),
                       req.get_param_value("scope"));
                 },
                 true));
  server.Post("/mobile/v1/agent-sessions/connect",
              route(
                  [this](const httplib::Request& req) {
                    return api->connectAgentSession(req.body);
                  },
                  true));
  // Refresh is authenticated by the refresh token in the body
  server.Post("/auth/refresh", route(
                                   [this](const httplib::Request& req) {
                                     return api->refreshGatewaySession(
                                         req.body);
                                   },
                                   false));
}
}  // namespace tt
