#ifndef __TT_HTTP_API_SERVER_HPP__
#define __TT_HTTP_API_SERVER_HPP__

#include "Headers.hpp"
#include "TerminalApi.hpp"

namespace tt {
/**
 * @brief Serves TerminalApi over HTTP.
 */
class HttpApiServer {
 public:
  explicit HttpApiServer(shared_ptr<TerminalApi> _api);
  virtual ~HttpApiServer();

  /** @brief Blocks until stop(). Returns false if the port could not be bound. */
  bool listen(const string& host, int port);
  /** @brief Binds an ephemeral port and returns it, or -1. */
  int bindToAnyPort(const string& host);
  /** @brief Blocks serving on a port bound by bindToAnyPort(). */
  bool listenAfterBind();
  void stop();
  bool isRunning() { return server.is_running(); }

 protected:
  typedef function<ApiResponse(const httplib::Request&)> RouteHandler;

  void registerRoutes();
  /** @brief Wraps handler with the bearer check (when guarded) and JSON output. */
  httplib::Server::Handler route(RouteHandler handler, bool guarded);

  shared_ptr<TerminalApi> api;
  httplib::Server server;
};
}  // namespace tt

#endif  // __TT_HTTP_API_SERVER_HPP__
