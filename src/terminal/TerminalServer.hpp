#ifndef __TT_TERMINAL_SERVER__
#define __TT_TERMINAL_SERVER__

#include "Headers.hpp"
#include "SessionRegistry.hpp"
#include "SocketHandler.hpp"
#include "TokenAuthority.hpp"

namespace tt {
/**
 * @brief Accepts attach connections and hands them to the session registry.
 *
 * Each accepted socket is handled on a worker thread: the AttachRequest is
 * read and checked (protocol version, token, project, session existence,
 * scope) and, if everything passes, the socket becomes the session's
 * attached connection. Failures are answered with an AttachResponse status
 * before the socket is closed.
 */
class TerminalServer {
 public:
  /**
   * @param _tokenAuthority Null disables token checks.
   * @param _projectId Project this server serves; tokens for another project
   * are rejected with PROJECT_FORBIDDEN.
   */
  TerminalServer(shared_ptr<SocketHandler> _socketHandler,
                 const SocketEndpoint& _serverEndpoint,
                 shared_ptr<SessionRegistry> _registry,
                 shared_ptr<TokenAuthority> _tokenAuthority,
                 const string& _projectId);
  virtual ~TerminalServer();

  /** @brief Accept loop. Returns after shutdown(). */
  void run();
  void shutdown();

  bool acceptNewConnection(int fd);

  /** @brief Runs the attach handshake for one client socket. */
  void clientHandler(int clientSocketFd);

  shared_ptr<SocketHandler> getSocketHandler() { return socketHandler; }

 protected:
  AttachStatus authorize(const AttachRequest& request, string* error);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint serverEndpoint;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<TokenAuthority> tokenAuthority;
  string projectId;
  unique_ptr<ThreadPool> clientHandlerThreadPool;
  mutex haltMutex;
  bool halt;
};
}  // namespace tt

#endif  // __TT_TERMINAL_SERVER__
