#ifndef __TT_SESSION_API_HPP__
#define __TT_SESSION_API_HPP__

#include "EventQueue.hpp"
#include "Headers.hpp"
#include "TokenAuthority.hpp"

namespace tt {
struct CreateSessionRequest {
  string worktreeId;
  string scope;
  int cols = 80;
  int rows = 24;
  string startupCommand;
};

/**
 * @brief The server's session lifecycle calls, as seen by a client.
 *
 * Every call is asynchronous. Callbacks run on the EventQueue given to the
 * implementation, never on the caller's stack.
 */
class SessionApi {
 public:
  /** @brief sessionId is nullopt on failure, with a message in error. */
  typedef function<void(const optional<string>& sessionId, const string& error)>
      CreateCallback;
  typedef function<void(bool destroyed)> DestroyCallback;
  typedef function<void(const optional<string>& sessionId)> FindCallback;
  typedef function<void(const optional<GatewaySession>& session)>
      RefreshCallback;

  virtual ~SessionApi() {}

  virtual void createSession(const CreateSessionRequest& request,
                             CreateCallback callback) = 0;
  virtual void destroySession(const string& sessionId,
                              DestroyCallback callback) = 0;
  /** @brief The live session for (worktreeId, scope), if any. */
  virtual void findLatestSession(const string& worktreeId, const string& scope,
                                 FindCallback callback) = 0;
  virtual void refreshGatewaySession(const string& refreshToken,
                                     RefreshCallback callback) = 0;
  /** @brief Bearer token sent with later calls. */
  virtual void setAccessToken(const string& accessToken) = 0;
};

/**
 * @brief SessionApi over the server's HTTP routes (cpp-httplib).
 *
 * Requests run on a small worker pool and their results are posted back to
 * the event queue. The mobile flavor uses the agent-session routes.
 */
class HttpSessionApi : public SessionApi {
 public:
  HttpSessionApi(const string& _host, int _port,
                 shared_ptr<EventQueue> _eventQueue, bool _mobile);
  virtual ~HttpSessionApi();

  virtual void createSession(const CreateSessionRequest& request,
                             CreateCallback callback);
  virtual void destroySession(const string& sessionId,
                              DestroyCallback callback);
  virtual void findLatestSession(const string& worktreeId, const string& scope,
                                 FindCallback callback);
  virtual void refreshGatewaySession(const string& refreshToken,
                                     RefreshCallback callback);
  virtual void setAccessToken(const string& accessToken);

  /**
   * @brief The running session for scope in an agent-session listing. Entries
   * that are not objects, or that lack a string sessionId, are skipped.
   */
  static optional<string> latestFromListing(const json& listing,
                                            const string& scope);

 protected:
  struct HttpResult {
    int status = -1;
    json body;
  };

  /** @brief Runs one request synchronously; status -1 if it never completed. */
  HttpResult request(const string& method, const string& path,
                     const json& body);
  httplib::Headers headers();
  /**
   * @brief Runs work on the pool. If it throws, onFailure is posted to the
   * event queue in its place so the caller always hears back.
   */
  void submit(const string& description, function<void()> work,
              function<void()> onFailure);

  string host;
  int port;
  shared_ptr<EventQueue> eventQueue;
  bool mobile;
  mutex tokenMutex;
  string accessToken;
  unique_ptr<ThreadPool> requestPool;
};
}  // namespace tt

#endif  // __TT_SESSION_API_HPP__
