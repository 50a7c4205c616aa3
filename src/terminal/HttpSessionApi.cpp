#include "SessionApi.hpp"

namespace tt {
namespace {
string errorMessage(const json& body, const string& fallback) {
  if (body.is_object() && body.contains("error")) {
    const json& error = body["error"];
    if (error.is_string()) {
      return error.get<string>();
    }
    if (error.is_object() && error.contains("message") &&
        error["message"].is_string()) {
      return error["message"].get<string>();
    }
  }
  return fallback;
}

optional<string> sessionIdFrom(const json& body) {
  if (body.is_object() && body.contains("sessionId") &&
      body["sessionId"].is_string()) {
    return body["sessionId"].get<string>();
  }
  return nullopt;
}
}  // namespace

HttpSessionApi::HttpSessionApi(const string& _host, int _port,
                               shared_ptr<EventQueue> _eventQueue,
                               bool _mobile)
    : host(_host),
      port(_port),
      eventQueue(_eventQueue),
      mobile(_mobile),
      requestPool(new ThreadPool(2)) {}

HttpSessionApi::~HttpSessionApi() {
  // Joins the workers before the members they use go away
  requestPool.reset();
}

void HttpSessionApi::setAccessToken(const string& _accessToken) {
  lock_guard<mutex> guard(tokenMutex);
  accessToken = _accessToken;
}

httplib::Headers HttpSessionApi::headers() {
  lock_guard<mutex> guard(tokenMutex);
  httplib::Headers result;
  if (!accessToken.empty()) {
    result.emplace("Authorization", "Bearer " + accessToken);
  }
  return result;
}

HttpSessionApi::HttpResult HttpSessionApi::request(const string& method,
                                                   const string& path,
                                                   const json& body) {
  httplib::Client client(host, port);
  client.set_connection_timeout(3, 0);
  client.set_read_timeout(10, 0);
  client.set_write_timeout(10, 0);

  auto send = [&]() -> httplib::Result {
    if (method == "GET") {
      return client.Get(path.c_str(), headers());
    }
    if (method == "POST") {
      return client.Post(path.c_str(), headers(), body.dump(),
                         "application/json");
    }
    return client.Delete(path.c_str(), headers());
  };
  httplib::Result response = send();

  HttpResult result;
  if (!response) {
    LOG(WARNING) << method << " " << path << " failed: "
                 << "error " << int(response.error());
    return result;
  }
  result.status = response->status;
  result.body = json::parse(response->body, nullptr, false);
  if (result.body.is_discarded()) {
    result.body = json::object();
  }
  VLOG(1) << method << " " << path << " -> " << result.status;
  return result;
}

void HttpSessionApi::submit(const string& description, function<void()> work,
                            function<void()> onFailure) {
  requestPool->enqueue([this, description, work, onFailure]() {
    try {
      work();
    } catch (const std::exception& e) {
      LOG(WARNING) << description << " failed: " << e.what();
      eventQueue->post(onFailure);
    }
  });
}

optional<string> HttpSessionApi::latestFromListing(const json& listing,
                                                   const string& scope) {
  if (!listing.is_object() || !listing.contains("sessions") ||
      !listing["sessions"].is_array()) {
    return nullopt;
  }
  // One entry per scope; its sessionId is null when nothing is running
  for (const auto& entry : listing["sessions"]) {
    if (!entry.is_object()) {
      VLOG(1) << "Skipping malformed session entry: " << entry.dump();
      continue;
    }
    auto it = entry.find("scope");
    if (it == entry.end() || !it->is_string() || it->get<string>() != scope) {
      continue;
    }
    optional<string> sessionId = sessionIdFrom(entry);
    if (sessionId) {
      return sessionId;
    }
  }
  return nullopt;
}

void HttpSessionApi::createSession(const CreateSessionRequest& createRequest,
                                   CreateCallback callback) {
  auto onFailure = [callback]() {
    callback(nullopt, "Failed to create session");
  };
  submit("Create session", [this, createRequest, callback]() {
    HttpResult result;
    if (mobile) {
      json body = {{"worktreeId", createRequest.worktreeId},
                   {"scope", createRequest.scope},
                   {"startIfMissing", true},
                   {"cols", createRequest.cols},
                   {"rows", createRequest.rows}};
      result = request("POST", "/mobile/v1/agent-sessions/connect", body);
    } else {
      json body = {{"cols", createRequest.cols}, {"rows", createRequest.rows}};
      if (!createRequest.scope.empty()) {
        body["scope"] = createRequest.scope;
      }
      if (!createRequest.startupCommand.empty()) {
        body["startupCommand"] = createRequest.startupCommand;
      }
      result = request("POST",
                       "/api/worktrees/" +
                           httplib::detail::encode_url(createRequest.worktreeId) +
                           "/terminals",
                       body);
    }
    optional<string> sessionId;
    string error;
    if (result.status == 200) {
      sessionId = sessionIdFrom(result.body);
    }
    if (!sessionId) {
      error = result.status < 0
                  ? string("Could not reach the server")
                  : errorMessage(result.body, "Failed to create session");
    }
    eventQueue->post([callback, sessionId, error]() { callback(sessionId, error); });
  }, onFailure);
}

void HttpSessionApi::destroySession(const string& sessionId,
                                    DestroyCallback callback) {
  submit("Destroy session", [this, sessionId, callback]() {
    HttpResult result = request(
        "DELETE", "/api/terminals/" + httplib::detail::encode_url(sessionId),
        json());
    bool destroyed = result.status == 200;
    eventQueue->post([callback, destroyed]() { callback(destroyed); });
  }, [callback]() { callback(false); });
}

void HttpSessionApi::findLatestSession(const string& worktreeId,
                                       const string& scope,
                                       FindCallback callback) {
  submit("Find latest session", [this, worktreeId, scope, callback]() {
    optional<string> sessionId;
    if (mobile) {
      HttpResult result =
          request("GET",
                  "/mobile/v1/agent-sessions?worktreeId=" +
                      httplib::detail::encode_url(worktreeId) +
                      "&scope=" + httplib::detail::encode_url(scope),
                  json());
      if (result.status == 200) {
        sessionId = latestFromListing(result.body, scope);
      }
    } else {
      HttpResult result = request(
          "GET",
          "/api/worktrees/" + httplib::detail::encode_url(worktreeId) +
              "/terminals/active?scope=" + httplib::detail::encode_url(scope),
          json());
      if (result.status == 200) {
        sessionId = sessionIdFrom(result.body);
      }
    }
    eventQueue->post([callback, sessionId]() { callback(sessionId); });
  }, [callback]() { callback(nullopt); });
}

void HttpSessionApi::refreshGatewaySession(const string& refreshToken,
                                           RefreshCallback callback) {
  submit("Refresh gateway session", [this, refreshToken, callback]() {
    HttpResult result =
        request("POST", "/auth/refresh", json{{"refreshToken", refreshToken}});
    optional<GatewaySession> session;
    if (result.status == 200 && result.body.contains("session")) {
      try {
        session = GatewaySession::fromJson(result.body["session"]);
      } catch (const json::exception& je) {
        LOG(WARNING) << "Malformed refresh response: " << je.what();
      }
    }
    eventQueue->post([callback, session]() { callback(session); });
  }, [callback]() { callback(nullopt); });
}
}  // namespace tt
