#ifndef __TT_SESSION_CACHE_HPP__
#define __TT_SESSION_CACHE_HPP__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Identifies one logical terminal: which server, which worktree,
 * which launch scope.
 */
struct SessionCacheKey {
  string endpoint;
  string target;
  string scope;

  string toString() const { return endpoint + "::" + target + "::" + scope; }
};

/**
 * @brief Remembers the last session id per logical terminal so a restarted
 * client can reattach instead of starting over.
 */
class SessionCache {
 public:
  virtual ~SessionCache() {}
  virtual optional<string> get(const SessionCacheKey& key) = 0;
  virtual void set(const SessionCacheKey& key, const string& sessionId) = 0;
  virtual void erase(const SessionCacheKey& key) = 0;
};

class MemorySessionCache : public SessionCache {
 public:
  virtual optional<string> get(const SessionCacheKey& key);
  virtual void set(const SessionCacheKey& key, const string& sessionId);
  virtual void erase(const SessionCacheKey& key);

 protected:
  recursive_mutex cacheMutex;
  map<string, string> entries;
};

/**
 * @brief Cache persisted as a JSON object in a file, shared by every client
 * process of the user. The file is re-read on every access.
 */
class FileSessionCache : public SessionCache {
 public:
  explicit FileSessionCache(const string& _path);

  /** @brief <user cache dir>/tetherterm/sessions.json */
  static string defaultPath();

  virtual optional<string> get(const SessionCacheKey& key);
  virtual void set(const SessionCacheKey& key, const string& sessionId);
  virtual void erase(const SessionCacheKey& key);

  const string& getPath() const { return path; }

 protected:
  json load();
  void save(const json& entries);

  string path;
  recursive_mutex cacheMutex;
};
}  // namespace tt

#endif  // __TT_SESSION_CACHE_HPP__
