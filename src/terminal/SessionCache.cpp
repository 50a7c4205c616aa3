#include "SessionCache.hpp"

namespace tt {
optional<string> MemorySessionCache::get(const SessionCacheKey& key) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  auto it = entries.find(key.toString());
  if (it == entries.end()) {
    return nullopt;
  }
  return it->second;
}

void MemorySessionCache::set(const SessionCacheKey& key,
                             const string& sessionId) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  entries[key.toString()] = sessionId;
}

void MemorySessionCache::erase(const SessionCacheKey& key) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  entries.erase(key.toString());
}

FileSessionCache::FileSessionCache(const string& _path) : path(_path) {}

string FileSessionCache::defaultPath() {
  return sago::getCacheDir() + "/tetherterm/sessions.json";
}

json FileSessionCache::load() {
  ifstream in(path);
  if (!in.good()) {
    return json::object();
  }
  json entries = json::parse(in, nullptr, false);
  if (entries.is_discarded() || !entries.is_object()) {
    LOG(WARNING) << "Ignoring corrupt session cache " << path;
    return json::object();
  }
  return entries;
}

void FileSessionCache::save(const json& entries) {
  fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      LOG(ERROR) << "Cannot create " << target.parent_path() << ": "
                 << ec.message();
      return;
    }
  }
  // Write then rename so a concurrent reader never sees a partial file
  string tmpPath = path + ".tmp" + to_string(getpid());
  {
    ofstream out(tmpPath, ios::trunc);
    if (!out.good()) {
      LOG(ERROR) << "Cannot write session cache " << tmpPath;
      return;
    }
    out << entries.dump(2);
  }
  fs::rename(tmpPath, target, ec);
  if (ec) {
    LOG(ERROR) << "Cannot replace session cache " << path << ": "
               << ec.message();
    fs::remove(tmpPath, ec);
  }
}

optional<string> FileSessionCache::get(const SessionCacheKey& key) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  json entries = load();
  auto it = entries.find(key.toString());
  if (it == entries.end() || !it->is_string()) {
    return nullopt;
  }
  return it->get<string>();
}

void FileSessionCache::set(const SessionCacheKey& key,
                           const string& sessionId) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  json entries = load();
  entries[key.toString()] = sessionId;
  save(entries);
}

void FileSessionCache::erase(const SessionCacheKey& key) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  json entries = load();
  if (entries.erase(key.toString()) > 0) {
    save(entries);
  }
}
}  // namespace tt
