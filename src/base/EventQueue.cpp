#include "EventQueue.hpp"

namespace tt {
void EventQueue::post(function<void()> task) {
  lock_guard<recursive_mutex> guard(queueMutex);
  posted.push_back(task);
}

int64_t EventQueue::schedule(int64_t delayMs, function<void()> task) {
  lock_guard<recursive_mutex> guard(queueMutex);
  int64_t id = nextTimerId++;
  int64_t deadline = clock->nowMs() + max<int64_t>(delayMs, 0);
  timers[make_pair(deadline, id)] = task;
  timerDeadlines[id] = deadline;
  return id;
}

void EventQueue::cancel(int64_t timerId) {
  lock_guard<recursive_mutex> guard(queueMutex);
  auto it = timerDeadlines.find(timerId);
  if (it == timerDeadlines.end()) {
    return;
  }
  timers.erase(make_pair(it->second, timerId));
  timerDeadlines.erase(it);
}

bool EventQueue::popNext(function<void()>* task) {
  lock_guard<recursive_mutex> guard(queueMutex);
  if (!posted.empty()) {
    *task = posted.front();
    posted.pop_front();
    return true;
  }
  if (!timers.empty() && timers.begin()->first.first <= clock->nowMs()) {
    auto it = timers.begin();
    *task = it->second;
    timerDeadlines.erase(it->first.second);
    timers.erase(it);
    return true;
  }
  return false;
}

int EventQueue::runReady() {
  int executed = 0;
  function<void()> task;
  while (popNext(&task)) {
    task();
    executed++;
  }
  return executed;
}

int64_t EventQueue::msUntilNextTimer() {
  lock_guard<recursive_mutex> guard(queueMutex);
  if (!posted.empty()) {
    return 0;
  }
  if (timers.empty()) {
    return -1;
  }
  return max<int64_t>(0, timers.begin()->first.first - clock->nowMs());
}

bool EventQueue::empty() {
  lock_guard<recursive_mutex> guard(queueMutex);
  return posted.empty() && timers.empty();
}
}  // namespace tt
