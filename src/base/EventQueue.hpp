#ifndef __TT_EVENT_QUEUE__
#define __TT_EVENT_QUEUE__

#include "Clock.hpp"
#include "Headers.hpp"

namespace tt {
/**
 * @brief Serializes client-side work onto the thread that calls runReady().
 *
 * post() may be called from any thread (HTTP worker threads use it to hand
 * results back). Timers fire from runReady() once the clock reaches their
 * deadline, in deadline order.
 */
class EventQueue {
 public:
  explicit EventQueue(shared_ptr<Clock> _clock) : clock(_clock), nextTimerId(1) {}

  void post(function<void()> task);

  /** @return A handle for cancel(). */
  int64_t schedule(int64_t delayMs, function<void()> task);
  void cancel(int64_t timerId);

  /**
   * @brief Runs posted tasks and due timers, including ones they enqueue.
   * @return Number of tasks executed.
   */
  int runReady();

  /** @return Milliseconds until the next timer, or -1 if none is pending. */
  int64_t msUntilNextTimer();

  bool empty();

  shared_ptr<Clock> getClock() { return clock; }

 protected:
  struct Timer {
    int64_t id;
    int64_t deadline;
    function<void()> task;
  };

  bool popNext(function<void()>* task);

  shared_ptr<Clock> clock;
  recursive_mutex queueMutex;
  deque<function<void()>> posted;
  // Keyed by (deadline, id) so equal deadlines keep scheduling order
  map<pair<int64_t, int64_t>, function<void()>> timers;
  map<int64_t, int64_t> timerDeadlines;
  int64_t nextTimerId;
};
}  // namespace tt

#endif  // __TT_EVENT_QUEUE__
