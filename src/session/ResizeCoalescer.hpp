#ifndef __TT_RESIZE_COALESCER__
#define __TT_RESIZE_COALESCER__

#include "Headers.hpp"
#include "SessionBackend.hpp"

namespace tt {
/**
 * @brief Collapses bursts of size changes into one resize.
 *
 * Each request replaces the pending size and restarts the quiet period. Once
 * the period elapses with no new request, the flush callback runs on the
 * coalescer's thread with the latest size.
 */
class ResizeCoalescer {
 public:
  typedef std::function<void(const TerminalSize&)> FlushCallback;

  ResizeCoalescer(int _quietPeriodMs, FlushCallback _flush);
  ~ResizeCoalescer();

  void request(int cols, int rows);

  /** @brief Size waiting for its quiet period to elapse. */
  optional<TerminalSize> getPending();

  /** @brief Discards the pending size and joins the flush thread. */
  void shutdown();

 protected:
  void run();

  std::chrono::milliseconds quietPeriod;
  FlushCallback flush;
  mutex coalescerMutex;
  condition_variable wakeup;
  optional<TerminalSize> pending;
  std::chrono::steady_clock::time_point deadline;
  bool shuttingDown;
  unique_ptr<thread> flushThread;
};
}  // namespace tt

#endif  // __TT_RESIZE_COALESCER__
