#ifndef __TT_SESSION_COORDINATOR__
#define __TT_SESSION_COORDINATOR__

#include "CwdTracker.hpp"
#include "Headers.hpp"
#include "PaneNode.hpp"
#include "ResizeCoalescer.hpp"
#include "SessionBackend.hpp"
#include "TerminalDisplay.hpp"

namespace tt {
enum class SessionPhase { IDLE, SPAWNING, REATTACHING, RUNNING, CLOSING, CLOSED };

/** @brief Why a terminal node left the tree. */
enum class CloseReason {
  PANE_CLOSED,
  TAB_CLOSED,
  /** @brief Moved to another window, the session lives on. */
  DETACHED,
  SESSION_EXITED,
  WORKSPACE_SHUTDOWN
};

string phaseToString(SessionPhase phase);

/** @brief Receives working-directory reports found in a pane's output. */
class SessionListener {
 public:
  virtual ~SessionListener() {}

  virtual void onCwdChanged(const string& tabId, const string& paneId,
                            const string& cwd) = 0;
};

/**
 * @brief Runs the session behind one terminal node, from spawn (or reattach)
 * to teardown.
 *
 * Spawning happens on a lifecycle thread. If the node is closed before the
 * backend answers, the new session is terminated once it arrives. Output is
 * written to the display and scanned for cwd reports on the backend's thread.
 */
class SessionCoordinator {
 public:
  /**
   * @param listener Must outlive the coordinator or be closed first; it is
   * not called once `close` returns.
   */
  SessionCoordinator(shared_ptr<SessionBackend> backend,
                     shared_ptr<TerminalDisplay> display,
                     SessionListener* listener, const string& tabId,
                     PaneNodePtr node, int resizeDebounceMs);

  /** @brief Closes with `PANE_CLOSED` if still open, then joins. */
  ~SessionCoordinator();

  /**
   * @brief Leaves `IDLE` for `SPAWNING` or `REATTACHING`.
   * @return false if the coordinator was already started.
   */
  bool start();

  /** @brief Size reported by the display, forwarded after a quiet period. */
  void requestResize(int cols, int rows);

  /** @brief Keystrokes, dropped unless the session is running. */
  void write(const string& data);

  /**
   * @brief Tears the session down. Every reason except `DETACHED` terminates
   * the backend session. A spawn still in flight is cleaned up when it
   * completes.
   */
  void close(CloseReason reason);

  SessionPhase getPhase() const;
  const string& getPaneId() const { return paneId; }
  const string& getTabId() const { return tabId; }
  /** @brief Set when a spawn failed. */
  optional<string> getError() const;
  /** @brief Dimensions the backend last acknowledged. */
  optional<TerminalSize> getSize() const;
  /** @brief Most recent directory reported by the shell. */
  optional<string> getCwd() const;

  /** @brief True when the session was running and its shell has exited. */
  bool hasSessionExited();

 protected:
  struct State;

  static void runLifecycle(shared_ptr<State> state);
  static void handleOutput(const shared_ptr<State>& state, const string& data,
                           uint64_t endOffset);
  static void flushResize(const shared_ptr<State>& state,
                          const TerminalSize& size);

  string paneId;
  string tabId;
  shared_ptr<State> state;
  unique_ptr<ResizeCoalescer> resizer;
  unique_ptr<thread> lifecycleThread;
  optional<int> subscriptionId;
  /** @brief Serializes `start` and `close`. */
  mutex controlMutex;
};
}  // namespace tt

#endif  // __TT_SESSION_COORDINATOR__
