#ifndef __TT_PTY_SESSION_BACKEND__
#define __TT_PTY_SESSION_BACKEND__

#include "Headers.hpp"
#include "SessionBackend.hpp"
#include "TabTermConfig.hpp"

namespace tt {
/**
 * @brief Runs each session as a shell on its own pseudo-terminal.
 *
 * A single reader thread polls every master fd, keeps the most recent output
 * of each session for reattach and hands chunks to subscribers.
 */
class PtySessionBackend : public SessionBackend {
 public:
  explicit PtySessionBackend(const TabTermConfig& _config);
  virtual ~PtySessionBackend();

  virtual TerminalSize spawn(const string& sessionId, const string& shell,
                             const optional<string>& distro,
                             const optional<string>& initialCwd);
  virtual optional<ReattachBuffer> reattach(const string& sessionId);
  virtual void write(const string& sessionId, const string& data);
  virtual void resize(const string& sessionId, int cols, int rows);
  virtual void terminate(const string& sessionId);
  virtual bool isRunning(const string& sessionId);
  virtual int subscribe(const string& sessionId, SessionOutputHandler handler);
  virtual void unsubscribe(int subscriptionId);

  /** @brief Stops the reader thread and kills every remaining shell. */
  void shutdown();

  /** @brief Number of sessions, exited ones included, still buffered. */
  int getSessionCount();

 protected:
  struct PtySession {
    string id;
    int masterFd;
    pid_t childPid;
    bool running;
    /** @brief Most recent output, capped at the scrollback size. */
    string buffer;
    /** @brief Every byte ever read from the pty. */
    uint64_t totalBytes;
  };

  /** @brief Forks the shell. Runs only in the child, never returns. */
  void runShell(const string& sessionId, const vector<string>& argv,
                const optional<string>& chdirTo, int errorPipeFd);
  void pollSessions();
  /** @brief Reads one chunk from `session`. Needs `backendMutex`. */
  void readSession(const shared_ptr<PtySession>& session);
  /** @brief Reaps the child of a session whose pty closed. */
  void handleSessionEnd(const shared_ptr<PtySession>& session);

  TabTermConfig config;
  recursive_mutex backendMutex;
  map<string, shared_ptr<PtySession>> sessions;
  map<int, pair<string, SessionOutputHandler>> subscribers;
  int nextSubscriptionId;
  bool shuttingDown;
  unique_ptr<thread> readThread;
};
}  // namespace tt

#endif  // __TT_PTY_SESSION_BACKEND__
