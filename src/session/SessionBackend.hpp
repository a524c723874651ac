#ifndef __TT_SESSION_BACKEND__
#define __TT_SESSION_BACKEND__

#include "Headers.hpp"

namespace tt {
/** @brief Character grid of a terminal. */
struct TerminalSize {
  int cols;
  int rows;

  bool operator==(const TerminalSize& other) const {
    return cols == other.cols && rows == other.rows;
  }
  bool operator!=(const TerminalSize& other) const { return !(*this == other); }
};

/** @brief Raised by a backend that cannot carry out a request. */
class SessionBackendException : public std::runtime_error {
 public:
  explicit SessionBackendException(const string& what)
      : std::runtime_error(what) {}
};

/** @brief Output a session produced before a reattach. */
struct ReattachBuffer {
  /** @brief Most recent output, oldest byte first. */
  string data;
  /** @brief Count of bytes the session has produced up to the end of `data`. */
  uint64_t endOffset;
};

/**
 * @brief Receives output of one session. `endOffset` is the count of bytes the
 * session has produced up to the end of `data`.
 */
typedef std::function<void(const string& data, uint64_t endOffset)>
    SessionOutputHandler;

/**
 * @brief Process side of a pane: runs shells and streams their output.
 *
 * Sessions are addressed by the id of the terminal node they back. Output is
 * delivered on a backend thread; a handler that returns has been called for
 * the last time once `unsubscribe` returns.
 */
class SessionBackend {
 public:
  virtual ~SessionBackend() {}

  /**
   * @brief Starts a shell for `sessionId`.
   * @throws SessionBackendException when the shell cannot be started.
   * @return The size the terminal was created with.
   */
  virtual TerminalSize spawn(const string& sessionId, const string& shell,
                             const optional<string>& distro,
                             const optional<string>& initialCwd) = 0;

  /**
   * @brief Output retained for a running session, without starting anything.
   * @return nullopt when the backend holds no buffer for `sessionId`.
   */
  virtual optional<ReattachBuffer> reattach(const string& sessionId) = 0;

  /** @brief Sends keystrokes. Dropped when the session is gone. */
  virtual void write(const string& sessionId, const string& data) = 0;

  /** @brief @throws SessionBackendException on failure. */
  virtual void resize(const string& sessionId, int cols, int rows) = 0;

  /** @brief Kills the session and drops its buffer. Unknown ids are ignored. */
  virtual void terminate(const string& sessionId) = 0;

  /** @brief False once the shell has exited or was never started. */
  virtual bool isRunning(const string& sessionId) = 0;

  /** @brief Registers for output of `sessionId`, returns a subscription id. */
  virtual int subscribe(const string& sessionId,
                        SessionOutputHandler handler) = 0;

  virtual void unsubscribe(int subscriptionId) = 0;
};
}  // namespace tt

#endif  // __TT_SESSION_BACKEND__
