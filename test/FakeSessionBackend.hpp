#ifndef __TT_FAKE_SESSION_BACKEND__
#define __TT_FAKE_SESSION_BACKEND__

#include "SessionBackend.hpp"
#include "TerminalDisplay.hpp"
#include "TestHeaders.hpp"

namespace tt {
/**
 * @brief Scripted backend: records every call, can fail or hold spawns and
 * reattaches and delivers output only when a test asks for it.
 */
class FakeSessionBackend : public SessionBackend {
 public:
  struct SpawnRequest {
    string sessionId;
    string shell;
    optional<string> distro;
    optional<string> initialCwd;
  };

  FakeSessionBackend()
      : holdSpawns(false),
        heldSpawns(0),
        holdReattach(false),
        heldReattaches(0),
        failResize(false),
        failReattach(false),
        resizeAttempts(0),
        nextSubscriptionId(1),
        spawnSize(TerminalSize{80, 24}) {}

  virtual TerminalSize spawn(const string& sessionId, const string& shell,
                             const optional<string>& distro,
                             const optional<string>& initialCwd) {
    unique_lock<recursive_mutex> lock(fakeMutex);
    spawns.push_back(SpawnRequest{sessionId, shell, distro, initialCwd});
    heldSpawns++;
    heldCallsChanged.notify_all();
    heldCallsChanged.wait(lock, [this] { return !holdSpawns; });
    heldSpawns--;
    auto failure = spawnFailures.find(shell);
    if (failure != spawnFailures.end()) {
      throw SessionBackendException(failure->second);
    }
    running.insert(sessionId);
    buffers[sessionId] = "";
    offsets[sessionId] = 0;
    return spawnSize;
  }

  /**
   * The buffer is captured on entry, so output emitted while the call is
   * held arrives only through subscribers.
   */
  virtual optional<ReattachBuffer> reattach(const string& sessionId) {
    unique_lock<recursive_mutex> lock(fakeMutex);
    reattachRequests.push_back(sessionId);
    optional<ReattachBuffer> snapshot;
    auto it = buffers.find(sessionId);
    if (it != buffers.end()) {
      snapshot = ReattachBuffer{it->second, offsets[sessionId]};
    }
    heldReattaches++;
    heldCallsChanged.notify_all();
    heldCallsChanged.wait(lock, [this] { return !holdReattach; });
    heldReattaches--;
    if (failReattach) {
      throw SessionBackendException("buffer unavailable");
    }
    return snapshot;
  }

  virtual void write(const string& sessionId, const string& data) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    writes.push_back(make_pair(sessionId, data));
  }

  virtual void resize(const string& sessionId, int cols, int rows) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    resizeAttempts++;
    if (failResize) {
      throw SessionBackendException("resize refused");
    }
    resizes.push_back(make_pair(sessionId, TerminalSize{cols, rows}));
  }

  virtual void terminate(const string& sessionId) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    terminated.push_back(sessionId);
    running.erase(sessionId);
    buffers.erase(sessionId);
    offsets.erase(sessionId);
  }

  virtual bool isRunning(const string& sessionId) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return running.count(sessionId) > 0;
  }

  virtual int subscribe(const string& sessionId,
                        SessionOutputHandler handler) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    int id = nextSubscriptionId++;
    subscribers[id] = make_pair(sessionId, handler);
    return id;
  }

  virtual void unsubscribe(int subscriptionId) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    subscribers.erase(subscriptionId);
  }

  /** @brief Output from the shell of `sessionId`, delivered synchronously. */
  void emitOutput(const string& sessionId, const string& data) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    buffers[sessionId] += data;
    offsets[sessionId] += data.length();
    deliverOutput(sessionId, data, offsets[sessionId]);
  }

  /**
   * @brief Hands a chunk to subscribers without touching the buffer, as a
   * reader thread does with bytes it read before a buffer was captured.
   */
  void deliverOutput(const string& sessionId, const string& data,
                     uint64_t endOffset) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    vector<SessionOutputHandler> handlers;
    for (const auto& it : subscribers) {
      if (it.second.first == sessionId) {
        handlers.push_back(it.second.second);
      }
    }
    for (const auto& handler : handlers) {
      handler(data, endOffset);
    }
  }

  /** @brief A session that exists before any coordinator sees it. */
  void addRunningSession(const string& sessionId, const string& buffered) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    running.insert(sessionId);
    buffers[sessionId] = buffered;
    offsets[sessionId] = buffered.length();
  }

  /** @brief The shell exited by itself. */
  void exitSession(const string& sessionId) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    running.erase(sessionId);
  }

  void setHoldSpawns(bool hold) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    holdSpawns = hold;
    heldCallsChanged.notify_all();
  }

  bool waitForHeldSpawns(int count) {
    return waitUntil([this, count] {
      lock_guard<recursive_mutex> lock(fakeMutex);
      return heldSpawns >= count;
    });
  }

  void setHoldReattach(bool hold) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    holdReattach = hold;
    heldCallsChanged.notify_all();
  }

  bool waitForHeldReattaches(int count) {
    return waitUntil([this, count] {
      lock_guard<recursive_mutex> lock(fakeMutex);
      return heldReattaches >= count;
    });
  }

  void failSpawnsOf(const string& shell, const string& error) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    spawnFailures[shell] = error;
  }

  void clearSpawnFailures() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    spawnFailures.clear();
  }

  void setFailResize(bool fail) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    failResize = fail;
  }

  void setFailReattach(bool fail) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    failReattach = fail;
  }

  vector<SpawnRequest> getSpawns() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return spawns;
  }

  vector<string> getTerminated() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return terminated;
  }

  bool wasTerminated(const string& sessionId) {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return std::find(terminated.begin(), terminated.end(), sessionId) !=
           terminated.end();
  }

  vector<pair<string, TerminalSize>> getResizes() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return resizes;
  }

  int getResizeAttempts() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return resizeAttempts;
  }

  vector<pair<string, string>> getWrites() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return writes;
  }

  vector<string> getReattachRequests() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return reattachRequests;
  }

  int getSubscriberCount() {
    lock_guard<recursive_mutex> lock(fakeMutex);
    return int(subscribers.size());
  }

 protected:
  recursive_mutex fakeMutex;
  condition_variable_any heldCallsChanged;
  bool holdSpawns;
  int heldSpawns;
  bool holdReattach;
  int heldReattaches;
  bool failResize;
  bool failReattach;
  int resizeAttempts;
  int nextSubscriptionId;
  TerminalSize spawnSize;
  map<string, string> spawnFailures;
  vector<SpawnRequest> spawns;
  vector<string> reattachRequests;
  vector<pair<string, string>> writes;
  vector<pair<string, TerminalSize>> resizes;
  vector<string> terminated;
  set<string> running;
  map<string, string> buffers;
  map<string, uint64_t> offsets;
  map<int, pair<string, SessionOutputHandler>> subscribers;
};

/** @brief Display that keeps everything written to it. */
class FakeTerminalDisplay : public TerminalDisplay {
 public:
  virtual void write(const string& data) {
    lock_guard<mutex> lock(displayMutex);
    output += data;
  }

  string getOutput() {
    lock_guard<mutex> lock(displayMutex);
    return output;
  }

 protected:
  mutex displayMutex;
  string output;
};

class FakeWorkspaceHost : public WorkspaceHost {
 public:
  virtual shared_ptr<TerminalDisplay> createDisplay(const string& tabId,
                                                    const string& paneId) {
    lock_guard<mutex> lock(hostMutex);
    shared_ptr<FakeTerminalDisplay> display(new FakeTerminalDisplay());
    displays[paneId] = display;
    return display;
  }

  shared_ptr<FakeTerminalDisplay> getDisplay(const string& paneId) {
    lock_guard<mutex> lock(hostMutex);
    auto it = displays.find(paneId);
    if (it == displays.end()) {
      return shared_ptr<FakeTerminalDisplay>();
    }
    return it->second;
  }

  int getDisplayCount() {
    lock_guard<mutex> lock(hostMutex);
    return int(displays.size());
  }

 protected:
  mutex hostMutex;
  map<string, shared_ptr<FakeTerminalDisplay>> displays;
};
}  // namespace tt

#endif  // __TT_FAKE_SESSION_BACKEND__
