#include "SessionCoordinator.hpp"

namespace tt {
namespace {
string spawnErrorText(const string& shell, const string& error) {
  return "\x1b[31mFailed to spawn shell: " + error + "\x1b[0m\r\n" +
         "\x1b[33mCheck that '" + shell +
         "' is installed or configure it under [Profile." + shell +
         "] in tabterm.ini.\x1b[0m\r\n";
}
}  // namespace

string phaseToString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::IDLE:
      return "idle";
    case SessionPhase::SPAWNING:
      return "spawning";
    case SessionPhase::REATTACHING:
      return "reattaching";
    case SessionPhase::RUNNING:
      return "running";
    case SessionPhase::CLOSING:
      return "closing";
    case SessionPhase::CLOSED:
      return "closed";
  }
  return "unknown";
}

struct SessionCoordinator::State {
  mutable mutex stateMutex;
  SessionPhase phase;
  CloseReason closeReason;
  shared_ptr<SessionBackend> backend;
  shared_ptr<TerminalDisplay> display;
  SessionListener* listener;
  string tabId;
  PaneNodePtr node;
  CwdTracker cwdTracker;
  optional<string> error;
  optional<TerminalSize> size;
  /** @brief Size the display asked for before the session was running. */
  optional<TerminalSize> requestedSize;
  optional<string> cwd;
  /**
   * @brief The backend has shown the session to exist. A pane reattached
   * ahead of a spawn still in flight has not seen it yet.
   */
  bool sessionSeen;
  /** @brief Live output that arrived while the reattach buffer was fetched. */
  deque<pair<string, uint64_t>> pendingOutput;

  /** @brief Shows output and returns a newly reported cwd. Needs the lock. */
  optional<string> render(const string& data) {
    display->write(data);
    auto newCwd = cwdTracker.scan(data);
    if (!newCwd || newCwd == cwd) {
      return nullopt;
    }
    cwd = newCwd;
    return newCwd;
  }
};

SessionCoordinator::SessionCoordinator(shared_ptr<SessionBackend> backend,
                                       shared_ptr<TerminalDisplay> display,
                                       SessionListener* listener,
                                       const string& _tabId, PaneNodePtr node,
                                       int resizeDebounceMs)
    : paneId(node->id), tabId(_tabId), state(new State()) {
  state->phase = SessionPhase::IDLE;
  state->sessionSeen = false;
  state->closeReason = CloseReason::PANE_CLOSED;
  state->backend = backend;
  state->display = display;
  state->listener = listener;
  state->tabId = tabId;
  state->node = node;
  state->cwd = node->cwd;

  weak_ptr<State> weakState = state;
  resizer.reset(new ResizeCoalescer(
      resizeDebounceMs, [weakState](const TerminalSize& size) {
        auto lockedState = weakState.lock();
        if (lockedState) {
          flushResize(lockedState, size);
        }
      }));
}

SessionCoordinator::~SessionCoordinator() {
  close(CloseReason::PANE_CLOSED);
  if (lifecycleThread) {
    lifecycleThread->join();
    lifecycleThread.reset();
  }
}

bool SessionCoordinator::start() {
  lock_guard<mutex> control(controlMutex);
  {
    lock_guard<mutex> guard(state->stateMutex);
    if (state->phase != SessionPhase::IDLE) {
      VLOG(1) << "Pane " << paneId << " already started, ignoring";
      return false;
    }
    state->phase = state->node->reattach ? SessionPhase::REATTACHING
                                         : SessionPhase::SPAWNING;
  }

  weak_ptr<State> weakState = state;
  subscriptionId = state->backend->subscribe(
      paneId, [weakState](const string& data, uint64_t endOffset) {
        auto lockedState = weakState.lock();
        if (lockedState) {
          handleOutput(lockedState, data, endOffset);
        }
      });
  lifecycleThread.reset(
      new thread(&SessionCoordinator::runLifecycle, state));
  return true;
}

void SessionCoordinator::requestResize(int cols, int rows) {
  {
    lock_guard<mutex> guard(state->stateMutex);
    switch (state->phase) {
      case SessionPhase::IDLE:
      case SessionPhase::SPAWNING:
      case SessionPhase::REATTACHING:
        // Applied once the session is up
        state->requestedSize = TerminalSize{cols, rows};
        return;
      case SessionPhase::CLOSING:
      case SessionPhase::CLOSED:
        return;
      case SessionPhase::RUNNING:
        break;
    }
  }
  resizer->request(cols, rows);
}

void SessionCoordinator::write(const string& data) {
  if (getPhase() != SessionPhase::RUNNING) {
    VLOG(1) << "Dropping input for pane " << paneId << " in phase "
            << phaseToString(getPhase());
    return;
  }
  state->backend->write(paneId, data);
}

void SessionCoordinator::close(CloseReason reason) {
  lock_guard<mutex> control(controlMutex);
  SessionPhase previous;
  {
    lock_guard<mutex> guard(state->stateMutex);
    previous = state->phase;
    if (previous == SessionPhase::CLOSING || previous == SessionPhase::CLOSED) {
      return;
    }
    state->phase = SessionPhase::CLOSING;
    state->closeReason = reason;
    state->pendingOutput.clear();
  }

  resizer->shutdown();
  if (subscriptionId) {
    state->backend->unsubscribe(*subscriptionId);
    subscriptionId.reset();
  }

  if (previous == SessionPhase::SPAWNING ||
      previous == SessionPhase::REATTACHING) {
    VLOG(1) << "Pane " << paneId
            << " closed while starting, cleanup deferred to completion";
    return;
  }

  bool ownsSession = previous == SessionPhase::RUNNING || state->node->reattach;
  if (ownsSession && reason != CloseReason::DETACHED) {
    try {
      state->backend->terminate(paneId);
    } catch (const SessionBackendException& sbe) {
      LOG(WARNING) << "Failed to terminate session " << paneId << ": "
                   << sbe.what();
    }
  }
  LOG(INFO) << "Pane " << paneId << " closed"
            << (reason == CloseReason::DETACHED ? " (detached)" : "");

  lock_guard<mutex> guard(state->stateMutex);
  state->phase = SessionPhase::CLOSED;
}

SessionPhase SessionCoordinator::getPhase() const {
  lock_guard<mutex> guard(state->stateMutex);
  return state->phase;
}

optional<string> SessionCoordinator::getError() const {
  lock_guard<mutex> guard(state->stateMutex);
  return state->error;
}

optional<TerminalSize> SessionCoordinator::getSize() const {
  lock_guard<mutex> guard(state->stateMutex);
  return state->size;
}

optional<string> SessionCoordinator::getCwd() const {
  lock_guard<mutex> guard(state->stateMutex);
  return state->cwd;
}

bool SessionCoordinator::hasSessionExited() {
  if (getPhase() != SessionPhase::RUNNING) {
    return false;
  }
  bool running = state->backend->isRunning(paneId);
  lock_guard<mutex> guard(state->stateMutex);
  if (running) {
    state->sessionSeen = true;
    return false;
  }
  return state->sessionSeen;
}

void SessionCoordinator::runLifecycle(shared_ptr<State> state) {
  const PaneNodePtr node = state->node;
  bool reattach;
  {
    lock_guard<mutex> guard(state->stateMutex);
    reattach = state->phase == SessionPhase::REATTACHING;
  }

  optional<TerminalSize> ack;
  optional<ReattachBuffer> buffer;
  if (reattach) {
    try {
      buffer = state->backend->reattach(node->id);
    } catch (const SessionBackendException& sbe) {
      LOG(WARNING) << "Could not fetch buffer for " << node->id << ": "
                   << sbe.what();
    }
  } else {
    try {
      ack = state->backend->spawn(node->id, node->shell, node->distro,
                                  node->cwd);
    } catch (const SessionBackendException& sbe) {
      LOG(WARNING) << "Failed to spawn " << node->shell << " for pane "
                   << node->id << ": " << sbe.what();
      lock_guard<mutex> guard(state->stateMutex);
      if (state->phase == SessionPhase::SPAWNING) {
        state->error = sbe.what();
        state->display->write(spawnErrorText(node->shell, sbe.what()));
      }
      state->phase = SessionPhase::CLOSED;
      return;
    }
  }

  bool cancelled = false;
  CloseReason reason;
  optional<TerminalSize> followUpResize;
  optional<string> newCwd;
  {
    lock_guard<mutex> guard(state->stateMutex);
    reason = state->closeReason;
    if (state->phase == SessionPhase::CLOSING) {
      cancelled = true;
    } else {
      if (reattach) {
        uint64_t replayedTo = 0;
        if (buffer) {
          if (!buffer->data.empty()) {
            newCwd = state->render(buffer->data);
          }
          replayedTo = buffer->endOffset;
        } else {
          VLOG(1) << "No buffer to replay for " << node->id;
        }
        // Chunks that overlap the replayed buffer are trimmed to the new part
        for (const auto& chunk : state->pendingOutput) {
          if (chunk.second <= replayedTo) {
            continue;
          }
          uint64_t chunkStart = chunk.second - chunk.first.length();
          string fresh = chunkStart < replayedTo
                             ? chunk.first.substr(replayedTo - chunkStart)
                             : chunk.first;
          auto chunkCwd = state->render(fresh);
          if (chunkCwd) {
            newCwd = chunkCwd;
          }
        }
        state->pendingOutput.clear();
      } else {
        state->size = ack;
      }
      if (state->requestedSize && state->requestedSize != state->size) {
        followUpResize = state->requestedSize;
      }
      state->requestedSize.reset();
      state->sessionSeen = ack.has_value() || buffer.has_value();
      state->phase = SessionPhase::RUNNING;
    }
  }

  if (cancelled) {
    if (reason != CloseReason::DETACHED) {
      LOG(INFO) << "Pane " << node->id
                << " was closed before its session started, terminating it";
      try {
        state->backend->terminate(node->id);
      } catch (const SessionBackendException& sbe) {
        LOG(WARNING) << "Failed to terminate session " << node->id << ": "
                     << sbe.what();
      }
    }
    lock_guard<mutex> guard(state->stateMutex);
    state->phase = SessionPhase::CLOSED;
    return;
  }

  LOG(INFO) << "Pane " << node->id << (reattach ? " reattached to " : " running ")
            << node->shell;
  if (newCwd && state->listener) {
    state->listener->onCwdChanged(state->tabId, node->id, *newCwd);
  }
  if (followUpResize) {
    flushResize(state, *followUpResize);
  }
}

void SessionCoordinator::handleOutput(const shared_ptr<State>& state,
                                      const string& data, uint64_t endOffset) {
  optional<string> newCwd;
  {
    lock_guard<mutex> guard(state->stateMutex);
    switch (state->phase) {
      case SessionPhase::REATTACHING:
        state->pendingOutput.push_back(make_pair(data, endOffset));
        return;
      case SessionPhase::IDLE:
      case SessionPhase::CLOSING:
      case SessionPhase::CLOSED:
        return;
      case SessionPhase::SPAWNING:
      case SessionPhase::RUNNING:
        break;
    }
    newCwd = state->render(data);
  }
  if (newCwd && state->listener) {
    state->listener->onCwdChanged(state->tabId, state->node->id, *newCwd);
  }
}

void SessionCoordinator::flushResize(const shared_ptr<State>& state,
                                     const TerminalSize& size) {
  {
    lock_guard<mutex> guard(state->stateMutex);
    if (state->phase != SessionPhase::RUNNING) {
      return;
    }
  }
  try {
    state->backend->resize(state->node->id, size.cols, size.rows);
  } catch (const SessionBackendException& sbe) {
    LOG(WARNING) << "Resize of " << state->node->id << " to " << size.cols
                 << "x" << size.rows << " failed: " << sbe.what();
    return;
  }
  lock_guard<mutex> guard(state->stateMutex);
  state->size = size;
}

}  // namespace tt
