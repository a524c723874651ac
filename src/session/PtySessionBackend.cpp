#include "PtySessionBackend.hpp"

namespace tt {
#define BUF_SIZE (16 * 1024)

namespace {
void chdirHome() {
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && ::chdir(pwd->pw_dir) == 0) {
    return;
  }
  int ignored = ::chdir("/");
  (void)ignored;
}

void reapChild(pid_t childPid) {
#if __NetBSD__
  int throwaway;
  FATAL_FAIL(waitpid(childPid, &throwaway, WUNTRACED));
#else
  siginfo_t childInfo;
  int rc = waitid(P_PID, childPid, &childInfo, WEXITED);
  if (rc < 0 && GetErrno() != ECHILD) {
    FATAL_FAIL(rc);
  }
#endif
}
}  // namespace

PtySessionBackend::PtySessionBackend(const TabTermConfig& _config)
    : config(_config), nextSubscriptionId(1), shuttingDown(false) {
  readThread.reset(new thread(&PtySessionBackend::pollSessions, this));
}

PtySessionBackend::~PtySessionBackend() { shutdown(); }

TerminalSize PtySessionBackend::spawn(const string& sessionId,
                                      const string& shell,
                                      const optional<string>& distro,
                                      const optional<string>& initialCwd) {
  ShellProfile profile = config.getProfile(shell);
  vector<string> argv = profile.buildArgv(distro, initialCwd);
  optional<string> chdirTo;
  if (profile.cwdFlag.empty()) {
    chdirTo = initialCwd;
  }
  TerminalSize size = {config.getInitialCols(), config.getInitialRows()};

  {
    lock_guard<recursive_mutex> guard(backendMutex);
    auto it = sessions.find(sessionId);
    if (it != sessions.end() && it->second->running) {
      throw SessionBackendException("Session already running: " + sessionId);
    }
  }

  // The child reports a failed exec through this pipe, a successful exec
  // closes it
  int errorPipe[2];
  FATAL_FAIL(::pipe(errorPipe));
  FATAL_FAIL(fcntl(errorPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));

  winsize ws;
  ws.ws_col = size.cols;
  ws.ws_row = size.rows;
  ws.ws_xpixel = 0;
  ws.ws_ypixel = 0;

  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &ws);
  switch (pid) {
    case -1: {
      auto localErrno = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw SessionBackendException(string("forkpty failed: ") +
                                    strerror(localErrno));
    }
    case 0:
      ::close(errorPipe[0]);
      runShell(sessionId, argv, chdirTo, errorPipe[1]);
      break;
    default:
      break;
  }

  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (bytesRead < 0 && GetErrno() == EINTR);
  ::close(errorPipe[0]);
  if (bytesRead == (ssize_t)sizeof(childErrno)) {
    reapChild(pid);
    ::close(masterFd);
    throw SessionBackendException("Cannot run " + argv[0] + ": " +
                                  strerror(childErrno));
  }
  FATAL_FAIL(fcntl(masterFd, F_SETFD, FD_CLOEXEC));

  shared_ptr<PtySession> session(new PtySession());
  session->id = sessionId;
  session->masterFd = masterFd;
  session->childPid = pid;
  session->running = true;
  session->totalBytes = 0;
  {
    lock_guard<recursive_mutex> guard(backendMutex);
    sessions[sessionId] = session;
  }
  LOG(INFO) << "Spawned " << argv[0] << " (pid " << pid << ", fd " << masterFd
            << ") for session " << sessionId;
  return size;
}

void PtySessionBackend::runShell(const string& sessionId,
                                 const vector<string>& argv,
                                 const optional<string>& chdirTo,
                                 int errorPipeFd) {
  if (!chdirTo || ::chdir(chdirTo->c_str()) == -1) {
    chdirHome();
  }
  setenv("TABTERM_VERSION", TT_VERSION, 1);
  setenv("TABTERM_PANE_ID", sessionId.c_str(), 1);
  setenv("TERM", "xterm-256color", 1);
  // Shells remember an ignored SIGCHLD as the original disposition
  signal(SIGCHLD, SIG_DFL);

  vector<char*> args;
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(NULL);
  execvp(args[0], &args[0]);

  int execErrno = GetErrno();
  ssize_t ignored = ::write(errorPipeFd, &execErrno, sizeof(execErrno));
  (void)ignored;
  _exit(127);
}

optional<ReattachBuffer> PtySessionBackend::reattach(const string& sessionId) {
  lock_guard<recursive_mutex> guard(backendMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullopt;
  }
  return ReattachBuffer{it->second->buffer, it->second->totalBytes};
}

void PtySessionBackend::write(const string& sessionId, const string& data) {
  lock_guard<recursive_mutex> guard(backendMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end() || !it->second->running) {
    VLOG(1) << "Dropping write to missing session " << sessionId;
    return;
  }
  int fd = it->second->masterFd;
  size_t bytesWritten = 0;
  while (bytesWritten < data.length()) {
    ssize_t rc =
        ::write(fd, data.data() + bytesWritten, data.length() - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        continue;
      }
      LOG(WARNING) << "Write to session " << sessionId
                   << " failed: " << strerror(localErrno);
      return;
    }
    bytesWritten += rc;
  }
}

void PtySessionBackend::resize(const string& sessionId, int cols, int rows) {
  lock_guard<recursive_mutex> guard(backendMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end() || !it->second->running) {
    throw SessionBackendException("No running session " + sessionId);
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(it->second->masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw SessionBackendException(string("TIOCSWINSZ failed: ") +
                                  strerror(GetErrno()));
  }
}

void PtySessionBackend::terminate(const string& sessionId) {
  lock_guard<recursive_mutex> guard(backendMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    VLOG(1) << "Nothing to terminate for " << sessionId;
    return;
  }
  auto session = it->second;
  if (session->running) {
    kill(session->childPid, SIGKILL);
    reapChild(session->childPid);
    ::close(session->masterFd);
    session->masterFd = -1;
    session->running = false;
  }
  sessions.erase(it);
  LOG(INFO) << "Terminated session " << sessionId;
}

bool PtySessionBackend::isRunning(const string& sessionId) {
  lock_guard<recursive_mutex> guard(backendMutex);
  auto it = sessions.find(sessionId);
  return it != sessions.end() && it->second->running;
}

int PtySessionBackend::subscribe(const string& sessionId,
                                 SessionOutputHandler handler) {
  lock_guard<recursive_mutex> guard(backendMutex);
  int id = nextSubscriptionId++;
  subscribers[id] = make_pair(sessionId, handler);
  return id;
}

void PtySessionBackend::unsubscribe(int subscriptionId) {
  lock_guard<recursive_mutex> guard(backendMutex);
  subscribers.erase(subscriptionId);
}

void PtySessionBackend::shutdown() {
  {
    lock_guard<recursive_mutex> guard(backendMutex);
    if (shuttingDown) {
      return;
    }
    shuttingDown = true;
  }
  if (readThread) {
    readThread->join();
    readThread.reset();
  }
  lock_guard<recursive_mutex> guard(backendMutex);
  for (auto& it : sessions) {
    if (it.second->running) {
      kill(it.second->childPid, SIGKILL);
      reapChild(it.second->childPid);
      ::close(it.second->masterFd);
      it.second->running = false;
    }
  }
  sessions.clear();
  subscribers.clear();
}

int PtySessionBackend::getSessionCount() {
  lock_guard<recursive_mutex> guard(backendMutex);
  return int(sessions.size());
}

void PtySessionBackend::pollSessions() {
  while (true) {
    vector<pollfd> fds;
    vector<shared_ptr<PtySession>> polled;
    {
      lock_guard<recursive_mutex> guard(backendMutex);
      if (shuttingDown) {
        return;
      }
      for (auto& it : sessions) {
        if (it.second->running) {
          pollfd pfd;
          pfd.fd = it.second->masterFd;
          pfd.events = POLLIN;
          pfd.revents = 0;
          fds.push_back(pfd);
          polled.push_back(it.second);
        }
      }
    }
    if (fds.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }

    int rc = ::poll(&fds[0], fds.size(), 10);
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    FATAL_FAIL(rc);
    if (rc == 0) {
      continue;
    }

    lock_guard<recursive_mutex> guard(backendMutex);
    for (size_t a = 0; a < fds.size(); a++) {
      if (!(fds[a].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      const auto& session = polled[a];
      auto it = sessions.find(session->id);
      // Terminated (and possibly respawned) while we were polling
      if (it == sessions.end() || it->second != session || !session->running) {
        continue;
      }
      readSession(session);
    }
  }
}

void PtySessionBackend::readSession(const shared_ptr<PtySession>& session) {
  char b[BUF_SIZE];
  ssize_t rc = ::read(session->masterFd, b, BUF_SIZE);
  if (rc < 0 && (GetErrno() == EAGAIN || GetErrno() == EINTR)) {
    return;
  }
  if (rc <= 0) {
    // Linux reports EIO once the child side of the pty is gone
    handleSessionEnd(session);
    return;
  }

  string chunk(b, rc);
  session->totalBytes += rc;
  session->buffer.append(chunk);
  size_t maxBuffer = config.getScrollbackBytes();
  if (session->buffer.length() > maxBuffer) {
    session->buffer.erase(0, session->buffer.length() - maxBuffer);
  }

  vector<int> targets;
  for (const auto& it : subscribers) {
    if (it.second.first == session->id) {
      targets.push_back(it.first);
    }
  }
  for (int id : targets) {
    auto it = subscribers.find(id);
    if (it == subscribers.end()) {
      continue;
    }
    SessionOutputHandler handler = it->second.second;
    handler(chunk, session->totalBytes);
  }
}

void PtySessionBackend::handleSessionEnd(
    const shared_ptr<PtySession>& session) {
  LOG(INFO) << "Terminal session ended: " << session->id;
  reapChild(session->childPid);
  ::close(session->masterFd);
  session->masterFd = -1;
  session->running = false;
}

}  // namespace tt
