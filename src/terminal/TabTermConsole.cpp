#include "TabTermConsole.hpp"

namespace tt {
namespace {
const map<string, string> COMMAND_USAGE = {
    {"tabs", "tabs"},
    {"newtab", "newtab [shell]"},
    {"closetab", "closetab <tab>"},
    {"split", "split <pane> <h|v> [shell]"},
    {"close", "close <pane>"},
    {"focus", "focus <pane>"},
    {"active", "active <tab>"},
    {"tree", "tree [tab]"},
    {"send", "send <pane> <text>"},
    {"resize", "resize <pane> <cols> <rows>"},
    {"detach", "detach <pane>"},
    {"attach", "attach <pane> <shell>"},
    {"retry", "retry <pane>"},
    {"save", "save [file]"},
    {"restore", "restore [file]"},
    {"quit", "quit"},
};

vector<string> tokenize(const string& line) {
  vector<string> tokens;
  for (const auto& token : split(line, ' ')) {
    if (!token.empty()) {
      tokens.push_back(token);
    }
  }
  return tokens;
}

optional<int> parsePositive(const string& s) {
  try {
    size_t used;
    int value = stoi(s, &used);
    if (used == s.length() && value > 0) {
      return value;
    }
  } catch (const std::logic_error& le) {
    VLOG(1) << "Not a number: " << s;
  }
  return nullopt;
}

optional<string> matchPrefix(const vector<string>& ids, const string& prefix) {
  optional<string> match;
  for (const auto& id : ids) {
    if (id == prefix) {
      return id;
    }
    if (id.compare(0, prefix.length(), prefix) == 0) {
      if (match) {
        // Ambiguous
        return nullopt;
      }
      match = id;
    }
  }
  return match;
}
}  // namespace

void ConsoleWriter::writeLine(const string& line) {
  lock_guard<mutex> guard(writerMutex);
  out << line << endl;
}

void ConsoleWriter::writePaneOutput(const string& paneId, const string& data) {
  lock_guard<mutex> guard(writerMutex);
  out << "[" << paneId.substr(0, 8) << "] " << data;
  out.flush();
}

TabTermConsole::TabTermConsole(shared_ptr<Workspace> _workspace,
                               shared_ptr<ConsoleWriter> _writer)
    : workspace(_workspace), writer(_writer), running(true) {}

string TabTermConsole::getDefaultSessionPath() {
  return sago::getDataHome() + "/tabterm/session.json";
}

void TabTermConsole::run(int fd) {
  string pending;
  char b[4096];
  while (running) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, 10);
    if (rc < 0 && GetErrno() != EINTR) {
      FATAL_FAIL(rc);
    }
    if (rc > 0) {
      ssize_t bytesRead = ::read(fd, b, sizeof(b));
      if (bytesRead <= 0) {
        LOG(INFO) << "Command input closed";
        running = false;
      } else {
        pending.append(b, bytesRead);
        size_t newline;
        while (running && (newline = pending.find('\n')) != string::npos) {
          string line = pending.substr(0, newline);
          pending.erase(0, newline + 1);
          if (!line.empty() && line.back() == '\r') {
            line.pop_back();
          }
          try {
            running = handleCommand(line);
          } catch (const std::runtime_error& re) {
            STERROR << re.what();
            writer->writeLine("error: " + string(re.what()));
          }
        }
      }
    }

    workspace->reapExitedSessions();
    if (running && workspace->getTabs().empty()) {
      writer->writeLine("All tabs closed");
      running = false;
    }
  }
}

bool TabTermConsole::handleCommand(const string& line) {
  vector<string> tokens = tokenize(line);
  if (tokens.empty()) {
    return true;
  }
  const string& command = tokens[0];
  size_t args = tokens.size() - 1;
  VLOG(1) << "Console command: " << line;

  if (command == "quit") {
    return false;
  }
  if (command == "tabs") {
    printTabs();
    return true;
  }
  if (command == "newtab") {
    if (args > 1) {
      usage(command);
      return true;
    }
    optional<string> shell;
    if (args == 1) {
      shell = tokens[1];
    }
    string tabId = workspace->openTab(shell);
    writer->writeLine("tab " + tabId + " pane " +
                      workspace->getActivePane(tabId).value_or(""));
    return true;
  }
  if (command == "closetab") {
    if (args != 1) {
      usage(command);
      return true;
    }
    auto tabId = resolveTab(tokens[1]);
    if (!tabId || !workspace->closeTab(*tabId)) {
      writer->writeLine("no such tab: " + tokens[1]);
    }
    return true;
  }
  if (command == "active") {
    if (args != 1) {
      usage(command);
      return true;
    }
    auto tabId = resolveTab(tokens[1]);
    if (!tabId || !workspace->setActiveTab(*tabId)) {
      writer->writeLine("no such tab: " + tokens[1]);
    }
    return true;
  }
  if (command == "tree") {
    if (args > 1) {
      usage(command);
      return true;
    }
    optional<string> tabId =
        args == 1 ? resolveTab(tokens[1]) : workspace->getActiveTab();
    optional<TabPaneState> state;
    if (tabId) {
      state = workspace->getTabState(*tabId);
    }
    if (!state) {
      writer->writeLine("no such tab");
      return true;
    }
    json tree;
    tree["tabId"] = state->tabId;
    tree["activePaneId"] = state->activePaneId;
    tree["root"] = state->root->toJson();
    writer->writeLine(tree.dump(2));
    return true;
  }
  if (command == "save" || command == "restore") {
    if (args > 1) {
      usage(command);
      return true;
    }
    string path = args == 1 ? tokens[1] : getDefaultSessionPath();
    if (command == "save") {
      fs::create_directories(fs::path(path).parent_path());
      ofstream sessionFile(path);
      sessionFile << workspace->saveSession().dump(2) << endl;
      if (!sessionFile) {
        writer->writeLine("could not write " + path);
        return true;
      }
      writer->writeLine("saved session to " + path);
      return true;
    }
    ifstream sessionFile(path);
    if (!sessionFile) {
      writer->writeLine("could not read " + path);
      return true;
    }
    json session = json::parse(sessionFile, nullptr, false);
    if (session.is_discarded()) {
      writer->writeLine("invalid session file " + path);
      return true;
    }
    int restored = workspace->restoreSession(session);
    writer->writeLine("restored " + to_string(restored) + " tabs");
    return true;
  }
  if (command == "attach") {
    if (args != 2) {
      usage(command);
      return true;
    }
    DetachedPane pane;
    pane.paneId = tokens[1];
    pane.shell = tokens[2];
    auto tabId = workspace->attachPane(pane);
    writer->writeLine(tabId ? "tab " + *tabId + " pane " + pane.paneId
                            : "pane already open: " + pane.paneId);
    return true;
  }

  if (COMMAND_USAGE.find(command) == COMMAND_USAGE.end()) {
    writer->writeLine("unknown command: " + command);
    return true;
  }

  // Everything below addresses a pane
  if (args < 1) {
    usage(command);
    return true;
  }
  auto paneId = resolvePane(tokens[1]);
  optional<string> tabId;
  if (paneId) {
    tabId = workspace->findTabForPane(*paneId);
  }
  if (!paneId || !tabId) {
    writer->writeLine("no such pane: " + tokens[1]);
    return true;
  }

  if (command == "split") {
    if (args < 2 || args > 3) {
      usage(command);
      return true;
    }
    auto orientation = orientationFromString(tokens[2]);
    if (!orientation) {
      usage(command);
      return true;
    }
    optional<string> shell;
    if (args == 3) {
      shell = tokens[3];
    }
    auto newPane = workspace->splitPane(*tabId, *paneId, *orientation, shell);
    writer->writeLine(newPane ? "pane " + *newPane
                              : "cannot split " + *paneId);
  } else if (command == "close") {
    if (!workspace->closePane(*tabId, *paneId)) {
      writer->writeLine("cannot close " + *paneId);
    }
  } else if (command == "focus") {
    if (!workspace->setActivePane(*tabId, *paneId)) {
      writer->writeLine("cannot focus " + *paneId);
    }
  } else if (command == "send") {
    if (args < 2) {
      usage(command);
      return true;
    }
    string text = tokens[2];
    for (size_t a = 3; a < tokens.size(); a++) {
      text += " " + tokens[a];
    }
    workspace->writeToPane(*tabId, *paneId, text + "\n");
  } else if (command == "resize") {
    optional<int> cols, rows;
    if (args == 3) {
      cols = parsePositive(tokens[2]);
      rows = parsePositive(tokens[3]);
    }
    if (!cols || !rows) {
      usage(command);
      return true;
    }
    workspace->resizePane(*tabId, *paneId, *cols, *rows);
  } else if (command == "detach") {
    auto detached = workspace->detachPane(*tabId, *paneId);
    writer->writeLine(detached ? detached->toJson().dump()
                               : "cannot detach " + *paneId);
  } else if (command == "retry") {
    if (!workspace->retryPane(*tabId, *paneId)) {
      writer->writeLine("cannot retry " + *paneId);
    }
  } else {
    usage(command);
  }
  return true;
}

optional<string> TabTermConsole::resolveTab(const string& prefix) {
  vector<string> ids;
  for (const auto& tab : workspace->getTabs()) {
    ids.push_back(tab.id);
  }
  return matchPrefix(ids, prefix);
}

optional<string> TabTermConsole::resolvePane(const string& prefix) {
  vector<string> ids;
  for (const auto& tab : workspace->getTabs()) {
    auto state = workspace->getTabState(tab.id);
    if (state) {
      auto leaves = PaneTree::collectLeafIds(state->root);
      ids.insert(ids.end(), leaves.begin(), leaves.end());
    }
  }
  return matchPrefix(ids, prefix);
}

void TabTermConsole::printTabs() {
  auto activeTab = workspace->getActiveTab();
  for (const auto& tab : workspace->getTabs()) {
    string line = (activeTab && *activeTab == tab.id) ? "* " : "  ";
    line += tab.id + " " + tab.title;
    if (tab.cwd) {
      line += " " + *tab.cwd;
    }
    auto activePane = workspace->getActivePane(tab.id);
    if (activePane) {
      auto phase = workspace->getPanePhase(*activePane);
      line += " pane " + *activePane;
      if (phase) {
        line += " (" + phaseToString(*phase) + ")";
      }
    }
    writer->writeLine(line);
  }
}

void TabTermConsole::usage(const string& command) {
  auto it = COMMAND_USAGE.find(command);
  writer->writeLine("usage: " +
                    (it == COMMAND_USAGE.end() ? command : it->second));
}

}  // namespace tt
