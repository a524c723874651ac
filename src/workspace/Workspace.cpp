#include "Workspace.hpp"

namespace tt {
namespace {
json optionalToJson(const optional<string>& value) {
  return value ? json(*value) : json(nullptr);
}

optional<string> optionalFromJson(const json& j, const string& key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<string>();
  }
  return nullopt;
}
}  // namespace

json DetachedPane::toJson() const {
  json j;
  j["paneId"] = paneId;
  j["shell"] = shell;
  j["distro"] = optionalToJson(distro);
  j["cwd"] = optionalToJson(cwd);
  return j;
}

DetachedPane DetachedPane::fromJson(const json& j) {
  DetachedPane pane;
  pane.paneId = j.at("paneId").get<string>();
  pane.shell = j.at("shell").get<string>();
  pane.distro = optionalFromJson(j, "distro");
  pane.cwd = optionalFromJson(j, "cwd");
  return pane;
}

Workspace::Workspace(shared_ptr<SessionBackend> _backend,
                     shared_ptr<WorkspaceHost> _host,
                     const TabTermConfig& _config)
    : backend(_backend), host(_host), config(_config), shuttingDown(false) {}

Workspace::~Workspace() { shutdown(); }

string Workspace::openTab(const optional<string>& shell,
                          const optional<string>& distro,
                          const optional<string>& cwd) {
  string selected = shell ? *shell : config.getDefaultShell();
  string tabId = newUuid();
  SessionChanges changes;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    TabEntry entry;
    entry.info = TabInfo{tabId, selected, selected, distro, cwd};
    entry.panes = PaneTree::initialize(tabId, selected, distro, cwd);
    addTab(entry, &changes);
  }
  applySessionChanges(&changes);
  LOG(INFO) << "Opened tab " << tabId << " with " << selected;
  return tabId;
}

optional<string> Workspace::attachPane(const DetachedPane& pane) {
  string tabId = newUuid();
  SessionChanges changes;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    if (coordinators.find(pane.paneId) != coordinators.end()) {
      STERROR << "Pane " << pane.paneId << " is already in this workspace";
      return nullopt;
    }
    TabEntry entry;
    entry.info = TabInfo{tabId, pane.shell, pane.shell, pane.distro, pane.cwd};
    entry.panes = PaneTree::restore(tabId, pane.paneId, pane.shell,
                                    pane.distro, pane.cwd);
    addTab(entry, &changes);
  }
  applySessionChanges(&changes);
  LOG(INFO) << "Attached pane " << pane.paneId << " as tab " << tabId;
  return tabId;
}

bool Workspace::closeTab(const string& tabId) {
  SessionChanges changes;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    if (!findTab(tabId)) {
      STERROR << "Cannot close unknown tab " << tabId;
      return false;
    }
    removeTab(tabId, CloseReason::TAB_CLOSED, &changes);
  }
  applySessionChanges(&changes);
  return true;
}

optional<string> Workspace::splitPane(const string& tabId,
                                      const string& paneId,
                                      SplitOrientation orientation,
                                      const optional<string>& shell,
                                      const optional<string>& distro) {
  SessionChanges changes;
  string newPaneId;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    TabEntry* tab = findTab(tabId);
    if (!tab) {
      STERROR << "Cannot split in unknown tab " << tabId;
      return nullopt;
    }
    try {
      PaneNodePtr target = PaneTree::findNode(tab->panes.root, paneId);
      string newShell = shell ? *shell
                              : (target ? target->shell : tab->info.shell);
      optional<string> newDistro = distro;
      if (!shell && !distro && target) {
        newDistro = target->distro;
      }
      tab->panes = PaneTree::split(tab->panes, paneId, orientation, newShell,
                                   newDistro);
      newPaneId = tab->panes.activePaneId;
      syncSessions(*tab, CloseReason::PANE_CLOSED, &changes);
    } catch (const PaneTreeException& pte) {
      STERROR << "Dropping split: " << pte.what();
      return nullopt;
    }
  }
  applySessionChanges(&changes);
  return newPaneId;
}

bool Workspace::closePane(const string& tabId, const string& paneId) {
  return closePaneWithReason(tabId, paneId, CloseReason::PANE_CLOSED);
}

bool Workspace::closePaneWithReason(const string& tabId, const string& paneId,
                                    CloseReason reason) {
  SessionChanges changes;
  bool applied;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    applied = closePaneLocked(tabId, paneId, reason, &changes);
  }
  applySessionChanges(&changes);
  return applied;
}

optional<DetachedPane> Workspace::detachPane(const string& tabId,
                                             const string& paneId) {
  SessionChanges changes;
  DetachedPane detached;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    TabEntry* tab = findTab(tabId);
    if (!tab) {
      STERROR << "Cannot detach from unknown tab " << tabId;
      return nullopt;
    }
    PaneNodePtr node = PaneTree::findNode(tab->panes.root, paneId);
    if (!node || !node->isTerminal()) {
      STERROR << "Cannot detach " << paneId << ", not a terminal in tab "
              << tabId;
      return nullopt;
    }
    auto coordinator = findCoordinator(tabId, paneId);
    if (!coordinator || coordinator->getPhase() != SessionPhase::RUNNING) {
      LOG(WARNING) << "Cannot detach " << paneId
                   << ", its session is not running";
      return nullopt;
    }
    detached.paneId = node->id;
    detached.shell = node->shell;
    detached.distro = node->distro;
    detached.cwd = node->cwd;
    if (coordinator->getCwd()) {
      detached.cwd = coordinator->getCwd();
    }
    if (!closePaneLocked(tabId, paneId, CloseReason::DETACHED, &changes)) {
      return nullopt;
    }
  }
  applySessionChanges(&changes);
  LOG(INFO) << "Detached pane " << paneId << " from tab " << tabId;
  return detached;
}

bool Workspace::setActivePane(const string& tabId, const string& paneId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  TabEntry* tab = findTab(tabId);
  if (!tab) {
    STERROR << "Cannot focus pane in unknown tab " << tabId;
    return false;
  }
  try {
    tab->panes.activePaneId = PaneTree::setActive(tab->panes, paneId);
  } catch (const PaneTreeException& pte) {
    STERROR << "Dropping focus change: " << pte.what();
    return false;
  }
  return true;
}

optional<string> Workspace::getActivePane(const string& tabId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  TabEntry* tab = findTab(tabId);
  if (!tab) {
    return nullopt;
  }
  return tab->panes.activePaneId;
}

bool Workspace::updatePaneCwd(const string& tabId, const string& paneId,
                              const string& cwd) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  TabEntry* tab = findTab(tabId);
  if (!tab) {
    STERROR << "Cannot update cwd in unknown tab " << tabId;
    return false;
  }
  try {
    tab->panes.root = PaneTree::updateCwd(tab->panes.root, paneId, cwd);
  } catch (const PaneTreeException& pte) {
    STERROR << "Dropping cwd update: " << pte.what();
    return false;
  }
  if (tab->panes.root->id == paneId || tab->panes.activePaneId == paneId) {
    tab->info.cwd = cwd;
  }
  VLOG(1) << "Pane " << paneId << " moved to " << cwd;
  return true;
}

bool Workspace::retryPane(const string& tabId, const string& paneId) {
  SessionChanges changes;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    TabEntry* tab = findTab(tabId);
    auto coordinator = findCoordinator(tabId, paneId);
    if (!tab || !coordinator) {
      STERROR << "Cannot retry unknown pane " << paneId;
      return false;
    }
    if (coordinator->getPhase() != SessionPhase::CLOSED ||
        !coordinator->getError()) {
      LOG(WARNING) << "Pane " << paneId << " did not fail, not retrying";
      return false;
    }
    PaneNodePtr node = PaneTree::findNode(tab->panes.root, paneId);
    changes.discarded.push_back(coordinator);
    auto replacement = makeCoordinator(tabId, node);
    coordinators[paneId] = replacement;
    changes.started.push_back(replacement);
  }
  applySessionChanges(&changes);
  LOG(INFO) << "Retrying spawn of pane " << paneId;
  return true;
}

bool Workspace::writeToPane(const string& tabId, const string& paneId,
                            const string& data) {
  shared_ptr<SessionCoordinator> coordinator;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    coordinator = findCoordinator(tabId, paneId);
  }
  if (!coordinator) {
    STERROR << "Cannot write to unknown pane " << paneId;
    return false;
  }
  coordinator->write(data);
  return true;
}

bool Workspace::resizePane(const string& tabId, const string& paneId,
                           int cols, int rows) {
  shared_ptr<SessionCoordinator> coordinator;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    coordinator = findCoordinator(tabId, paneId);
  }
  if (!coordinator) {
    STERROR << "Cannot resize unknown pane " << paneId;
    return false;
  }
  coordinator->requestResize(cols, rows);
  return true;
}

optional<TabPaneState> Workspace::getTabState(const string& tabId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  TabEntry* tab = findTab(tabId);
  if (!tab) {
    return nullopt;
  }
  return tab->panes;
}

vector<TabInfo> Workspace::getTabs() {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  vector<TabInfo> result;
  for (const auto& tabId : tabOrder) {
    result.push_back(tabs[tabId].info);
  }
  return result;
}

optional<string> Workspace::getActiveTab() {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  return activeTabId;
}

bool Workspace::setActiveTab(const string& tabId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  if (!findTab(tabId)) {
    STERROR << "Cannot activate unknown tab " << tabId;
    return false;
  }
  activeTabId = tabId;
  return true;
}

optional<string> Workspace::findTabForPane(const string& paneId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  for (const auto& it : tabs) {
    if (PaneTree::findNode(it.second.panes.root, paneId)) {
      return it.first;
    }
  }
  return nullopt;
}

optional<SessionPhase> Workspace::getPanePhase(const string& paneId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  auto it = coordinators.find(paneId);
  if (it == coordinators.end()) {
    return nullopt;
  }
  return it->second->getPhase();
}

optional<string> Workspace::getPaneError(const string& paneId) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  auto it = coordinators.find(paneId);
  if (it == coordinators.end()) {
    return nullopt;
  }
  return it->second->getError();
}

int Workspace::reapExitedSessions() {
  vector<shared_ptr<SessionCoordinator>> current;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    for (const auto& it : coordinators) {
      current.push_back(it.second);
    }
  }
  int reaped = 0;
  for (const auto& coordinator : current) {
    if (!coordinator->hasSessionExited()) {
      continue;
    }
    LOG(INFO) << "Shell of pane " << coordinator->getPaneId() << " exited";
    if (closePaneWithReason(coordinator->getTabId(), coordinator->getPaneId(),
                            CloseReason::SESSION_EXITED)) {
      reaped++;
    }
  }
  return reaped;
}

json Workspace::toJson() {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  json j;
  j["activeTab"] = optionalToJson(activeTabId);
  j["tabs"] = json::array();
  for (const auto& tabId : tabOrder) {
    const TabEntry& tab = tabs[tabId];
    json tabJson;
    tabJson["id"] = tab.info.id;
    tabJson["title"] = tab.info.title;
    tabJson["shell"] = tab.info.shell;
    tabJson["distro"] = optionalToJson(tab.info.distro);
    tabJson["cwd"] = optionalToJson(tab.info.cwd);
    tabJson["activePaneId"] = tab.panes.activePaneId;
    tabJson["root"] = tab.panes.root->toJson();
    json sessions = json::object();
    for (const auto& paneId : PaneTree::collectLeafIds(tab.panes.root)) {
      auto it = coordinators.find(paneId);
      if (it == coordinators.end()) {
        continue;
      }
      json session;
      session["phase"] = phaseToString(it->second->getPhase());
      auto error = it->second->getError();
      if (error) {
        session["error"] = *error;
      }
      auto size = it->second->getSize();
      if (size) {
        session["cols"] = size->cols;
        session["rows"] = size->rows;
      }
      sessions[paneId] = session;
    }
    tabJson["sessions"] = sessions;
    j["tabs"].push_back(tabJson);
  }
  return j;
}

json Workspace::saveSession(int64_t now) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  json session;
  session["version"] = 1;
  session["savedAt"] = now;
  session["tabs"] = json::array();
  int activeIndex = 0;
  for (size_t a = 0; a < tabOrder.size(); a++) {
    const TabEntry& tab = tabs[tabOrder[a]];
    if (activeTabId && *activeTabId == tab.info.id) {
      activeIndex = int(a);
    }
    json tabJson;
    tabJson["title"] = tab.info.title;
    tabJson["shell"] = tab.info.shell;
    tabJson["distro"] = optionalToJson(tab.info.distro);
    tabJson["cwd"] = optionalToJson(tab.info.cwd);
    tabJson["panes"] = tab.panes.root->toJson();
    session["tabs"].push_back(tabJson);
  }
  session["activeTabIndex"] = activeIndex;
  return session;
}

int Workspace::restoreSession(const json& session, int64_t now) {
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    if (!tabs.empty()) {
      LOG(INFO) << "Workspace already has tabs, not restoring session";
      return 0;
    }
  }
  vector<string> opened;
  int activeIndex = 0;
  try {
    int64_t savedAt = session.at("savedAt").get<int64_t>();
    if (now - savedAt > SESSION_MAX_AGE_MS) {
      LOG(INFO) << "Saved session is too old to restore";
      return 0;
    }
    activeIndex = session.value("activeTabIndex", 0);
    for (const auto& tabJson : session.at("tabs")) {
      string shell = tabJson.at("shell").get<string>();
      string tabId = openTab(shell, optionalFromJson(tabJson, "distro"),
                             optionalFromJson(tabJson, "cwd"));
      auto title = optionalFromJson(tabJson, "title");
      if (title) {
        lock_guard<recursive_mutex> guard(workspaceMutex);
        TabEntry* tab = findTab(tabId);
        if (tab) {
          tab->info.title = *title;
        }
      }
      opened.push_back(tabId);
    }
  } catch (const json::exception& je) {
    LOG(WARNING) << "Invalid saved session: " << je.what();
  }
  if (!opened.empty()) {
    setActiveTab(opened[std::min(std::max(activeIndex, 0),
                                 int(opened.size()) - 1)]);
  }
  LOG(INFO) << "Restored " << opened.size() << " tabs";
  return int(opened.size());
}

void Workspace::shutdown() {
  SessionChanges changes;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    if (shuttingDown) {
      return;
    }
    shuttingDown = true;
    vector<string> remaining = tabOrder;
    for (const auto& tabId : remaining) {
      removeTab(tabId, CloseReason::WORKSPACE_SHUTDOWN, &changes);
    }
  }
  applySessionChanges(&changes);

  vector<shared_ptr<SessionCoordinator>> pending;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    pending.swap(retired);
  }
  // Destroying a coordinator waits for its spawn to come back
  pending.clear();
}

void Workspace::onCwdChanged(const string& tabId, const string& paneId,
                             const string& cwd) {
  lock_guard<recursive_mutex> guard(workspaceMutex);
  TabEntry* tab = findTab(tabId);
  if (shuttingDown || !tab || !PaneTree::findNode(tab->panes.root, paneId)) {
    // The pane went away while its output was in flight
    VLOG(1) << "Ignoring cwd report from removed pane " << paneId;
    return;
  }
  updatePaneCwd(tabId, paneId, cwd);
}

Workspace::TabEntry* Workspace::findTab(const string& tabId) {
  auto it = tabs.find(tabId);
  if (it == tabs.end()) {
    return NULL;
  }
  return &(it->second);
}

void Workspace::addTab(const TabEntry& entry, SessionChanges* changes) {
  const string& tabId = entry.info.id;
  tabs[tabId] = entry;
  tabOrder.push_back(tabId);
  activeTabId = tabId;
  syncSessions(tabs[tabId], CloseReason::PANE_CLOSED, changes);
}

void Workspace::removeTab(const string& tabId, CloseReason reason,
                          SessionChanges* changes) {
  for (auto it = coordinators.begin(); it != coordinators.end();) {
    if (it->second->getTabId() == tabId) {
      changes->closing.push_back(make_pair(it->second, reason));
      it = coordinators.erase(it);
    } else {
      ++it;
    }
  }
  tabs.erase(tabId);
  auto position = std::find(tabOrder.begin(), tabOrder.end(), tabId);
  if (position == tabOrder.end()) {
    return;
  }
  size_t index = position - tabOrder.begin();
  tabOrder.erase(position);
  if (activeTabId && *activeTabId == tabId) {
    if (tabOrder.empty()) {
      activeTabId.reset();
    } else {
      activeTabId = tabOrder[std::min(index, tabOrder.size() - 1)];
    }
  }
  LOG(INFO) << "Removed tab " << tabId;
}

bool Workspace::closePaneLocked(const string& tabId, const string& paneId,
                                CloseReason reason, SessionChanges* changes) {
  TabEntry* tab = findTab(tabId);
  if (!tab) {
    STERROR << "Cannot close pane in unknown tab " << tabId;
    return false;
  }
  try {
    PaneCloseResult result = PaneTree::close(tab->panes, paneId);
    if (result.closeOwnerTab) {
      removeTab(tabId, reason, changes);
    } else {
      tab->panes = result.state;
      syncSessions(*tab, reason, changes);
    }
  } catch (const PaneTreeException& pte) {
    STERROR << "Dropping close: " << pte.what();
    return false;
  }
  return true;
}

void Workspace::syncSessions(const TabEntry& tab, CloseReason reason,
                             SessionChanges* changes) {
  const string& tabId = tab.info.id;
  vector<string> leafIds = PaneTree::collectLeafIds(tab.panes.root);
  set<string> leaves(leafIds.begin(), leafIds.end());

  for (auto it = coordinators.begin(); it != coordinators.end();) {
    if (it->second->getTabId() == tabId && !leaves.count(it->first)) {
      changes->closing.push_back(make_pair(it->second, reason));
      it = coordinators.erase(it);
    } else {
      ++it;
    }
  }
  for (const auto& leafId : leafIds) {
    if (coordinators.find(leafId) != coordinators.end()) {
      continue;
    }
    auto coordinator =
        makeCoordinator(tabId, PaneTree::findNode(tab.panes.root, leafId));
    coordinators[leafId] = coordinator;
    changes->started.push_back(coordinator);
  }
}

shared_ptr<SessionCoordinator> Workspace::makeCoordinator(
    const string& tabId, const PaneNodePtr& node) {
  return shared_ptr<SessionCoordinator>(new SessionCoordinator(
      backend, host->createDisplay(tabId, node->id), this, tabId, node,
      config.getResizeDebounceMs()));
}

shared_ptr<SessionCoordinator> Workspace::findCoordinator(
    const string& tabId, const string& paneId) {
  auto it = coordinators.find(paneId);
  if (it == coordinators.end() || it->second->getTabId() != tabId) {
    return shared_ptr<SessionCoordinator>();
  }
  return it->second;
}

void Workspace::applySessionChanges(SessionChanges* changes) {
  for (auto& it : changes->closing) {
    it.first->close(it.second);
  }
  for (auto& coordinator : changes->started) {
    coordinator->start();
  }

  vector<shared_ptr<SessionCoordinator>> finished;
  {
    lock_guard<recursive_mutex> guard(workspaceMutex);
    for (auto& it : changes->closing) {
      retired.push_back(it.first);
    }
    for (auto& coordinator : changes->discarded) {
      retired.push_back(coordinator);
    }
    for (auto it = retired.begin(); it != retired.end();) {
      if ((*it)->getPhase() == SessionPhase::CLOSED) {
        finished.push_back(*it);
        it = retired.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Joins lifecycle threads that have already finished
  finished.clear();
}

}  // namespace tt
