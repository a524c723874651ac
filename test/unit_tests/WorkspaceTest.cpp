#include "FakeSessionBackend.hpp"
#include "TestHeaders.hpp"
#include "Workspace.hpp"

using namespace tt;

namespace {
struct WorkspaceFixture {
  WorkspaceFixture()
      : backend(new FakeSessionBackend()), host(new FakeWorkspaceHost()) {
    config.loadString("[Session]\nresize_debounce_ms = 5\n");
    workspace.reset(new Workspace(backend, host, config));
  }

  ~WorkspaceFixture() { workspace.reset(); }

  bool waitForPhase(const string& paneId, SessionPhase phase) {
    return waitUntil([this, &paneId, phase] {
      return workspace->getPanePhase(paneId) == optional<SessionPhase>(phase);
    });
  }

  TabTermConfig config;
  shared_ptr<FakeSessionBackend> backend;
  shared_ptr<FakeWorkspaceHost> host;
  shared_ptr<Workspace> workspace;
};
}  // namespace

TEST_CASE_METHOD(WorkspaceFixture, "Opening tabs spawns a session per pane",
                 "[Workspace]") {
  string tabId = workspace->openTab(string("zsh"), nullopt, string("/srv"));
  auto paneId = workspace->getActivePane(tabId);
  REQUIRE(paneId);
  REQUIRE(waitForPhase(*paneId, SessionPhase::RUNNING));

  auto spawns = backend->getSpawns();
  REQUIRE(spawns.size() == 1);
  REQUIRE(spawns[0].sessionId == *paneId);
  REQUIRE(spawns[0].shell == "zsh");
  REQUIRE(spawns[0].initialCwd == optional<string>("/srv"));
  REQUIRE(host->getDisplay(*paneId));

  auto tabs = workspace->getTabs();
  REQUIRE(tabs.size() == 1);
  REQUIRE(tabs[0].id == tabId);
  REQUIRE(tabs[0].title == "zsh");
  REQUIRE(tabs[0].cwd == optional<string>("/srv"));
  REQUIRE(workspace->getActiveTab() == optional<string>(tabId));
  REQUIRE(workspace->findTabForPane(*paneId) == optional<string>(tabId));

  string defaultTab = workspace->openTab();
  REQUIRE(workspace->getActiveTab() == optional<string>(defaultTab));
  REQUIRE(workspace->getTabs()[1].shell == "bash");
}

TEST_CASE_METHOD(WorkspaceFixture, "Splitting and closing panes",
                 "[Workspace]") {
  string tabId = workspace->openTab(string("zsh"), string("Ubuntu"));
  string first = *workspace->getActivePane(tabId);

  auto second =
      workspace->splitPane(tabId, first, SplitOrientation::VERTICAL);
  REQUIRE(second);
  REQUIRE(workspace->getActivePane(tabId) == second);
  REQUIRE(waitForPhase(*second, SessionPhase::RUNNING));

  auto spawns = backend->getSpawns();
  REQUIRE(spawns.size() == 2);
  REQUIRE(spawns[1].sessionId == *second);
  REQUIRE(spawns[1].shell == "zsh");
  REQUIRE(spawns[1].distro == optional<string>("Ubuntu"));

  auto third = workspace->splitPane(tabId, *second,
                                    SplitOrientation::HORIZONTAL,
                                    string("bash"));
  REQUIRE(third);
  REQUIRE(waitForPhase(*third, SessionPhase::RUNNING));
  REQUIRE(backend->getSpawns()[2].shell == "bash");
  REQUIRE_FALSE(backend->getSpawns()[2].distro);

  REQUIRE(workspace->closePane(tabId, *third));
  REQUIRE(backend->wasTerminated(*third));
  REQUIRE_FALSE(workspace->getPanePhase(*third));
  auto state = workspace->getTabState(tabId);
  REQUIRE(state);
  REQUIRE(PaneTree::collectLeafIds(state->root) ==
          vector<string>({first, *second}));
  REQUIRE(state->activePaneId == first);

  // Untouched panes keep their sessions
  REQUIRE_FALSE(backend->wasTerminated(first));
  REQUIRE_FALSE(backend->wasTerminated(*second));
  REQUIRE(backend->getSpawns().size() == 3);
}

TEST_CASE_METHOD(WorkspaceFixture, "Invalid ids leave the workspace alone",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string paneId = *workspace->getActivePane(tabId);
  json before = workspace->toJson();

  REQUIRE_FALSE(workspace->splitPane(tabId, "missing",
                                     SplitOrientation::VERTICAL));
  REQUIRE_FALSE(workspace->splitPane("no-tab", paneId,
                                     SplitOrientation::VERTICAL));
  REQUIRE_FALSE(workspace->closePane(tabId, "missing"));
  REQUIRE_FALSE(workspace->closePane("no-tab", paneId));
  REQUIRE_FALSE(workspace->setActivePane(tabId, "missing"));
  REQUIRE_FALSE(workspace->updatePaneCwd(tabId, "missing", "/tmp"));
  REQUIRE_FALSE(workspace->detachPane(tabId, "missing"));
  REQUIRE_FALSE(workspace->closeTab("no-tab"));
  REQUIRE_FALSE(workspace->setActiveTab("no-tab"));
  REQUIRE_FALSE(workspace->writeToPane(tabId, "missing", "x"));
  REQUIRE_FALSE(workspace->resizePane("no-tab", paneId, 10, 10));
  REQUIRE_FALSE(workspace->retryPane(tabId, "missing"));

  REQUIRE(waitForPhase(paneId, SessionPhase::RUNNING));
  json after = workspace->toJson();
  REQUIRE(after["tabs"][0]["root"] == before["tabs"][0]["root"]);
  REQUIRE(after["tabs"][0]["activePaneId"] ==
          before["tabs"][0]["activePaneId"]);
  REQUIRE(backend->getTerminated().empty());
}

TEST_CASE_METHOD(WorkspaceFixture, "Closing the last pane closes the tab",
                 "[Workspace]") {
  string left = workspace->openTab();
  string middle = workspace->openTab();
  string right = workspace->openTab();
  string middlePane = *workspace->getActivePane(middle);
  REQUIRE(waitForPhase(middlePane, SessionPhase::RUNNING));

  REQUIRE(workspace->setActiveTab(middle));
  REQUIRE(workspace->closePane(middle, middlePane));
  REQUIRE(backend->wasTerminated(middlePane));
  REQUIRE_FALSE(workspace->getTabState(middle));
  REQUIRE(workspace->getTabs().size() == 2);
  // The tab that took its place becomes active
  REQUIRE(workspace->getActiveTab() == optional<string>(right));

  REQUIRE(workspace->closeTab(right));
  REQUIRE(workspace->getActiveTab() == optional<string>(left));
  REQUIRE(workspace->closeTab(left));
  REQUIRE_FALSE(workspace->getActiveTab());
  REQUIRE(workspace->getTabs().empty());
}

TEST_CASE_METHOD(WorkspaceFixture, "Closing a tab terminates all its panes",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string first = *workspace->getActivePane(tabId);
  string second =
      *workspace->splitPane(tabId, first, SplitOrientation::HORIZONTAL);
  string other = workspace->openTab();
  string otherPane = *workspace->getActivePane(other);
  REQUIRE(waitForPhase(first, SessionPhase::RUNNING));
  REQUIRE(waitForPhase(second, SessionPhase::RUNNING));
  REQUIRE(waitForPhase(otherPane, SessionPhase::RUNNING));

  REQUIRE(workspace->closeTab(tabId));
  REQUIRE(backend->wasTerminated(first));
  REQUIRE(backend->wasTerminated(second));
  REQUIRE_FALSE(backend->wasTerminated(otherPane));
}

TEST_CASE_METHOD(WorkspaceFixture, "Closing a tab while a spawn is pending",
                 "[Workspace]") {
  backend->setHoldSpawns(true);
  string tabId = workspace->openTab();
  string paneId = *workspace->getActivePane(tabId);
  REQUIRE(backend->waitForHeldSpawns(1));

  // Returns without waiting for the backend
  REQUIRE(workspace->closeTab(tabId));
  REQUIRE(workspace->getTabs().empty());
  REQUIRE(backend->getTerminated().empty());

  backend->setHoldSpawns(false);
  REQUIRE(waitUntil([this, &paneId] { return backend->wasTerminated(paneId); }));
}

TEST_CASE_METHOD(WorkspaceFixture, "Moving a pane to another window",
                 "[Workspace]") {
  string tabId = workspace->openTab(string("zsh"));
  string first = *workspace->getActivePane(tabId);
  string second =
      *workspace->splitPane(tabId, first, SplitOrientation::VERTICAL);
  REQUIRE(waitForPhase(second, SessionPhase::RUNNING));
  backend->emitOutput(second, "$ cd /var\r\n\x1b]7;file://host/var\x07$ ");

  auto detached = workspace->detachPane(tabId, second);
  REQUIRE(detached);
  REQUIRE(detached->paneId == second);
  REQUIRE(detached->shell == "zsh");
  REQUIRE(detached->cwd == optional<string>("/var"));
  REQUIRE_FALSE(backend->wasTerminated(second));
  REQUIRE(backend->isRunning(second));
  REQUIRE(PaneTree::collectLeafIds(workspace->getTabState(tabId)->root) ==
          vector<string>({first}));

  // The descriptor survives a trip through JSON
  DetachedPane received = DetachedPane::fromJson(detached->toJson());
  REQUIRE(received.paneId == second);
  REQUIRE(received.cwd == optional<string>("/var"));
  REQUIRE_FALSE(received.distro);

  shared_ptr<FakeWorkspaceHost> otherHost(new FakeWorkspaceHost());
  Workspace otherWindow(backend, otherHost, config);
  auto newTab = otherWindow.attachPane(received);
  REQUIRE(newTab);
  REQUIRE(waitUntil([&otherWindow, &second] {
    return otherWindow.getPanePhase(second) ==
           optional<SessionPhase>(SessionPhase::RUNNING);
  }));
  REQUIRE(backend->getSpawns().size() == 2);
  REQUIRE(backend->getReattachRequests() == vector<string>({second}));
  REQUIRE(otherHost->getDisplay(second)->getOutput() ==
          "$ cd /var\r\n\x1b]7;file://host/var\x07$ ");
  REQUIRE(otherWindow.getTabs()[0].cwd == optional<string>("/var"));

  // The same pane cannot be attached twice
  REQUIRE_FALSE(otherWindow.attachPane(received));

  REQUIRE(otherWindow.closePane(*newTab, second));
  REQUIRE(backend->wasTerminated(second));
}

TEST_CASE_METHOD(WorkspaceFixture, "Detaching the only pane removes the tab",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string paneId = *workspace->getActivePane(tabId);
  REQUIRE(waitForPhase(paneId, SessionPhase::RUNNING));

  auto detached = workspace->detachPane(tabId, paneId);
  REQUIRE(detached);
  REQUIRE(workspace->getTabs().empty());
  REQUIRE(backend->isRunning(paneId));
}

TEST_CASE_METHOD(WorkspaceFixture, "Panes that are still spawning stay put",
                 "[Workspace]") {
  backend->setHoldSpawns(true);
  string tabId = workspace->openTab();
  string paneId = *workspace->getActivePane(tabId);
  REQUIRE(backend->waitForHeldSpawns(1));

  REQUIRE_FALSE(workspace->detachPane(tabId, paneId));
  REQUIRE(PaneTree::collectLeafIds(workspace->getTabState(tabId)->root) ==
          vector<string>({paneId}));
  REQUIRE(workspace->getPanePhase(paneId) ==
          optional<SessionPhase>(SessionPhase::SPAWNING));

  backend->setHoldSpawns(false);
  REQUIRE(waitForPhase(paneId, SessionPhase::RUNNING));
  REQUIRE(workspace->detachPane(tabId, paneId));
  REQUIRE_FALSE(backend->wasTerminated(paneId));
}

TEST_CASE_METHOD(WorkspaceFixture,
                 "An attached pane waits for a session that is not up yet",
                 "[Workspace]") {
  DetachedPane incoming;
  incoming.paneId = "pane-from-elsewhere";
  incoming.shell = "bash";
  string tabId = *workspace->attachPane(incoming);
  REQUIRE(waitForPhase(incoming.paneId, SessionPhase::RUNNING));

  REQUIRE(workspace->reapExitedSessions() == 0);
  REQUIRE(workspace->getTabs().size() == 1);

  backend->addRunningSession(incoming.paneId, "");
  REQUIRE(workspace->reapExitedSessions() == 0);

  REQUIRE(workspace->closeTab(tabId));
  REQUIRE(backend->wasTerminated(incoming.paneId));
}

TEST_CASE_METHOD(WorkspaceFixture, "Shell cwd reports update the tree",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string first = *workspace->getActivePane(tabId);
  string second =
      *workspace->splitPane(tabId, first, SplitOrientation::VERTICAL);
  REQUIRE(waitForPhase(first, SessionPhase::RUNNING));
  REQUIRE(waitForPhase(second, SessionPhase::RUNNING));

  // The active pane drives the tab cwd
  backend->emitOutput(second, "\x1b]7;file://host/opt/app\x07");
  auto node = PaneTree::findNode(workspace->getTabState(tabId)->root, second);
  REQUIRE(node->cwd == optional<string>("/opt/app"));
  REQUIRE(workspace->getTabs()[0].cwd == optional<string>("/opt/app"));

  // Other panes only update their own node
  backend->emitOutput(first, "\x1b]7;file://host/etc\x07");
  node = PaneTree::findNode(workspace->getTabState(tabId)->root, first);
  REQUIRE(node->cwd == optional<string>("/etc"));
  REQUIRE(workspace->getTabs()[0].cwd == optional<string>("/opt/app"));

  // Reports from panes that are gone are ignored
  workspace->onCwdChanged(tabId, "removed-pane", "/nowhere");
  workspace->onCwdChanged("removed-tab", first, "/nowhere");
  REQUIRE(workspace->getTabs()[0].cwd == optional<string>("/opt/app"));
}

TEST_CASE_METHOD(WorkspaceFixture, "Retrying a failed spawn", "[Workspace]") {
  backend->failSpawnsOf("fish", "No such file or directory");
  string tabId = workspace->openTab(string("fish"));
  string paneId = *workspace->getActivePane(tabId);
  REQUIRE(waitForPhase(paneId, SessionPhase::CLOSED));
  REQUIRE(workspace->getPaneError(paneId) ==
          optional<string>("No such file or directory"));
  // The failed pane stays in the tree
  REQUIRE(workspace->getTabs().size() == 1);

  json state = workspace->toJson();
  REQUIRE(state["tabs"][0]["sessions"][paneId]["phase"] == "closed");
  REQUIRE(state["tabs"][0]["sessions"][paneId]["error"] ==
          "No such file or directory");

  backend->clearSpawnFailures();
  REQUIRE(workspace->retryPane(tabId, paneId));
  REQUIRE(waitForPhase(paneId, SessionPhase::RUNNING));
  REQUIRE_FALSE(workspace->getPaneError(paneId));
  REQUIRE(backend->getSpawns().size() == 2);

  // Running panes are not retried
  REQUIRE_FALSE(workspace->retryPane(tabId, paneId));
}

TEST_CASE_METHOD(WorkspaceFixture, "Exited shells close their pane",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string first = *workspace->getActivePane(tabId);
  string second =
      *workspace->splitPane(tabId, first, SplitOrientation::VERTICAL);
  REQUIRE(waitForPhase(first, SessionPhase::RUNNING));
  REQUIRE(waitForPhase(second, SessionPhase::RUNNING));

  REQUIRE(workspace->reapExitedSessions() == 0);
  backend->exitSession(first);
  REQUIRE(workspace->reapExitedSessions() == 1);
  REQUIRE(PaneTree::collectLeafIds(workspace->getTabState(tabId)->root) ==
          vector<string>({second}));

  backend->exitSession(second);
  REQUIRE(workspace->reapExitedSessions() == 1);
  REQUIRE(workspace->getTabs().empty());
}

TEST_CASE_METHOD(WorkspaceFixture, "Input and resizes reach the pane",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string paneId = *workspace->getActivePane(tabId);
  REQUIRE(waitForPhase(paneId, SessionPhase::RUNNING));

  REQUIRE(workspace->writeToPane(tabId, paneId, "echo hi\n"));
  REQUIRE(backend->getWrites().size() == 1);
  REQUIRE(workspace->resizePane(tabId, paneId, 132, 43));
  REQUIRE(waitUntil([this] { return backend->getResizes().size() == 1; }));

  REQUIRE(waitUntil([this, &tabId, &paneId] {
    json sessions = workspace->toJson()["tabs"][0]["sessions"];
    return sessions[paneId].value("cols", 0) == 132;
  }));
  REQUIRE(workspace->toJson()["activeTab"] == tabId);
}

TEST_CASE_METHOD(WorkspaceFixture, "Saving and restoring tabs",
                 "[Workspace]") {
  string first = workspace->openTab(string("zsh"), string("Debian"),
                                    string("/home/user"));
  string firstPane = *workspace->getActivePane(first);
  workspace->splitPane(first, firstPane, SplitOrientation::VERTICAL);
  string second = workspace->openTab(string("bash"));
  REQUIRE(workspace->setActiveTab(second));
  REQUIRE(workspace->updatePaneCwd(
      second, *workspace->getActivePane(second), "/srv"));

  const int64_t savedAt = 1700000000000LL;
  json session = workspace->saveSession(savedAt);
  REQUIRE(session["savedAt"] == savedAt);
  REQUIRE(session["tabs"].size() == 2);
  REQUIRE(session["tabs"][0]["shell"] == "zsh");
  REQUIRE(session["tabs"][0]["distro"] == "Debian");
  REQUIRE(session["tabs"][0]["panes"]["type"] == "split");
  REQUIRE(session["tabs"][1]["cwd"] == "/srv");
  REQUIRE(session["activeTabIndex"] == 1);

  SECTION("Restored into a fresh window") {
    shared_ptr<FakeSessionBackend> freshBackend(new FakeSessionBackend());
    Workspace restored(freshBackend,
                       shared_ptr<WorkspaceHost>(new FakeWorkspaceHost()),
                       config);
    REQUIRE(restored.restoreSession(session, savedAt + 1000) == 2);
    auto tabs = restored.getTabs();
    REQUIRE(tabs.size() == 2);
    REQUIRE(tabs[0].shell == "zsh");
    REQUIRE(tabs[0].distro == optional<string>("Debian"));
    REQUIRE(tabs[0].cwd == optional<string>("/home/user"));
    REQUIRE(tabs[1].cwd == optional<string>("/srv"));
    REQUIRE(restored.getActiveTab() == optional<string>(tabs[1].id));
    // One fresh pane per tab
    REQUIRE(PaneTree::collectLeafIds(
                restored.getTabState(tabs[0].id)->root)
                .size() == 1);
    REQUIRE(waitUntil(
        [&freshBackend] { return freshBackend->getSpawns().size() == 2; }));
  }

  SECTION("Old snapshots are ignored") {
    Workspace restored(backend,
                       shared_ptr<WorkspaceHost>(new FakeWorkspaceHost()),
                       config);
    REQUIRE(restored.restoreSession(
                session, savedAt + SESSION_MAX_AGE_MS + 1) == 0);
    REQUIRE(restored.getTabs().empty());
  }

  SECTION("A window with tabs is not restored into") {
    REQUIRE(workspace->restoreSession(session, savedAt) == 0);
    REQUIRE(workspace->getTabs().size() == 2);
  }

  SECTION("Broken documents are rejected") {
    Workspace restored(backend,
                       shared_ptr<WorkspaceHost>(new FakeWorkspaceHost()),
                       config);
    REQUIRE(restored.restoreSession(json::parse("{\"tabs\": []}"), savedAt) ==
            0);
    REQUIRE(restored.restoreSession(json::parse("[1, 2]"), savedAt) == 0);
    REQUIRE(restored.getTabs().empty());
  }
}

TEST_CASE_METHOD(WorkspaceFixture, "Shutdown closes every session",
                 "[Workspace]") {
  string tabId = workspace->openTab();
  string paneId = *workspace->getActivePane(tabId);
  REQUIRE(waitForPhase(paneId, SessionPhase::RUNNING));
  backend->setHoldSpawns(true);
  string pendingTab = workspace->openTab();
  string pendingPane = *workspace->getActivePane(pendingTab);
  REQUIRE(backend->waitForHeldSpawns(1));

  std::thread releaser([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    backend->setHoldSpawns(false);
  });
  workspace->shutdown();
  releaser.join();

  REQUIRE(workspace->getTabs().empty());
  REQUIRE(backend->wasTerminated(paneId));
  REQUIRE(backend->wasTerminated(pendingPane));
  // Further operations are harmless
  workspace->shutdown();
}
