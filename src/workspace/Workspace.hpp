#ifndef __TT_WORKSPACE__
#define __TT_WORKSPACE__

#include "Headers.hpp"
#include "PaneTree.hpp"
#include "SessionBackend.hpp"
#include "SessionCoordinator.hpp"
#include "TabTermConfig.hpp"
#include "TerminalDisplay.hpp"

namespace tt {
/** @brief Saved sessions older than this are not restored. */
const int64_t SESSION_MAX_AGE_MS = 7LL * 24 * 60 * 60 * 1000;

/** @brief Tab bar entry. */
struct TabInfo {
  string id;
  string title;
  /** @brief Shell the tab was opened with. */
  string shell;
  optional<string> distro;
  /** @brief Follows the cwd of the root or active pane. */
  optional<string> cwd;
};

/**
 * @brief A pane removed from its window with its session left running, ready
 * to be attached in another window.
 */
struct DetachedPane {
  string paneId;
  string shell;
  optional<string> distro;
  optional<string> cwd;

  json toJson() const;
  static DetachedPane fromJson(const json& j);
};

/**
 * @brief One window: its tabs, their pane trees and a session coordinator
 * for every terminal leaf.
 *
 * All structural operations are applied under a single lock, in the order
 * they are issued. Invalid pane or tab ids are logged and the operation is
 * dropped, leaving the state untouched. Coordinators are started and closed
 * after the lock is released.
 */
class Workspace : public SessionListener {
 public:
  Workspace(shared_ptr<SessionBackend> _backend,
            shared_ptr<WorkspaceHost> _host, const TabTermConfig& _config);
  virtual ~Workspace();

  /**
   * @brief Opens a tab with one fresh pane and makes it active.
   * @param shell Profile to run, the configured default when empty.
   */
  string openTab(const optional<string>& shell = nullopt,
                 const optional<string>& distro = nullopt,
                 const optional<string>& cwd = nullopt);

  /**
   * @brief Opens a tab around a pane detached from another window. The pane
   * reattaches to its running session instead of spawning.
   * @return The new tab id, or nullopt if the pane id is already in use here.
   */
  optional<string> attachPane(const DetachedPane& pane);

  /** @brief Closes a tab and terminates every session in it. */
  bool closeTab(const string& tabId);

  /**
   * @brief Splits a terminal pane. The new pane inherits the target's shell
   * and distro unless given.
   * @return The id of the new pane.
   */
  optional<string> splitPane(const string& tabId, const string& paneId,
                             SplitOrientation orientation,
                             const optional<string>& shell = nullopt,
                             const optional<string>& distro = nullopt);

  /** @brief Closes a pane, and its tab when it was the only pane. */
  bool closePane(const string& tabId, const string& paneId);

  /**
   * @brief Removes a pane without terminating its session. Detaching the only
   * pane of a tab removes the tab. Refused unless the session is running.
   */
  optional<DetachedPane> detachPane(const string& tabId, const string& paneId);

  bool setActivePane(const string& tabId, const string& paneId);
  optional<string> getActivePane(const string& tabId);

  /** @brief Records a pane's cwd, the tab's too when it is the root or active
   * pane. */
  bool updatePaneCwd(const string& tabId, const string& paneId,
                     const string& cwd);

  /** @brief Spawns again a pane whose spawn failed. */
  bool retryPane(const string& tabId, const string& paneId);

  bool writeToPane(const string& tabId, const string& paneId,
                   const string& data);
  /** @brief Size reported by the pane's display. */
  bool resizePane(const string& tabId, const string& paneId, int cols,
                  int rows);

  /** @brief Immutable snapshot of a tab's layout for rendering. */
  optional<TabPaneState> getTabState(const string& tabId);
  vector<TabInfo> getTabs();
  optional<string> getActiveTab();
  bool setActiveTab(const string& tabId);
  optional<string> findTabForPane(const string& paneId);
  optional<SessionPhase> getPanePhase(const string& paneId);
  optional<string> getPaneError(const string& paneId);

  /** @brief Closes panes whose shell has exited. Returns how many. */
  int reapExitedSessions();

  /** @brief Tabs, trees, active ids and per-pane phases. */
  json toJson();

  /** @brief Declarative description of the open tabs for reopening later. */
  json saveSession(int64_t now = nowMillis());

  /**
   * @brief Reopens tabs saved by `saveSession`, one fresh pane per tab at the
   * saved cwd. Only applies to an empty workspace and a recent snapshot.
   * @return Number of tabs opened.
   */
  int restoreSession(const json& session, int64_t now = nowMillis());

  /** @brief Closes every tab and waits for pending spawns to settle. */
  void shutdown();

  virtual void onCwdChanged(const string& tabId, const string& paneId,
                            const string& cwd);

 protected:
  struct TabEntry {
    TabInfo info;
    TabPaneState panes;
  };

  /** @brief Coordinator work collected under the lock, run after it. */
  struct SessionChanges {
    vector<shared_ptr<SessionCoordinator>> started;
    vector<pair<shared_ptr<SessionCoordinator>, CloseReason>> closing;
    vector<shared_ptr<SessionCoordinator>> discarded;
  };

  bool closePaneWithReason(const string& tabId, const string& paneId,
                           CloseReason reason);

  // The methods below need workspaceMutex
  TabEntry* findTab(const string& tabId);
  void addTab(const TabEntry& entry, SessionChanges* changes);
  void removeTab(const string& tabId, CloseReason reason,
                 SessionChanges* changes);
  bool closePaneLocked(const string& tabId, const string& paneId,
                       CloseReason reason, SessionChanges* changes);
  /** @brief Creates coordinators for new leaves, retires removed ones. */
  void syncSessions(const TabEntry& tab, CloseReason reason,
                    SessionChanges* changes);
  shared_ptr<SessionCoordinator> makeCoordinator(const string& tabId,
                                                 const PaneNodePtr& node);
  shared_ptr<SessionCoordinator> findCoordinator(const string& tabId,
                                                 const string& paneId);

  /** @brief Closes and starts coordinators. Must not hold workspaceMutex. */
  void applySessionChanges(SessionChanges* changes);

  shared_ptr<SessionBackend> backend;
  shared_ptr<WorkspaceHost> host;
  TabTermConfig config;
  recursive_mutex workspaceMutex;
  vector<string> tabOrder;
  map<string, TabEntry> tabs;
  optional<string> activeTabId;
  /** @brief Live coordinators keyed by pane id. */
  map<string, shared_ptr<SessionCoordinator>> coordinators;
  /** @brief Closed coordinators whose spawn has not come back yet. */
  vector<shared_ptr<SessionCoordinator>> retired;
  bool shuttingDown;
};
}  // namespace tt

#endif  // __TT_WORKSPACE__
