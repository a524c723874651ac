#ifndef __TT_PANE_TREE__
#define __TT_PANE_TREE__

#include "Headers.hpp"
#include "PaneNode.hpp"

namespace tt {
enum class PaneTreeError { NODE_NOT_FOUND, NOT_A_TERMINAL };

/**
 * @brief Raised by `PaneTree` when an operation names a pane that is missing
 * or of the wrong kind. Always a caller bug; the tree is left untouched.
 */
class PaneTreeException : public std::runtime_error {
 public:
  PaneTreeException(PaneTreeError _error, const string& _paneId);

  PaneTreeError getError() const { return error; }
  const string& getPaneId() const { return paneId; }

 protected:
  PaneTreeError error;
  string paneId;
};

/** @brief Layout of one tab plus the pane that has input focus. */
struct TabPaneState {
  string tabId;
  PaneNodePtr root;
  /** @brief Always names a terminal node reachable from `root`. */
  string activePaneId;
};

/** @brief Outcome of `PaneTree::close`. */
struct PaneCloseResult {
  /** @brief Unchanged when `closeOwnerTab` is set. */
  TabPaneState state;
  /** @brief The pane was the tab's only terminal: the tab itself should go. */
  bool closeOwnerTab;
};

/** @brief Location of a node inside its parent split. */
struct PaneParentInfo {
  PaneNodePtr parent;
  size_t index;
};

/**
 * @brief Pure operations over pane trees.
 *
 * Nothing here talks to a shell backend. Every mutation returns a new root
 * that shares all subtrees not on the path to the edited node, so a reader
 * holding the previous root keeps a consistent snapshot.
 */
class PaneTree {
 public:
  /** @brief A tab with one fresh terminal. */
  static TabPaneState initialize(const string& tabId, const string& shell,
                                 const optional<string>& distro = nullopt,
                                 const optional<string>& cwd = nullopt);

  /**
   * @brief A tab whose single terminal binds to the already running session
   * `existingId` (reattach instead of spawn).
   */
  static TabPaneState restore(const string& tabId, const string& existingId,
                              const string& shell,
                              const optional<string>& distro = nullopt,
                              const optional<string>& cwd = nullopt);

  /**
   * @brief Replaces terminal `targetPaneId` with a split holding the original
   * terminal and a new one. The new terminal becomes active.
   */
  static TabPaneState split(const TabPaneState& state,
                            const string& targetPaneId,
                            SplitOrientation orientation, const string& shell,
                            const optional<string>& distro = nullopt);

  /**
   * @brief Removes `targetPaneId`, collapsing a parent split left with a single
   * child. Survivor sizes are reset to equal shares.
   */
  static PaneCloseResult close(const TabPaneState& state,
                               const string& targetPaneId);

  /** @brief Validates that `paneId` is a terminal in the tree. */
  static string setActive(const TabPaneState& state, const string& paneId);

  /** @brief Tree with the cwd of terminal `paneId` replaced. */
  static PaneNodePtr updateCwd(const PaneNodePtr& root, const string& paneId,
                               const string& cwd);

  /** @brief Terminal ids, depth first, left to right. */
  static vector<string> collectLeafIds(const PaneNodePtr& root);

  static PaneNodePtr findNode(const PaneNodePtr& root, const string& id);
  static optional<PaneParentInfo> findParent(const PaneNodePtr& root,
                                             const string& id);

  /**
   * @brief Substitutes the subtree whose id is `targetId`. Returns `node`
   * itself when the id does not occur below it.
   */
  static PaneNodePtr replace(const PaneNodePtr& node, const string& targetId,
                             const PaneNodePtr& newNode);

  /** @brief Leftmost terminal in depth first order. */
  static string firstTerminalId(const PaneNodePtr& root);
};
}  // namespace tt

#endif  // __TT_PANE_TREE__
