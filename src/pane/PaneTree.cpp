#include "PaneTree.hpp"

namespace tt {
namespace {
string describeError(PaneTreeError error, const string& paneId) {
  switch (error) {
    case PaneTreeError::NODE_NOT_FOUND:
      return "Pane not found in tree: " + paneId;
    case PaneTreeError::NOT_A_TERMINAL:
      return "Pane is a split, not a terminal: " + paneId;
  }
  return "Unknown pane tree error: " + paneId;
}

PaneNodePtr findTerminalOrThrow(const PaneNodePtr& root, const string& id) {
  PaneNodePtr node = PaneTree::findNode(root, id);
  if (!node) {
    throw PaneTreeException(PaneTreeError::NODE_NOT_FOUND, id);
  }
  if (!node->isTerminal()) {
    throw PaneTreeException(PaneTreeError::NOT_A_TERMINAL, id);
  }
  return node;
}

void collectLeafIdsInto(const PaneNodePtr& node, vector<string>* ids) {
  if (node->isTerminal()) {
    ids->push_back(node->id);
    return;
  }
  for (const auto& child : node->children) {
    collectLeafIdsInto(child, ids);
  }
}
}  // namespace

PaneTreeException::PaneTreeException(PaneTreeError _error,
                                     const string& _paneId)
    : std::runtime_error(describeError(_error, _paneId)),
      error(_error),
      paneId(_paneId) {}

TabPaneState PaneTree::initialize(const string& tabId, const string& shell,
                                  const optional<string>& distro,
                                  const optional<string>& cwd) {
  TabPaneState state;
  state.tabId = tabId;
  state.root = PaneNode::makeTerminal(newUuid(), shell, distro, cwd);
  state.activePaneId = state.root->id;
  return state;
}

TabPaneState PaneTree::restore(const string& tabId, const string& existingId,
                               const string& shell,
                               const optional<string>& distro,
                               const optional<string>& cwd) {
  TabPaneState state;
  state.tabId = tabId;
  state.root = PaneNode::makeTerminal(existingId, shell, distro, cwd, true);
  state.activePaneId = existingId;
  return state;
}

TabPaneState PaneTree::split(const TabPaneState& state,
                             const string& targetPaneId,
                             SplitOrientation orientation, const string& shell,
                             const optional<string>& distro) {
  PaneNodePtr target = findTerminalOrThrow(state.root, targetPaneId);

  PaneNodePtr newPane = PaneNode::makeTerminal(newUuid(), shell, distro,
                                               nullopt);
  PaneNodePtr newSplit = PaneNode::makeSplit(
      newUuid(), orientation, {target, newPane},
      {SPLIT_SIZE_TOTAL / 2, SPLIT_SIZE_TOTAL / 2});

  TabPaneState newState = state;
  newState.root = replace(state.root, targetPaneId, newSplit);
  newState.activePaneId = newPane->id;
  VLOG(1) << "Split " << targetPaneId << " " << orientationToString(orientation)
          << " into " << newSplit->id << ", new pane " << newPane->id;
  return newState;
}

PaneCloseResult PaneTree::close(const TabPaneState& state,
                                const string& targetPaneId) {
  PaneCloseResult result;
  result.state = state;
  result.closeOwnerTab = false;

  if (state.root->isTerminal() && state.root->id == targetPaneId) {
    // Nothing to collapse into, the owner closes the tab
    result.closeOwnerTab = true;
    return result;
  }

  auto parentInfo = findParent(state.root, targetPaneId);
  if (!parentInfo) {
    throw PaneTreeException(PaneTreeError::NODE_NOT_FOUND, targetPaneId);
  }
  const PaneNodePtr& parent = parentInfo->parent;

  vector<PaneNodePtr> remaining;
  for (size_t a = 0; a < parent->children.size(); a++) {
    if (a != parentInfo->index) {
      remaining.push_back(parent->children[a]);
    }
  }

  PaneNodePtr newRoot;
  if (remaining.size() == 1) {
    // The split is now redundant, its only child takes its place
    if (parent == state.root) {
      newRoot = remaining.front();
    } else {
      newRoot = replace(state.root, parent->id, remaining.front());
    }
  } else {
    vector<float> sizes(remaining.size(),
                        SPLIT_SIZE_TOTAL / float(remaining.size()));
    newRoot =
        replace(state.root, parent->id, parent->withChildren(remaining, sizes));
  }

  result.state.root = newRoot;
  PaneNodePtr active = findNode(newRoot, state.activePaneId);
  if (!active || !active->isTerminal()) {
    result.state.activePaneId = firstTerminalId(newRoot);
  }
  return result;
}

string PaneTree::setActive(const TabPaneState& state, const string& paneId) {
  return findTerminalOrThrow(state.root, paneId)->id;
}

PaneNodePtr PaneTree::updateCwd(const PaneNodePtr& root, const string& paneId,
                                const string& cwd) {
  PaneNodePtr target = findTerminalOrThrow(root, paneId);
  if (target->cwd && *(target->cwd) == cwd) {
    return root;
  }
  return replace(root, paneId, target->withCwd(cwd));
}

vector<string> PaneTree::collectLeafIds(const PaneNodePtr& root) {
  vector<string> ids;
  collectLeafIdsInto(root, &ids);
  return ids;
}

PaneNodePtr PaneTree::findNode(const PaneNodePtr& root, const string& id) {
  if (root->id == id) {
    return root;
  }
  for (const auto& child : root->children) {
    PaneNodePtr found = findNode(child, id);
    if (found) {
      return found;
    }
  }
  return PaneNodePtr();
}

optional<PaneParentInfo> PaneTree::findParent(const PaneNodePtr& root,
                                              const string& id) {
  for (size_t a = 0; a < root->children.size(); a++) {
    if (root->children[a]->id == id) {
      return PaneParentInfo{root, a};
    }
    auto found = findParent(root->children[a], id);
    if (found) {
      return found;
    }
  }
  return nullopt;
}

PaneNodePtr PaneTree::replace(const PaneNodePtr& node, const string& targetId,
                              const PaneNodePtr& newNode) {
  if (node->id == targetId) {
    return newNode;
  }
  for (size_t a = 0; a < node->children.size(); a++) {
    PaneNodePtr newChild = replace(node->children[a], targetId, newNode);
    if (newChild != node->children[a]) {
      vector<PaneNodePtr> children = node->children;
      children[a] = newChild;
      return node->withChildren(children, node->sizes);
    }
  }
  return node;
}

string PaneTree::firstTerminalId(const PaneNodePtr& root) {
  if (root->isTerminal()) {
    return root->id;
  }
  if (root->children.empty()) {
    STFATAL << "Split node without children: " << root->id;
  }
  return firstTerminalId(root->children.front());
}

}  // namespace tt
