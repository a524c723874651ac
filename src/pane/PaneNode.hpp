#ifndef __TT_PANE_NODE__
#define __TT_PANE_NODE__

#include "Headers.hpp"

namespace tt {
/** @brief Sum of the `sizes` of every split node. */
const float SPLIT_SIZE_TOTAL = 100.0f;

enum class SplitOrientation { HORIZONTAL, VERTICAL };

string orientationToString(SplitOrientation orientation);
/** @brief Parses `horizontal`/`vertical` (or `h`/`v`). */
optional<SplitOrientation> orientationFromString(const string& s);

struct PaneNode;
/**
 * @brief Trees are immutable once built. Every edit produces new nodes along
 * the path to the root and shares the untouched subtrees.
 */
typedef shared_ptr<const PaneNode> PaneNodePtr;

/**
 * @brief One node of a tab's layout: a terminal leaf or a split.
 */
struct PaneNode {
  enum class Type { TERMINAL, SPLIT };

  /** @brief Unique within the tree, stable for the node's lifetime. */
  string id;
  Type type;

  /** @brief Shell selector (terminal nodes). */
  string shell;
  /** @brief Optional environment selector passed to the shell profile. */
  optional<string> distro;
  /** @brief Last known working directory. */
  optional<string> cwd;
  /** @brief Bind to an already running session instead of spawning. */
  bool reattach;

  SplitOrientation orientation;
  /** @brief At least two children for a split node. */
  vector<PaneNodePtr> children;
  /** @brief One proportion per child, summing to `SPLIT_SIZE_TOTAL`. */
  vector<float> sizes;

  inline bool isTerminal() const { return type == Type::TERMINAL; }
  inline bool isSplit() const { return type == Type::SPLIT; }

  static PaneNodePtr makeTerminal(const string& id, const string& shell,
                                  const optional<string>& distro,
                                  const optional<string>& cwd,
                                  bool reattach = false);
  static PaneNodePtr makeSplit(const string& id, SplitOrientation orientation,
                               const vector<PaneNodePtr>& children,
                               const vector<float>& sizes);

  /** @brief Copy of a terminal node with a different cwd. */
  PaneNodePtr withCwd(const string& newCwd) const;
  /** @brief Copy of a split node with different children and sizes. */
  PaneNodePtr withChildren(const vector<PaneNodePtr>& newChildren,
                           const vector<float>& newSizes) const;

  /** @brief Declarative form of the subtree (no runtime state). */
  json toJson() const;
  /** @brief Rebuilds a subtree, throwing `std::runtime_error` when the
   * document breaks the split invariants. */
  static PaneNodePtr fromJson(const json& j);

 protected:
  PaneNode();
};
}  // namespace tt

#endif  // __TT_PANE_NODE__
