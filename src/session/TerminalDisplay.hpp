#ifndef __TT_TERMINAL_DISPLAY__
#define __TT_TERMINAL_DISPLAY__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Surface that renders one pane (a terminal widget in a GUI, a prefixed
 * stream in the console host).
 *
 * Writes for a given pane are serialized by its coordinator. Implementations
 * must not call back into the coordinator or the workspace.
 */
class TerminalDisplay {
 public:
  virtual ~TerminalDisplay() {}

  /** @brief Shows raw terminal output, escape sequences included. */
  virtual void write(const string& data) = 0;
};

/**
 * @brief Rendering layer contract: produces the display for each pane the
 * workspace mounts.
 */
class WorkspaceHost {
 public:
  virtual ~WorkspaceHost() {}

  virtual shared_ptr<TerminalDisplay> createDisplay(const string& tabId,
                                                    const string& paneId) = 0;
};
}  // namespace tt

#endif  // __TT_TERMINAL_DISPLAY__
