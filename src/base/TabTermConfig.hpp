#ifndef __TT_TAB_TERM_CONFIG__
#define __TT_TAB_TERM_CONFIG__

#include "Headers.hpp"

namespace tt {
/**
 * @brief How to launch one shell selector (`bash`, `zsh`, a custom name).
 */
struct ShellProfile {
  /** @brief Selector stored on terminal nodes. */
  string name;
  /** @brief Program passed to exec. */
  string command;
  /** @brief Arguments appended after the program name. */
  vector<string> args;
  /** @brief When non-empty, `<distroFlag> <distro>` is appended for panes
   * that carry a distro selector. */
  string distroFlag;
  /** @brief When non-empty, the initial cwd is passed as `<cwdFlag> <cwd>`
   * instead of changing directory before exec. */
  string cwdFlag;

  /** @brief Full argv (program name first) for a pane's selectors. */
  vector<string> buildArgv(const optional<string>& distro,
                           const optional<string>& cwd) const;
};

/**
 * @brief Settings read from `tabterm.ini`.
 *
 * Every value has a default so a missing file behaves like an empty one.
 */
class TabTermConfig {
 public:
  TabTermConfig();

  /** @brief `<config home>/tabterm/tabterm.ini`. */
  static string getDefaultPath();

  /** @brief Parses an ini file. Returns false if it can't be read. */
  bool loadFile(const string& path);
  /** @brief Parses ini text held in memory. */
  bool loadString(const string& contents);

  /**
   * @brief Looks up a profile by selector. Unknown selectors are treated as
   * a program path with no arguments.
   */
  ShellProfile getProfile(const string& name) const;

  const string& getDefaultShell() const { return defaultShell; }
  int getResizeDebounceMs() const { return resizeDebounceMs; }
  size_t getScrollbackBytes() const { return scrollbackBytes; }
  int getInitialCols() const { return initialCols; }
  int getInitialRows() const { return initialRows; }
  optional<int> getVerboseLevel() const { return verboseLevel; }
  bool isSilent() const { return silent; }
  const string& getMaxLogSize() const { return maxLogSize; }

 protected:
  /** @brief Shell used when a tab is opened without an explicit selector. */
  string defaultShell;
  /** @brief Profiles keyed by selector, seeded with the built-in shells. */
  map<string, ShellProfile> profiles;
  /** @brief Quiet period before a pending resize is flushed to the PTY. */
  int resizeDebounceMs;
  /** @brief Cap on replayable output kept per session. */
  size_t scrollbackBytes;
  int initialCols;
  int initialRows;
  optional<int> verboseLevel;
  bool silent;
  string maxLogSize;

  template <typename Ini>
  void apply(const Ini& ini);
};
}  // namespace tt

#endif  // __TT_TAB_TERM_CONFIG__
