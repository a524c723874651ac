#ifndef __TT_TAB_TERM_CONSOLE__
#define __TT_TAB_TERM_CONSOLE__

#include "Headers.hpp"
#include "TerminalDisplay.hpp"
#include "Workspace.hpp"

namespace tt {
/** @brief Stream shared by pane output and command replies. */
class ConsoleWriter {
 public:
  explicit ConsoleWriter(ostream& _out) : out(_out) {}

  void writeLine(const string& line);
  /** @brief Raw pane output tagged with the start of the pane id. */
  void writePaneOutput(const string& paneId, const string& data);

 protected:
  mutex writerMutex;
  ostream& out;
};

/** @brief Display that prints a pane's output to the console. */
class ConsoleDisplay : public TerminalDisplay {
 public:
  ConsoleDisplay(shared_ptr<ConsoleWriter> _writer, const string& _paneId)
      : writer(_writer), paneId(_paneId) {}

  virtual void write(const string& data) {
    writer->writePaneOutput(paneId, data);
  }

 protected:
  shared_ptr<ConsoleWriter> writer;
  string paneId;
};

class ConsoleHost : public WorkspaceHost {
 public:
  explicit ConsoleHost(shared_ptr<ConsoleWriter> _writer) : writer(_writer) {}

  virtual shared_ptr<TerminalDisplay> createDisplay(const string& tabId,
                                                    const string& paneId) {
    return shared_ptr<TerminalDisplay>(new ConsoleDisplay(writer, paneId));
  }

 protected:
  shared_ptr<ConsoleWriter> writer;
};

/**
 * @brief Line oriented front end for a workspace.
 *
 * Tabs and panes may be named by any unique prefix of their id.
 */
class TabTermConsole {
 public:
  TabTermConsole(shared_ptr<Workspace> _workspace,
                 shared_ptr<ConsoleWriter> _writer);

  /** @brief Reads commands from `fd` until `quit`, EOF or no tab is left. */
  void run(int fd);

  /**
   * @brief Runs one command line.
   * @return false when the console should exit.
   */
  bool handleCommand(const string& line);

  /** @brief Default location of the saved session document. */
  static string getDefaultSessionPath();

 protected:
  optional<string> resolveTab(const string& prefix);
  optional<string> resolvePane(const string& prefix);
  void printTabs();
  void usage(const string& command);

  shared_ptr<Workspace> workspace;
  shared_ptr<ConsoleWriter> writer;
  bool running;
};
}  // namespace tt

#endif  // __TT_TAB_TERM_CONSOLE__
