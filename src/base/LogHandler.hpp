#ifndef __TT_LOG_HANDLER__
#define __TT_LOG_HANDLER__

#include "Headers.hpp"
#include "TabTermConfig.hpp"

namespace tt {
/**
 * @brief Configures easylogging++ for the tabterm executable and the tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies the `[Debug]` settings of a config file. A verbose level
   * given on the command line wins over the file.
   */
  static void applyConfig(el::Configurations *defaultConf,
                          const TabTermConfig &config,
                          optional<int> verboseOverride);

  /**
   * @brief Sends the default logger to a fresh timestamped file in `path`.
   * @return Full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              const string &maxlogsize = "20971520");

  /** @brief Keeps the log easylogging++ just rolled over as `<file>.1`. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Reconfigures the `stdout` logger so it just writes messages. */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /** @brief Ensures the directory exists and creates an empty log file. */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tt
#endif  // __TT_LOG_HANDLER__
