#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PtySessionBackend.hpp"
#include "TabTermConfig.hpp"
#include "TabTermConsole.hpp"
#include "Workspace.hpp"

using namespace tt;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tt::InterruptSignalHandler);

  cxxopts::Options options("tabterm",
                           "Tabbed, split-pane terminal sessions");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell profile for the first tab",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tabterm version " << TT_VERSION << endl;
      exit(0);
    }

    TabTermConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      if (!config.loadFile(cfgfilename)) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    } else if (fs::exists(TabTermConfig::getDefaultPath())) {
      if (!config.loadFile(TabTermConfig::getDefaultPath())) {
        LOG(WARNING) << "Ignoring unreadable config file "
                     << TabTermConfig::getDefaultPath();
      }
    }

    // Command line verbosity wins over the config file
    optional<int> verbose;
    if (result.count("verbose")) {
      verbose = result["verbose"].as<int>();
    }
    LogHandler::applyConfig(&defaultConf, config, verbose);

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory(), "tabterm",
                              result.count("logtostdout") > 0, true,
                              config.getMaxLogSize());
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("tabterm-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<ConsoleWriter> writer(new ConsoleWriter(cout));
    shared_ptr<PtySessionBackend> backend(new PtySessionBackend(config));
    shared_ptr<Workspace> workspace(new Workspace(
        backend, shared_ptr<WorkspaceHost>(new ConsoleHost(writer)), config));

    string shell = result["shell"].as<string>();
    string tabId =
        workspace->openTab(shell.empty() ? nullopt : optional<string>(shell));
    writer->writeLine("tab " + tabId + " pane " +
                      workspace->getActivePane(tabId).value_or(""));

    TabTermConsole console(workspace, writer);
    console.run(STDIN_FILENO);

    LOG(INFO) << "Shutting down";
    workspace->shutdown();
    backend->shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
