#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tt {
namespace {
const char *LOG_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
const char *VERBOSE_LOG_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";

string logTimestamp() {
  time_t rawtime;
  time(&rawtime);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", localtime(&rawtime));
  return string(buffer) + "_" + to_string(getpid());
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts and the config file, not from easylogging's
  // own argument parsing
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  VERBOSE_LOG_FORMAT);
  return defaultConf;
}

void LogHandler::applyConfig(el::Configurations *defaultConf,
                             const TabTermConfig &config,
                             optional<int> verboseOverride) {
  optional<int> verbose =
      verboseOverride ? verboseOverride : config.getVerboseLevel();
  if (verbose) {
    el::Loggers::setVerboseLevel(*verbose);
  }
  if (config.isSilent()) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix,
                                 bool logToStdout, bool redirectStderrToFile,
                                 const string &maxlogsize) {
  string stamp = logTimestamp();
  string fullFname =
      createLogFile(path, filenamePrefix + "-" + stamp + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(path, filenamePrefix + "-stderr-" + stamp + ".log");
  }
  return fullFname;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, nothing may be logged
  string backup = string(filename) + ".1";
  if (::rename(filename, backup.c_str()) != 0) {
    ::remove(filename);
  }
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << fse.what() << endl;
    exit(1);
  }
  string fullFname = (fs::path(path) / filename).string();
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string fullFname = createLogFile(path, stderrFilename);
  FILE *stderrStream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Cannot redirect stderr to " << fullFname;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
}

}  // namespace tt
