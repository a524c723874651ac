#include "TabTermConfig.hpp"

#include "SimpleIni.h"

namespace tt {
namespace {
const string PROFILE_SECTION_PREFIX = "Profile.";

ShellProfile makeProfile(const string& name, const string& command,
                         const vector<string>& args) {
  ShellProfile profile;
  profile.name = name;
  profile.command = command;
  profile.args = args;
  return profile;
}
}  // namespace

vector<string> ShellProfile::buildArgv(const optional<string>& distro,
                                       const optional<string>& cwd) const {
  vector<string> argv;
  argv.push_back(command);
  argv.insert(argv.end(), args.begin(), args.end());
  if (distro && !distroFlag.empty()) {
    argv.push_back(distroFlag);
    argv.push_back(*distro);
  }
  if (cwd && !cwdFlag.empty()) {
    argv.push_back(cwdFlag);
    argv.push_back(*cwd);
  }
  return argv;
}

TabTermConfig::TabTermConfig()
    : defaultShell("bash"),
      resizeDebounceMs(50),
      scrollbackBytes(100 * 1024),
      initialCols(80),
      initialRows(24),
      silent(false),
      maxLogSize("20971520") {
  profiles["bash"] = makeProfile("bash", "/bin/bash", {"-l"});
  profiles["zsh"] = makeProfile("zsh", "/bin/zsh", {"-l"});
  profiles["sh"] = makeProfile("sh", "/bin/sh", {});
}

string TabTermConfig::getDefaultPath() {
  return sago::getConfigHome() + "/tabterm/tabterm.ini";
}

bool TabTermConfig::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << path << " (" << rc << ")";
    return false;
  }
  LOG(INFO) << "Loaded config file " << path;
  apply(ini);
  return true;
}

bool TabTermConfig::loadString(const string& contents) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(contents);
  if (rc < 0) {
    return false;
  }
  apply(ini);
  return true;
}

ShellProfile TabTermConfig::getProfile(const string& name) const {
  auto it = profiles.find(name);
  if (it != profiles.end()) {
    return it->second;
  }
  VLOG(1) << "No profile named " << name << ", running it as a program";
  return makeProfile(name, name, {});
}

template <typename Ini>
void TabTermConfig::apply(const Ini& ini) {
  defaultShell = ini.GetValue("Shell", "default", defaultShell.c_str());

  typename Ini::TNamesDepend sections;
  ini.GetAllSections(sections);
  for (const auto& section : sections) {
    string sectionName(section.pItem);
    if (sectionName.find(PROFILE_SECTION_PREFIX) != 0) {
      continue;
    }
    string profileName = sectionName.substr(PROFILE_SECTION_PREFIX.length());
    if (profileName.empty()) {
      STFATAL << "Profile section without a name in config file";
    }
    const char* command = ini.GetValue(section.pItem, "command", NULL);
    if (!command) {
      STFATAL << "Profile " << profileName << " is missing a command";
    }
    ShellProfile profile;
    profile.name = profileName;
    profile.command = command;
    for (const auto& arg :
         split(ini.GetValue(section.pItem, "args", ""), ' ')) {
      if (!arg.empty()) {
        profile.args.push_back(arg);
      }
    }
    profile.distroFlag = ini.GetValue(section.pItem, "distro_flag", "");
    profile.cwdFlag = ini.GetValue(section.pItem, "cwd_flag", "");
    profiles[profileName] = profile;
  }

  resizeDebounceMs = int(ini.GetLongValue("Session", "resize_debounce_ms",
                                          resizeDebounceMs));
  long scrollback = ini.GetLongValue("Session", "scrollback_bytes",
                                     long(scrollbackBytes));
  if (scrollback < 0 || resizeDebounceMs < 0) {
    STFATAL << "Session settings must not be negative";
  }
  scrollbackBytes = size_t(scrollback);
  initialCols = int(ini.GetLongValue("Session", "initial_cols", initialCols));
  initialRows = int(ini.GetLongValue("Session", "initial_rows", initialRows));

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verboseLevel = atoi(vlevel);
  }
  const char* silentValue = ini.GetValue("Debug", "silent", NULL);
  silent = silentValue && atoi(silentValue) != 0;
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    maxLogSize = string(logsize);
  }
}

}  // namespace tt
