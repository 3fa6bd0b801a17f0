#include "PanelConfig.hpp"

#include "SimpleIni.h"

namespace pt {
string PanelConfig::getLaunchLine() const {
  if (launchFlags.empty()) {
    return launchCommand;
  }
  return launchCommand + " " + launchFlags;
}

PanelConfig PanelConfig::load(const string& path) {
  PanelConfig config;
  if (!fs::exists(path)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return config;
  }

  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  config.shellPath = ini.GetValue("Shell", "path", "");
  config.cwd = ini.GetValue("Shell", "cwd", "");

  config.autoLaunch = ini.GetBoolValue("Launch", "autolaunch", false);
  config.launchCommand = ini.GetValue("Launch", "command", "claude");
  config.launchFlags = ini.GetValue("Launch", "flags", "");
  config.launchDelayMs =
      int(ini.GetLongValue("Launch", "delay_ms", config.launchDelayMs));
  config.launchDirect = ini.GetBoolValue("Launch", "direct", false);

  config.verbose = int(ini.GetLongValue("Debug", "verbose", 0));
  config.silent = ini.GetBoolValue("Debug", "silent", false);
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxLogSize is a string of int value
    config.maxLogSize = to_string(atoi(logsize));
  }
  config.logDirectory = ini.GetValue("Debug", "logdir", "");

  if (config.launchDelayMs < 0) {
    LOG(WARNING) << "Negative delay_ms in " << path << ", using 0";
    config.launchDelayMs = 0;
  }
  LOG(INFO) << "Loaded config from " << path;
  return config;
}

void PanelConfig::save(const string& path) const {
  CSimpleIniA ini(true, false, false);
  ini.SetValue("Shell", "path", shellPath.c_str());
  ini.SetValue("Shell", "cwd", cwd.c_str());
  ini.SetBoolValue("Launch", "autolaunch", autoLaunch);
  ini.SetValue("Launch", "command", launchCommand.c_str());
  ini.SetValue("Launch", "flags", launchFlags.c_str());
  ini.SetLongValue("Launch", "delay_ms", launchDelayMs);
  ini.SetBoolValue("Launch", "direct", launchDirect);
  ini.SetLongValue("Debug", "verbose", verbose);
  ini.SetBoolValue("Debug", "silent", silent);
  ini.SetValue("Debug", "logsize", maxLogSize.c_str());
  ini.SetValue("Debug", "logdir", logDirectory.c_str());

  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }
  if (ini.SaveFile(path.c_str()) < 0) {
    throw std::runtime_error("Cannot write config file: " + path);
  }
}

string PanelConfig::getDefaultPath() {
  return sago::getConfigHome() + "/panelterm/panelterm.ini";
}
}  // namespace pt
