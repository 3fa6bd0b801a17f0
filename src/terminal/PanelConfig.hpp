#ifndef __PT_PANEL_CONFIG__
#define __PT_PANEL_CONFIG__

#include "Headers.hpp"

namespace pt {
/**
 * @brief User settings of a terminal panel, stored as an INI file.
 *
 * [Shell]  path, cwd
 * [Launch] autolaunch, command, flags, delay_ms, direct
 * [Debug]  verbose, silent, logsize, logdir
 */
struct PanelConfig {
  /** @brief Shell override; auto-detected when empty. */
  string shellPath;
  /** @brief Session working directory; the current directory when empty. */
  string cwd;

  bool autoLaunch = false;
  string launchCommand = "claude";
  string launchFlags;
  int launchDelayMs = 500;
  /** @brief Exec the launch command directly instead of typing it. */
  bool launchDirect = false;

  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";
  string logDirectory;

  /** @brief `launchCommand` followed by `launchFlags`, if any. */
  string getLaunchLine() const;

  /**
   * @brief Reads a config file.  A missing file yields the defaults.
   * @throws std::runtime_error if the file exists but cannot be parsed.
   */
  static PanelConfig load(const string& path);

  /** @brief Writes the config, creating parent directories. */
  void save(const string& path) const;

  /** @brief `<config home>/panelterm/panelterm.ini`. */
  static string getDefaultPath();
};
}  // namespace pt

#endif  // __PT_PANEL_CONFIG__
