#ifndef __PT_PANEL_HOST__
#define __PT_PANEL_HOST__

#include "Console.hpp"
#include "Headers.hpp"
#include "PanelConfig.hpp"
#include "PtySessionManager.hpp"

namespace pt {
/**
 * @brief Host panel lifecycle: connects a display surface to one session
 * manager and drives the event loop.
 */
class PanelHost {
 public:
  PanelHost(shared_ptr<Console> _console,
            shared_ptr<PtySessionManager> _manager, const PanelConfig& _config);
  virtual ~PanelHost();

  /** @brief Prepares the console and spawns the first session. */
  void open();

  /**
   * @brief One iteration of the event loop.
   * @return False once the session has ended or failed to start.
   */
  bool tick(int timeoutMs);

  /**
   * @brief Runs until the session ends.
   * @return The exit code the host process should report.
   */
  int run();

  /** @brief Kills the session, clears the display and spawns again. */
  void restart();

  /** @brief Types a line into the session. */
  void sendToTerminal(const string& text);

  /** @brief Makes `run()` return after the current iteration. */
  void shutdown() { shuttingDown = true; }

  /** @brief Kills the session and restores the console. */
  void close();

  optional<ExitStatus> getExitStatus() const { return exitStatus; }
  bool hasSpawnFailed() const { return spawnFailed; }

 protected:
  shared_ptr<Console> console;
  shared_ptr<PtySessionManager> manager;
  PanelConfig config;
  TerminalSize lastSize;
  optional<std::chrono::steady_clock::time_point> autoLaunchAt;
  optional<ExitStatus> exitStatus;
  bool opened;
  bool spawnFailed;
  bool shuttingDown;

  /** @brief Returns false if the spawn failed; the error is shown. */
  bool spawnSession();
  void reportSpawnFailure(const PtyError& error, const string& hint);
};
}  // namespace pt

#endif  // __PT_PANEL_HOST__
