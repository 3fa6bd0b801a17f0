#include "PanelHost.hpp"

#include "RawFdUtils.hpp"

namespace pt {
PanelHost::PanelHost(shared_ptr<Console> _console,
                     shared_ptr<PtySessionManager> _manager,
                     const PanelConfig& _config)
    : console(_console),
      manager(_manager),
      config(_config),
      opened(false),
      spawnFailed(false),
      shuttingDown(false) {}

PanelHost::~PanelHost() { close(); }

void PanelHost::open() {
  console->setup();
  opened = true;
  spawnSession();
}

bool PanelHost::spawnSession() {
  lastSize = console->getTerminalSize();
  exitStatus.reset();
  autoLaunchAt.reset();
  spawnFailed = false;

  SpawnOptions options;
  if (!config.shellPath.empty()) {
    options.shellPath = config.shellPath;
  }
  options.cwd =
      config.cwd.empty() ? fs::current_path().string() : config.cwd;
  options.cols = lastSize.cols;
  options.rows = lastSize.rows;
  if (config.autoLaunch && config.launchDirect) {
    options.command = config.getLaunchLine();
  }

  try {
    manager->spawn(options);
  } catch (const BindingLoadFailure& blf) {
    reportSpawnFailure(
        blf, "Make sure pseudo-terminals are available to this user.");
    return false;
  } catch (const SpawnFailure& sf) {
    reportSpawnFailure(
        sf, "Check the shell path, working directory and launch command.");
    return false;
  }

  manager->onData([this](const string& data) { console->write(data); });
  manager->onExit([this](const ExitStatus& status) { exitStatus = status; });

  if (config.autoLaunch && !config.launchDirect) {
    // Give the shell time to read its rc files before typing.
    autoLaunchAt = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(config.launchDelayMs);
  }
  return true;
}

void PanelHost::reportSpawnFailure(const PtyError& error, const string& hint) {
  spawnFailed = true;
  console->write(string("\r\n\x1b[31mFailed to spawn terminal: ") +
                 error.what() + "\x1b[0m\r\n");
  console->write("\x1b[33m" + hint + "\x1b[0m\r\n");
}

bool PanelHost::tick(int timeoutMs) {
  if (shuttingDown) {
    return false;
  }

  int consoleFd = console->getFd();
  int ptyFd = manager->getFd();
  vector<int> writeFds;
  if (manager->hasPendingInput()) {
    writeFds.push_back(ptyFd);
  }
  auto readable =
      RawFdUtils::waitForReady({consoleFd, ptyFd}, writeFds, timeoutMs);
  if (consoleFd >= 0 &&
      std::find(readable.begin(), readable.end(), consoleFd) !=
          readable.end()) {
    string keys = console->read();
    if (!keys.empty()) {
      VLOG(4) << "Got " << keys.length() << " bytes from the console";
      manager->write(keys);
    }
  }

  manager->poll(0);

  TerminalSize size = console->getTerminalSize();
  if (size != lastSize) {
    LOG(INFO) << "Window size changed: " << size.cols << "x" << size.rows;
    lastSize = size;
    manager->resize(size.cols, size.rows);
  }

  if (autoLaunchAt && std::chrono::steady_clock::now() >= *autoLaunchAt) {
    autoLaunchAt.reset();
    LOG(INFO) << "Auto-launching: " << config.getLaunchLine();
    manager->sendCommand(config.getLaunchLine());
  }

  return !spawnFailed && !exitStatus && !shuttingDown;
}

int PanelHost::run() {
  if (!opened) {
    open();
  }
  while (true) {
    try {
      if (!tick(10)) {
        break;
      }
    } catch (const std::runtime_error& re) {
      STERROR << "Error: " << re.what();
      break;
    }
  }
  close();

  if (spawnFailed) {
    return 1;
  }
  if (exitStatus) {
    if (exitStatus->signal) {
      return 128 + *exitStatus->signal;
    }
    return exitStatus->exitCode;
  }
  return 0;
}

void PanelHost::restart() {
  LOG(INFO) << "Restarting session";
  manager->kill();
  // RIS: clear the screen and reset the terminal state
  console->write("\x1b" "c");
  spawnSession();
}

void PanelHost::sendToTerminal(const string& text) {
  manager->sendCommand(text);
}

void PanelHost::close() {
  manager->kill();
  if (opened) {
    console->teardown();
    opened = false;
  }
}
}  // namespace pt
