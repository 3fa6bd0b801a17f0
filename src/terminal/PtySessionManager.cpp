#include "PtySessionManager.hpp"

#include "CommandTokenizer.hpp"
#include "ForkPtyBackend.hpp"

namespace pt {
const char* sessionStateName(SessionState state) {
  switch (state) {
    case SessionState::IDLE:
      return "idle";
    case SessionState::SPAWNING:
      return "spawning";
    case SessionState::RUNNING:
      return "running";
    case SessionState::EXITED:
      return "exited";
  }
  return "unknown";
}

PtySessionManager::PtySessionManager(shared_ptr<PathResolver> _pathResolver,
                                     BackendLoader _backendLoader)
    : pathResolver(_pathResolver),
      backendLoader(_backendLoader),
      state(SessionState::IDLE),
      generation(0) {
  if (!backendLoader) {
    backendLoader = []() { return loadPtyBackend(); };
  }
}

PtySessionManager::~PtySessionManager() { kill(); }

void PtySessionManager::spawn(const SpawnOptions& options) {
  if (state != SessionState::IDLE) {
    LOG(INFO) << "[" << sessionId << "] Replacing "
              << sessionStateName(state) << " session";
    kill();
  }

  state = SessionState::SPAWNING;
  generation++;
  sessionId = sole::uuid4().str();
  lastExitStatus.reset();
  sanitizer = EscapeSanitizer();

  try {
    if (options.cwd.empty()) {
      throw SpawnFailure("A working directory is required");
    }
    if (options.cols <= 0 || options.rows <= 0) {
      throw SpawnFailure("Invalid terminal size " + to_string(options.cols) +
                         "x" + to_string(options.rows));
    }

    string program;
    vector<string> args;
    string shell = (options.shellPath && !options.shellPath->empty())
                       ? *options.shellPath
                       : PathResolver::detectShell();
    bool direct = options.command && !options.command->empty();
    if (direct) {
      ParsedCommand parsed = parseCommand(*options.command);
      program = parsed.program;
      args = parsed.args;
    } else {
      program = shell;
    }

    if (!backend) {
      backend = backendLoader();
    }

    string pathValue = (options.resolvedPath && !options.resolvedPath->empty())
                           ? *options.resolvedPath
                           : pathResolver->resolve(shell);

    PtySpawnOptions ptyOptions;
    ptyOptions.name = PT_TERM_NAME;
    ptyOptions.cols = options.cols;
    ptyOptions.rows = options.rows;
    ptyOptions.cwd = options.cwd;
    ptyOptions.env = buildEnvironment(pathValue);

    LOG(INFO) << "[" << sessionId << "] Spawning " << program << " with "
              << args.size() << " args in " << options.cwd << " ("
              << options.cols << "x" << options.rows << ")"
              << (direct ? " without a shell" : "");
    auto process = backend->spawn(program, args, ptyOptions);

    uint64_t spawnGeneration = generation;
    process->onData([this, spawnGeneration](const string& raw) {
      handleData(spawnGeneration, raw);
    });
    process->onExit([this, spawnGeneration](const ExitStatus& status) {
      handleExit(spawnGeneration, status);
    });
    session = process;
    state = SessionState::RUNNING;
  } catch (const PtyError& pe) {
    LOG(ERROR) << "[" << sessionId << "] Spawn failed: " << pe.what();
    session.reset();
    state = SessionState::IDLE;
    throw;
  }
}

void PtySessionManager::write(const string& data) {
  if (!session || state != SessionState::RUNNING) {
    return;
  }
  try {
    session->write(data);
    VLOG(4) << "[" << sessionId << "] Wrote " << data.length() << " bytes";
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "[" << sessionId << "] Write failed: " << re.what();
  }
}

void PtySessionManager::resize(int cols, int rows) {
  if (!session) {
    return;
  }
  try {
    session->resize(cols, rows);
    VLOG(1) << "[" << sessionId << "] Resized to " << cols << "x" << rows;
  } catch (const std::runtime_error& re) {
    // Resizing races with the child exiting.
    VLOG(1) << "[" << sessionId << "] Ignoring resize failure: " << re.what();
  }
}

void PtySessionManager::onData(DataCallback callback) {
  dataCallbacks.push_back(callback);
}

void PtySessionManager::onExit(ExitCallback callback) {
  exitCallbacks.push_back(callback);
}

void PtySessionManager::kill() {
  auto process = session;
  session.reset();
  generation++;
  dataCallbacks.clear();
  exitCallbacks.clear();
  sanitizer = EscapeSanitizer();
  state = SessionState::IDLE;
  if (process) {
    LOG(INFO) << "[" << sessionId << "] Killing pid " << process->getPid();
    try {
      process->kill();
    } catch (const std::runtime_error& re) {
      VLOG(1) << "[" << sessionId << "] Ignoring kill failure: " << re.what();
    }
  }
}

void PtySessionManager::sendCommand(const string& text) { write(text + "\r"); }

void PtySessionManager::sendText(const string& text) { write(text); }

bool PtySessionManager::poll(int timeoutMs) {
  // Keep the process alive while it dispatches, callbacks may kill it.
  auto process = session;
  if (!process) {
    return false;
  }
  uint64_t pollGeneration = generation;
  bool delivered = process->poll(timeoutMs);
  if (!delivered && pollGeneration == generation && sanitizer.hasPending()) {
    // The child went quiet with a partial sequence buffered.
    flushPending(pollGeneration);
    return true;
  }
  return delivered;
}

int PtySessionManager::getFd() { return session ? session->getFd() : -1; }

bool PtySessionManager::hasPendingInput() {
  return session && session->hasPendingInput();
}

string PtySessionManager::getProgram() {
  return session ? session->getProgram() : string();
}

map<string, string> PtySessionManager::buildEnvironment(
    const string& pathValue) {
  map<string, string> env;
  for (char** it = environ; it && *it; it++) {
    string entry(*it);
    auto equals = entry.find('=');
    if (equals == string::npos || equals == 0) {
      continue;
    }
    env[entry.substr(0, equals)] = entry.substr(equals + 1);
  }
  env["TERM"] = PT_TERM_NAME;
  env["COLORTERM"] = PT_COLORTERM;
  env["PATH"] = pathValue;
  env["TERM_PROGRAM"] = PT_TERM_PROGRAM;
  return env;
}

void PtySessionManager::handleData(uint64_t eventGeneration,
                                   const string& raw) {
  if (eventGeneration != generation) {
    VLOG(4) << "Dropping " << raw.length() << " bytes from a dead session";
    return;
  }
  string cleaned = sanitizer.filter(raw);
  if (cleaned.empty()) {
    return;
  }
  deliverData(eventGeneration, cleaned);
}

void PtySessionManager::handleExit(uint64_t eventGeneration,
                                   const ExitStatus& status) {
  if (eventGeneration != generation) {
    return;
  }
  flushPending(eventGeneration);
  if (eventGeneration != generation) {
    return;
  }
  LOG(INFO) << "[" << sessionId << "] Session exited with code "
            << status.exitCode;
  lastExitStatus = status;
  state = SessionState::EXITED;
  session.reset();

  auto callbacks = exitCallbacks;
  for (auto& callback : callbacks) {
    if (eventGeneration != generation) {
      // A callback killed or replaced the session.
      return;
    }
    callback(status);
  }
}

void PtySessionManager::deliverData(uint64_t eventGeneration,
                                    const string& cleaned) {
  auto callbacks = dataCallbacks;
  for (auto& callback : callbacks) {
    if (eventGeneration != generation) {
      return;
    }
    callback(cleaned);
  }
}

void PtySessionManager::flushPending(uint64_t eventGeneration) {
  string remaining = sanitizer.flush();
  if (!remaining.empty()) {
    deliverData(eventGeneration, remaining);
  }
}
}  // namespace pt
