#ifndef __PT_PTY_SESSION_MANAGER__
#define __PT_PTY_SESSION_MANAGER__

#include "EscapeSanitizer.hpp"
#include "Headers.hpp"
#include "PathResolver.hpp"
#include "PtyBackend.hpp"
#include "PtyErrors.hpp"

namespace pt {
/**
 * @brief Caller supplied parameters for one spawn.
 */
struct SpawnOptions {
  /** @brief Shell to launch; the detected shell when unset. */
  optional<string> shellPath;
  /** @brief Working directory; must exist. */
  string cwd;
  int cols = 80;
  int rows = 24;
  /**
   * @brief Run this command line directly instead of an interactive shell.
   * No shell is involved and no rc file is sourced.
   */
  optional<string> command;
  /** @brief PATH for the child; resolved through the PathResolver if unset. */
  optional<string> resolvedPath;
};

enum class SessionState { IDLE, SPAWNING, RUNNING, EXITED };

const char* sessionStateName(SessionState state);

/**
 * @brief Owns at most one pty child and mediates all of its I/O.
 *
 * No threads are created.  The host calls poll() from its event loop and
 * every data/exit callback runs on that thread, in registration order.
 * Callbacks may call kill(), spawn() or write() on the manager; they must
 * not register further callbacks while an event is being delivered.
 *
 * Each spawn bumps a generation counter.  Events carrying an older
 * generation are dropped, so nothing registered before a kill() can be
 * invoked after it returns.
 */
class PtySessionManager {
 public:
  typedef function<void(const string&)> DataCallback;
  typedef function<void(const ExitStatus&)> ExitCallback;
  typedef function<shared_ptr<PtyBackend>()> BackendLoader;

  /**
   * @param _backendLoader Returns the pty capability; called lazily on the
   * first spawn and may throw BindingLoadFailure.
   */
  explicit PtySessionManager(shared_ptr<PathResolver> _pathResolver,
                             BackendLoader _backendLoader = BackendLoader());
  virtual ~PtySessionManager();

  /**
   * @brief Tears down any previous session and starts a new one.
   * @throws BindingLoadFailure, SpawnFailure (CommandParseError included).
   * No session exists after a failure.
   */
  void spawn(const SpawnOptions& options);

  /** @brief Forwards raw text to the child; no-op without a live session. */
  void write(const string& data);

  /** @brief Updates the window size; failures are swallowed. */
  void resize(int cols, int rows);

  void onData(DataCallback callback);
  void onExit(ExitCallback callback);

  /**
   * @brief Terminates the child (errors swallowed), then drops the session
   * and both callback lists.  Idempotent.
   */
  void kill();

  /** @brief Writes `text` followed by a carriage return. */
  void sendCommand(const string& text);

  /** @brief Writes `text` as-is. */
  void sendText(const string& text);

  /**
   * @brief Waits up to `timeoutMs` for pty events and delivers them.
   * @return True if an event was delivered.
   */
  bool poll(int timeoutMs);

  /** @brief Descriptor of the live session to include in a select set. */
  int getFd();

  /**
   * @brief True while written input is still queued; the host should then
   * also wake up when getFd() is writable.
   */
  bool hasPendingInput();

  SessionState getState() const { return state; }
  bool isRunning() const { return state == SessionState::RUNNING; }
  /** @brief Exit record of the most recent session, once it has exited. */
  optional<ExitStatus> getLastExitStatus() const { return lastExitStatus; }
  /** @brief Random id of the current session, used to tag log lines. */
  const string& getSessionId() const { return sessionId; }
  /** @brief Program launched by the current session. */
  string getProgram();

  /**
   * @brief The current process environment with the terminal overrides
   * (TERM, COLORTERM, TERM_PROGRAM) and `pathValue` applied.
   */
  static map<string, string> buildEnvironment(const string& pathValue);

 protected:
  shared_ptr<PathResolver> pathResolver;
  BackendLoader backendLoader;
  shared_ptr<PtyBackend> backend;
  shared_ptr<PtyProcess> session;
  vector<DataCallback> dataCallbacks;
  vector<ExitCallback> exitCallbacks;
  EscapeSanitizer sanitizer;
  SessionState state;
  uint64_t generation;
  string sessionId;
  optional<ExitStatus> lastExitStatus;

  void handleData(uint64_t eventGeneration, const string& raw);
  void handleExit(uint64_t eventGeneration, const ExitStatus& status);
  void deliverData(uint64_t eventGeneration, const string& cleaned);
  void flushPending(uint64_t eventGeneration);
};
}  // namespace pt

#endif  // __PT_PTY_SESSION_MANAGER__
