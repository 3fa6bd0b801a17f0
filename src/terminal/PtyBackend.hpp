#ifndef __PT_PTY_BACKEND_HPP__
#define __PT_PTY_BACKEND_HPP__

#include "Headers.hpp"

namespace pt {
/**
 * @brief How a pty child ended.
 */
struct ExitStatus {
  int exitCode = 0;
  /** @brief Set when the child was terminated by a signal. */
  optional<int> signal;
};

/**
 * @brief Parameters handed to the backend for one child process.
 */
struct PtySpawnOptions {
  /** @brief Terminal type name (TERM). */
  string name;
  int cols = 80;
  int rows = 24;
  string cwd;
  /** @brief Complete environment of the child. */
  map<string, string> env;
};

/**
 * @brief A child process attached to a pseudo-terminal.
 *
 * Events are only delivered from `poll()`, on the calling thread.
 */
class PtyProcess {
 public:
  typedef function<void(const string&)> DataHandler;
  typedef function<void(const ExitStatus&)> ExitHandler;

  virtual ~PtyProcess() {}

  /** @brief Sets the receiver of raw output chunks. */
  virtual void onData(DataHandler handler) = 0;
  /** @brief Sets the receiver of the single exit event. */
  virtual void onExit(ExitHandler handler) = 0;
  /**
   * @brief Queues bytes for the child's terminal input without blocking.
   *
   * Whatever the pty does not accept right away is written from later
   * `poll()` calls, in order.
   */
  virtual void write(const string& data) = 0;
  /** @brief True while written bytes are still waiting for the child. */
  virtual bool hasPendingInput() = 0;
  /** @brief Updates the window size; throws if the child is gone. */
  virtual void resize(int cols, int rows) = 0;
  /**
   * @brief Terminates the child and drops both handlers; throws if the child
   * is already gone.
   */
  virtual void kill() = 0;
  /**
   * @brief Waits up to `timeoutMs` for output or exit and dispatches it.
   * @return True if a handler was invoked.
   */
  virtual bool poll(int timeoutMs) = 0;
  /**
   * @brief Descriptor that becomes readable when `poll` has work, or
   * writable when pending input can move, or -1.
   */
  virtual int getFd() = 0;
  virtual pid_t getPid() = 0;
  /** @brief Program that was executed, as passed to spawn. */
  virtual string getProgram() = 0;
  virtual bool isRunning() = 0;
};

/**
 * @brief Capability that creates pty children.
 */
class PtyBackend {
 public:
  virtual ~PtyBackend() {}

  /**
   * @brief Starts `program` with `args` on a new pseudo-terminal.
   * @throws SpawnFailure if the OS rejects the process.
   */
  virtual shared_ptr<PtyProcess> spawn(const string& program,
                                       const vector<string>& args,
                                       const PtySpawnOptions& options) = 0;
};
}  // namespace pt

#endif  // __PT_PTY_BACKEND_HPP__
