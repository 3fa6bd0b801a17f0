#ifndef __PT_FORK_PTY_BACKEND_HPP__
#define __PT_FORK_PTY_BACKEND_HPP__

#include "PtyBackend.hpp"
#include "PtyErrors.hpp"

namespace pt {
/**
 * @brief Child process forked onto a pty with `forkpty`.
 */
class ForkPtyProcess : public PtyProcess {
 public:
  ForkPtyProcess(pid_t _pid, int _masterFd, const string& _program);
  virtual ~ForkPtyProcess();

  virtual void onData(DataHandler handler) { dataHandler = handler; }
  virtual void onExit(ExitHandler handler) { exitHandler = handler; }
  virtual void write(const string& data);
  virtual bool hasPendingInput() { return !pendingInput.empty(); }
  virtual void resize(int cols, int rows);
  virtual void kill();
  virtual bool poll(int timeoutMs);
  virtual int getFd() { return masterFd; }
  virtual pid_t getPid() { return pid; }
  virtual string getProgram() { return program; }
  virtual bool isRunning() { return running; }

 protected:
  /** @brief PID of the child spawned by `forkpty`. */
  pid_t pid;
  /** @brief Master side of the pty, -1 once closed. */
  int masterFd;
  string program;
  bool running;
  /** @brief Set once the master reported EOF/EIO. */
  bool outputClosed;
  /** @brief Set once waitpid has collected the child. */
  bool reaped;
  DataHandler dataHandler;
  ExitHandler exitHandler;
  /** @brief Input the pty has not accepted yet. */
  string pendingInput;

  /** @brief Writes as much pending input as the pty takes. */
  void flushPendingInput();
  /** @brief Reads one chunk; returns true if data was dispatched. */
  bool readChunk();
  /** @brief Reaps the child without blocking and fires the exit event. */
  bool tryReap();
  void closeMaster();
};

/**
 * @brief Spawns children with `forkpty` and `execv`.
 *
 * The program is looked up on the PATH of the child's environment before
 * forking so that a missing executable is reported synchronously; an exec
 * failure inside the child is reported back over a close-on-exec pipe.
 */
class ForkPtyBackend : public PtyBackend {
 public:
  virtual ~ForkPtyBackend() {}

  virtual shared_ptr<PtyProcess> spawn(const string& program,
                                       const vector<string>& args,
                                       const PtySpawnOptions& options);

  /**
   * @brief Finds `program` on `pathValue` the way execvp would.
   * @return The executable path, or an empty string.
   */
  static string findExecutable(const string& program, const string& pathValue);
};

/**
 * @brief Probes the pty device and returns the native backend.
 * @throws BindingLoadFailure naming the device and remediation.
 */
shared_ptr<PtyBackend> loadPtyBackend(const string& ptmxPath = "/dev/ptmx");
}  // namespace pt

#endif  // __PT_FORK_PTY_BACKEND_HPP__
