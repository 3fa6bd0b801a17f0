#ifndef __PT_FAKE_PTY_BACKEND_HPP__
#define __PT_FAKE_PTY_BACKEND_HPP__

#include "PtyBackend.hpp"
#include "PtyErrors.hpp"
#include "TestHeaders.hpp"

namespace pt {
/**
 * @brief In-memory pty child.  Tests push output and exits into it and
 * inspect what the manager wrote.
 */
class FakePtyProcess : public PtyProcess {
 public:
  FakePtyProcess(pid_t _pid, const string& _program)
      : pid(_pid), program(_program), running(true), killCount(0) {}

  virtual ~FakePtyProcess() {}

  virtual void onData(DataHandler handler) { dataHandler = handler; }
  virtual void onExit(ExitHandler handler) { exitHandler = handler; }

  virtual void write(const string& data) {
    if (!running) {
      throw std::runtime_error("Cannot write: fake child has exited");
    }
    written += data;
  }

  virtual bool hasPendingInput() { return false; }

  virtual void resize(int cols, int rows) {
    if (!running) {
      throw std::runtime_error("Cannot resize: fake child has exited");
    }
    sizes.push_back(make_pair(cols, rows));
  }

  virtual void kill() {
    killCount++;
    if (!running) {
      throw std::runtime_error("Cannot kill: fake child has exited");
    }
    running = false;
    // Keep the handlers around so tests can fire late events at them.
    staleDataHandler = dataHandler;
    staleExitHandler = exitHandler;
    dataHandler = nullptr;
    exitHandler = nullptr;
  }

  virtual bool poll(int timeoutMs) {
    if (queued.empty()) {
      return false;
    }
    auto event = queued.front();
    queued.pop_front();
    event();
    return true;
  }

  virtual int getFd() { return -1; }
  virtual pid_t getPid() { return pid; }
  virtual string getProgram() { return program; }
  virtual bool isRunning() { return running; }

  /** @brief Delivers output right away, as if it was just read. */
  void emitData(const string& data) {
    auto handler = dataHandler;
    if (handler) {
      handler(data);
    }
  }

  /** @brief Marks the child as exited and delivers the exit event. */
  void emitExit(int exitCode, optional<int> signal = nullopt) {
    running = false;
    ExitStatus status;
    status.exitCode = exitCode;
    status.signal = signal;
    auto handler = exitHandler;
    dataHandler = nullptr;
    exitHandler = nullptr;
    if (handler) {
      handler(status);
    }
  }

  /** @brief Queues output for the next poll(). */
  void queueData(const string& data) {
    queued.push_back([this, data]() { emitData(data); });
  }

  /** @brief Queues an exit for a later poll(). */
  void queueExit(int exitCode) {
    queued.push_back([this, exitCode]() { emitExit(exitCode); });
  }

  /** @brief Fires events at the handlers that were live before kill(). */
  void emitLateEvents(const string& data, int exitCode) {
    if (staleDataHandler) {
      staleDataHandler(data);
    }
    if (staleExitHandler) {
      ExitStatus status;
      status.exitCode = exitCode;
      staleExitHandler(status);
    }
  }

  pid_t pid;
  string program;
  bool running;
  int killCount;
  string written;
  vector<pair<int, int>> sizes;
  deque<function<void()>> queued;
  DataHandler dataHandler;
  ExitHandler exitHandler;
  DataHandler staleDataHandler;
  ExitHandler staleExitHandler;
};

/**
 * @brief Records every spawn request and hands out FakePtyProcess children.
 */
class FakePtyBackend : public PtyBackend {
 public:
  struct SpawnRecord {
    string program;
    vector<string> args;
    PtySpawnOptions options;
  };

  FakePtyBackend() : nextPid(1000) {}
  virtual ~FakePtyBackend() {}

  virtual shared_ptr<PtyProcess> spawn(const string& program,
                                       const vector<string>& args,
                                       const PtySpawnOptions& options) {
    SpawnRecord record;
    record.program = program;
    record.args = args;
    record.options = options;
    spawns.push_back(record);
    if (!failure.empty()) {
      throw SpawnFailure(failure);
    }
    auto process = std::make_shared<FakePtyProcess>(nextPid++, program);
    processes.push_back(process);
    return process;
  }

  shared_ptr<FakePtyProcess> last() {
    REQUIRE(!processes.empty());
    return processes.back();
  }

  /** @brief When set, every spawn throws SpawnFailure with this message. */
  string failure;
  vector<SpawnRecord> spawns;
  vector<shared_ptr<FakePtyProcess>> processes;

 protected:
  pid_t nextPid;
};
}  // namespace pt

#endif  // __PT_FAKE_PTY_BACKEND_HPP__
