#include "ForkPtyBackend.hpp"

#include "RawFdUtils.hpp"

namespace pt {
namespace {
#define BUF_SIZE (16 * 1024)

// Grace period between SIGHUP and SIGKILL when a session is killed.
const int KILL_GRACE_STEPS = 10;
const int KILL_GRACE_STEP_MS = 5;

ExitStatus statusFromWait(int status) {
  ExitStatus es;
  if (WIFEXITED(status)) {
    es.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    es.exitCode = 0;
    es.signal = WTERMSIG(status);
  }
  return es;
}

bool isExecutableFile(const string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) == -1) {
    return false;
  }
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

void reportErrnoAndExit(int fd) {
  int e = errno;
  ssize_t ignored = ::write(fd, &e, sizeof(e));
  (void)ignored;
  _exit(127);
}
}  // namespace

ForkPtyProcess::ForkPtyProcess(pid_t _pid, int _masterFd,
                               const string& _program)
    : pid(_pid),
      masterFd(_masterFd),
      program(_program),
      running(true),
      outputClosed(false),
      reaped(false) {}

ForkPtyProcess::~ForkPtyProcess() {
  if (running) {
    kill();
  }
  closeMaster();
}

void ForkPtyProcess::write(const string& data) {
  if (!running || masterFd < 0) {
    throw std::runtime_error("Cannot write: pty child has exited");
  }
  pendingInput.append(data);
  flushPendingInput();
}

void ForkPtyProcess::flushPendingInput() {
  if (pendingInput.empty() || masterFd < 0) {
    return;
  }
  size_t written =
      RawFdUtils::writeSome(masterFd, pendingInput.data(), pendingInput.size());
  pendingInput.erase(0, written);
  if (!pendingInput.empty()) {
    VLOG(4) << "pty " << masterFd << " is full, " << pendingInput.length()
            << " bytes pending";
  }
}

void ForkPtyProcess::resize(int cols, int rows) {
  if (!running || masterFd < 0) {
    throw std::runtime_error("Cannot resize: pty child has exited");
  }
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw std::runtime_error(string("TIOCSWINSZ failed: ") +
                             strerror(GetErrno()));
  }
}

void ForkPtyProcess::kill() {
  if (!running) {
    throw std::runtime_error("Cannot kill: pty child has exited");
  }
  running = false;
  dataHandler = nullptr;
  exitHandler = nullptr;
  if (!reaped) {
    // forkpty makes the child a session leader, so -pid is its group.
    ::kill(-pid, SIGHUP);
    ::kill(pid, SIGHUP);
    closeMaster();
    int status;
    for (int a = 0; a < KILL_GRACE_STEPS && !reaped; a++) {
      if (::waitpid(pid, &status, WNOHANG) == pid) {
        reaped = true;
        break;
      }
      std::this_thread::sleep_for(
          std::chrono::milliseconds(KILL_GRACE_STEP_MS));
    }
    if (!reaped) {
      VLOG(1) << "Child " << pid << " ignored SIGHUP, sending SIGKILL";
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) == -1 && GetErrno() == EINTR) {
      }
      reaped = true;
    }
  }
  closeMaster();
}

bool ForkPtyProcess::poll(int timeoutMs) {
  if (!running) {
    return false;
  }
  if (outputClosed) {
    // The pty hung up but the child has not been reaped yet.
    if (tryReap()) {
      return true;
    }
    std::this_thread::sleep_for(
        std::chrono::milliseconds(std::min(timeoutMs, 10)));
    return tryReap();
  }
  vector<int> writeFds;
  if (!pendingInput.empty()) {
    writeFds.push_back(masterFd);
  }
  auto ready = RawFdUtils::waitForReady({masterFd}, writeFds, timeoutMs);
  if (!ready.empty()) {
    try {
      flushPendingInput();
    } catch (const std::runtime_error& re) {
      // The read below reports the hang up.
      LOG(WARNING) << "Dropping " << pendingInput.length()
                   << " bytes of pty input: " << re.what();
      pendingInput.clear();
    }
    return readChunk();
  }
  // A background job can keep the pty open after the child exits.
  return tryReap();
}

bool ForkPtyProcess::readChunk() {
  char b[BUF_SIZE];
  ssize_t rc = ::read(masterFd, b, BUF_SIZE);
  if (rc > 0) {
    VLOG(4) << "Read " << rc << " bytes from pty " << masterFd;
    // Invoke a copy: the handler may kill this process and reset the member.
    auto handler = dataHandler;
    if (handler) {
      handler(string(b, rc));
    }
    return true;
  }
  int readErrno = GetErrno();
  if (rc < 0 && (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
                 readErrno == EINTR)) {
    return false;
  }
  if (rc < 0 && readErrno != EIO) {
    LOG(ERROR) << "pty read error: " << readErrno << " " << strerror(readErrno);
  }
  // Linux reports EIO once every slave descriptor is closed.
  VLOG(1) << "pty " << masterFd << " hung up";
  outputClosed = true;
  return tryReap();
}

bool ForkPtyProcess::tryReap() {
  int status = 0;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc == -1 && GetErrno() == EINTR) {
    return false;
  }
  reaped = true;
  ExitStatus es;
  if (rc == pid) {
    es = statusFromWait(status);
  } else {
    LOG(WARNING) << "waitpid on " << pid << " failed: " << strerror(GetErrno());
    es.exitCode = -1;
  }

  // Output written right before exit may still sit in the pty.
  while (running && !outputClosed && masterFd >= 0) {
    char b[BUF_SIZE];
    ssize_t n = ::read(masterFd, b, BUF_SIZE);
    if (n <= 0) {
      break;
    }
    auto handler = dataHandler;
    if (handler) {
      handler(string(b, n));
    }
  }
  if (!running) {
    // Killed from inside a data handler.
    return true;
  }

  LOG(INFO) << "pty child " << pid << " exited with code " << es.exitCode
            << (es.signal ? " signal " + to_string(*es.signal) : string());
  running = false;
  closeMaster();
  auto handler = exitHandler;
  dataHandler = nullptr;
  exitHandler = nullptr;
  if (handler) {
    handler(es);
  }
  return true;
}

void ForkPtyProcess::closeMaster() {
  if (masterFd < 0) {
    return;
  }
#ifdef WITH_UTEMPTER
  utempter_remove_record(masterFd);
#endif
  ::close(masterFd);
  masterFd = -1;
  pendingInput.clear();
}

string ForkPtyBackend::findExecutable(const string& program,
                                      const string& pathValue) {
  if (program.empty()) {
    return string();
  }
  if (program.find('/') != string::npos) {
    return isExecutableFile(program) ? program : string();
  }
  for (auto dir : split(pathValue, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    string candidate = dir + "/" + program;
    if (isExecutableFile(candidate)) {
      return candidate;
    }
  }
  return string();
}

shared_ptr<PtyProcess> ForkPtyBackend::spawn(const string& program,
                                             const vector<string>& args,
                                             const PtySpawnOptions& options) {
  struct stat st;
  if (::stat(options.cwd.c_str(), &st) == -1 || !S_ISDIR(st.st_mode)) {
    throw SpawnFailure("Working directory does not exist: " + options.cwd);
  }
  auto pathIt = options.env.find("PATH");
  string pathValue =
      pathIt == options.env.end() ? string("/usr/bin:/bin") : pathIt->second;
  string executable = findExecutable(program, pathValue);
  if (executable.empty()) {
    throw SpawnFailure("Executable not found: " + program +
                       " (PATH=" + pathValue + ")");
  }

  // Everything the child needs is built before forking.
  vector<string> argStorage;
  argStorage.push_back(program);
  argStorage.insert(argStorage.end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& it : argStorage) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);
  vector<string> envStorage;
  for (auto& it : options.env) {
    envStorage.push_back(it.first + "=" + it.second);
  }
  vector<char*> envp;
  for (auto& it : envStorage) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);

  int errorPipe[2];
  FATAL_FAIL(::pipe(errorPipe));
  FATAL_FAIL(::fcntl(errorPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(::fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));

  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = options.cols;
  win.ws_row = options.rows;

  int masterFd = -1;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw SpawnFailure(string("forkpty failed: ") + strerror(forkErrno));
    }
    case 0: {
      ::close(errorPipe[0]);
      if (::chdir(options.cwd.c_str()) == -1) {
        reportErrnoAndExit(errorPipe[1]);
      }
      // Do not leak the host's signal setup into the shell; bash in
      // particular remembers an ignored SIGCHLD as the "original" value.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      signal(SIGINT, SIG_DFL);
      signal(SIGQUIT, SIG_DFL);
      signal(SIGTERM, SIG_DFL);
      signal(SIGHUP, SIG_DFL);
      sigset_t noSignals;
      sigemptyset(&noSignals);
      sigprocmask(SIG_SETMASK, &noSignals, NULL);
      environ = envp.data();
      execv(executable.c_str(), argv.data());
      reportErrnoAndExit(errorPipe[1]);
    }
    default: {
      // parent
      break;
    }
  }

  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t rc;
  do {
    rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (rc == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);
  if (rc == sizeof(childErrno)) {
    int status;
    ::waitpid(pid, &status, 0);
    ::close(masterFd);
    throw SpawnFailure("Failed to start " + program + " in " + options.cwd +
                       ": " + strerror(childErrno));
  }

  RawFdUtils::setNonBlockingCloseOnExec(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
#ifdef WITH_UTEMPTER
  {
    char buf[1024];
    sprintf(buf, "panelterm [%lld]", (long long)getpid());
    utempter_add_record(masterFd, buf);
  }
#endif
  return std::make_shared<ForkPtyProcess>(pid, masterFd, program);
}

shared_ptr<PtyBackend> loadPtyBackend(const string& ptmxPath) {
  if (::access(ptmxPath.c_str(), R_OK | W_OK) == -1) {
    int accessErrno = GetErrno();
    throw BindingLoadFailure(
        "Cannot use the pseudo-terminal device " + ptmxPath + " (" +
        strerror(accessErrno) +
        "). Make sure devpts is mounted (mount -t devpts devpts /dev/pts) and "
        "that the current user can read and write " +
        ptmxPath + ".");
  }
  int fd = ::posix_openpt(O_RDWR | O_NOCTTY);
  if (fd == -1) {
    int openErrno = GetErrno();
    throw BindingLoadFailure(
        "Cannot allocate a pseudo-terminal from " + ptmxPath + " (" +
        strerror(openErrno) +
        "). The pty limit may be exhausted (see /proc/sys/kernel/pty/max) or "
        "devpts is not mounted.");
  }
  ::close(fd);
  VLOG(1) << "Using forkpty backend on " << ptmxPath;
  return std::make_shared<ForkPtyBackend>();
}
}  // namespace pt
