#include "SubprocessUtils.hpp"

namespace pt {
namespace {
int exitCodeFromStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
}

int waitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      return -1;
    }
  }
  return exitCodeFromStatus(status);
}

// Reaps the child if it exits before the deadline.
optional<int> waitForChildUntil(
    pid_t pid, std::chrono::steady_clock::time_point deadline) {
  while (true) {
    int status = 0;
    pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      return exitCodeFromStatus(status);
    }
    if (rc == -1 && GetErrno() != EINTR) {
      return -1;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}
}  // namespace

SubprocessResult SubprocessUtils::SubprocessToStringWithTimeout(
    const string& command, const vector<string>& args,
    const map<string, string>& env, int timeoutMs) {
  SubprocessResult result;

  // Everything the child needs is built before fork().
  vector<string> argStorage;
  argStorage.push_back(command);
  argStorage.insert(argStorage.end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& it : argStorage) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  vector<string> envStorage;
  for (auto& it : env) {
    envStorage.push_back(it.first + "=" + it.second);
  }
  vector<char*> envp;
  for (auto& it : envStorage) {
    envp.push_back(&it[0]);
  }
  envp.push_back(NULL);

  int link[2];
  if (::pipe(link) == -1) {
    LOG(WARNING) << "Could not create pipe for " << command << ": "
                 << strerror(GetErrno());
    return result;
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    ::setsid();
    int devNull = ::open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      dup2(devNull, STDERR_FILENO);
    }
    dup2(link[1], STDOUT_FILENO);
    ::close(link[0]);
    ::close(link[1]);
    signal(SIGCHLD, SIG_DFL);
    environ = envp.data();
    execvp(command.c_str(), argv.data());
    _exit(127);
  }
  if (pid < 0) {
    LOG(WARNING) << "Failed to fork for " << command << ": "
                 << strerror(GetErrno());
    ::close(link[0]);
    ::close(link[1]);
    return result;
  }

  // parent process
  ::close(link[1]);
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  char buf[4096];
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                         deadline - std::chrono::steady_clock::now())
                         .count();
    if (remaining <= 0) {
      result.timedOut = true;
      break;
    }
    pollfd pfd;
    pfd.fd = link[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, int(remaining));
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      LOG(WARNING) << "poll failed while reading " << command << ": "
                   << strerror(GetErrno());
      result.timedOut = true;
      break;
    }
    if (rc == 0) {
      continue;
    }
    ssize_t nbytes = ::read(link[0], buf, sizeof(buf));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    result.output.append(buf, nbytes);
  }
  ::close(link[0]);

  if (!result.timedOut) {
    // The child may close stdout and keep running.
    auto exitCode = waitForChildUntil(pid, deadline);
    if (exitCode) {
      result.exitCode = *exitCode;
      return result;
    }
    result.timedOut = true;
  }
  VLOG(1) << command << " did not finish within " << timeoutMs
          << "ms, killing it";
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
  waitForChild(pid);
  return result;
}
}  // namespace pt
