#include "RawFdUtils.hpp"

namespace pt {
void RawFdUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // The child is not draining its input yet, keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to fd: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

size_t RawFdUtils::writeSome(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeSome");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        break;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to fd: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      break;
    }
    bytesWritten += rc;
  }
  return bytesWritten;
}

vector<int> RawFdUtils::waitForReadable(const vector<int>& fds,
                                        int timeoutMs) {
  return waitForReady(fds, {}, timeoutMs);
}

vector<int> RawFdUtils::waitForReady(const vector<int>& readFds,
                                     const vector<int>& writeFds,
                                     int timeoutMs) {
  vector<pollfd> pfds;
  auto watch = [&pfds](int fd, short events) {
    if (fd < 0) {
      return;
    }
    for (auto& pfd : pfds) {
      if (pfd.fd == fd) {
        pfd.events |= events;
        return;
      }
    }
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    pfds.push_back(pfd);
  };
  for (int fd : readFds) {
    watch(fd, POLLIN);
  }
  for (int fd : writeFds) {
    watch(fd, POLLOUT);
  }
  vector<int> ready;
  if (pfds.empty()) {
    if (timeoutMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
    }
    return ready;
  }
  int rc = ::poll(pfds.data(), pfds.size(), timeoutMs);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      LOG(WARNING) << "poll failed: " << strerror(GetErrno());
    }
    return ready;
  }
  for (auto& pfd : pfds) {
    if (pfd.revents & (POLLIN | POLLOUT | POLLHUP | POLLERR)) {
      ready.push_back(pfd.fd);
    }
  }
  return ready;
}

void RawFdUtils::setNonBlockingCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFL, flags | O_NONBLOCK));
  int fdFlags = ::fcntl(fd, F_GETFD, 0);
  FATAL_FAIL(fdFlags);
  FATAL_FAIL(::fcntl(fd, F_SETFD, fdFlags | FD_CLOEXEC));
}
}  // namespace pt
