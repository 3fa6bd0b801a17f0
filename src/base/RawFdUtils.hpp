#ifndef __PT_RAW_FD_UTILS__
#define __PT_RAW_FD_UTILS__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Wrappers around POSIX write and poll on non-blocking
 * descriptors (pty masters, pipes).
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN and EINTR.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Writes as much of the buffer as the descriptor accepts without
   * blocking.
   * @return The number of bytes written, 0 if the descriptor is full.
   */
  static size_t writeSome(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to `timeoutMs` for any of `fds` to become readable.
   * @return The subset of `fds` that is readable (or hung up).
   */
  static vector<int> waitForReadable(const vector<int>& fds, int timeoutMs);

  /**
   * @brief Waits up to `timeoutMs` for any of `readFds` to become readable
   * or any of `writeFds` to become writable.
   * @return Every descriptor with a pending event, listed once.
   */
  static vector<int> waitForReady(const vector<int>& readFds,
                                  const vector<int>& writeFds, int timeoutMs);

  /** @brief Sets O_NONBLOCK and FD_CLOEXEC on a descriptor. */
  static void setNonBlockingCloseOnExec(int fd);
};
}  // namespace pt
#endif  // __PT_RAW_FD_UTILS__
