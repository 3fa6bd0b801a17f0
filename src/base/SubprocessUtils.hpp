#ifndef __PT_SUBPROCESS_UTILS__
#define __PT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace pt {
/**
 * @brief What a captured subprocess produced.
 */
struct SubprocessResult {
  /** @brief Everything the child wrote to stdout. */
  string output;
  /** @brief Exit code, or -1 if the child did not exit normally. */
  int exitCode = -1;
  /** @brief True if the child was killed because the deadline passed. */
  bool timedOut = false;

  bool succeeded() const { return !timedOut && exitCode == 0; }
};

/**
 * @brief Utility class for executing subprocesses and capturing output.
 *
 * Virtual so tests can replace the real fork/exec with a scripted fake.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments (no intermediate shell) and
   * captures its stdout.
   *
   * The child runs in its own session with stdin and stderr bound to
   * /dev/null, so an interactive shell can neither read from nor stop on the
   * caller's terminal.
   *
   * @param env Complete environment of the child; nothing is inherited.
   * @param timeoutMs The whole process group is SIGKILLed after this long.
   */
  virtual SubprocessResult SubprocessToStringWithTimeout(
      const string& command, const vector<string>& args,
      const map<string, string>& env, int timeoutMs);
};
}  // namespace pt

#endif  // __PT_SUBPROCESS_UTILS__
