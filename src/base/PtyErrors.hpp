#ifndef __PT_PTY_ERRORS__
#define __PT_PTY_ERRORS__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Base class for every error the session core reports to its caller.
 */
class PtyError : public std::runtime_error {
 public:
  explicit PtyError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The OS refused to create the child process (bad cwd, missing
 * executable, fork/exec failure).
 */
class SpawnFailure : public PtyError {
 public:
  explicit SpawnFailure(const string& what) : PtyError(what) {}
};

/**
 * @brief The pseudo-terminal capability is not usable on this machine.
 *
 * The message names the device that was probed and how to fix it.
 */
class BindingLoadFailure : public SpawnFailure {
 public:
  explicit BindingLoadFailure(const string& what) : SpawnFailure(what) {}
};

/**
 * @brief A direct command line could not be split into words.
 */
class CommandParseError : public SpawnFailure {
 public:
  CommandParseError(const string& what, size_t _position)
      : SpawnFailure(what), position(_position) {}

  /** @brief Offset in the command line where parsing gave up. */
  size_t getPosition() const { return position; }

 protected:
  size_t position;
};
}  // namespace pt

#endif  // __PT_PTY_ERRORS__
