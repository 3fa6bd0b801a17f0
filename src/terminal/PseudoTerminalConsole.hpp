#ifndef __PT_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __PT_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"
#include "RawFdUtils.hpp"

namespace pt {
/**
 * @brief Uses the local tty as the display surface: raw mode on stdin,
 * output on stdout.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : rawMode(false) {
    termios terminal_local;
    if (tcgetattr(STDIN_FILENO, &terminal_local) == 0) {
      memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
      isTty = true;
    } else {
      isTty = false;
    }
  }

  virtual ~PseudoTerminalConsole() {}

  /** @brief Switches stdin to raw mode so every keystroke reaches the pty. */
  virtual void setup() {
    if (!isTty) {
      return;
    }
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local);
    rawMode = true;
  }

  /** @brief Restores the terminal state saved in `setup()`. */
  virtual void teardown() {
    if (rawMode) {
      tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
      rawMode = false;
    }
  }

  /** @brief Queries the window size; 80x24 when stdout is not a tty. */
  virtual TerminalSize getTerminalSize() {
    TerminalSize size;
    winsize win;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == 0 && win.ws_col > 0 &&
        win.ws_row > 0) {
      size.cols = win.ws_col;
      size.rows = win.ws_row;
    } else {
      size.cols = 80;
      size.rows = 24;
    }
    return size;
  }

  virtual int getFd() { return STDIN_FILENO; }

  virtual string read() {
    char b[4096];
    ssize_t rc = ::read(STDIN_FILENO, b, sizeof(b));
    if (rc > 0) {
      return string(b, rc);
    }
    if (rc == 0) {
      throw std::runtime_error("stdin closed");
    }
    if (GetErrno() == EAGAIN || GetErrno() == EINTR) {
      return string();
    }
    throw std::runtime_error(string("Cannot read stdin: ") +
                             strerror(GetErrno()));
  }

  virtual void write(const string& s) {
    RawFdUtils::writeAll(STDOUT_FILENO, s.c_str(), s.length());
  }

 protected:
  /** @brief Backup of the terminal's `termios` state for teardown. */
  termios terminal_backup;
  bool isTty;
  bool rawMode;
};
}  // namespace pt

#endif  // __PT_PSEUDO_TERMINAL_CONSOLE_HPP__
