#ifndef __PT_CONSOLE_HPP__
#define __PT_CONSOLE_HPP__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Grid size of a display surface in character cells.
 */
struct TerminalSize {
  int cols = 0;
  int rows = 0;

  bool operator==(const TerminalSize& other) const {
    return cols == other.cols && rows == other.rows;
  }
  bool operator!=(const TerminalSize& other) const { return !(*this == other); }
};

/**
 * @brief Abstract display surface: renders session output and produces
 * keystrokes and size changes.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Returns the current size of the surface. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Prepares the surface before a session is attached. */
  virtual void setup() = 0;
  /** @brief Restores the surface state. */
  virtual void teardown() = 0;
  /** @brief Descriptor that becomes readable when keystrokes arrive. */
  virtual int getFd() = 0;
  /** @brief Reads whatever keystrokes are pending (may be empty). */
  virtual string read() = 0;
  /** @brief Renders session output. */
  virtual void write(const string& s) = 0;
};
}  // namespace pt

#endif  // __PT_CONSOLE_HPP__
