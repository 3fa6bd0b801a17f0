#ifndef __PT_ESCAPE_SANITIZER__
#define __PT_ESCAPE_SANITIZER__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Length of the unsupported control sequence starting at `pos`, or 0.
 *
 * Recognized sequences:
 *  - kitty keyboard protocol: CSI [<>?] [0-9;]* u
 *  - synchronized output, focus reporting and bracketed paste toggles:
 *    CSI ? 2026|1004|2004 h|l
 *  - ConEmu progress reset: OSC 9;4;0; with an optional BEL
 */
size_t unsupportedSequenceLength(const string& data, size_t pos);

/**
 * @brief True if `data[pos..]` is the start of an unsupported sequence that
 * more input could still complete or extend.
 */
bool isIncompleteUnsupportedSequence(const string& data, size_t pos);

/**
 * @brief Removes every unsupported sequence from a chunk and leaves all
 * other bytes untouched and in order.
 *
 * Stateless and idempotent: removing one sequence can splice its
 * neighbours into a new one, so passes repeat until nothing changes.
 */
string stripUnsupportedSequences(const string& data);

/**
 * @brief Streaming variant used on live pty output.
 *
 * A target sequence split across two reads would survive the stateless
 * filter, so a trailing partial sequence is held back until the next
 * chunk (or an explicit flush).
 */
class EscapeSanitizer {
 public:
  /**
   * @brief Longest tail that is ever held back.
   *
   * Any prefix of a target sequence counts, down to a lone ESC, so an ESC
   * that ends a chunk (a bare Escape echoed by the child) is only shown on
   * the next chunk or on the next idle PtySessionManager::poll(), one tick
   * later.
   */
  static const size_t MAX_PENDING_BYTES = 32;

  /** @brief Filters one chunk; may return less than was fed. */
  string filter(const string& chunk);

  /** @brief Releases whatever is held back, sanitized. */
  string flush();

  bool hasPending() const { return !pending.empty(); }

 protected:
  string pending;
};
}  // namespace pt

#endif  // __PT_ESCAPE_SANITIZER__
