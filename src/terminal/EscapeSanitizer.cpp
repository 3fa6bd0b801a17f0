#include "EscapeSanitizer.hpp"

namespace pt {
namespace {
const char ESC = '\x1b';
const char BEL = '\x07';
const char* PRIVATE_MODES[] = {"2026", "1004", "2004"};
const string PROGRESS_RESET = "\x1b]9;4;0;";

enum class Match { NONE, PARTIAL, COMPLETE };

inline bool isParam(char c) { return (c >= '0' && c <= '9') || c == ';'; }

// CSI [<>?] [0-9;]* u
Match matchKeyboardProtocol(const string& data, size_t pos, size_t* length) {
  size_t j = pos + 3;
  while (j < data.length() && isParam(data[j])) {
    j++;
  }
  if (j == data.length()) {
    return Match::PARTIAL;
  }
  if (data[j] == 'u') {
    *length = j - pos + 1;
    return Match::COMPLETE;
  }
  return Match::NONE;
}

// CSI ? <mode> h|l
Match matchPrivateModeToggle(const string& data, size_t pos, size_t* length) {
  size_t start = pos + 3;
  size_t available = data.length() - start;
  Match best = Match::NONE;
  for (const char* mode : PRIVATE_MODES) {
    size_t modeLength = strlen(mode);
    size_t n = std::min(available, modeLength);
    if (data.compare(start, n, mode, n) != 0) {
      continue;
    }
    if (n < modeLength || start + modeLength == data.length()) {
      best = Match::PARTIAL;
      continue;
    }
    char final = data[start + modeLength];
    if (final == 'h' || final == 'l') {
      *length = modeLength + 4;
      return Match::COMPLETE;
    }
  }
  return best;
}

// OSC 9;4;0; BEL?  A complete match at the very end is reported as PARTIAL
// too, since a BEL may follow in the next chunk.
Match matchProgressReset(const string& data, size_t pos, size_t* length) {
  size_t available = data.length() - pos;
  size_t n = std::min(available, PROGRESS_RESET.length());
  if (data.compare(pos, n, PROGRESS_RESET, 0, n) != 0) {
    return Match::NONE;
  }
  if (n < PROGRESS_RESET.length()) {
    return Match::PARTIAL;
  }
  size_t end = pos + PROGRESS_RESET.length();
  if (end < data.length() && data[end] == BEL) {
    *length = PROGRESS_RESET.length() + 1;
  } else {
    *length = PROGRESS_RESET.length();
  }
  return end == data.length() ? Match::PARTIAL : Match::COMPLETE;
}

Match matchAt(const string& data, size_t pos, size_t* length) {
  *length = 0;
  if (pos >= data.length() || data[pos] != ESC) {
    return Match::NONE;
  }
  if (pos + 1 == data.length()) {
    return Match::PARTIAL;
  }
  char introducer = data[pos + 1];
  if (introducer == ']') {
    return matchProgressReset(data, pos, length);
  }
  if (introducer != '[') {
    return Match::NONE;
  }
  if (pos + 2 == data.length()) {
    return Match::PARTIAL;
  }
  char marker = data[pos + 2];
  Match result = Match::NONE;
  if (marker == '?') {
    result = matchPrivateModeToggle(data, pos, length);
    if (result == Match::COMPLETE) {
      return result;
    }
  }
  if (marker == '<' || marker == '>' || marker == '?') {
    Match keyboard = matchKeyboardProtocol(data, pos, length);
    if (keyboard != Match::NONE) {
      return keyboard;
    }
  }
  return result;
}

string stripOnce(const string& data) {
  string out;
  out.reserve(data.length());
  size_t i = 0;
  while (i < data.length()) {
    if (data[i] == ESC) {
      size_t length = unsupportedSequenceLength(data, i);
      if (length > 0) {
        i += length;
        continue;
      }
    }
    out.push_back(data[i]);
    i++;
  }
  return out;
}
}  // namespace

size_t unsupportedSequenceLength(const string& data, size_t pos) {
  size_t length = 0;
  Match m = matchAt(data, pos, &length);
  // A progress reset at the end of the data is complete for stateless use.
  if (m == Match::COMPLETE || (m == Match::PARTIAL && length > 0)) {
    return length;
  }
  return 0;
}

bool isIncompleteUnsupportedSequence(const string& data, size_t pos) {
  size_t length = 0;
  return matchAt(data, pos, &length) == Match::PARTIAL;
}

string stripUnsupportedSequences(const string& data) {
  if (data.find(ESC) == string::npos) {
    return data;
  }
  string current = data;
  while (true) {
    string next = stripOnce(current);
    if (next.length() == current.length()) {
      return next;
    }
    current.swap(next);
  }
}

string EscapeSanitizer::filter(const string& chunk) {
  string joined = pending + chunk;
  pending.clear();

  // Target sequences contain a single ESC, so only the last one can open an
  // incomplete sequence.
  size_t holdFrom = joined.length();
  auto lastEsc = joined.rfind(ESC);
  if (lastEsc != string::npos &&
      joined.length() - lastEsc <= MAX_PENDING_BYTES &&
      isIncompleteUnsupportedSequence(joined, lastEsc)) {
    holdFrom = lastEsc;
  }
  pending = joined.substr(holdFrom);
  if (!pending.empty()) {
    VLOG(4) << "Holding back " << pending.length()
            << " bytes of a partial escape sequence";
  }
  return stripUnsupportedSequences(joined.substr(0, holdFrom));
}

string EscapeSanitizer::flush() {
  string remaining = stripUnsupportedSequences(pending);
  pending.clear();
  return remaining;
}
}  // namespace pt
