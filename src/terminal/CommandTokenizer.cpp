#include "CommandTokenizer.hpp"

namespace pt {
namespace {
inline bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}
}  // namespace

vector<string> tokenizeCommandLine(const string& commandLine) {
  vector<string> words;
  string current;
  // Distinguishes "no word yet" from an empty quoted word like ''
  bool inWord = false;

  size_t i = 0;
  while (i < commandLine.length()) {
    char c = commandLine[i];
    if (isBlank(c)) {
      if (inWord) {
        words.push_back(current);
        current.clear();
        inWord = false;
      }
      i++;
      continue;
    }

    inWord = true;
    if (c == '\\') {
      if (i + 1 >= commandLine.length()) {
        throw CommandParseError("Trailing backslash in command: " + commandLine,
                                i);
      }
      current.push_back(commandLine[i + 1]);
      i += 2;
    } else if (c == '\'') {
      auto close = commandLine.find('\'', i + 1);
      if (close == string::npos) {
        throw CommandParseError(
            "Unterminated single quote in command: " + commandLine, i);
      }
      current.append(commandLine, i + 1, close - i - 1);
      i = close + 1;
    } else if (c == '"') {
      size_t start = i;
      i++;
      bool closed = false;
      while (i < commandLine.length()) {
        char d = commandLine[i];
        if (d == '"') {
          closed = true;
          i++;
          break;
        }
        if (d == '\\' && i + 1 < commandLine.length()) {
          char next = commandLine[i + 1];
          if (next == '"' || next == '\\' || next == '$' || next == '`') {
            current.push_back(next);
            i += 2;
            continue;
          }
        }
        current.push_back(d);
        i++;
      }
      if (!closed) {
        throw CommandParseError(
            "Unterminated double quote in command: " + commandLine, start);
      }
    } else {
      current.push_back(c);
      i++;
    }
  }
  if (inWord) {
    words.push_back(current);
  }
  return words;
}

ParsedCommand parseCommand(const string& commandLine) {
  vector<string> words = tokenizeCommandLine(commandLine);
  if (words.empty()) {
    throw CommandParseError("Empty command", 0);
  }
  ParsedCommand parsed;
  parsed.program = words.front();
  parsed.args.assign(words.begin() + 1, words.end());
  return parsed;
}

}  // namespace pt
