#ifndef __PT_COMMAND_TOKENIZER__
#define __PT_COMMAND_TOKENIZER__

#include "Headers.hpp"
#include "PtyErrors.hpp"

namespace pt {

// A command line split for direct execution
struct ParsedCommand {
  string program;
  vector<string> args;
};

// Split a command line into words using POSIX-like quoting:
//  - unquoted whitespace separates words
//  - '...' is literal
//  - "..." allows \" \\ \$ \` escapes, other backslashes are kept
//  - \x outside quotes is a literal x
//  - adjacent segments join: a'b c'"d" is one word
// Throws CommandParseError on unbalanced quotes or a trailing backslash.
vector<string> tokenizeCommandLine(const string& commandLine);

// Tokenize and split into program + arguments.  Throws CommandParseError if
// the line holds no words.
ParsedCommand parseCommand(const string& commandLine);

}  // namespace pt

#endif  // __PT_COMMAND_TOKENIZER__
