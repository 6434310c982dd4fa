#ifndef BUMPLOG_UTILS_H_
#define BUMPLOG_UTILS_H_

#include <string>
#include <vector>

namespace bumplog {

std::vector<std::string> split(const std::string& str, const std::string& sep);

// Splits on '\n', keeping empty lines and dropping a trailing '\r'.
std::vector<std::string> SplitLines(const std::string& text);

std::string Trim(const std::string& str);

bool StartsWith(const std::string& str, const std::string& prefix);

bool EndsWith(const std::string& str, const std::string& suffix);

// Abbreviated object id as shown by `git log --oneline`.
std::string ShortId(const std::string& id);

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

// Runs `command` through the shell and captures its stdout.
CommandResult RunCommand(const std::string& command);

// Quotes `arg` for safe interpolation into a /bin/sh command line.
std::string ShellQuote(const std::string& arg);

}  // namespace bumplog

#endif  // BUMPLOG_UTILS_H_
