#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <sys/wait.h>

#include "bumplog/error.h"
#include "bumplog/utils.h"

namespace bumplog {

namespace {

constexpr std::size_t kShortIdLength = 7;

struct PipeCloser {
    void operator()(FILE* f) const {
        if (f) pclose(f);
    }
};

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

}  // namespace

std::vector<std::string> split(const std::string& str, const std::string& sep) {
    std::vector<std::string> result;
    std::size_t start = 0;
    std::size_t pos;

    while ((pos = str.find(sep, start)) != std::string::npos) {
        if (pos != start) {
            result.push_back(str.substr(start, pos - start));
        }
        start = pos + sep.size();
    }

    if (start < str.size()) {
        result.push_back(str.substr(start));
    }

    return result;
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            if (start < text.size()) lines.push_back(text.substr(start));
            break;
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    if (!lines.empty() && !lines.back().empty() && lines.back().back() == '\r') {
        lines.back().pop_back();
    }
    return lines;
}

std::string Trim(const std::string& str) {
    std::size_t begin = 0;
    std::size_t end = str.size();
    while (begin < end && IsSpace(str[begin])) ++begin;
    while (end > begin && IsSpace(str[end - 1])) --end;
    return str.substr(begin, end - begin);
}

bool StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ShortId(const std::string& id) { return id.substr(0, kShortIdLength); }

CommandResult RunCommand(const std::string& command) {
    std::unique_ptr<FILE, PipeCloser> pipe(popen(command.c_str(), "r"));
    if (!pipe) {
        throw Error(ErrorKind::kIo, "Failed to run command: " + command);
    }

    CommandResult result;
    char buffer[4096];
    std::size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe.get())) > 0) {
        result.output.append(buffer, n);
    }

    int status = pclose(pipe.release());
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

std::string ShellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

}  // namespace bumplog
