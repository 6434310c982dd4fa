#include <string>
#include <vector>

#include "bumplog/commit.h"
#include "bumplog/utils.h"

namespace bumplog {

namespace {

const std::string kCoAuthorTrailer = "Co-authored-by:";

bool IsLower(char c) { return c >= 'a' && c <= 'z'; }

bool IsShortcodeChar(char c) {
    return IsLower(c) || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
           c == '-' || c == '+';
}

bool IsNonAscii(char c) { return static_cast<unsigned char>(c) >= 0x80; }

// Consumes a leading ":shortcode:" or a run of non-ASCII bytes (one glyph
// plus any variation selectors). Returns the number of bytes consumed.
std::size_t ScanEmoji(const std::string& s) {
    if (s.empty()) return 0;
    if (s[0] == ':') {
        std::size_t i = 1;
        while (i < s.size() && IsShortcodeChar(s[i])) ++i;
        if (i > 1 && i < s.size() && s[i] == ':') return i + 1;
        return 0;
    }
    std::size_t i = 0;
    while (i < s.size() && IsNonAscii(s[i])) ++i;
    return i;
}

}  // namespace

const std::vector<std::string>& KnownTypes() {
    static const std::vector<std::string> types = {
        "feat", "fix", "docs", "style", "refactor", "perf",
        "test", "build", "ci", "chore", "revert", "other",
    };
    return types;
}

std::string BucketFor(const std::string& type) {
    for (const auto& known : KnownTypes()) {
        if (known == type) return known;
    }
    return "other";
}

std::optional<Subject> ParseSubject(const std::string& subject) {
    Subject parsed;
    std::size_t pos = ScanEmoji(subject);
    parsed.emoji = subject.substr(0, pos);
    while (pos < subject.size() && subject[pos] == ' ') ++pos;

    std::size_t type_begin = pos;
    while (pos < subject.size() && IsLower(subject[pos])) ++pos;
    if (pos == type_begin) return std::nullopt;
    parsed.type = subject.substr(type_begin, pos - type_begin);

    if (pos < subject.size() && subject[pos] == '(') {
        // The scope runs to the first ")" that is followed by the separator,
        // so "feat(a(b)): x" keeps "a(b)".
        std::size_t close = std::string::npos;
        for (std::size_t i = pos + 1; i < subject.size(); ++i) {
            if (subject[i] != ')') continue;
            std::size_t next = i + 1;
            if (next < subject.size() && subject[next] == '!') ++next;
            if (next < subject.size() && subject[next] == ':') {
                close = i;
                break;
            }
        }
        if (close == std::string::npos || close == pos + 1) return std::nullopt;
        parsed.scope = subject.substr(pos + 1, close - pos - 1);
        pos = close + 1;
    }

    if (pos < subject.size() && subject[pos] == '!') {
        parsed.breaking = true;
        ++pos;
    }

    if (pos + 1 >= subject.size() || subject[pos] != ':' || subject[pos + 1] != ' ') {
        return std::nullopt;
    }
    pos += 2;

    parsed.description = Trim(subject.substr(pos));
    if (parsed.description.empty()) return std::nullopt;
    return parsed;
}

std::vector<Author> ParseCoAuthors(const std::string& body) {
    std::vector<Author> authors;
    for (const auto& raw : SplitLines(body)) {
        std::string line = Trim(raw);
        if (!StartsWith(line, kCoAuthorTrailer)) continue;

        std::string rest = Trim(line.substr(kCoAuthorTrailer.size()));
        std::size_t open = rest.rfind('<');
        if (open == std::string::npos || rest.back() != '>') continue;

        Author author;
        author.name = Trim(rest.substr(0, open));
        author.mail = rest.substr(open + 1, rest.size() - open - 2);
        if (author.name.empty() || author.mail.empty()) continue;
        authors.push_back(std::move(author));
    }
    return authors;
}

std::optional<Commit> ClassifyCommit(const std::string& hash, const std::string& subject,
                                     const std::string& body, const Author& author) {
    auto parsed = ParseSubject(subject);
    if (!parsed) return std::nullopt;

    Commit commit;
    commit.hash = hash;
    commit.emoji = parsed->emoji;
    commit.type = parsed->type;
    commit.scope = parsed->scope;
    commit.description = parsed->description;
    commit.is_breaking = parsed->breaking;
    commit.authors.push_back(author);
    for (auto& co_author : ParseCoAuthors(body)) {
        commit.authors.push_back(std::move(co_author));
    }
    return commit;
}

std::string FormatSubject(const Commit& commit) {
    std::string out = commit.type;
    if (!commit.scope.empty()) out += "(" + commit.scope + ")";
    if (commit.is_breaking) out += "!";
    return out + ": " + commit.description;
}

}  // namespace bumplog
