#ifndef BUMPLOG_COMMIT_H_
#define BUMPLOG_COMMIT_H_

#include <optional>
#include <string>
#include <vector>

namespace bumplog {

// A contributor. Two authors with the same mail are the same person.
struct Author {
    std::string name;
    std::string mail;
    std::string handle;

    bool operator==(const Author& o) const {
        return name == o.name && mail == o.mail && handle == o.handle;
    }
};

// The conventional-commit header of a subject line:
//
//   [emoji] <type>[(<scope>)][!]: <description>
struct Subject {
    std::string emoji;
    std::string type;
    std::string scope;
    bool breaking = false;
    std::string description;
};

struct Commit {
    std::string hash;
    std::string emoji;
    std::string type;
    std::string scope;
    std::string description;
    bool is_breaking = false;
    std::vector<Author> authors;
};

// Bucket names in rendering order, "other" last.
const std::vector<std::string>& KnownTypes();

// Maps a type token onto one of KnownTypes().
std::string BucketFor(const std::string& type);

std::optional<Subject> ParseSubject(const std::string& subject);

// Collects "Co-authored-by: Name <mail>" trailers in the order they appear.
std::vector<Author> ParseCoAuthors(const std::string& body);

std::optional<Commit> ClassifyCommit(const std::string& hash, const std::string& subject,
                                     const std::string& body, const Author& author);

// Writes the header back as "type(scope)!: description".
std::string FormatSubject(const Commit& commit);

}  // namespace bumplog

#endif  // BUMPLOG_COMMIT_H_
