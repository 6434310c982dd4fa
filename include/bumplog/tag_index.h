#ifndef BUMPLOG_TAG_INDEX_H_
#define BUMPLOG_TAG_INDEX_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "bumplog/repository.h"

namespace bumplog {

// Semver tags and the commits they point to.
class TagIndex {
   public:
    TagIndex() = default;

    // Keeps only tags accepted by IsSemverTag(), in the repository's order.
    static TagIndex Build(const Repository& repo);

    void Add(const std::string& tag, const CommitId& commit);

    std::optional<std::string> TagFor(const CommitId& commit) const;
    std::optional<CommitId> CommitFor(const std::string& tag) const;
    bool HasTag(const CommitId& commit) const { return commit_to_tag_.count(commit) > 0; }

    const std::vector<std::string>& Tags() const { return tags_; }
    const std::map<CommitId, std::string>& CommitToTag() const { return commit_to_tag_; }
    const std::map<std::string, CommitId>& TagToCommit() const { return tag_to_commit_; }

   private:
    std::vector<std::string> tags_;
    std::map<CommitId, std::string> commit_to_tag_;
    std::map<std::string, CommitId> tag_to_commit_;
};

}  // namespace bumplog

#endif  // BUMPLOG_TAG_INDEX_H_
