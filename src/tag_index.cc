#include <spdlog/spdlog.h>

#include "bumplog/tag_index.h"
#include "bumplog/version.h"

namespace bumplog {

TagIndex TagIndex::Build(const Repository& repo) {
    TagIndex index;
    for (const auto& [name, commit] : repo.ListTags()) {
        if (!IsSemverTag(name)) {
            spdlog::debug("Ignoring non-semver tag {}", name);
            continue;
        }
        index.Add(name, commit);
    }
    spdlog::debug("Indexed {} semver tags", index.tags_.size());
    return index;
}

void TagIndex::Add(const std::string& tag, const CommitId& commit) {
    if (tag_to_commit_.count(tag)) return;
    tags_.push_back(tag);
    tag_to_commit_[tag] = commit;

    // Several tags on one commit: the smallest name is the commit's tag.
    auto it = commit_to_tag_.find(commit);
    if (it == commit_to_tag_.end()) {
        commit_to_tag_.emplace(commit, tag);
    } else if (tag < it->second) {
        it->second = tag;
    }
}

std::optional<std::string> TagIndex::TagFor(const CommitId& commit) const {
    auto it = commit_to_tag_.find(commit);
    if (it == commit_to_tag_.end()) return std::nullopt;
    return it->second;
}

std::optional<CommitId> TagIndex::CommitFor(const std::string& tag) const {
    auto it = tag_to_commit_.find(tag);
    if (it == tag_to_commit_.end()) return std::nullopt;
    return it->second;
}

}  // namespace bumplog
