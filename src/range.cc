#include <spdlog/spdlog.h>

#include "bumplog/error.h"
#include "bumplog/range.h"
#include "bumplog/utils.h"

namespace bumplog {

CommitId ResolveFrom(const Repository& repo, const TagIndex& tags,
                     const std::optional<std::string>& from) {
    if (from) {
        if (auto commit = tags.CommitFor(*from)) {
            return *commit;
        }
        return repo.ResolveRef(*from);
    }

    std::vector<CommitId> history = repo.WalkRange("", repo.ResolveRef("HEAD"));
    for (const auto& id : history) {
        if (auto tag = tags.TagFor(id)) {
            spdlog::debug("Latest tag reachable from HEAD is {}", *tag);
            return id;
        }
    }
    if (history.empty()) {
        throw Error(ErrorKind::kEmptyRepository, "The repository is empty.");
    }
    spdlog::debug("No tag reachable from HEAD, starting at root commit {}",
                  ShortId(history.back()));
    return history.back();
}

std::vector<CommitId> ResolveRange(const Repository& repo, const TagIndex& tags,
                                   const std::optional<std::string>& from,
                                   const std::string& to) {
    CommitId from_commit = ResolveFrom(repo, tags, from);
    CommitId to_commit = repo.ResolveRef(to);

    if (from_commit == to_commit) {
        throw Error(ErrorKind::kEmptyRange, "No commits between from and to.");
    }

    std::vector<CommitId> boundaries = {to_commit};
    for (const auto& id : repo.WalkRange(from_commit, to_commit)) {
        if (id != to_commit && tags.HasTag(id)) {
            boundaries.push_back(id);
        }
    }
    boundaries.push_back(from_commit);

    spdlog::debug("Range {}..{} splits into {} segment(s)", ShortId(from_commit),
                  ShortId(to_commit), boundaries.size() - 1);
    return boundaries;
}

}  // namespace bumplog
