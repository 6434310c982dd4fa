#ifndef BUMPLOG_RANGE_H_
#define BUMPLOG_RANGE_H_

#include <optional>
#include <string>
#include <vector>

#include "bumplog/repository.h"
#include "bumplog/tag_index.h"

namespace bumplog {

// Resolves `from`, or with no `from`, the nearest tagged commit reachable
// from HEAD (the root commit when there is none).
CommitId ResolveFrom(const Repository& repo, const TagIndex& tags,
                     const std::optional<std::string>& from);

// Splits from..to at every tagged commit inside the range. The result is
// [to, <tagged commits, newest first>, from]; consecutive pairs
// (b[i + 1], b[i]) are the segments. Throws Error(kEmptyRange) when from and
// to are the same commit.
std::vector<CommitId> ResolveRange(const Repository& repo, const TagIndex& tags,
                                   const std::optional<std::string>& from,
                                   const std::string& to = "HEAD");

}  // namespace bumplog

#endif  // BUMPLOG_RANGE_H_
