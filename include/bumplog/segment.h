#ifndef BUMPLOG_SEGMENT_H_
#define BUMPLOG_SEGMENT_H_

#include <map>
#include <string>
#include <vector>

#include "bumplog/commit.h"
#include "bumplog/identity.h"
#include "bumplog/repository.h"

namespace bumplog {

// One changelog entry: the classified commits in from..to.
struct Segment {
    CommitId from;
    CommitId to;
    bool has_breaking = false;
    // bucket (see KnownTypes()) -> commits, newest first
    std::map<std::string, std::vector<Commit>> commits_by_type;
    // mail -> contributor
    std::map<std::string, Author> contributors;

    std::size_t CommitCount() const;
};

class SegmentAggregator {
   public:
    SegmentAggregator(const Repository& repo, IdentityResolver& resolver)
        : repo_(repo), resolver_(resolver) {}

    Segment Aggregate(const CommitId& older, const CommitId& newer);

    // One segment per consecutive pair of `boundaries`, in the same order.
    std::vector<Segment> BuildSegments(const std::vector<CommitId>& boundaries);

    // Gives every author and contributor without a handle the one the
    // resolver learned since, so the result does not depend on the order
    // commits were visited in.
    void FillKnownHandles(Segment& segment) const;

   private:
    void AddContributor(Segment& segment, const Author& author);
    void FillKnownHandle(Author& author) const;

    const Repository& repo_;
    IdentityResolver& resolver_;
};

}  // namespace bumplog

#endif  // BUMPLOG_SEGMENT_H_
