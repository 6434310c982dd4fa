#include <spdlog/spdlog.h>

#include "bumplog/segment.h"
#include "bumplog/utils.h"

namespace bumplog {

std::size_t Segment::CommitCount() const {
    std::size_t count = 0;
    for (const auto& [type, commits] : commits_by_type) {
        count += commits.size();
    }
    return count;
}

Segment SegmentAggregator::Aggregate(const CommitId& older, const CommitId& newer) {
    Segment segment;
    segment.from = older;
    segment.to = newer;

    for (const auto& id : repo_.WalkRange(older, newer)) {
        RawCommit raw = repo_.GetCommit(id);
        Author primary{raw.author_name, raw.author_mail, raw.author_handle};

        auto commit = ClassifyCommit(raw.id, raw.subject, raw.body, primary);
        if (!commit) {
            spdlog::debug("Skipping {}: not a conventional commit: {}", ShortId(id), raw.subject);
            continue;
        }

        for (auto& author : commit->authors) {
            author = resolver_.Resolve(author);
            AddContributor(segment, author);
        }

        if (commit->is_breaking) {
            segment.has_breaking = true;
        }
        std::string bucket = BucketFor(commit->type);
        spdlog::debug("{} -> {}: {}", ShortId(id), bucket, FormatSubject(*commit));
        segment.commits_by_type[bucket].push_back(std::move(*commit));
    }

    FillKnownHandles(segment);
    return segment;
}

void SegmentAggregator::FillKnownHandle(Author& author) const {
    if (!author.handle.empty()) return;
    if (auto handle = resolver_.Cached(author.mail)) {
        author.handle = *handle;
    }
}

void SegmentAggregator::FillKnownHandles(Segment& segment) const {
    for (auto& [bucket, commits] : segment.commits_by_type) {
        for (auto& commit : commits) {
            for (auto& author : commit.authors) {
                FillKnownHandle(author);
            }
        }
    }
    for (auto& [mail, contributor] : segment.contributors) {
        FillKnownHandle(contributor);
    }
}

void SegmentAggregator::AddContributor(Segment& segment, const Author& author) {
    auto it = segment.contributors.find(author.mail);
    if (it == segment.contributors.end()) {
        segment.contributors.emplace(author.mail, author);
    } else if (it->second.handle.empty() && !author.handle.empty()) {
        it->second.handle = author.handle;
    }
}

std::vector<Segment> SegmentAggregator::BuildSegments(const std::vector<CommitId>& boundaries) {
    std::vector<Segment> segments;
    for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
        segments.push_back(Aggregate(boundaries[i + 1], boundaries[i]));
        spdlog::debug("Segment {}..{}: {} commits, {} contributors",
                      ShortId(boundaries[i + 1]), ShortId(boundaries[i]),
                      segments.back().CommitCount(), segments.back().contributors.size());
    }
    // Handles learned in older segments also apply to newer ones.
    for (auto& segment : segments) {
        FillKnownHandles(segment);
    }
    return segments;
}

}  // namespace bumplog
