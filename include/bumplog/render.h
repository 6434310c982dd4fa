#ifndef BUMPLOG_RENDER_H_
#define BUMPLOG_RENDER_H_

#include <string>
#include <vector>

#include "bumplog/commit.h"
#include "bumplog/segment.h"
#include "bumplog/version.h"

namespace bumplog {

struct RenderOptions {
    // https://<host>/<owner>/<repo>, or empty for no links.
    std::string base_url;
    bool use_emoji = true;
};

// "by X", "by X and Y", "by X, Y, and Z"; @handle where known.
std::string FormatAttribution(const std::vector<Author>& authors);

std::string FormatEntry(const Commit& commit, const RenderOptions& options);

std::string RenderSegment(const Segment& segment, const SegmentNames& names,
                          const RenderOptions& options);

}  // namespace bumplog

#endif  // BUMPLOG_RENDER_H_
