#ifndef BUMPLOG_CHANGELOG_H_
#define BUMPLOG_CHANGELOG_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bumplog/identity.h"
#include "bumplog/remote.h"
#include "bumplog/repository.h"
#include "bumplog/segment.h"
#include "bumplog/version.h"

namespace bumplog {

struct Release {
    Segment segment;
    SegmentNames names;
};

class Changelog {
   public:
    struct Config {
        std::string repo = ".";
        std::optional<std::string> from;
        std::string to = "HEAD";
        std::string prefix = "v";
        std::string remote = "origin";
        // Web URL of the repository; derived from `remote` when empty.
        std::string url;
        // Printed to stdout when empty, otherwise prepended to this file.
        std::string output;
        // Replaces the computed bump of the newest release.
        std::optional<BumpLevel> bump;
        bool use_emoji = true;
        bool lookup = true;
        bool use_gh = true;
    };

    // Opens `config.repo` with libgit2; handles come from ungh.cc and, for
    // GitHub remotes, from the commits API via `gh`.
    explicit Changelog(Config config);

    // Any of `lookup` and `history` may be null.
    Changelog(Config config, std::unique_ptr<Repository> repo,
              std::unique_ptr<IdentityLookup> lookup, std::unique_ptr<RemoteHistory> history);

    Changelog(const Changelog&) = delete;
    Changelog& operator=(const Changelog&) = delete;

    // Releases newest first, one per tag-bounded segment of from..to.
    std::vector<Release> Build();

    std::string Render(const std::vector<Release>& releases) const;

    void Generate();

    const std::string& base_url() const { return base_url_; }

   private:
    static std::string ReadChangelogFile(const std::string& fpath);
    static void PrependToFile(const std::string& fpath, const std::string& text);

    Config config_;
    std::unique_ptr<Repository> repo_;
    std::unique_ptr<IdentityLookup> lookup_;
    std::unique_ptr<RemoteHistory> history_;
    std::optional<RemoteInfo> remote_;
    std::string base_url_;
};

}  // namespace bumplog

#endif  // BUMPLOG_CHANGELOG_H_
