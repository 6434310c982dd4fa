#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>

#include "bumplog/changelog.h"
#include "bumplog/error.h"
#include "bumplog/range.h"
#include "bumplog/render.h"
#include "bumplog/tag_index.h"
#include "bumplog/utils.h"

namespace bumplog {

Changelog::Changelog(Config config)
    : Changelog(config, std::make_unique<GitRepository>(config.repo),
                config.lookup ? std::make_unique<UnghIdentityLookup>() : nullptr,
                nullptr) {
    if (config_.use_gh && remote_ && remote_->IsGitHub()) {
        history_ = std::make_unique<GhRemoteHistory>(remote_->owner, remote_->name);
    }
}

Changelog::Changelog(Config config, std::unique_ptr<Repository> repo,
                     std::unique_ptr<IdentityLookup> lookup,
                     std::unique_ptr<RemoteHistory> history)
    : config_(std::move(config)),
      repo_(std::move(repo)),
      lookup_(std::move(lookup)),
      history_(std::move(history)) {
    std::string url = config_.url;
    if (url.empty()) {
        url = repo_->RemoteUrl(config_.remote).value_or("");
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    remote_ = ParseRemoteUrl(url);
    if (remote_) {
        base_url_ = remote_->WebUrl();
    } else if (!url.empty()) {
        spdlog::warn("Unrecognized remote URL {}, links are disabled.", url);
    }
}

std::vector<Release> Changelog::Build() {
    TagIndex tags = TagIndex::Build(*repo_);
    std::vector<CommitId> boundaries = ResolveRange(*repo_, tags, config_.from, config_.to);

    IdentityResolver resolver(lookup_.get());
    if (history_) {
        std::size_t read =
            PrimeFromRemoteHistory(*history_, resolver, boundaries.front(), boundaries.back());
        spdlog::debug("Read {} commits of remote history", read);
    }

    SegmentAggregator aggregator(*repo_, resolver);
    std::vector<Release> releases;
    for (auto& segment : aggregator.BuildSegments(boundaries)) {
        SegmentNames names = ComputeNames(segment, tags, config_.prefix);
        releases.push_back({std::move(segment), std::move(names)});
    }

    if (config_.bump && !releases.empty()) {
        SegmentNames& newest = releases.front().names;
        if (newest.candidates) {
            OverrideBump(newest, *config_.bump, config_.prefix);
            spdlog::info("Using {} bump: {}", BumpLevelName(*config_.bump), newest.to_name);
        } else {
            spdlog::warn("{} is already tagged, ignoring the {} bump.", newest.to_name,
                         BumpLevelName(*config_.bump));
        }
    }
    return releases;
}

std::string Changelog::Render(const std::vector<Release>& releases) const {
    RenderOptions options;
    options.base_url = base_url_;
    options.use_emoji = config_.use_emoji;

    std::ostringstream out;
    for (std::size_t i = 0; i < releases.size(); ++i) {
        if (i > 0) out << "\n";
        out << RenderSegment(releases[i].segment, releases[i].names, options);
    }
    return out.str();
}

void Changelog::Generate() {
    std::vector<Release> releases = Build();
    std::string text = Render(releases);

    if (config_.output.empty()) {
        std::cout << text;
        return;
    }

    PrependToFile(config_.output, text);
    spdlog::info("Wrote {} release(s) to: {}", releases.size(), config_.output);
}

std::string Changelog::ReadChangelogFile(const std::string& fpath) {
    std::ifstream file(fpath);
    if (!file.is_open()) {
        return "";
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

void Changelog::PrependToFile(const std::string& fpath, const std::string& text) {
    std::string existing = ReadChangelogFile(fpath);

    std::ofstream out(fpath, std::ios::trunc);
    if (!out.is_open()) {
        throw Error(ErrorKind::kIo, "Cannot open output file: " + fpath);
    }
    out << text;
    if (!existing.empty()) {
        out << "\n" << existing;
    }
    if (!out) {
        throw Error(ErrorKind::kIo, "Failed to write " + fpath);
    }
}

}  // namespace bumplog
