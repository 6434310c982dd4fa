#include <sstream>

#include "bumplog/render.h"
#include "bumplog/utils.h"

namespace bumplog {

namespace {

struct SectionSpec {
    const char* bucket;  // nullptr: breaking commits of every bucket
    const char* emoji;
    const char* title;
};

const std::vector<SectionSpec>& Sections() {
    static const std::vector<SectionSpec> sections = {
        {nullptr, ":sparkles:", "Breaking Changes"},
        {"feat", ":sparkles:", "Features"},
        {"fix", ":bug:", "Bug Fixes"},
        {"docs", ":memo:", "Documentation"},
        {"style", ":art:", "Styles"},
        {"refactor", ":recycle:", "Code Refactoring"},
        {"perf", ":zap:", "Performance Improvements"},
        {"test", ":rotating_light:", "Tests"},
        {"build", ":hammer:", "Build"},
        {"ci", ":green_heart:", "Continuous Integration"},
        {"chore", ":wrench:", "Chores"},
        {"revert", ":rewind:", "Reverts"},
        {"other", ":package:", "Others"},
    };
    return sections;
}

std::string Heading(const char* emoji, const char* title, const RenderOptions& options) {
    std::string heading = "### ";
    if (options.use_emoji) {
        heading += std::string(emoji) + " ";
    }
    return heading + title;
}

bool HasIssueReference(const std::string& text) {
    for (std::size_t i = 0; i + 1 < text.size(); ++i) {
        if (text[i] == '#' && text[i + 1] >= '0' && text[i + 1] <= '9') return true;
    }
    return false;
}

std::string DisplayName(const Author& author) {
    return author.handle.empty() ? author.name : "@" + author.handle;
}

std::vector<const Commit*> Collect(const Segment& segment, const SectionSpec& section) {
    std::vector<const Commit*> commits;
    if (section.bucket == nullptr) {
        for (const auto& bucket : KnownTypes()) {
            auto it = segment.commits_by_type.find(bucket);
            if (it == segment.commits_by_type.end()) continue;
            for (const auto& commit : it->second) {
                if (commit.is_breaking) commits.push_back(&commit);
            }
        }
        return commits;
    }
    auto it = segment.commits_by_type.find(section.bucket);
    if (it == segment.commits_by_type.end()) return commits;
    for (const auto& commit : it->second) {
        if (!commit.is_breaking) commits.push_back(&commit);
    }
    return commits;
}

}  // namespace

std::string FormatAttribution(const std::vector<Author>& authors) {
    if (authors.empty()) return "";
    std::string by = "by " + DisplayName(authors[0]);
    if (authors.size() == 2) {
        return by + " and " + DisplayName(authors[1]);
    }
    for (std::size_t i = 1; i < authors.size(); ++i) {
        by += (i + 1 == authors.size()) ? ", and " : ", ";
        by += DisplayName(authors[i]);
    }
    return by;
}

std::string FormatEntry(const Commit& commit, const RenderOptions& options) {
    std::string entry = "- ";
    if (!commit.scope.empty()) {
        entry += "**" + commit.scope + "** ";
    }
    entry += commit.description;

    if (!HasIssueReference(commit.description)) {
        std::string short_hash = ShortId(commit.hash);
        if (options.base_url.empty()) {
            entry += " (" + short_hash + ")";
        } else {
            entry += " ([" + short_hash + "](" + options.base_url + "/commit/" + commit.hash + "))";
        }
    }

    std::string by = FormatAttribution(commit.authors);
    if (!by.empty()) {
        entry += " - " + by;
    }
    return entry;
}

std::string RenderSegment(const Segment& segment, const SegmentNames& names,
                          const RenderOptions& options) {
    std::ostringstream out;
    out << "## " << names.to_name << "\n\n";

    if (!options.base_url.empty()) {
        out << "[compare changes](" << options.base_url << "/compare/" << names.from_name
            << "..." << names.to_name << ")\n";
    }

    for (const auto& section : Sections()) {
        std::vector<const Commit*> commits = Collect(segment, section);
        if (commits.empty()) continue;
        out << "\n" << Heading(section.emoji, section.title, options) << "\n\n";
        for (const Commit* commit : commits) {
            out << FormatEntry(*commit, options) << "\n";
        }
    }

    out << "\n" << Heading(":busts_in_silhouette:", "Contributors", options) << "\n\n";
    for (const auto& [mail, contributor] : segment.contributors) {
        if (contributor.handle.empty()) {
            out << "- " << contributor.name << " <" << mail << ">\n";
        } else {
            out << "- " << contributor.name << " (@" << contributor.handle << ")\n";
        }
    }
    return out.str();
}

}  // namespace bumplog
