#include <regex>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "bumplog/segment.h"
#include "bumplog/tag_index.h"
#include "bumplog/utils.h"
#include "bumplog/version.h"

namespace bumplog {

namespace {

const std::regex& SemverRegex() {
    static const std::regex re(
        R"(^(v|ver)?(0|[1-9]\d*)\.(0|[1-9]\d*)\.(0|[1-9]\d*))"
        R"((?:-((?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*)(?:\.(?:0|[1-9]\d*|\d*[a-zA-Z-][0-9a-zA-Z-]*))*))?)"
        R"((?:\+([0-9a-zA-Z-]+(?:\.[0-9a-zA-Z-]+)*))?$)");
    return re;
}

bool IsNumeric(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// Pre-release precedence, SemVer 2.0 section 11. Both sides are non-empty.
int ComparePrerelease(const std::string& a, const std::string& b) {
    std::vector<std::string> lhs = split(a, ".");
    std::vector<std::string> rhs = split(b, ".");
    for (std::size_t i = 0; i < lhs.size() && i < rhs.size(); ++i) {
        const std::string& x = lhs[i];
        const std::string& y = rhs[i];
        bool x_num = IsNumeric(x);
        bool y_num = IsNumeric(y);
        if (x_num && y_num) {
            if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
            int c = x.compare(y);
            if (c != 0) return c < 0 ? -1 : 1;
        } else if (x_num != y_num) {
            return x_num ? -1 : 1;
        } else {
            int c = x.compare(y);
            if (c != 0) return c < 0 ? -1 : 1;
        }
    }
    if (lhs.size() == rhs.size()) return 0;
    return lhs.size() < rhs.size() ? -1 : 1;
}

bool HasFeature(const Segment& segment) {
    auto it = segment.commits_by_type.find("feat");
    return it != segment.commits_by_type.end() && !it->second.empty();
}

}  // namespace

std::string SemanticVersion::ToString() const {
    std::string out =
        std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) out += "-" + prerelease;
    if (!build.empty()) out += "+" + build;
    return out;
}

SemanticVersion SemanticVersion::Parse(const std::string& str, const std::string& prefix) {
    std::vector<std::string> attempts;
    if (!prefix.empty() && StartsWith(str, prefix)) {
        attempts.push_back(str.substr(prefix.size()));
    }
    attempts.push_back(str);

    for (const auto& attempt : attempts) {
        std::smatch m;
        if (!std::regex_match(attempt, m, SemverRegex())) continue;
        try {
            SemanticVersion v;
            v.major = std::stoull(m[2]);
            v.minor = std::stoull(m[3]);
            v.patch = std::stoull(m[4]);
            v.prerelease = m[5].str();
            v.build = m[6].str();
            return v;
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Version component out of range: " + str);
        }
    }
    throw std::runtime_error("Invalid version string: " + str);
}

bool SemanticVersion::operator==(const SemanticVersion& o) const {
    return major == o.major && minor == o.minor && patch == o.patch &&
           prerelease == o.prerelease;
}

bool SemanticVersion::operator<(const SemanticVersion& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    if (prerelease.empty() || o.prerelease.empty()) {
        // A release outranks any of its pre-releases.
        return !prerelease.empty() && o.prerelease.empty();
    }
    return ComparePrerelease(prerelease, o.prerelease) < 0;
}

bool IsSemverTag(const std::string& name) { return std::regex_match(name, SemverRegex()); }

SemanticVersion BumpMajor(const SemanticVersion& v) {
    SemanticVersion next;
    next.major = v.major + 1;
    return next;
}

SemanticVersion BumpMinor(const SemanticVersion& v) {
    SemanticVersion next;
    next.major = v.major;
    next.minor = v.minor + 1;
    return next;
}

SemanticVersion BumpPatch(const SemanticVersion& v) {
    SemanticVersion next;
    next.major = v.major;
    next.minor = v.minor;
    next.patch = v.patch + 1;
    return next;
}

const char* BumpLevelName(BumpLevel level) {
    switch (level) {
        case BumpLevel::kMajor:
            return "major";
        case BumpLevel::kMinor:
            return "minor";
        case BumpLevel::kPatch:
            return "patch";
    }
    return "patch";
}

std::optional<BumpLevel> ParseBumpLevel(const std::string& name) {
    if (name == "major") return BumpLevel::kMajor;
    if (name == "minor") return BumpLevel::kMinor;
    if (name == "patch") return BumpLevel::kPatch;
    return std::nullopt;
}

BumpLevel SelectBump(bool has_breaking, bool has_feat) {
    if (has_breaking) return BumpLevel::kMajor;
    if (has_feat) return BumpLevel::kMinor;
    return BumpLevel::kPatch;
}

const SemanticVersion& BumpCandidates::At(BumpLevel level) const {
    switch (level) {
        case BumpLevel::kMajor:
            return major;
        case BumpLevel::kMinor:
            return minor;
        case BumpLevel::kPatch:
            return patch;
    }
    return patch;
}

BumpCandidates ComputeCandidates(const SemanticVersion& base, bool has_breaking,
                                 bool has_feat) {
    BumpCandidates candidates;
    candidates.major = BumpMajor(base);
    candidates.minor = BumpMinor(base);
    candidates.patch = BumpPatch(base);
    candidates.selected = SelectBump(has_breaking, has_feat);
    return candidates;
}

std::string FormatCandidate(const BumpCandidates& candidates, BumpLevel level,
                            const std::string& prefix) {
    return prefix + candidates.At(level).ToString();
}

SegmentNames ComputeNames(const Segment& segment, const TagIndex& tags,
                          const std::string& prefix) {
    SegmentNames names;
    auto from_tag = tags.TagFor(segment.from);
    auto to_tag = tags.TagFor(segment.to);

    names.from_name = from_tag ? *from_tag : ShortId(segment.from);
    names.to_name = to_tag ? *to_tag : ShortId(segment.to);

    if (from_tag) {
        names.from_version = SemanticVersion::Parse(*from_tag, prefix);
    }
    if (to_tag) {
        return names;
    }

    names.candidates =
        ComputeCandidates(names.from_version, segment.has_breaking, HasFeature(segment));
    names.to_name = FormatCandidate(*names.candidates, names.candidates->selected, prefix);
    spdlog::debug("{} -> {} ({} bump)", names.from_name, names.to_name,
                  BumpLevelName(names.candidates->selected));
    return names;
}

void OverrideBump(SegmentNames& names, BumpLevel level, const std::string& prefix) {
    if (!names.candidates) return;
    names.candidates->selected = level;
    names.to_name = FormatCandidate(*names.candidates, level, prefix);
}

}  // namespace bumplog
