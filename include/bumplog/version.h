#ifndef BUMPLOG_VERSION_H_
#define BUMPLOG_VERSION_H_

#include <optional>
#include <string>

namespace bumplog {

class TagIndex;
struct Segment;

struct SemanticVersion {
    unsigned long long major = 0;
    unsigned long long minor = 0;
    unsigned long long patch = 0;
    std::string prerelease;
    std::string build;

    // "1.2.3-rc.1+meta", without any tag prefix.
    std::string ToString() const;

    // Accepts an optional "v"/"ver" prefix, or `prefix` when given.
    // Throws std::runtime_error on anything that is not SemVer 2.0.
    static SemanticVersion Parse(const std::string& str, const std::string& prefix = "");

    bool operator==(const SemanticVersion& o) const;
    bool operator!=(const SemanticVersion& o) const { return !(*this == o); }
    // SemVer 2.0 precedence; build metadata is ignored.
    bool operator<(const SemanticVersion& o) const;
    bool operator>(const SemanticVersion& o) const { return o < *this; }
};

// Strict SemVer 2.0 with an optional "v" or "ver" prefix.
bool IsSemverTag(const std::string& name);

// Every bump clears pre-release and build metadata.
SemanticVersion BumpMajor(const SemanticVersion& v);
SemanticVersion BumpMinor(const SemanticVersion& v);
SemanticVersion BumpPatch(const SemanticVersion& v);

enum class BumpLevel { kMajor, kMinor, kPatch };

const char* BumpLevelName(BumpLevel level);
std::optional<BumpLevel> ParseBumpLevel(const std::string& name);

// - Breaking change: MAJOR
// - Any feat commit: MINOR
// - Anything else: PATCH
BumpLevel SelectBump(bool has_breaking, bool has_feat);

struct BumpCandidates {
    SemanticVersion major;
    SemanticVersion minor;
    SemanticVersion patch;
    BumpLevel selected = BumpLevel::kPatch;

    const SemanticVersion& At(BumpLevel level) const;
    const SemanticVersion& Default() const { return At(selected); }
};

BumpCandidates ComputeCandidates(const SemanticVersion& base, bool has_breaking,
                                 bool has_feat);

std::string FormatCandidate(const BumpCandidates& candidates, BumpLevel level,
                            const std::string& prefix);

// Display names of a segment's two boundaries. `candidates` is only set when
// the newer boundary is not tagged yet and `to_name` had to be computed.
struct SegmentNames {
    std::string from_name;
    std::string to_name;
    SemanticVersion from_version;
    std::optional<BumpCandidates> candidates;
};

SegmentNames ComputeNames(const Segment& segment, const TagIndex& tags,
                          const std::string& prefix);

// Replaces a computed to_name with another candidate. No-op for tagged
// boundaries.
void OverrideBump(SegmentNames& names, BumpLevel level, const std::string& prefix);

}  // namespace bumplog

#endif  // BUMPLOG_VERSION_H_
