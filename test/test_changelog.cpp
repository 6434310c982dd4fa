#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "bumplog/changelog.h"
#include "bumplog/error.h"
#include "test_utils.h"

namespace fs = std::filesystem;

using namespace bumplog;
using namespace bumplog::test;

class ChangelogTest : public ::testing::Test {
   protected:
    void SetUp() override {
        repo = std::make_unique<FakeRepository>();
        lookup = std::make_unique<FakeIdentityLookup>();

        root = repo->Commit("chore: initial commit", "", "Alice", "alice@example.com");
        v100 = repo->Commit("feat: first release", "", "Alice", "alice@example.com");
        repo->Tag("v1.0.0", v100);
        v110 = repo->Commit("fix: patch things", "", "Bob", "bob@example.com");
        repo->Tag("v1.1.0", v110);
        feat = repo->Commit("feat(api): add X", "", "Alice", "alice@example.com");
        breaking = repo->Commit("fix!: change Y", "Co-authored-by: Carol <carol@example.com>",
                                "Bob", "bob@example.com");
        repo->SetRemote("origin", "git@github.com:octo/demo.git");

        lookup->Add("bob@example.com", "bobby");
    }

    std::unique_ptr<Changelog> Make(Changelog::Config config = {},
                                    std::unique_ptr<RemoteHistory> history = nullptr) {
        return std::make_unique<Changelog>(std::move(config), std::move(repo), std::move(lookup),
                                           std::move(history));
    }

    std::unique_ptr<FakeRepository> repo;
    std::unique_ptr<FakeIdentityLookup> lookup;
    CommitId root, v100, v110, feat, breaking;
};

TEST_F(ChangelogTest, BreakingChangeSinceLatestTag) {
    auto changelog = Make();
    std::vector<Release> releases = changelog->Build();

    ASSERT_EQ(releases.size(), 1u);
    const Release& release = releases[0];
    EXPECT_EQ(release.segment.from, v110);
    EXPECT_EQ(release.segment.to, breaking);
    EXPECT_TRUE(release.segment.has_breaking);
    EXPECT_EQ(release.names.from_name, "v1.1.0");
    EXPECT_EQ(release.names.to_name, "v2.0.0");
    ASSERT_TRUE(release.names.candidates.has_value());
    EXPECT_EQ(release.names.candidates->minor.ToString(), "1.2.0");
    EXPECT_EQ(release.names.candidates->patch.ToString(), "1.1.1");

    std::string text = changelog->Render(releases);
    EXPECT_NE(text.find("## v2.0.0\n"), std::string::npos);
    EXPECT_NE(text.find("[compare changes](https://github.com/octo/demo/compare/v1.1.0...v2.0.0)"),
              std::string::npos);
    EXPECT_NE(text.find("Breaking Changes\n\n- change Y ([" + breaking.substr(0, 7) + "]"),
              std::string::npos);
    EXPECT_NE(text.find("by @bobby and Carol\n"), std::string::npos);
    EXPECT_NE(text.find("Features\n\n- **api** add X"), std::string::npos);
    EXPECT_NE(text.find("- Bob (@bobby)\n"), std::string::npos);
    EXPECT_NE(text.find("- Carol <carol@example.com>\n"), std::string::npos);
}

TEST_F(ChangelogTest, RangeFromRootSpansEveryRelease) {
    Changelog::Config config;
    config.from = root;
    auto changelog = Make(config);
    std::vector<Release> releases = changelog->Build();

    ASSERT_EQ(releases.size(), 3u);
    EXPECT_EQ(releases[0].names.to_name, "v2.0.0");
    EXPECT_EQ(releases[1].names.from_name, "v1.0.0");
    EXPECT_EQ(releases[1].names.to_name, "v1.1.0");
    EXPECT_FALSE(releases[1].names.candidates.has_value());
    EXPECT_EQ(releases[2].names.from_name, root.substr(0, 7));
    EXPECT_EQ(releases[2].names.to_name, "v1.0.0");

    std::string text = changelog->Render(releases);
    std::size_t newest = text.find("## v2.0.0");
    std::size_t middle = text.find("## v1.1.0");
    std::size_t oldest = text.find("## v1.0.0");
    EXPECT_LT(newest, middle);
    EXPECT_LT(middle, oldest);
}

TEST_F(ChangelogTest, HandleFromOldestReleaseAppearsInNewest) {
    repo->SetAuthorHandle(v100, "alice-gh");
    Changelog::Config config;
    config.from = root;
    auto changelog = Make(config);
    std::vector<Release> releases = changelog->Build();

    ASSERT_EQ(releases.size(), 3u);
    EXPECT_EQ(releases[0].segment.contributors.at("alice@example.com").handle, "alice-gh");
    EXPECT_EQ(releases[2].segment.contributors.at("alice@example.com").handle, "alice-gh");

    std::string text = changelog->Render(releases);
    EXPECT_NE(text.find("add X ([" + feat.substr(0, 7) + "](https://github.com/octo/demo/commit/" +
                        feat + ")) - by @alice-gh\n"),
              std::string::npos);
    EXPECT_EQ(text.find("- by Alice\n"), std::string::npos);
}

TEST_F(ChangelogTest, PrefixIsAppliedToComputedName) {
    Changelog::Config config;
    config.from = v110;
    config.to = feat;
    config.prefix = "ver";
    auto changelog = Make(config);
    std::vector<Release> releases = changelog->Build();
    ASSERT_EQ(releases.size(), 1u);
    EXPECT_EQ(releases[0].names.to_name, "ver1.2.0");
}

TEST_F(ChangelogTest, BumpOverrideAppliesToNewestRelease) {
    Changelog::Config config;
    config.bump = BumpLevel::kPatch;
    auto changelog = Make(config);
    std::vector<Release> releases = changelog->Build();
    ASSERT_EQ(releases.size(), 1u);
    EXPECT_EQ(releases[0].names.to_name, "v1.1.1");
    EXPECT_EQ(releases[0].names.candidates->Default().ToString(), "1.1.1");
}

TEST_F(ChangelogTest, UrlOverridesRemote) {
    Changelog::Config config;
    config.url = "https://gitlab.example.com/team/demo/";
    auto changelog = Make(config);
    EXPECT_EQ(changelog->base_url(), "https://gitlab.example.com/team/demo");
}

TEST_F(ChangelogTest, NoRemoteMeansNoLinks) {
    Changelog::Config config;
    config.remote = "upstream";
    auto changelog = Make(config);
    EXPECT_EQ(changelog->base_url(), "");
    std::string text = changelog->Render(changelog->Build());
    EXPECT_EQ(text.find("compare changes"), std::string::npos);
    EXPECT_NE(text.find("(" + feat.substr(0, 7) + ")"), std::string::npos);
}

TEST_F(ChangelogTest, OutputIsIdempotent) {
    FakeRepository* raw_repo = repo.get();
    auto changelog = Make();
    std::string first = changelog->Render(changelog->Build());
    std::string second = changelog->Render(changelog->Build());
    EXPECT_EQ(first, second);
    EXPECT_GT(raw_repo->get_commit_calls(), 0);
}

TEST_F(ChangelogTest, UnclassifiedAuthorIsNotAContributor) {
    repo->Commit("oops I forgot the prefix", "", "Mallory", "mallory@example.com");
    auto changelog = Make();
    std::string text = changelog->Render(changelog->Build());
    EXPECT_EQ(text.find("Mallory"), std::string::npos);
    EXPECT_EQ(text.find("oops"), std::string::npos);
}

TEST_F(ChangelogTest, RemoteHistorySuppliesHandles) {
    FakeIdentityLookup* raw_lookup = lookup.get();
    auto history = std::make_unique<FakeRemoteHistory>(100);
    FakeRemoteHistory* raw_history = history.get();
    history->AddPage({MakeRemoteCommit(breaking, "bob@example.com", "bob-gh"),
                      MakeRemoteCommit(feat, "alice@example.com", "alice-gh"),
                      MakeRemoteCommit(v110, "bob@example.com", "bob-gh")});

    auto changelog = Make({}, std::move(history));
    std::vector<Release> releases = changelog->Build();

    EXPECT_EQ(raw_history->last_head(), breaking);
    const auto& contributors = releases[0].segment.contributors;
    EXPECT_EQ(contributors.at("alice@example.com").handle, "alice-gh");
    EXPECT_EQ(contributors.at("bob@example.com").handle, "bob-gh");
    EXPECT_EQ(raw_lookup->calls("alice@example.com"), 0);
    EXPECT_EQ(raw_lookup->calls("bob@example.com"), 0);
    EXPECT_EQ(raw_lookup->calls("carol@example.com"), 1);
}

TEST_F(ChangelogTest, RemoteHistoryFailureAbortsTheRun) {
    auto history = std::make_unique<FakeRemoteHistory>(1);
    history->AddPage({MakeRemoteCommit(breaking, "bob@example.com", "bob-gh")});
    history->FailOnPage(2);

    auto changelog = Make({}, std::move(history));
    try {
        changelog->Build();
        FAIL() << "expected an Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kRemoteHistoryFetchFailure);
    }
}

TEST_F(ChangelogTest, EmptyRangeAbortsTheRun) {
    Changelog::Config config;
    config.from = "v1.1.0";
    config.to = "v1.1.0";
    auto changelog = Make(config);
    EXPECT_THROW(changelog->Build(), Error);
}

TEST_F(ChangelogTest, GeneratePrependsToOutputFile) {
    fs::path out = fs::temp_directory_path() / "bumplog_test_CHANGELOG.md";
    {
        std::ofstream existing(out);
        existing << "## v1.1.0\n\nolder notes\n";
    }

    Changelog::Config config;
    config.output = out.string();
    auto changelog = Make(config);
    changelog->Generate();

    std::ifstream in(out);
    std::stringstream content;
    content << in.rdbuf();
    std::string text = content.str();
    fs::remove(out);

    std::size_t fresh = text.find("## v2.0.0");
    std::size_t older = text.find("older notes");
    ASSERT_NE(fresh, std::string::npos);
    ASSERT_NE(older, std::string::npos);
    EXPECT_LT(fresh, older);
}
