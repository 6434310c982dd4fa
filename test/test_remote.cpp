#include <gtest/gtest.h>

#include "bumplog/error.h"
#include "bumplog/remote.h"
#include "test_utils.h"

using namespace bumplog;
using namespace bumplog::test;

TEST(ParseRemoteUrlTest, SshUrl) {
    auto info = ParseRemoteUrl("git@github.com:octo/hello-world.git");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->host, "github.com");
    EXPECT_EQ(info->owner, "octo");
    EXPECT_EQ(info->name, "hello-world");
    EXPECT_TRUE(info->IsGitHub());
    EXPECT_EQ(info->WebUrl(), "https://github.com/octo/hello-world");
}

TEST(ParseRemoteUrlTest, SshUrlWithPort) {
    auto info = ParseRemoteUrl("ssh://git@github.com:22/octo/hello-world.git");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->host, "github.com");
    EXPECT_EQ(info->owner, "octo");
    EXPECT_EQ(info->name, "hello-world");

    auto no_port = ParseRemoteUrl("ssh://git@example.org/team/tool");
    ASSERT_TRUE(no_port.has_value());
    EXPECT_EQ(no_port->WebUrl(), "https://example.org/team/tool");
}

TEST(ParseRemoteUrlTest, HttpsUrl) {
    auto info = ParseRemoteUrl("https://gitlab.com/group/project");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->WebUrl(), "https://gitlab.com/group/project");
    EXPECT_FALSE(info->IsGitHub());

    auto with_suffix = ParseRemoteUrl("https://user@github.com/octo/repo.git");
    ASSERT_TRUE(with_suffix.has_value());
    EXPECT_EQ(with_suffix->host, "github.com");
    EXPECT_EQ(with_suffix->name, "repo");
}

TEST(ParseRemoteUrlTest, UnknownFormats) {
    EXPECT_FALSE(ParseRemoteUrl("").has_value());
    EXPECT_FALSE(ParseRemoteUrl("/srv/git/project.git").has_value());
    EXPECT_FALSE(ParseRemoteUrl("https://github.com/octo").has_value());
}

TEST(GhRemoteHistoryTest, ParsesCommitsPage) {
    const char* page = R"([
      {"sha": "aaa", "commit": {"author": {"name": "A", "email": "a@example.com"},
                                "committer": {"name": "GitHub", "email": "noreply@github.com"}},
       "author": {"login": "alpha"}, "committer": {"login": "web-flow"}},
      {"sha": "bbb", "commit": {"author": {"name": "B", "email": "b@example.com"},
                                "committer": {"name": "B", "email": "b@example.com"}},
       "author": null, "committer": null}
    ])";
    auto commits = GhRemoteHistory::ParsePage(page);
    ASSERT_EQ(commits.size(), 2u);
    EXPECT_EQ(commits[0].sha, "aaa");
    EXPECT_EQ(commits[0].author_mail, "a@example.com");
    EXPECT_EQ(commits[0].author_login, "alpha");
    EXPECT_EQ(commits[0].committer_login, "web-flow");
    EXPECT_EQ(commits[1].author_mail, "b@example.com");
    EXPECT_EQ(commits[1].author_login, "");
}

TEST(GhRemoteHistoryTest, RejectsErrorReplies) {
    EXPECT_THROW(GhRemoteHistory::ParsePage(R"({"message": "Not Found"})"), Error);
    EXPECT_THROW(GhRemoteHistory::ParsePage("not json"), Error);
    EXPECT_THROW(GhRemoteHistory::ParsePage(R"([{"commit": {}}])"), Error);
}

TEST(PrimeFromRemoteHistoryTest, StopsAtTheStopCommit) {
    FakeRemoteHistory history(2);
    history.AddPage({MakeRemoteCommit("s4", "a@example.com", "alpha"),
                     MakeRemoteCommit("s3", "b@example.com", "")});
    history.AddPage({MakeRemoteCommit("s2", "c@example.com", "gamma"),
                     MakeRemoteCommit("s1", "d@example.com", "delta")});
    history.AddPage({MakeRemoteCommit("s0", "e@example.com", "epsilon")});

    IdentityResolver resolver;
    EXPECT_EQ(PrimeFromRemoteHistory(history, resolver, "s4", "s2"), 3u);
    EXPECT_EQ(history.fetches(), 2);
    EXPECT_EQ(history.last_head(), "s4");
    EXPECT_EQ(resolver.Cached("a@example.com"), "alpha");
    EXPECT_EQ(resolver.Cached("c@example.com"), "gamma");
    EXPECT_EQ(resolver.Cached("noreply@github.com"), "web-flow");
    EXPECT_FALSE(resolver.Cached("b@example.com").has_value());
    EXPECT_FALSE(resolver.Cached("d@example.com").has_value());
}

TEST(PrimeFromRemoteHistoryTest, StopsOnShortPage) {
    FakeRemoteHistory history(2);
    history.AddPage({MakeRemoteCommit("s1", "a@example.com", "alpha")});

    IdentityResolver resolver;
    EXPECT_EQ(PrimeFromRemoteHistory(history, resolver, "s1", "unseen"), 1u);
    EXPECT_EQ(history.fetches(), 1);
}

TEST(PrimeFromRemoteHistoryTest, FailureMidPaginationPrimesNothing) {
    FakeRemoteHistory history(1);
    history.AddPage({MakeRemoteCommit("s2", "a@example.com", "alpha")});
    history.AddPage({MakeRemoteCommit("s1", "b@example.com", "beta")});
    history.FailOnPage(2);

    IdentityResolver resolver;
    try {
        PrimeFromRemoteHistory(history, resolver, "s2", "s0");
        FAIL() << "expected an Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kRemoteHistoryFetchFailure);
    }
    EXPECT_FALSE(resolver.Cached("a@example.com").has_value());
}
