#ifndef BUMPLOG_REMOTE_H_
#define BUMPLOG_REMOTE_H_

#include <optional>
#include <string>
#include <vector>

#include "bumplog/identity.h"
#include "bumplog/repository.h"

namespace bumplog {

struct RemoteInfo {
    std::string host;
    std::string owner;
    std::string name;

    // https://<host>/<owner>/<name>
    std::string WebUrl() const;
    bool IsGitHub() const { return host == "github.com"; }
};

// Understands "git@host:owner/repo.git" and "http(s)://host/owner/repo[.git]".
std::optional<RemoteInfo> ParseRemoteUrl(const std::string& url);

struct RemoteCommit {
    std::string sha;
    std::string author_mail;
    std::string author_login;
    std::string committer_mail;
    std::string committer_login;
};

// Paged commit history of a hosted repository, newest first.
class RemoteHistory {
   public:
    virtual ~RemoteHistory() = default;

    // Pages are 1-based. Throws Error(kRemoteHistoryFetchFailure).
    virtual std::vector<RemoteCommit> FetchPage(const CommitId& head, int page) = 0;

    virtual std::size_t PageSize() const = 0;
};

// GitHub commits API through the `gh` helper, which carries its own
// credentials.
class GhRemoteHistory : public RemoteHistory {
   public:
    GhRemoteHistory(std::string owner, std::string repo);

    std::vector<RemoteCommit> FetchPage(const CommitId& head, int page) override;
    std::size_t PageSize() const override { return kPageSize; }

    static std::vector<RemoteCommit> ParsePage(const std::string& json);

   private:
    static constexpr std::size_t kPageSize = 100;

    std::string owner_;
    std::string repo_;
};

// Pages back from `head` until a short page or `stop` and primes `resolver`
// with every author and committer login seen. Nothing is primed when any
// page fails. Returns the number of commits read.
std::size_t PrimeFromRemoteHistory(RemoteHistory& history, IdentityResolver& resolver,
                                   const CommitId& head, const CommitId& stop);

}  // namespace bumplog

#endif  // BUMPLOG_REMOTE_H_
