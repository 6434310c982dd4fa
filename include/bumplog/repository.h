#ifndef BUMPLOG_REPOSITORY_H_
#define BUMPLOG_REPOSITORY_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <git2.h>

namespace bumplog {

// Full hex object id.
using CommitId = std::string;

struct RawCommit {
    CommitId id;
    std::string subject;
    std::string body;
    std::string author_name;
    std::string author_mail;
    std::string committer_name;
    std::string committer_mail;
    // Hosting account of the author, when the gateway knows it.
    std::string author_handle;
};

// Read-only view of a version-control repository.
class Repository {
   public:
    virtual ~Repository() = default;

    // Resolves a ref name, tag or commit-ish. Throws Error(kUnresolvableRef).
    virtual CommitId ResolveRef(const std::string& name) const = 0;

    // Tags in descending name order, each peeled to its commit. Tags that do
    // not peel to a commit are left out.
    virtual std::vector<std::pair<std::string, CommitId>> ListTags() const = 0;

    // Commits reachable from `to` but not from `from`, newest first. An
    // empty `from` walks the whole history of `to`.
    virtual std::vector<CommitId> WalkRange(const CommitId& from, const CommitId& to) const = 0;

    virtual RawCommit GetCommit(const CommitId& id) const = 0;

    virtual std::optional<std::string> RemoteUrl(const std::string& remote) const = 0;
};

// libgit2-backed repository. Construction fails unless the repository is
// non-empty, has no operation in progress and no uncommitted or untracked
// changes.
class GitRepository : public Repository {
   public:
    explicit GitRepository(const std::string& path);
    ~GitRepository() override;

    GitRepository(const GitRepository&) = delete;
    GitRepository& operator=(const GitRepository&) = delete;

    CommitId ResolveRef(const std::string& name) const override;
    std::vector<std::pair<std::string, CommitId>> ListTags() const override;
    std::vector<CommitId> WalkRange(const CommitId& from, const CommitId& to) const override;
    RawCommit GetCommit(const CommitId& id) const override;
    std::optional<std::string> RemoteUrl(const std::string& remote) const override;

   private:
    static void EnsureClean(git_repository* repo, const std::string& path);

    git_repository* repo_ = nullptr;
};

}  // namespace bumplog

#endif  // BUMPLOG_REPOSITORY_H_
