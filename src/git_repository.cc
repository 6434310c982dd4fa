#include <algorithm>
#include <memory>
#include <string>

#include <git2.h>
#include <spdlog/spdlog.h>

#include "bumplog/error.h"
#include "bumplog/repository.h"

namespace bumplog {

namespace {

struct GitRepoDeleter {
    void operator()(git_repository* r) const { git_repository_free(r); }
};

struct GitRevwalkDeleter {
    void operator()(git_revwalk* w) const { git_revwalk_free(w); }
};

struct GitCommitDeleter {
    void operator()(git_commit* c) const { git_commit_free(c); }
};

struct GitObjectDeleter {
    void operator()(git_object* o) const { git_object_free(o); }
};

struct GitRemoteDeleter {
    void operator()(git_remote* r) const { git_remote_free(r); }
};

struct GitStatusListDeleter {
    void operator()(git_status_list* s) const { git_status_list_free(s); }
};

using UniqueRepo = std::unique_ptr<git_repository, GitRepoDeleter>;
using UniqueRevwalk = std::unique_ptr<git_revwalk, GitRevwalkDeleter>;
using UniqueCommit = std::unique_ptr<git_commit, GitCommitDeleter>;
using UniqueObject = std::unique_ptr<git_object, GitObjectDeleter>;
using UniqueRemote = std::unique_ptr<git_remote, GitRemoteDeleter>;
using UniqueStatusList = std::unique_ptr<git_status_list, GitStatusListDeleter>;

struct LibGit2Init {
    LibGit2Init() { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};

static LibGit2Init g_libgit2_init;

std::string LastGitError() {
    const git_error* e = git_error_last();
    return e ? e->message : "unknown error";
}

#define BUMPLOG_CHECK_GIT2(error, kind, msg)                                 \
    if ((error) < 0) {                                                       \
        throw Error((kind), std::string(msg) + ": " + LastGitError());        \
    }

std::string OidToString(const git_oid* oid) {
    char buf[GIT_OID_SHA1_HEXSIZE + 1] = {};
    git_oid_tostr(buf, sizeof(buf), oid);
    return std::string(buf);
}

git_oid StringToOid(const std::string& id) {
    git_oid oid;
    BUMPLOG_CHECK_GIT2(git_oid_fromstr(&oid, id.c_str()), ErrorKind::kUnresolvableRef,
                       "Invalid object id " + id);
    return oid;
}

// Peels whatever `spec` names (branch, tag, annotated tag, hash) to a commit.
int PeelToCommit(git_oid* out, git_repository* repo, const std::string& spec) {
    git_object* object_raw = nullptr;
    int e = git_revparse_single(&object_raw, repo, spec.c_str());
    if (e < 0) return e;
    UniqueObject object(object_raw);

    git_object* commit_raw = nullptr;
    e = git_object_peel(&commit_raw, object.get(), GIT_OBJECT_COMMIT);
    if (e < 0) return e;
    UniqueObject commit(commit_raw);

    git_oid_cpy(out, git_object_id(commit.get()));
    return 0;
}

}  // namespace

GitRepository::GitRepository(const std::string& path) {
    git_repository* repo_raw = nullptr;
    BUMPLOG_CHECK_GIT2(git_repository_open(&repo_raw, path.c_str()),
                       ErrorKind::kNotARepository, "Failed to open repository at " + path);
    UniqueRepo repo(repo_raw);

    EnsureClean(repo.get(), path);
    repo_ = repo.release();
}

GitRepository::~GitRepository() {
    if (repo_) {
        git_repository_free(repo_);
    }
}

void GitRepository::EnsureClean(git_repository* repo, const std::string& path) {
    int empty = git_repository_is_empty(repo);
    BUMPLOG_CHECK_GIT2(empty, ErrorKind::kGit, "Failed to inspect " + path);
    if (empty == 1) {
        throw Error(ErrorKind::kEmptyRepository, "The repository is empty.");
    }

    if (git_repository_state(repo) != GIT_REPOSITORY_STATE_NONE) {
        throw Error(ErrorKind::kRepositoryNotClean, "The repository is not clean.");
    }

    if (git_repository_is_bare(repo)) {
        return;
    }

    git_status_options opts;
    git_status_options_init(&opts, GIT_STATUS_OPTIONS_VERSION);
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_EXCLUDE_SUBMODULES;

    git_status_list* status_raw = nullptr;
    BUMPLOG_CHECK_GIT2(git_status_list_new(&status_raw, repo, &opts), ErrorKind::kGit,
                       "Failed to read status");
    UniqueStatusList statuses(status_raw);

    const unsigned int untracked = GIT_STATUS_WT_NEW | GIT_STATUS_INDEX_NEW;
    bool dirty = false;
    std::size_t count = git_status_list_entrycount(statuses.get());
    for (std::size_t i = 0; i < count; ++i) {
        const git_status_entry* entry = git_status_byindex(statuses.get(), i);
        if (entry->status & untracked) {
            throw Error(ErrorKind::kRepositoryNotClean, "The repository has untracked files.");
        }
        if (entry->status != GIT_STATUS_CURRENT && !(entry->status & GIT_STATUS_IGNORED)) {
            dirty = true;
        }
    }
    if (dirty) {
        throw Error(ErrorKind::kRepositoryNotClean,
                    "The repository has uncommitted changes.");
    }
}

CommitId GitRepository::ResolveRef(const std::string& name) const {
    git_oid oid;
    if (PeelToCommit(&oid, repo_, name) < 0) {
        throw Error(ErrorKind::kUnresolvableRef,
                    "Cannot resolve '" + name + "' to a commit: " + LastGitError());
    }
    return OidToString(&oid);
}

std::vector<std::pair<std::string, CommitId>> GitRepository::ListTags() const {
    std::vector<std::pair<std::string, CommitId>> tags;

    git_strarray names = {};
    BUMPLOG_CHECK_GIT2(git_tag_list(&names, repo_), ErrorKind::kGit, "Failed to list tags");

    for (std::size_t i = 0; i < names.count; ++i) {
        std::string name(names.strings[i]);
        git_oid oid;
        if (PeelToCommit(&oid, repo_, "refs/tags/" + name) < 0) {
            spdlog::debug("Skipping tag {}: {}", name, LastGitError());
            continue;
        }
        tags.emplace_back(name, OidToString(&oid));
    }
    git_strarray_dispose(&names);

    // Loose and packed tags come back as two separately sorted runs.
    std::sort(tags.begin(), tags.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    return tags;
}

std::vector<CommitId> GitRepository::WalkRange(const CommitId& from, const CommitId& to) const {
    git_revwalk* walker_raw = nullptr;
    BUMPLOG_CHECK_GIT2(git_revwalk_new(&walker_raw, repo_), ErrorKind::kGit,
                       "Failed to create revwalk");
    UniqueRevwalk walker(walker_raw);
    git_revwalk_sorting(walker.get(), GIT_SORT_TOPOLOGICAL | GIT_SORT_TIME);

    git_oid to_oid = StringToOid(to);
    BUMPLOG_CHECK_GIT2(git_revwalk_push(walker.get(), &to_oid), ErrorKind::kGit,
                       "Failed to push " + to);
    if (!from.empty()) {
        git_oid from_oid = StringToOid(from);
        BUMPLOG_CHECK_GIT2(git_revwalk_hide(walker.get(), &from_oid), ErrorKind::kGit,
                           "Failed to hide " + from);
    }

    std::vector<CommitId> ids;
    git_oid oid;
    int e;
    while ((e = git_revwalk_next(&oid, walker.get())) == 0) {
        ids.push_back(OidToString(&oid));
    }
    if (e != GIT_ITEROVER) {
        BUMPLOG_CHECK_GIT2(e, ErrorKind::kGit, "Failed to walk " + from + ".." + to);
    }
    return ids;
}

RawCommit GitRepository::GetCommit(const CommitId& id) const {
    git_oid oid = StringToOid(id);
    git_commit* commit_raw = nullptr;
    BUMPLOG_CHECK_GIT2(git_commit_lookup(&commit_raw, repo_, &oid), ErrorKind::kGit,
                       "Failed to lookup commit " + id);
    UniqueCommit commit(commit_raw);

    RawCommit raw;
    raw.id = id;

    const char* message = git_commit_message(commit.get());
    std::string text = message ? message : "";
    raw.subject = text.substr(0, text.find('\n'));
    if (!raw.subject.empty() && raw.subject.back() == '\r') raw.subject.pop_back();

    const char* body = git_commit_body(commit.get());
    raw.body = body ? body : "";

    const git_signature* author = git_commit_author(commit.get());
    raw.author_name = author->name;
    raw.author_mail = author->email;
    const git_signature* committer = git_commit_committer(commit.get());
    raw.committer_name = committer->name;
    raw.committer_mail = committer->email;
    return raw;
}

std::optional<std::string> GitRepository::RemoteUrl(const std::string& remote) const {
    git_remote* remote_raw = nullptr;
    int e = git_remote_lookup(&remote_raw, repo_, remote.c_str());
    if (e == GIT_ENOTFOUND || e == GIT_EINVALIDSPEC) {
        spdlog::debug("Remote {} not found.", remote);
        return std::nullopt;
    }
    BUMPLOG_CHECK_GIT2(e, ErrorKind::kGit, "Failed to look up remote " + remote);
    UniqueRemote handle(remote_raw);

    const char* url = git_remote_url(handle.get());
    if (!url) return std::nullopt;
    return std::string(url);
}

}  // namespace bumplog
