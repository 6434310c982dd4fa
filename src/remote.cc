#include <regex>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bumplog/error.h"
#include "bumplog/remote.h"
#include "bumplog/utils.h"

namespace bumplog {

using json = nlohmann::json;

namespace {

const std::string kGitSuffix = ".git";

std::string StringAt(const json& object, const char* key) {
    if (!object.is_object()) return "";
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

}  // namespace

std::string RemoteInfo::WebUrl() const { return "https://" + host + "/" + owner + "/" + name; }

std::optional<RemoteInfo> ParseRemoteUrl(const std::string& url) {
    static const std::regex scp_re(R"(^git@([^:/]+):([^/]+)/(.+)$)");
    static const std::regex ssh_re(R"(^ssh://(?:[^@/]+@)?([^:/]+)(?::\d+)?/([^/]+)/(.+)$)");
    static const std::regex http_re(R"(^https?://(?:[^@/]+@)?([^:/]+)(?::\d+)?/([^/]+)/(.+)$)");

    std::smatch m;
    if (!std::regex_match(url, m, scp_re) && !std::regex_match(url, m, ssh_re) &&
        !std::regex_match(url, m, http_re)) {
        return std::nullopt;
    }

    RemoteInfo info;
    info.host = m[1].str();
    info.owner = m[2].str();
    info.name = m[3].str();
    while (!info.name.empty() && info.name.back() == '/') info.name.pop_back();
    if (EndsWith(info.name, kGitSuffix)) {
        info.name.resize(info.name.size() - kGitSuffix.size());
    }
    if (info.name.empty()) return std::nullopt;
    return info;
}

GhRemoteHistory::GhRemoteHistory(std::string owner, std::string repo)
    : owner_(std::move(owner)), repo_(std::move(repo)) {}

std::vector<RemoteCommit> GhRemoteHistory::FetchPage(const CommitId& head, int page) {
    std::string endpoint = "repos/" + owner_ + "/" + repo_ +
                           "/commits?per_page=" + std::to_string(kPageSize) +
                           "&page=" + std::to_string(page) + "&sha=" + head;
    CommandResult result = RunCommand("gh api " + ShellQuote(endpoint) + " 2>/dev/null");
    if (result.exit_code != 0) {
        throw Error(ErrorKind::kRemoteHistoryFetchFailure,
                    "gh api " + endpoint + " exited with " + std::to_string(result.exit_code));
    }
    return ParsePage(result.output);
}

std::vector<RemoteCommit> GhRemoteHistory::ParsePage(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_array()) {
        throw Error(ErrorKind::kRemoteHistoryFetchFailure,
                    "Unexpected reply from the GitHub commits API");
    }

    std::vector<RemoteCommit> commits;
    for (const auto& raw : data) {
        RemoteCommit commit;
        commit.sha = StringAt(raw, "sha");
        if (commit.sha.empty()) {
            throw Error(ErrorKind::kRemoteHistoryFetchFailure, "Commit without sha in reply");
        }
        // "author"/"committer" at the top level are GitHub accounts (null when
        // the mail is not linked); under "commit" they are git signatures.
        const json& meta =
            raw.contains("commit") && raw["commit"].is_object() ? raw["commit"] : json::object();
        commit.author_mail = StringAt(meta.value("author", json::object()), "email");
        commit.committer_mail = StringAt(meta.value("committer", json::object()), "email");
        commit.author_login = StringAt(raw.value("author", json::object()), "login");
        commit.committer_login = StringAt(raw.value("committer", json::object()), "login");
        commits.push_back(std::move(commit));
    }
    return commits;
}

std::size_t PrimeFromRemoteHistory(RemoteHistory& history, IdentityResolver& resolver,
                                   const CommitId& head, const CommitId& stop) {
    std::vector<RemoteCommit> seen;
    bool reached_stop = false;
    for (int page = 1; !reached_stop; ++page) {
        std::vector<RemoteCommit> commits = history.FetchPage(head, page);
        spdlog::debug("Fetched page {} of remote history ({} commits)", page, commits.size());
        for (auto& commit : commits) {
            reached_stop = reached_stop || commit.sha == stop;
            seen.push_back(std::move(commit));
            if (reached_stop) break;
        }
        if (commits.size() < history.PageSize()) break;
    }

    // Unlinked accounts are not primed, so the lookup service still gets a
    // chance at them.
    for (const auto& commit : seen) {
        if (!commit.author_mail.empty() && !commit.author_login.empty()) {
            resolver.Prime(commit.author_mail, commit.author_login);
        }
        if (!commit.committer_mail.empty() && !commit.committer_login.empty()) {
            resolver.Prime(commit.committer_mail, commit.committer_login);
        }
    }
    return seen.size();
}

}  // namespace bumplog
