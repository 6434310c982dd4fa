#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bumplog/error.h"
#include "bumplog/identity.h"
#include "bumplog/utils.h"

namespace bumplog {

using json = nlohmann::json;

UnghIdentityLookup::UnghIdentityLookup(std::string endpoint) : endpoint_(std::move(endpoint)) {}

std::optional<std::string> UnghIdentityLookup::FindHandle(const std::string& mail) {
    std::string command = "curl -sS --fail --max-time 10 -H 'User-Agent: bumplog' " +
                          ShellQuote(endpoint_ + mail) + " 2>/dev/null";
    CommandResult result = RunCommand(command);
    // curl exits with 22 on HTTP errors, which ungh.cc uses for unknown users.
    if (result.exit_code == 22) {
        return std::nullopt;
    }
    if (result.exit_code != 0) {
        throw Error(ErrorKind::kIdentityLookupFailure,
                    "curl exited with " + std::to_string(result.exit_code) + " for " + mail);
    }
    return ParseReply(result.output);
}

std::optional<std::string> UnghIdentityLookup::ParseReply(const std::string& reply) {
    json data = json::parse(reply, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw Error(ErrorKind::kIdentityLookupFailure, "Malformed reply from ungh.cc");
    }
    auto user = data.find("user");
    if (user == data.end() || !user->is_object()) {
        return std::nullopt;
    }
    auto username = user->find("username");
    if (username == user->end() || !username->is_string()) {
        return std::nullopt;
    }
    std::string handle = username->get<std::string>();
    if (handle.empty()) return std::nullopt;
    return handle;
}

void IdentityResolver::Prime(const std::string& mail, const std::string& handle) {
    auto it = handles_.find(mail);
    if (it == handles_.end()) {
        handles_.emplace(mail, handle);
    } else if (it->second.empty() && !handle.empty()) {
        it->second = handle;
    }
}

std::optional<std::string> IdentityResolver::Cached(const std::string& mail) const {
    auto it = handles_.find(mail);
    if (it == handles_.end()) return std::nullopt;
    return it->second;
}

Author IdentityResolver::Resolve(const Author& author) {
    Author resolved = author;
    if (!author.handle.empty()) {
        Prime(author.mail, author.handle);
        return resolved;
    }
    auto cached = Cached(author.mail);
    resolved.handle = cached ? *cached : Lookup(author.mail);
    return resolved;
}

std::string IdentityResolver::Lookup(const std::string& mail) {
    std::string handle;
    if (lookup_) {
        ++lookup_count_;
        try {
            handle = lookup_->FindHandle(mail).value_or("");
        } catch (const std::exception& e) {
            spdlog::warn("Could not look up a handle for {}: {}", mail, e.what());
        }
    }
    handles_.emplace(mail, handle);
    if (!handle.empty()) {
        spdlog::debug("{} is @{}", mail, handle);
    }
    return handle;
}

}  // namespace bumplog
