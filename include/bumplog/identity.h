#ifndef BUMPLOG_IDENTITY_H_
#define BUMPLOG_IDENTITY_H_

#include <map>
#include <optional>
#include <string>

#include "bumplog/commit.h"

namespace bumplog {

// Maps a commit mail to a public handle.
class IdentityLookup {
   public:
    virtual ~IdentityLookup() = default;

    // std::nullopt when the mail is unknown. Throws Error on transport
    // failures.
    virtual std::optional<std::string> FindHandle(const std::string& mail) = 0;
};

// Asks https://ungh.cc for the GitHub user behind a mail, through curl.
class UnghIdentityLookup : public IdentityLookup {
   public:
    explicit UnghIdentityLookup(std::string endpoint = "https://ungh.cc/users/find/");

    std::optional<std::string> FindHandle(const std::string& mail) override;

    // Reads user.username out of an ungh.cc reply.
    static std::optional<std::string> ParseReply(const std::string& json);

   private:
    std::string endpoint_;
};

// Per-run mail -> handle memo. Each mail is looked up at most once, and a
// failed lookup leaves the handle empty instead of failing the run.
class IdentityResolver {
   public:
    // `lookup` may be null, in which case only primed handles are known.
    explicit IdentityResolver(IdentityLookup* lookup = nullptr) : lookup_(lookup) {}

    // Records a handle that came with richer commit metadata. A non-empty
    // handle is never replaced.
    void Prime(const std::string& mail, const std::string& handle);

    Author Resolve(const Author& author);

    std::optional<std::string> Cached(const std::string& mail) const;

    int LookupCount() const { return lookup_count_; }

   private:
    std::string Lookup(const std::string& mail);

    IdentityLookup* lookup_;
    std::map<std::string, std::string> handles_;
    int lookup_count_ = 0;
};

}  // namespace bumplog

#endif  // BUMPLOG_IDENTITY_H_
