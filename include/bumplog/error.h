#ifndef BUMPLOG_ERROR_H_
#define BUMPLOG_ERROR_H_

#include <stdexcept>
#include <string>

namespace bumplog {

enum class ErrorKind {
    kNotARepository,
    kEmptyRepository,
    kRepositoryNotClean,
    kEmptyRange,
    kUnresolvableRef,
    kRemoteHistoryFetchFailure,
    kIdentityLookupFailure,
    kGit,
    kIo,
};

const char* ErrorKindName(ErrorKind kind);

// Every failure that aborts a run is thrown as an Error. Recoverable
// conditions (unclassifiable subjects, failed handle lookups) never leave
// the component that hit them.
class Error : public std::runtime_error {
   public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

   private:
    ErrorKind kind_;
};

}  // namespace bumplog

#endif  // BUMPLOG_ERROR_H_
