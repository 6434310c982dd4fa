#include "bumplog/error.h"

namespace bumplog {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNotARepository:
            return "NotARepository";
        case ErrorKind::kEmptyRepository:
            return "EmptyRepository";
        case ErrorKind::kRepositoryNotClean:
            return "RepositoryNotClean";
        case ErrorKind::kEmptyRange:
            return "EmptyRange";
        case ErrorKind::kUnresolvableRef:
            return "UnresolvableRef";
        case ErrorKind::kRemoteHistoryFetchFailure:
            return "RemoteHistoryFetchFailure";
        case ErrorKind::kIdentityLookupFailure:
            return "IdentityLookupFailure";
        case ErrorKind::kGit:
            return "Git";
        case ErrorKind::kIo:
            return "Io";
    }
    return "Unknown";
}

}  // namespace bumplog
