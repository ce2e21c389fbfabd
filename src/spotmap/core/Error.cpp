#include "spotmap/core/Error.hpp"

namespace spotmap {

const char* errorKindName(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::InvalidLabel:                return "InvalidLabel";
        case ErrorKind::MalformedRow:                return "MalformedRow";
        case ErrorKind::NotFound:                    return "NotFound";
        case ErrorKind::DegenerateReferenceSet:      return "DegenerateReferenceSet";
        case ErrorKind::InsufficientReferencePoints: return "InsufficientReferencePoints";
        case ErrorKind::FileAccessError:             return "FileAccessError";
        case ErrorKind::MissingColumn:               return "MissingColumn";
        case ErrorKind::DuplicateId:                 return "DuplicateId";
        case ErrorKind::InvalidValue:                return "InvalidValue";
    }
    return "Unknown";
}

} // namespace spotmap
