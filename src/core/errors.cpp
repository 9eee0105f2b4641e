#include "core/errors.hpp"

namespace evindex {

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_COORDINATE:
            return "InvalidCoordinate";
        case ErrorKind::MALFORMED_RECORD:
            return "MalformedRecord";
        case ErrorKind::DUPLICATE_ID:
            return "DuplicateId";
        case ErrorKind::TIMEOUT:
            return "Timeout";
        case ErrorKind::INTERNAL_INCONSISTENCY:
            return "InternalInconsistency";
        case ErrorKind::PROJECTION_FAILURE:
            return "ProjectionFailure";
        case ErrorKind::IO_FAILURE:
            return "IOFailure";
    }
    return "Unknown";
}

} // namespace evindex
