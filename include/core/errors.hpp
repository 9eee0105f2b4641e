#ifndef EVINDEX_ERRORS_HPP
#define EVINDEX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace evindex {

// Error categories raised by the engine
enum class ErrorKind {
    INVALID_COORDINATE,      // Latitude/longitude out of range or not projectable
    MALFORMED_RECORD,        // Schema violation in a station record
    DUPLICATE_ID,            // Strict insert collided with a live id
    TIMEOUT,                 // Deadline-bound query did not finish in time
    INTERNAL_INCONSISTENCY,  // Validator or index reached a state that must not exist
    PROJECTION_FAILURE,      // Coordinate transformation could not be created
    IO_FAILURE               // Input could not be read or output could not be written
};

/**
 * Get the canonical name of an error kind (e.g. "InvalidCoordinate")
 * @param kind Error kind
 * @return Name used in logs and query responses
 */
std::string errorKindName(ErrorKind kind);

/**
 * Exception type for every failure reported by evindex
 */
class EvIndexError : public std::runtime_error {
public:
    EvIndexError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace evindex

#endif // EVINDEX_ERRORS_HPP
