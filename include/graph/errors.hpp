#ifndef STOPGRAPH_ERRORS_HPP
#define STOPGRAPH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stopgraph {
namespace graph {

// Data-quality error kinds raised while parsing, building or reading entities
enum class ErrorKind {
    MALFORMED_RECORD,        // Too few fields in a row
    MISSING_REQUIRED_FIELD,  // Empty identifier, label or coordinate
    INVALID_COORDINATE,      // Coordinate text is not a usable decimal number
    MISSING_COORDINATE       // Entity lacks a latitude or longitude fact
};

/**
 * Get a stable name for an error kind (e.g. "MalformedRecord")
 * @param kind Error kind
 * @return Error kind name
 */
std::string errorKindName(ErrorKind kind);

/**
 * Exception carrying a data-quality error kind
 */
class RecordError : public std::runtime_error {
public:
    RecordError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_ERRORS_HPP
