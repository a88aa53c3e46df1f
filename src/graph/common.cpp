#include "graph/common.hpp"
#include "graph/errors.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace stopgraph {
namespace graph {

std::string Node::toString() const {
    switch (type) {
        case NodeType::RESOURCE:
            return value;
        case NodeType::LANG_LITERAL:
            return "\"" + value + "\"@" + language;
        case NodeType::TYPED_LITERAL:
            return value + "^^" + datatype;
        case NodeType::PLAIN_LITERAL:
        default:
            return "\"" + value + "\"";
    }
}

std::string SpatialEntity::toString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4)
        << "Station[" << subject << "] " << name
        << " (" << latitude << ", " << longitude << ")";
    return oss.str();
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);

    if (end != begin + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MALFORMED_RECORD:
            return "MalformedRecord";
        case ErrorKind::MISSING_REQUIRED_FIELD:
            return "MissingRequiredField";
        case ErrorKind::INVALID_COORDINATE:
            return "InvalidCoordinate";
        case ErrorKind::MISSING_COORDINATE:
            return "MissingCoordinate";
    }
    return "Unknown";
}

} // namespace graph
} // namespace stopgraph
