#include "io/namespace_utils.hpp"
#include <cctype>

namespace stopgraph {
namespace io {

namespace {

bool isNameChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.';
}

} // namespace

std::optional<QualifiedName> NamespaceUtils::abbreviate(const std::string& iri,
                                                        const std::map<std::string, std::string>& prefixes,
                                                        bool xml_names) {
    std::optional<QualifiedName> best;
    size_t best_length = 0;

    for (const auto& [prefix, uri] : prefixes) {
        if (uri.empty() || uri.size() <= best_length || iri.compare(0, uri.size(), uri) != 0) {
            continue;
        }
        std::string local = iri.substr(uri.size());
        bool valid = xml_names ? isXmlLocalName(local) : isTurtleLocalName(local);
        if (valid) {
            best = QualifiedName(prefix, local);
            best_length = uri.size();
        }
    }

    return best;
}

std::pair<std::string, std::string> NamespaceUtils::splitIri(const std::string& iri) {
    size_t pos = iri.find_last_of("#/");
    if (pos == std::string::npos) {
        return {"", iri};
    }
    return {iri.substr(0, pos + 1), iri.substr(pos + 1)};
}

bool NamespaceUtils::isTurtleLocalName(const std::string& local) {
    if (local.empty()) {
        return false;
    }
    if (local.front() == '-' || local.front() == '.' || local.back() == '.') {
        return false;
    }
    for (unsigned char c : local) {
        if (!isNameChar(c)) {
            return false;
        }
    }
    return true;
}

bool NamespaceUtils::isXmlLocalName(const std::string& local) {
    if (local.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(local.front());
    if (!std::isalpha(first) && first != '_') {
        return false;
    }
    for (unsigned char c : local) {
        if (!isNameChar(c)) {
            return false;
        }
    }
    return true;
}

} // namespace io
} // namespace stopgraph
