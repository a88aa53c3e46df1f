#ifndef STOPGRAPH_NAMESPACE_UTILS_HPP
#define STOPGRAPH_NAMESPACE_UTILS_HPP

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace stopgraph {
namespace io {

// IRI split into a registered prefix and a local name
struct QualifiedName {
    std::string prefix;
    std::string local_name;

    QualifiedName(const std::string& pfx, const std::string& local)
        : prefix(pfx), local_name(local) {}

    std::string toString() const { return prefix + ":" + local_name; }
};

/**
 * Namespace helpers shared by the encoders
 */
class NamespaceUtils {
public:
    /**
     * Abbreviate an IRI with the longest matching registered namespace
     * @param iri Full IRI
     * @param prefixes Prefix to namespace map
     * @param xml_names Require the local name to be a valid XML NCName instead of a Turtle local name
     * @return Qualified name if a namespace matches and the local part is valid
     */
    static std::optional<QualifiedName> abbreviate(const std::string& iri,
                                                   const std::map<std::string, std::string>& prefixes,
                                                   bool xml_names = false);

    /**
     * Split an IRI after its last '#' or '/' into namespace and local name
     * @param iri Full IRI
     * @return Pair (namespace, local name); namespace is empty if no separator
     */
    static std::pair<std::string, std::string> splitIri(const std::string& iri);

    /**
     * Check a Turtle prefixed-name local part (letters, digits, '_', '-', '.' not last)
     */
    static bool isTurtleLocalName(const std::string& local);

    /**
     * Check an XML NCName (letter or '_' first, then letters, digits, '_', '-', '.')
     */
    static bool isXmlLocalName(const std::string& local);

private:
    // Disable instantiation
    NamespaceUtils() = delete;
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_NAMESPACE_UTILS_HPP
