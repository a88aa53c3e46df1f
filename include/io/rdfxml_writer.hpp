#ifndef STOPGRAPH_RDFXML_WRITER_HPP
#define STOPGRAPH_RDFXML_WRITER_HPP

#include <map>
#include <string>
#include "graph/common.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace io {

/**
 * RDF/XML writer producing the abbreviated form:
 * one typed node element per subject (rdf:Description when untyped),
 * property elements with xml:lang, rdf:datatype or rdf:resource.
 * Namespaces without a registered prefix get generated j.N prefixes.
 */
class RdfXmlWriter {
public:
    /**
     * Write a graph store to an RDF/XML file
     * @param store Graph store to write
     * @param filepath Path to the output file
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const graph::GraphStore& store, const std::string& filepath);

    /**
     * Convert a graph store to an RDF/XML document
     * @param store Graph store to convert
     * @return RDF/XML text
     */
    static std::string writeToString(const graph::GraphStore& store);

    /**
     * Escape text for XML element content or attribute values
     * @param value Raw text
     * @return Escaped text
     */
    static std::string escapeXml(const std::string& value);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    /**
     * Resolve an IRI to an element name, registering a generated prefix if needed
     * @param iri Full IRI
     * @param namespaces Prefix map, extended in place
     * @return Qualified element name, or empty string if the IRI cannot be an XML name
     */
    static std::string elementName(const std::string& iri, std::map<std::string, std::string>& namespaces);

    /**
     * Set error message
     * @param error Error message to set
     */
    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    RdfXmlWriter() = delete;
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_RDFXML_WRITER_HPP
