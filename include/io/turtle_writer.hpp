#ifndef STOPGRAPH_TURTLE_WRITER_HPP
#define STOPGRAPH_TURTLE_WRITER_HPP

#include <map>
#include <string>
#include "graph/common.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace io {

/**
 * Turtle writer for graph stores.
 * Subjects are written in order of first appearance, each with its facts
 * in insertion order.
 */
class TurtleWriter {
public:
    /**
     * Write a graph store to a Turtle file
     * @param store Graph store to write
     * @param filepath Path to the output file
     * @return true if successful, false otherwise
     */
    static bool writeToFile(const graph::GraphStore& store, const std::string& filepath);

    /**
     * Convert a graph store to a Turtle document
     * @param store Graph store to convert
     * @return Turtle text
     */
    static std::string writeToString(const graph::GraphStore& store);

    /**
     * Format a node as a Turtle term
     * @param node Node to format
     * @param prefixes Prefix map used for abbreviation
     * @return Turtle term (prefixed name, IRI reference or literal)
     */
    static std::string formatNode(const graph::Node& node, const std::map<std::string, std::string>& prefixes);

    /**
     * Format an IRI as a prefixed name when possible, otherwise as <IRI>
     * @param iri Full IRI
     * @param prefixes Prefix map
     * @return Turtle term
     */
    static std::string formatIri(const std::string& iri, const std::map<std::string, std::string>& prefixes);

    /**
     * Get the last error message
     * @return Error message from the last operation
     */
    static std::string getLastError() {
        return last_error_;
    }

private:
    static std::string last_error_;

    static std::string escapeString(const std::string& value);
    static std::string escapeIri(const std::string& iri);

    /**
     * Set error message
     * @param error Error message to set
     */
    static void setError(const std::string& error) {
        last_error_ = error;
    }

    // Disable instantiation
    TurtleWriter() = delete;
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_TURTLE_WRITER_HPP
