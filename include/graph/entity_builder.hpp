#ifndef STOPGRAPH_ENTITY_BUILDER_HPP
#define STOPGRAPH_ENTITY_BUILDER_HPP

#include <string>
#include "graph/common.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace graph {

/**
 * Builds spatial entities (type, label, latitude, longitude facts) from stop records
 */
class EntityBuilder {
public:
    /**
     * Append the facts of one spatial entity to a store.
     * Either all four facts are appended or none are.
     * @param record Validated stop record
     * @param store Target graph store
     * @return Subject IRI of the entity
     * @throws RecordError (INVALID_COORDINATE) if a coordinate is not a valid xsd:decimal
     */
    static std::string buildSpatialEntity(const StopRecord& record, GraphStore& store);

    /**
     * Derive the subject IRI for a stop identifier (namespace + raw identifier)
     * @param stop_id Stop identifier
     * @return Subject IRI
     */
    static std::string subjectFor(const std::string& stop_id);

    /**
     * Create an xsd:decimal typed literal
     * @param lexical Lexical form
     * @return Typed literal node
     * @throws RecordError (INVALID_COORDINATE) if lexical is not an xsd:decimal lexical form
     */
    static Node makeDecimalLiteral(const std::string& lexical);

    /**
     * Check the xsd:decimal lexical form: [+-]? (digits ('.' digits?)? | '.' digits)
     * @param lexical Text to check
     * @return true if valid
     */
    static bool isDecimalLexical(const std::string& lexical);

private:
    // Disable instantiation
    EntityBuilder() = delete;
};

} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_ENTITY_BUILDER_HPP
