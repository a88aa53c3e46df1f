#ifndef STOPGRAPH_SPATIAL_VIEW_HPP
#define STOPGRAPH_SPATIAL_VIEW_HPP

#include <string>
#include <vector>
#include "graph/common.hpp"
#include "graph/errors.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace graph {

// Subject skipped during enumeration
struct ExtractionFailure {
    std::string subject;
    ErrorKind kind;
    std::string message;

    ExtractionFailure(const std::string& subj, ErrorKind error_kind, const std::string& msg)
        : subject(subj), kind(error_kind), message(msg) {}
};

// Result of enumerating the spatial entities of a store
struct SpatialListing {
    std::vector<SpatialEntity> entities;      // Successfully extracted, in subject-index order
    std::vector<ExtractionFailure> failures;  // Subjects skipped
    size_t total_examined = 0;                // Subjects tagged geo:SpatialThing
};

/**
 * Read-only projection of the geo:SpatialThing subjects of a graph store
 */
class SpatialIndexView {
public:
    /**
     * Enumerate every geo:SpatialThing subject and extract its typed entity.
     * Subjects that fail extraction are recorded and skipped.
     * @param store Graph store
     * @return Extracted entities, failures and examined count
     */
    static SpatialListing listSpatialEntities(const GraphStore& store);

    /**
     * Extract the typed entity of one subject
     * @param store Graph store
     * @param subject Subject IRI
     * @return Spatial entity (label falls back to a placeholder)
     * @throws RecordError MISSING_COORDINATE if geo:lat or geo:long is absent,
     *         INVALID_COORDINATE if a coordinate is not numeric
     */
    static SpatialEntity extract(const GraphStore& store, const std::string& subject);

private:
    static double coordinateValue(const Node& node, const std::string& subject, const std::string& property);

    // Disable instantiation
    SpatialIndexView() = delete;
};

} // namespace graph
} // namespace stopgraph

#endif // STOPGRAPH_SPATIAL_VIEW_HPP
