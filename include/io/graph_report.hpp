#ifndef STOPGRAPH_GRAPH_REPORT_HPP
#define STOPGRAPH_GRAPH_REPORT_HPP

#include <ostream>
#include <vector>
#include "graph/common.hpp"
#include "graph/graph_store.hpp"

namespace stopgraph {
namespace io {

/**
 * Console reports over a graph store
 */
class GraphReport {
public:
    // Facts shown by printSample when no limit is given
    static constexpr size_t DEFAULT_SAMPLE_SIZE = 20;

    /**
     * Print the triple count and the number of spatial entities
     */
    static void printStatistics(const graph::GraphStore& store, std::ostream& out);

    /**
     * Print the first facts of the store as "subject predicate object"
     * @param store Graph store
     * @param out Output stream
     * @param limit Maximum number of facts
     */
    static void printSample(const graph::GraphStore& store, std::ostream& out, size_t limit = DEFAULT_SAMPLE_SIZE);

    /**
     * Print a numbered list of stations, or a notice when the list is empty
     */
    static void printFilteredEntities(const std::vector<graph::SpatialEntity>& entities, std::ostream& out);

    /**
     * Count the subjects tagged geo:SpatialThing
     */
    static size_t countSpatialEntities(const graph::GraphStore& store);

private:
    // Disable instantiation
    GraphReport() = delete;
};

} // namespace io
} // namespace stopgraph

#endif // STOPGRAPH_GRAPH_REPORT_HPP
